#include "convergencepoller.hpp"

#include <QPointer>

#include <utility>

ConvergencePoller::ConvergencePoller(StatusFetcher fetcher,
                                     const EngineTimings& timings,
                                     MonotonicClock clock,
                                     QObject *parent)
    : QObject(parent)
    , m_fetcher(std::move(fetcher))
    , m_timings(timings)
    , m_clock(std::move(clock))
{
    m_timer.setInterval(m_timings.pollIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &ConvergencePoller::onTick);
}

void ConvergencePoller::start(bool targetConnected, bool downStartedNow)
{
    if (m_session.has_value()) {
        emit systemLog(QStringLiteral("[Poller] Session %1 superseded.").arg(m_session->id));
        m_timer.stop();
    }

    PollSession session;
    session.id = m_nextSessionId++;
    session.targetConnected = targetConnected;
    session.startedAtMs = m_clock();
    if (downStartedNow) {
        session.downObservedAtMs = session.startedAtMs;
    }
    m_session = session;
    m_fetchInFlight = false;

    emit systemLog(QStringLiteral("[Poller] Waiting for %1 (session %2).")
        .arg(targetConnected ? QStringLiteral("connected") : QStringLiteral("disconnected"))
        .arg(session.id));

    m_timer.start();
}

void ConvergencePoller::abort(TailnetErrorKind kind, const QString& message)
{
    if (!m_session.has_value()) {
        return;
    }

    PollOutcome outcome;
    outcome.errorKind = kind;
    outcome.error = message;
    finish(outcome);
}

bool ConvergencePoller::isPolling() const
{
    return m_session.has_value();
}

std::optional<PollSession> ConvergencePoller::session() const
{
    return m_session;
}

qint64 ConvergencePoller::timeoutFor(bool targetConnected, const EngineTimings& timings)
{
    return targetConnected ? timings.connectTimeoutMs : timings.disconnectTimeoutMs;
}

QString ConvergencePoller::timeoutMessage()
{
    return QStringLiteral("timed out waiting for state change");
}

PollVerdict ConvergencePoller::evaluate(const PollSession& session,
                                        const StatusProbe& probe,
                                        qint64 nowMs,
                                        const EngineTimings& timings)
{
    if (probe.errorKind == TailnetErrorKind::Unavailable) {
        return PollVerdict::Aborted;
    }

    if (probe.status.has_value()) {
        const TailnetStatus& status = probe.status.value();
        if (status.connected() == session.targetConnected) {
            return PollVerdict::Converged;
        }

        // The derived flag waits for address clearing; the backend state flips first.
        if (!session.targetConnected
            && session.downObservedAtMs.has_value()
            && nowMs - session.downObservedAtMs.value() >= timings.disconnectGraceMs
            && !TailnetStatus::isRunningState(status.backendState)) {
            return PollVerdict::Converged;
        }
    } else if (!session.targetConnected) {
        return PollVerdict::Converged;
    }

    if (nowMs - session.startedAtMs > timeoutFor(session.targetConnected, timings)) {
        return PollVerdict::TimedOut;
    }
    return PollVerdict::Continue;
}

void ConvergencePoller::onTick()
{
    if (!m_session.has_value()) {
        m_timer.stop();
        return;
    }

    const PollSession session = m_session.value();

    if (!m_fetcher) {
        PollOutcome outcome;
        outcome.errorKind = TailnetErrorKind::Unavailable;
        outcome.error = QStringLiteral("No tailscale client available.");
        finish(outcome);
        return;
    }

    if (m_fetchInFlight) {
        // A hung fetch must not keep the session alive past its timeout.
        if (m_clock() - session.startedAtMs > timeoutFor(session.targetConnected, m_timings)) {
            PollOutcome outcome;
            outcome.errorKind = TailnetErrorKind::ConvergenceTimeout;
            outcome.error = timeoutMessage();
            finish(outcome);
        }
        return;
    }

    m_fetchInFlight = true;
    const quint64 sessionId = session.id;
    const QPointer<ConvergencePoller> guard(this);
    m_fetcher([guard, sessionId](const StatusProbe& probe) {
        if (!guard) {
            return;
        }
        guard->handleProbe(sessionId, probe);
    });
}

void ConvergencePoller::handleProbe(quint64 sessionId, const StatusProbe& probe)
{
    if (!m_session.has_value() || m_session->id != sessionId) {
        return;
    }
    m_fetchInFlight = false;

    const PollSession session = m_session.value();
    const PollVerdict verdict = evaluate(session, probe, m_clock(), m_timings);

    PollOutcome outcome;
    switch (verdict) {
    case PollVerdict::Continue:
        if (!probe.status.has_value()) {
            emit systemLog(QStringLiteral("[Poller] Status fetch failed, retrying: %1").arg(probe.error));
        }
        return;
    case PollVerdict::Converged:
        outcome.success = true;
        outcome.connected = session.targetConnected;
        break;
    case PollVerdict::TimedOut:
        outcome.errorKind = TailnetErrorKind::ConvergenceTimeout;
        outcome.error = timeoutMessage();
        break;
    case PollVerdict::Aborted:
        outcome.errorKind = TailnetErrorKind::Unavailable;
        outcome.error = probe.error.isEmpty() ? QStringLiteral("No tailscale client available.") : probe.error;
        break;
    }
    finish(outcome);
}

void ConvergencePoller::finish(const PollOutcome& outcome)
{
    m_timer.stop();
    const quint64 sessionId = m_session.has_value() ? m_session->id : 0;
    m_session.reset();
    m_fetchInFlight = false;

    if (outcome.success) {
        emit systemLog(QStringLiteral("[Poller] Session %1 converged (%2).")
            .arg(sessionId)
            .arg(outcome.connected ? QStringLiteral("connected") : QStringLiteral("disconnected")));
    } else {
        emit systemLog(QStringLiteral("[Poller] Session %1 ended: %2").arg(sessionId).arg(outcome.error));
    }
    emit finished(outcome);
}
