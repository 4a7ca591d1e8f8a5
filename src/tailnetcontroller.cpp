#include "tailnetcontroller.hpp"

#include "tailscaleclient.hpp"

#include <utility>

namespace {
EngineTimings timingsFromSettings(const AppSettings& settings)
{
    EngineTimings timings;
    timings.refreshIntervalMs = settings.refreshIntervalMs;
    return timings;
}

QString unavailableMessage()
{
    return QStringLiteral("Tailscale is not available on this system (no binary in PATH).");
}
}

TailnetController::TailnetController(QObject *parent)
    : TailnetController(AppSettings::load(), parent)
{
    m_persistSettings = true;
}

TailnetController::TailnetController(const AppSettings& settings, QObject *parent)
    : TailnetController(std::make_shared<TailscaleClient>(settings.tailscaleExecutable, settings.allowSudo),
                        settings,
                        timingsFromSettings(settings),
                        systemMonotonicClock(),
                        parent)
{
}

TailnetController::TailnetController(std::shared_ptr<TailnetBackend> backend,
                                     const AppSettings& settings,
                                     const EngineTimings& timings,
                                     MonotonicClock clock,
                                     QObject *parent)
    : QObject(parent)
    , m_backend(std::move(backend))
    , m_settings(settings)
    , m_timings(timings)
    , m_clock(std::move(clock))
    , m_available(m_backend && m_backend->isAvailable())
    , m_poller(m_available
                   ? ConvergencePoller::StatusFetcher([this](std::function<void(const StatusProbe&)> done) {
                         fetchForPoller(std::move(done));
                     })
                   : ConvergencePoller::StatusFetcher(),
               m_timings, m_clock)
    , m_reconciler(m_available
                       ? ExitNodeReconciler::CommandSubmitter([this](const std::optional<QString>& argument,
                                                                     std::function<void()> onSuccess,
                                                                     std::function<void(const QString&)> onFailure) {
                             submitExitNode(argument, std::move(onSuccess), std::move(onFailure));
                         })
                       : ExitNodeReconciler::CommandSubmitter())
    , m_debouncer(m_timings, m_clock)
    , m_publicIp(settings.publicIpTtlSec, m_clock)
{
    initialize();
}

TailnetController::~TailnetController()
{
    m_refreshTimer.stop();
    m_dispatcher.waitForDone();
}

void TailnetController::initialize()
{
    connect(&m_poller, &ConvergencePoller::systemLog, this, &TailnetController::appendSystemLog);
    connect(&m_poller, &ConvergencePoller::finished, this, &TailnetController::finishTransition);
    connect(&m_reconciler, &ExitNodeReconciler::systemLog, this, &TailnetController::appendSystemLog);
    connect(&m_reconciler, &ExitNodeReconciler::stateChanged, this, &TailnetController::exitNodeChanged);
    connect(&m_reconciler, &ExitNodeReconciler::commandSucceeded, this, &TailnetController::onExitNodeCommandSucceeded);
    connect(&m_reconciler, &ExitNodeReconciler::commandFailed, this, &TailnetController::onExitNodeCommandFailed);
    connect(&m_debouncer, &InteractionDebouncer::refreshRequested, this, [this]() {
        refreshStatus(false);
    });
    connect(&m_publicIp, &PublicIpFetcher::systemLog, this, &TailnetController::appendSystemLog);
    connect(&m_publicIp, &PublicIpFetcher::changed, this, &TailnetController::publicIpChanged);

    m_reconciler.setLastAppliedTarget(m_settings.lastExitNode);
    m_selectedExitNode = m_settings.lastExitNode;

    if (!m_available) {
        m_connectionState = ConnectionState::Unavailable;
        m_lastError = unavailableMessage();
        appendSystemLog(QStringLiteral("[Tailnet] %1").arg(unavailableMessage()));
        return;
    }

    m_refreshTimer.setInterval(m_timings.refreshIntervalMs);
    connect(&m_refreshTimer, &QTimer::timeout, this, [this]() {
        refreshStatus(false);
    });
    m_refreshTimer.start();

    QTimer::singleShot(0, this, [this]() {
        refreshStatus(true);
        refreshPublicIp(false);
    });
}

ConnectionState TailnetController::connectionState() const
{
    return m_connectionState;
}

bool TailnetController::connected() const
{
    return m_connectionState == ConnectionState::Connected;
}

bool TailnetController::busy() const
{
    return m_connectionState == ConnectionState::Connecting
        || m_connectionState == ConnectionState::Disconnecting;
}

bool TailnetController::available() const
{
    return m_available;
}

QString TailnetController::statusText() const
{
    switch (m_connectionState) {
    case ConnectionState::Unavailable:
        return QStringLiteral("Tailscale unavailable");
    case ConnectionState::Connecting:
        return QStringLiteral("Connecting...");
    case ConnectionState::Disconnecting:
        return QStringLiteral("Disconnecting...");
    case ConnectionState::Error:
        return QStringLiteral("Error: %1").arg(m_lastError);
    case ConnectionState::Connected:
    case ConnectionState::Disconnected:
        break;
    }

    if (!m_lastStatus.has_value()) {
        return connected() ? QStringLiteral("Connected") : QStringLiteral("Disconnected");
    }

    QString text = QStringLiteral("%1 | Connected: %2")
        .arg(m_lastStatus->backendState.isEmpty() ? QStringLiteral("Unknown") : m_lastStatus->backendState,
             m_lastStatus->connected() ? QStringLiteral("yes") : QStringLiteral("no"));
    if (m_lastStatus->self.has_value() && !m_lastStatus->self->addresses.isEmpty()) {
        text += QStringLiteral(" | %1").arg(m_lastStatus->self->addresses.first());
    }
    return text;
}

bool TailnetController::exitNodeEnabled() const
{
    return m_reconciler.displayedEnabled();
}

QString TailnetController::selectedExitNode() const
{
    const std::optional<QString> displayed = m_reconciler.displayedTarget();
    if (displayed.has_value()) {
        return displayed.value();
    }
    return m_selectedExitNode;
}

bool TailnetController::exitNodeBusy() const
{
    return m_reconciler.busy();
}

QList<ExitNodeOption> TailnetController::exitNodeOptions() const
{
    return m_reconciler.options();
}

std::optional<TailnetStatus> TailnetController::lastStatus() const
{
    return m_lastStatus;
}

QString TailnetController::publicIpText() const
{
    const std::optional<PublicIpInfo> info = m_publicIp.info();
    if (!info.has_value()) {
        return m_publicIp.fetching() ? QStringLiteral("Checking public IP...") : QStringLiteral("Public IP unknown");
    }

    const QString details = info->summary();
    if (details.isEmpty()) {
        return info->ip;
    }
    return QStringLiteral("%1 (%2)").arg(info->ip, details);
}

QString TailnetController::lastError() const
{
    return m_lastError;
}

QString TailnetController::latestLogLine() const
{
    return m_latestLogLine;
}

QStringList TailnetController::recentLogs() const
{
    return m_recentLogs;
}

bool TailnetController::loggingEnabled() const
{
    return m_settings.loggingEnabled;
}

void TailnetController::setLoggingEnabled(bool enabled)
{
    if (m_settings.loggingEnabled == enabled) {
        return;
    }

    m_settings.loggingEnabled = enabled;
    if (!enabled) {
        m_recentLogs.clear();
        m_latestLogLine.clear();
        emit latestLogLineChanged();
        emit logsChanged();
    }
    emit loggingEnabledChanged();
    saveSettings();
}

void TailnetController::connectTailnet()
{
    if (!m_available) {
        reportUnavailable();
        return;
    }
    if (busy()) {
        return;
    }
    if (connected()) {
        appendSystemLog(QStringLiteral("[Tailnet] Already connected."));
        return;
    }

    setLastError(QString());
    setConnectionState(ConnectionState::Connecting);
    appendSystemLog(QStringLiteral("[Tailnet] Bringing tailnet up."));
    emit statusMessage(QStringLiteral("Connecting..."), kInfoMessageMs);

    const std::shared_ptr<TailnetBackend> backend = m_backend;
    const QStringList upArguments = m_settings.upArguments;
    m_dispatcher.submit<bool>(
        [backend, upArguments](QString *errorMessage) -> std::optional<bool> {
            if (!backend->up(upArguments, errorMessage)) {
                return std::nullopt;
            }
            return true;
        },
        [this](const bool&) {
            m_poller.start(true, false);
        },
        [this](const QString& error) {
            PollOutcome outcome;
            outcome.errorKind = TailnetErrorKind::CommandFailed;
            outcome.error = error;
            if (m_poller.isPolling()) {
                m_poller.abort(outcome.errorKind, error);
                return;
            }
            finishTransition(outcome);
        });
}

void TailnetController::disconnectTailnet()
{
    if (!m_available) {
        reportUnavailable();
        return;
    }
    if (busy()) {
        return;
    }
    if (m_connectionState == ConnectionState::Disconnected) {
        appendSystemLog(QStringLiteral("[Tailnet] Already disconnected."));
        return;
    }

    setLastError(QString());
    setConnectionState(ConnectionState::Disconnecting);
    appendSystemLog(QStringLiteral("[Tailnet] Bringing tailnet down."));
    emit statusMessage(QStringLiteral("Disconnecting..."), kInfoMessageMs);

    const std::shared_ptr<TailnetBackend> backend = m_backend;
    m_dispatcher.submit<bool>(
        [backend](QString *errorMessage) -> std::optional<bool> {
            if (!backend->down(errorMessage)) {
                return std::nullopt;
            }
            return true;
        },
        [this](const bool&) {
            m_poller.start(false, true);
        },
        [this](const QString& error) {
            PollOutcome outcome;
            outcome.errorKind = TailnetErrorKind::CommandFailed;
            outcome.error = error;
            if (m_poller.isPolling()) {
                m_poller.abort(outcome.errorKind, error);
                return;
            }
            finishTransition(outcome);
        });
}

void TailnetController::toggleConnection()
{
    if (busy()) {
        return;
    }
    if (connected()) {
        disconnectTailnet();
        return;
    }
    connectTailnet();
}

void TailnetController::setExitNodeEnabled(bool enabled)
{
    if (!m_available) {
        reportUnavailable();
        emit exitNodeChanged();
        return;
    }
    if (busy()) {
        appendSystemLog(QStringLiteral("[ExitNode] Connection change in progress, request ignored."));
        emit exitNodeChanged();
        return;
    }

    std::optional<QString> target;
    if (enabled && !m_selectedExitNode.isEmpty()) {
        target = m_selectedExitNode;
    }

    QString error;
    if (!m_reconciler.request(enabled, target, &error)) {
        appendSystemLog(QStringLiteral("[ExitNode] %1").arg(error));
        reportError(error);
        emit exitNodeChanged();
        return;
    }
    setLastError(QString());
}

void TailnetController::selectExitNode(const QString& argument)
{
    const QString trimmed = argument.trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    const QString canonical = m_reconciler.aliasMap().value(trimmed, trimmed);
    m_selectedExitNode = canonical;

    if (!m_reconciler.displayedEnabled()) {
        emit exitNodeChanged();
        return;
    }
    if (m_reconciler.displayedTarget() == std::optional<QString>(canonical)) {
        return;
    }
    setExitNodeEnabled(true);
}

void TailnetController::refreshStatus(bool force)
{
    if (!m_available) {
        return;
    }
    if (m_refreshInFlight) {
        if (force) {
            m_refreshQueued = true;
        }
        return;
    }
    // The poller refreshes on its own cadence.
    if (!force && m_poller.isPolling()) {
        return;
    }

    m_refreshInFlight = true;
    const std::shared_ptr<TailnetBackend> backend = m_backend;
    m_dispatcher.submit<TailnetStatus>(
        [backend](QString *errorMessage) {
            return backend->status(errorMessage);
        },
        [this](const TailnetStatus& status) {
            m_refreshInFlight = false;
            applyStatus(status);
            if (std::exchange(m_refreshQueued, false)) {
                refreshStatus(true);
            }
        },
        [this](const QString& error) {
            m_refreshInFlight = false;
            m_debouncer.markRefreshed();
            appendSystemLog(QStringLiteral("[Tailnet] Status refresh failed: %1").arg(error));
            if (std::exchange(m_refreshQueued, false)) {
                refreshStatus(true);
            }
        });
}

void TailnetController::notifyInteraction()
{
    if (!m_available) {
        return;
    }
    m_debouncer.notify();
}

void TailnetController::refreshPublicIp(bool force)
{
    if (!m_settings.publicIpEnabled) {
        return;
    }
    m_publicIp.fetch(force);
}

void TailnetController::applyStatus(const TailnetStatus& status)
{
    m_lastStatus = status;
    m_reconciler.reconcile(status);
    m_debouncer.markRefreshed();

    // Transitions own the connection state until the poller finishes.
    if (!busy()) {
        setConnectionState(status.connected() ? ConnectionState::Connected : ConnectionState::Disconnected);
    }
    emit statusChanged();
}

void TailnetController::fetchForPoller(std::function<void(const StatusProbe&)> done)
{
    const std::shared_ptr<TailnetBackend> backend = m_backend;
    m_dispatcher.submit<StatusProbe>(
        [backend](QString *) -> std::optional<StatusProbe> {
            StatusProbe probe;
            TailnetErrorKind kind = TailnetErrorKind::None;
            probe.status = backend->status(&probe.error, &kind);
            if (!probe.status.has_value()) {
                probe.errorKind = (kind == TailnetErrorKind::None) ? TailnetErrorKind::TransientStatus : kind;
            }
            return probe;
        },
        [this, done](const StatusProbe& probe) {
            if (probe.status.has_value()) {
                applyStatus(probe.status.value());
            }
            done(probe);
        },
        [done](const QString& error) {
            StatusProbe probe;
            probe.errorKind = TailnetErrorKind::TransientStatus;
            probe.error = error;
            done(probe);
        });
}

void TailnetController::submitExitNode(const std::optional<QString>& argument,
                                       std::function<void()> onSuccess,
                                       std::function<void(const QString&)> onFailure)
{
    const std::shared_ptr<TailnetBackend> backend = m_backend;
    m_dispatcher.submit<bool>(
        [backend, argument](QString *errorMessage) -> std::optional<bool> {
            if (!backend->setExitNode(argument, errorMessage)) {
                return std::nullopt;
            }
            return true;
        },
        [onSuccess = std::move(onSuccess)](const bool&) {
            onSuccess();
        },
        std::move(onFailure));
}

void TailnetController::finishTransition(const PollOutcome& outcome)
{
    if (outcome.success) {
        setLastError(QString());
        setConnectionState(outcome.connected ? ConnectionState::Connected : ConnectionState::Disconnected);
        const QString message = outcome.connected ? QStringLiteral("Connected") : QStringLiteral("Disconnected");
        appendSystemLog(QStringLiteral("[Tailnet] %1.").arg(message));
        emit statusMessage(message, kInfoMessageMs);
    } else {
        setConnectionState(outcome.errorKind == TailnetErrorKind::Unavailable
                               ? ConnectionState::Unavailable
                               : ConnectionState::Error);
        appendSystemLog(QStringLiteral("[Tailnet] Transition failed: %1").arg(outcome.error));
        reportError(outcome.error);
    }

    refreshStatus(true);
    refreshPublicIp(true);
}

void TailnetController::reportUnavailable()
{
    reportError(unavailableMessage());
}

void TailnetController::reportError(const QString& message)
{
    setLastError(message);
    emit statusChanged();
    emit statusMessage(message, kErrorMessageMs);
}

void TailnetController::onExitNodeCommandSucceeded(bool enabled, const QString& target)
{
    if (enabled) {
        m_selectedExitNode = target;
        m_settings.lastExitNode = target;
        saveSettings();
        emit statusMessage(QStringLiteral("Exit node set to %1").arg(target), kInfoMessageMs);
    } else {
        emit statusMessage(QStringLiteral("Exit node disabled"), kInfoMessageMs);
    }

    refreshStatus(true);
    refreshPublicIp(true);
}

void TailnetController::onExitNodeCommandFailed(const QString& error)
{
    reportError(error);
    refreshStatus(true);
}

void TailnetController::setConnectionState(ConnectionState state)
{
    if (m_connectionState == state) {
        return;
    }

    m_connectionState = state;
    emit connectionStateChanged();
    emit statusChanged();
}

void TailnetController::setLastError(const QString& error)
{
    if (m_lastError == error) {
        return;
    }

    m_lastError = error;
    emit lastErrorChanged();
}

void TailnetController::appendSystemLog(const QString& message)
{
    if (!m_settings.loggingEnabled) {
        return;
    }
    const bool duplicate = !m_recentLogs.isEmpty() && m_recentLogs.last() == message;
    if (duplicate) {
        return;
    }

    m_latestLogLine = message;
    emit latestLogLineChanged();

    m_recentLogs.append(message);
    while (m_recentLogs.size() > kMaxLogLines) {
        m_recentLogs.removeFirst();
    }
    emit logsChanged();
}

void TailnetController::saveSettings() const
{
    if (!m_persistSettings) {
        return;
    }
    m_settings.save();
}
