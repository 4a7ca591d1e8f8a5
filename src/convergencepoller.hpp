/*!
 * @file        convergencepoller.hpp
 * @brief       Waits for the backend to reach a requested connection state.
 *
 * @details
 * After `up`/`down` returns, the daemon may need several seconds before a
 * status snapshot reflects the change. The poller re-fetches status on a
 * fixed interval until the snapshot matches the target, a disconnect
 * heuristic fires, or the direction-specific timeout elapses. Exactly one
 * session is active at a time; starting a new one supersedes the old one
 * and any late result of the old session is dropped.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_CONVERGENCEPOLLER_HPP
#define TAILCONTROL_CONVERGENCEPOLLER_HPP

#include "connectionstate.hpp"
#include "enginetimings.hpp"
#include "monotonicclock.hpp"
#include "tailnetstatus.hpp"

#include <QObject>
#include <QString>
#include <QTimer>

#include <functional>
#include <optional>

/**
 * @struct StatusProbe
 * @brief Result of one status fetch as seen by the poller.
 */
struct StatusProbe {
    std::optional<TailnetStatus> status;                //!< Snapshot on success.
    TailnetErrorKind errorKind = TailnetErrorKind::None; //!< Failure class otherwise.
    QString error;                                       //!< Failure message.
};

/**
 * @struct PollSession
 * @brief Book-keeping of the active convergence wait.
 */
struct PollSession {
    quint64 id = 0;                           //!< Identity used to reject stale results.
    bool targetConnected = false;             //!< Desired `connected` value.
    qint64 startedAtMs = 0;                   //!< Session start.
    std::optional<qint64> downObservedAtMs;   //!< Reference for the disconnect grace period.
};

/**
 * @enum PollVerdict
 * @brief Decision taken for one probe.
 */
enum class PollVerdict
{
    Continue,  //!< Keep polling.
    Converged, //!< Target observed (or inferred).
    TimedOut,  //!< Timeout elapsed.
    Aborted    //!< No collaborator available.
};

/**
 * @struct PollOutcome
 * @brief Terminal result delivered through `finished`.
 */
struct PollOutcome {
    bool success = false;                                //!< Converged.
    bool connected = false;                              //!< Confirmed state on success.
    TailnetErrorKind errorKind = TailnetErrorKind::None; //!< Failure class otherwise.
    QString error;                                       //!< Failure message.
};

/**
 * @class ConvergencePoller
 * @brief Idle/Polling state machine with a single finish signal.
 */
class ConvergencePoller : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Asynchronous status fetch.
     *
     * @details
     * Receives a completion callback that must be invoked exactly once on
     * the poller's thread.
     */
    using StatusFetcher = std::function<void(std::function<void(const StatusProbe&)>)>;

    /**
     * @brief Construct poller.
     * @param fetcher Status source; an empty fetcher aborts every session.
     * @param timings Interval and timeout table.
     * @param clock Monotonic time source.
     * @param parent Optional QObject parent.
     */
    explicit ConvergencePoller(StatusFetcher fetcher,
                               const EngineTimings& timings = {},
                               MonotonicClock clock = systemMonotonicClock(),
                               QObject *parent = nullptr);

    /**
     * @brief Start a new session, superseding the current one.
     * @param targetConnected Desired `connected` value.
     * @param downStartedNow Record now as the disconnect reference.
     */
    void start(bool targetConnected, bool downStartedNow);

    /**
     * @brief Terminate the active session with a failure.
     * @param kind Failure class.
     * @param message Failure message.
     */
    void abort(TailnetErrorKind kind, const QString& message);

    /**
     * @brief Whether a session is active.
     * @return True while polling.
     */
    bool isPolling() const;

    /**
     * @brief Active session.
     * @return Session or empty optional when idle.
     */
    std::optional<PollSession> session() const;

    /**
     * @brief Pure decision function for one probe.
     * @param session Active session.
     * @param probe Fetch result.
     * @param nowMs Current monotonic time.
     * @param timings Interval and timeout table.
     * @return Verdict.
     */
    static PollVerdict evaluate(const PollSession& session,
                                const StatusProbe& probe,
                                qint64 nowMs,
                                const EngineTimings& timings);

    /**
     * @brief Timeout applicable to a direction.
     * @param targetConnected Desired `connected` value.
     * @param timings Interval and timeout table.
     * @return Timeout in milliseconds.
     */
    static qint64 timeoutFor(bool targetConnected, const EngineTimings& timings);

    //! Message used for convergence timeouts.
    static QString timeoutMessage();

signals:
    //! Emitted once per session that reaches a terminal state.
    void finished(const PollOutcome& outcome);
    //! Emitted for diagnostic log lines.
    void systemLog(const QString& line);

private slots:
    //! Periodic tick.
    void onTick();

private:
    /**
     * @brief Evaluate a probe if it belongs to the active session.
     * @param sessionId Session the probe was requested for.
     * @param probe Fetch result.
     */
    void handleProbe(quint64 sessionId, const StatusProbe& probe);

    /**
     * @brief Stop timer, go idle and emit the outcome.
     * @param outcome Terminal result.
     */
    void finish(const PollOutcome& outcome);

    StatusFetcher m_fetcher;              //!< Status source.
    EngineTimings m_timings;              //!< Interval and timeout table.
    MonotonicClock m_clock;               //!< Time source.
    QTimer m_timer;                       //!< Tick timer.
    std::optional<PollSession> m_session; //!< Active session.
    quint64 m_nextSessionId = 1;          //!< Monotonic session counter.
    bool m_fetchInFlight = false;         //!< A fetch for the active session is running.
};

#endif // TAILCONTROL_CONVERGENCEPOLLER_HPP
