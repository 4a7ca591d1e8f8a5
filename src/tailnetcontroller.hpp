/*!
 * @file        tailnetcontroller.hpp
 * @brief       Main backend controller for TailControl.
 *
 * @details
 * Owns every piece of reconciliation state and exposes it to the control
 * surface:
 * - connect/disconnect with convergence polling
 * - exit-node selection with pending-intent confirmation
 * - periodic and interaction-triggered status refresh
 * - public IP lookup after transitions
 * - bounded diagnostic log
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_TAILNETCONTROLLER_HPP
#define TAILCONTROL_TAILNETCONTROLLER_HPP

#include "appsettings.hpp"
#include "commanddispatcher.hpp"
#include "connectionstate.hpp"
#include "convergencepoller.hpp"
#include "enginetimings.hpp"
#include "exitnodereconciler.hpp"
#include "interactiondebouncer.hpp"
#include "monotonicclock.hpp"
#include "publicipfetcher.hpp"
#include "tailnetbackend.hpp"
#include "tailnetstatus.hpp"

#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <memory>
#include <optional>

/**
 * @class TailnetController
 * @brief Central backend controller used by the control surface.
 *
 * @details
 * All state lives on the thread that owns the controller. Blocking
 * collaborator calls run on the dispatcher's workers and report back
 * through queued callbacks.
 */
class TailnetController : public QObject
{
    Q_OBJECT

    Q_PROPERTY(TailControl::ConnectionState connectionState READ connectionState NOTIFY connectionStateChanged)
    Q_PROPERTY(bool connected READ connected NOTIFY connectionStateChanged)
    Q_PROPERTY(bool busy READ busy NOTIFY connectionStateChanged)
    Q_PROPERTY(bool available READ available CONSTANT)
    Q_PROPERTY(QString statusText READ statusText NOTIFY statusChanged)

    Q_PROPERTY(bool exitNodeEnabled READ exitNodeEnabled NOTIFY exitNodeChanged)
    Q_PROPERTY(QString selectedExitNode READ selectedExitNode NOTIFY exitNodeChanged)
    Q_PROPERTY(bool exitNodeBusy READ exitNodeBusy NOTIFY exitNodeChanged)

    Q_PROPERTY(QString publicIpText READ publicIpText NOTIFY publicIpChanged)

    Q_PROPERTY(QString lastError READ lastError NOTIFY lastErrorChanged)
    Q_PROPERTY(QString latestLogLine READ latestLogLine NOTIFY latestLogLineChanged)
    Q_PROPERTY(QStringList recentLogs READ recentLogs NOTIFY logsChanged)
    Q_PROPERTY(bool loggingEnabled READ loggingEnabled WRITE setLoggingEnabled NOTIFY loggingEnabledChanged)

public:
    /**
     * @brief Construct controller from stored settings and the tailscale CLI.
     * @param parent Optional QObject parent.
     */
    explicit TailnetController(QObject *parent = nullptr);

    /**
     * @brief Construct controller around an explicit collaborator.
     * @param backend Status/command collaborator; null means unavailable.
     * @param settings Configuration values.
     * @param timings Interval and timeout table.
     * @param clock Monotonic time source.
     * @param parent Optional QObject parent.
     */
    TailnetController(std::shared_ptr<TailnetBackend> backend,
                      const AppSettings& settings,
                      const EngineTimings& timings = {},
                      MonotonicClock clock = systemMonotonicClock(),
                      QObject *parent = nullptr);

    /**
     * @brief Stop timers and wait for running collaborator calls.
     */
    ~TailnetController() override;

    /**
     * @brief Current connection state.
     * @return Connection state value.
     */
    ConnectionState connectionState() const;

    /**
     * @brief Whether the tailnet is connected.
     * @return True in the Connected state.
     */
    bool connected() const;

    /**
     * @brief Whether a connect or disconnect transition is running.
     * @return True while Connecting or Disconnecting.
     */
    bool busy() const;

    /**
     * @brief Whether a collaborator was found at startup.
     * @return False in unavailable mode.
     */
    bool available() const;

    /**
     * @brief One-line status description.
     * @return Human readable status.
     */
    QString statusText() const;

    /**
     * @brief Toggle state for "use exit node".
     * @return Pending intent while unconfirmed, observed state otherwise.
     */
    bool exitNodeEnabled() const;

    /**
     * @brief Exit node shown as selected.
     * @return Canonical argument or empty string.
     */
    QString selectedExitNode() const;

    /**
     * @brief Whether an exit-node command is in flight.
     * @return Busy flag for egress controls.
     */
    bool exitNodeBusy() const;

    /**
     * @brief Eligible exit nodes of the latest snapshot.
     * @return Options in snapshot order.
     */
    QList<ExitNodeOption> exitNodeOptions() const;

    /**
     * @brief Latest status snapshot.
     * @return Snapshot or empty optional before the first refresh.
     */
    std::optional<TailnetStatus> lastStatus() const;

    /**
     * @brief Public IP line.
     * @return Address and details, or a placeholder.
     */
    QString publicIpText() const;

    QString lastError() const;
    QString latestLogLine() const;
    QStringList recentLogs() const;
    bool loggingEnabled() const;

    /**
     * @brief Enable or disable diagnostic log collection.
     * @param enabled New value.
     */
    void setLoggingEnabled(bool enabled);

    Q_INVOKABLE void connectTailnet();
    Q_INVOKABLE void disconnectTailnet();
    Q_INVOKABLE void toggleConnection();

    /**
     * @brief Turn exit-node routing on or off.
     * @param enabled True to route through an exit node.
     */
    Q_INVOKABLE void setExitNodeEnabled(bool enabled);

    /**
     * @brief Choose an exit node.
     * @param argument Canonical argument or any alias of the device.
     *
     * @details
     * Re-requests the egress when exit-node routing is on; otherwise the
     * choice is kept for the next enable.
     */
    Q_INVOKABLE void selectExitNode(const QString& argument);

    /**
     * @brief Fetch a status snapshot asynchronously.
     * @param force Also run while polling, queueing behind a running fetch.
     */
    Q_INVOKABLE void refreshStatus(bool force = false);

    /**
     * @brief Register a user interaction with the control surface.
     */
    Q_INVOKABLE void notifyInteraction();

    /**
     * @brief Look up the public IP.
     * @param force Ignore the cache.
     */
    Q_INVOKABLE void refreshPublicIp(bool force = false);

    //! Lines kept in `recentLogs`.
    static constexpr int kMaxLogLines = 200;
    //! Display time for informational status messages.
    static constexpr int kInfoMessageMs = 4000;
    //! Display time for error status messages.
    static constexpr int kErrorMessageMs = 10000;

signals:
    void connectionStateChanged();
    void statusChanged();
    void exitNodeChanged();
    void publicIpChanged();
    void lastErrorChanged();
    void latestLogLineChanged();
    void logsChanged();
    void loggingEnabledChanged();

    /**
     * @brief Transient message for the surface.
     * @param text Message.
     * @param timeoutMs Display time.
     */
    void statusMessage(const QString& text, int timeoutMs);

private:
    /**
     * @brief Construct around the tailscale CLI configured in settings.
     * @param settings Configuration values.
     * @param parent Optional QObject parent.
     */
    TailnetController(const AppSettings& settings, QObject *parent);

    //! Wire the components together and start refreshing.
    void initialize();

    /**
     * @brief Apply a snapshot to every consumer.
     * @param status Snapshot.
     */
    void applyStatus(const TailnetStatus& status);

    /**
     * @brief Asynchronous status fetch used by the poller.
     * @param done Completion callback.
     */
    void fetchForPoller(std::function<void(const StatusProbe&)> done);

    /**
     * @brief Submit an egress command for the reconciler.
     * @param argument Canonical argument or empty optional to clear.
     * @param onSuccess Success callback.
     * @param onFailure Failure callback.
     */
    void submitExitNode(const std::optional<QString>& argument,
                        std::function<void()> onSuccess,
                        std::function<void(const QString&)> onFailure);

    //! Terminal outcome of a connect/disconnect transition.
    void finishTransition(const PollOutcome& outcome);

    //! Surface the unavailable-mode failure.
    void reportUnavailable();

    /**
     * @brief Surface a failure to the user.
     * @param message Error text.
     */
    void reportError(const QString& message);

    void onExitNodeCommandSucceeded(bool enabled, const QString& target);
    void onExitNodeCommandFailed(const QString& error);

    void setConnectionState(ConnectionState state);
    void setLastError(const QString& error);
    void appendSystemLog(const QString& message);
    void saveSettings() const;

    std::shared_ptr<TailnetBackend> m_backend; //!< Status/command collaborator.
    AppSettings m_settings;                    //!< Configuration values.
    EngineTimings m_timings;                   //!< Interval and timeout table.
    MonotonicClock m_clock;                    //!< Time source.
    bool m_available = false;                  //!< Collaborator found.
    bool m_persistSettings = false;            //!< Write settings back.

    CommandDispatcher m_dispatcher;
    ConvergencePoller m_poller;
    ExitNodeReconciler m_reconciler;
    InteractionDebouncer m_debouncer;
    PublicIpFetcher m_publicIp;
    QTimer m_refreshTimer;

    ConnectionState m_connectionState = ConnectionState::Disconnected;
    std::optional<TailnetStatus> m_lastStatus;
    QString m_selectedExitNode;      //!< Choice kept while egress is off.
    bool m_refreshInFlight = false;  //!< Controller-initiated fetch running.
    bool m_refreshQueued = false;    //!< Forced refresh requested meanwhile.

    QString m_lastError;
    QString m_latestLogLine;
    QStringList m_recentLogs;
};

#endif // TAILCONTROL_TAILNETCONTROLLER_HPP
