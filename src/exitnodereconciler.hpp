/*!
 * @file        exitnodereconciler.hpp
 * @brief       Tracks the requested egress device until a snapshot confirms it.
 *
 * @details
 * `tailscale set --exit-node=` returns before the daemon reports the new
 * egress. The reconciler keeps the user's intent pending across that lag
 * and exposes the toggle state the control surface should display: the
 * intent while it is unconfirmed, the observed state otherwise. Snapshot
 * identities and command arguments are bridged through the alias map
 * produced by `DeviceIdentity`.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_EXITNODERECONCILER_HPP
#define TAILCONTROL_EXITNODERECONCILER_HPP

#include "deviceidentity.hpp"
#include "tailnetstatus.hpp"

#include <QList>
#include <QObject>
#include <QString>

#include <functional>
#include <optional>

/**
 * @struct ExitNodeIntent
 * @brief Egress selection requested by the user.
 */
struct ExitNodeIntent {
    bool enabled = false;          //!< Use an exit node at all.
    std::optional<QString> target; //!< Canonical argument when enabled.
};

/**
 * @struct ExitNodeOption
 * @brief One selectable egress device of the latest snapshot.
 */
struct ExitNodeOption {
    QString argument; //!< Canonical command argument.
    QString label;    //!< Display label.
    bool online = true; //!< Peer reachability.
    bool active = false; //!< Currently used as egress.
};

/**
 * @class ExitNodeReconciler
 * @brief Pending-intent bookkeeping for exit-node changes.
 */
class ExitNodeReconciler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Issues the egress command asynchronously.
     *
     * @details
     * Arguments: canonical argument (empty optional clears the egress),
     * success callback, failure callback. Exactly one callback must be
     * invoked on the reconciler's thread.
     */
    using CommandSubmitter = std::function<void(const std::optional<QString>&,
                                                std::function<void()>,
                                                std::function<void(const QString&)>)>;

    /**
     * @brief Construct reconciler.
     * @param submitter Command path used by `request`.
     * @param parent Optional QObject parent.
     */
    explicit ExitNodeReconciler(CommandSubmitter submitter, QObject *parent = nullptr);

    /**
     * @brief Record an intent and dispatch the matching command.
     * @param enable Use an exit node.
     * @param targetArgument Requested device; when empty and enabling, the
     *        last applied target (if still eligible) or the first eligible
     *        device is used.
     * @param errorMessage Optional output message when the request is refused.
     * @return True when a command was dispatched.
     */
    bool request(bool enable, const std::optional<QString>& targetArgument, QString *errorMessage = nullptr);

    /**
     * @brief Feed a new snapshot.
     * @param status Latest snapshot.
     */
    void reconcile(const TailnetStatus& status);

    /**
     * @brief Pick the device to use when enabling without explicit choice.
     * @param selected Explicit choice, if any.
     * @return Canonical argument or empty optional when nothing is eligible.
     */
    std::optional<QString> chooseTarget(const std::optional<QString>& selected) const;

    /**
     * @brief Toggle state the surface should show.
     * @return Intent while unconfirmed, observed state otherwise.
     */
    bool displayedEnabled() const;

    /**
     * @brief Device the surface should show as selected.
     * @return Intent target while unconfirmed, observed argument otherwise.
     */
    std::optional<QString> displayedTarget() const;

    /**
     * @brief Whether an egress command is in flight.
     * @return True until the command callback fired.
     */
    bool busy() const;

    /**
     * @brief Unconfirmed intent.
     * @return Intent or empty optional.
     */
    std::optional<ExitNodeIntent> pendingIntent() const;

    /**
     * @brief Whether the pending intent matches the latest snapshot.
     * @return False when no intent is pending.
     */
    bool intentSatisfied() const;

    /**
     * @brief Canonical argument of the observed egress device.
     * @return Argument or empty optional when no egress is active.
     */
    std::optional<QString> activeArgument() const;

    /**
     * @brief Alias map of the latest snapshot.
     * @return Alias -> argument map.
     */
    const AliasMap& aliasMap() const;

    /**
     * @brief Eligible devices of the latest snapshot.
     * @return Options in snapshot order.
     */
    QList<ExitNodeOption> options() const;

    /**
     * @brief Last target applied successfully.
     * @return Canonical argument, possibly empty.
     */
    QString lastAppliedTarget() const;

    /**
     * @brief Seed the last applied target (from settings).
     * @param argument Canonical argument.
     */
    void setLastAppliedTarget(const QString& argument);

signals:
    //! Displayed state, busy flag or options changed.
    void stateChanged();
    //! Command succeeded; confirmation still pending.
    void commandSucceeded(bool enabled, const QString& target);
    //! Command failed; intent discarded.
    void commandFailed(const QString& error);
    //! Emitted for diagnostic log lines.
    void systemLog(const QString& line);

private:
    /**
     * @brief Evaluate the pending intent against the latest snapshot.
     * @return True when confirmed.
     */
    bool evaluateIntent() const;

    //! Drop a confirmed intent when no command is running.
    void settleIntent();

    CommandSubmitter m_submitter;                 //!< Command path.
    std::optional<ExitNodeIntent> m_pending;      //!< Unconfirmed intent.
    quint64 m_requestId = 0;                      //!< Identity of the latest request.
    bool m_inFlight = false;                      //!< Command running.
    AliasMap m_aliases;                           //!< Latest alias map.
    QList<TailnetDevice> m_eligible;              //!< Latest eligible devices.
    std::optional<TailnetDevice> m_activeDevice;  //!< Latest egress device.
    std::optional<QString> m_activeArgument;      //!< Canonical argument of the egress.
    QString m_lastAppliedTarget;                  //!< Last successful target.
};

#endif // TAILCONTROL_EXITNODERECONCILER_HPP
