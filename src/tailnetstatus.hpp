/*!
 * @file        tailnetstatus.hpp
 * @brief       Tailnet device and status snapshot value types.
 *
 * @details
 * Defines `TailnetDevice` and `TailnetStatus`, the point-in-time view of
 * the local tailnet produced by `tailscale status --json`. Snapshots are
 * immutable values: every refresh builds a new one and replaces the old
 * one wholesale.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_TAILNETSTATUS_HPP
#define TAILCONTROL_TAILNETSTATUS_HPP

#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @struct TailnetDevice
 * @brief One node of the tailnet (self or peer).
 */
struct TailnetDevice {
    std::optional<QString> name;      //!< Short display name.
    QStringList addresses;            //!< Tailnet IPv4/IPv6 addresses.
    std::optional<QString> os;        //!< Operating system label.
    bool online = true;               //!< Peer reachability.
    bool exitNodeOption = false;      //!< Device may be used as egress.
    bool activeExitNode = false;      //!< Device is the current egress.
    QHash<QString, QString> hostInfo; //!< Host metadata (`Hostname`, `DNSName`, ...).
    std::optional<QString> id;        //!< Stable device id.

    /**
     * @brief Read one host metadata value.
     * @param key Metadata key.
     * @return Value or empty optional when missing/empty.
     */
    std::optional<QString> hostInfoValue(const QString& key) const;

    /**
     * @brief Build a label for list usage.
     * @return Name, else first address, else id.
     */
    QString displayLabel() const;
};

/**
 * @class TailnetStatus
 * @brief Point-in-time snapshot of backend state.
 *
 * @details
 * `connected()` is derived from the backend state and the self addresses;
 * it is never stored independently.
 */
class TailnetStatus
{
public:
    QString backendState;                        //!< Raw `BackendState` label.
    std::optional<TailnetDevice> self;           //!< Local device.
    QList<TailnetDevice> devices;                //!< Self first, then peers.
    QList<TailnetDevice> exitNodes;              //!< Devices eligible as egress.
    std::optional<TailnetDevice> activeExitNode; //!< Current egress device.

    /**
     * @brief Whether the local device is an active tailnet member.
     * @return True iff backend is running and self has an address.
     */
    bool connected() const;

    /**
     * @brief Case-insensitive check for the running label.
     * @param backendState Backend state label.
     * @return True when the label denotes a running backend.
     */
    static bool isRunningState(const QString& backendState);

    /**
     * @brief Parse `tailscale status --json` output.
     * @param json Raw process output.
     * @param errorMessage Optional output message on failure.
     * @return Parsed snapshot or empty optional.
     */
    static std::optional<TailnetStatus> fromJson(const QByteArray& json, QString *errorMessage = nullptr);

    /**
     * @brief Parse an already decoded status object.
     * @param root Status document root.
     * @return Parsed snapshot.
     */
    static TailnetStatus fromJson(const QJsonObject& root);

    /**
     * @brief Strip the tailnet suffix from a DNS name.
     * @param fullName Name such as `host.tail1234.ts.net`.
     * @return Text before the first dot.
     */
    static QString shortHostname(const QString& fullName);

    //! Backend state label meaning "up".
    static constexpr const char *kRunningState = "Running";
};

#endif // TAILCONTROL_TAILNETSTATUS_HPP
