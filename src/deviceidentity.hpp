/*!
 * @file        deviceidentity.hpp
 * @brief       Device alias resolution for exit-node commands.
 *
 * @details
 * A device may be referred to by its name, stable id, any tailnet address,
 * or its advertised hostname/DNS name. `DeviceIdentity` computes these
 * aliases and maps each of them to the single canonical argument passed to
 * `tailscale set --exit-node=`.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_DEVICEIDENTITY_HPP
#define TAILCONTROL_DEVICEIDENTITY_HPP

#include "tailnetstatus.hpp"

#include <QHash>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include <optional>

//! Alias -> canonical exit-node argument. Rebuilt for every snapshot.
using AliasMap = QHash<QString, QString>;

/**
 * @class DeviceIdentity
 * @brief Stateless helpers bridging snapshot identities and command arguments.
 */
class DeviceIdentity
{
public:
    /**
     * @brief All identifiers a device is known by.
     * @param device Snapshot device.
     * @return Name, id, non-empty addresses, `Hostname` and `DNSName`.
     */
    static QSet<QString> aliasesFor(const TailnetDevice& device);

    /**
     * @brief Aliases in argument-priority order.
     * @param device Snapshot device.
     * @return `Hostname`, `DNSName`, name, addresses, id (no duplicates).
     */
    static QStringList orderedAliases(const TailnetDevice& device);

    /**
     * @brief Canonical argument for the exit-node command.
     * @param device Snapshot device.
     * @return `Hostname`, else `DNSName`, else name, else first address,
     *         else id; empty optional when the device has none.
     */
    static std::optional<QString> preferredArgument(const TailnetDevice& device);

    /**
     * @brief Build alias lookup for eligible devices.
     *
     * @details
     * Every alias of every device that has a preferred argument maps to that
     * argument. When two devices share an alias the first device in
     * iteration order keeps it.
     *
     * @param devices Eligible exit-node devices.
     * @return Alias map.
     */
    static AliasMap buildAliasMap(const QList<TailnetDevice>& devices);

    /**
     * @brief Resolve the canonical argument of a device.
     * @param aliases Alias map of the current snapshot.
     * @param device Device to resolve.
     * @return First alias hit in priority order, else `preferredArgument`.
     */
    static std::optional<QString> resolveArgument(const AliasMap& aliases, const TailnetDevice& device);

    /**
     * @brief Every alias that resolves to a canonical argument.
     * @param aliases Alias map of the current snapshot.
     * @param argument Canonical argument.
     * @return Alias set including the argument itself.
     */
    static QSet<QString> aliasesOfArgument(const AliasMap& aliases, const QString& argument);
};

#endif // TAILCONTROL_DEVICEIDENTITY_HPP
