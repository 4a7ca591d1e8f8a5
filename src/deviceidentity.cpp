#include "deviceidentity.hpp"

namespace {
const QString kHostnameKey = QStringLiteral("Hostname");
const QString kDnsNameKey = QStringLiteral("DNSName");

void appendUnique(QStringList& list, const QString& value)
{
    if (!value.isEmpty() && !list.contains(value)) {
        list.append(value);
    }
}
}

QSet<QString> DeviceIdentity::aliasesFor(const TailnetDevice& device)
{
    const QStringList ordered = orderedAliases(device);
    return QSet<QString>(ordered.cbegin(), ordered.cend());
}

QStringList DeviceIdentity::orderedAliases(const TailnetDevice& device)
{
    QStringList aliases;
    appendUnique(aliases, device.hostInfoValue(kHostnameKey).value_or(QString()));
    appendUnique(aliases, device.hostInfoValue(kDnsNameKey).value_or(QString()));
    appendUnique(aliases, device.name.value_or(QString()));
    for (const QString& address : device.addresses) {
        appendUnique(aliases, address);
    }
    appendUnique(aliases, device.id.value_or(QString()));
    return aliases;
}

std::optional<QString> DeviceIdentity::preferredArgument(const TailnetDevice& device)
{
    const QStringList ordered = orderedAliases(device);
    if (ordered.isEmpty()) {
        return std::nullopt;
    }
    return ordered.constFirst();
}

AliasMap DeviceIdentity::buildAliasMap(const QList<TailnetDevice>& devices)
{
    AliasMap map;
    for (const TailnetDevice& device : devices) {
        const std::optional<QString> argument = preferredArgument(device);
        if (!argument.has_value()) {
            continue;
        }
        for (const QString& alias : orderedAliases(device)) {
            if (!map.contains(alias)) {
                map.insert(alias, *argument);
            }
        }
    }
    return map;
}

std::optional<QString> DeviceIdentity::resolveArgument(const AliasMap& aliases, const TailnetDevice& device)
{
    for (const QString& alias : orderedAliases(device)) {
        const auto it = aliases.constFind(alias);
        if (it != aliases.constEnd()) {
            return it.value();
        }
    }
    return preferredArgument(device);
}

QSet<QString> DeviceIdentity::aliasesOfArgument(const AliasMap& aliases, const QString& argument)
{
    QSet<QString> out;
    out.insert(argument);
    for (auto it = aliases.constBegin(); it != aliases.constEnd(); ++it) {
        if (it.value() == argument) {
            out.insert(it.key());
        }
    }
    return out;
}
