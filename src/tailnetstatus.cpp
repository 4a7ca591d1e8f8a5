#include "tailnetstatus.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>

#include <utility>

namespace {
QString firstString(const QJsonObject& object, std::initializer_list<const char *> keys)
{
    for (const char *key : keys) {
        const QJsonValue value = object.value(QLatin1String(key));
        if (value.isString() && !value.toString().trimmed().isEmpty()) {
            return value.toString().trimmed();
        }
    }
    return {};
}

QHash<QString, QString> flattenHostInfo(const QJsonObject& hostInfo)
{
    QHash<QString, QString> out;
    for (auto it = hostInfo.constBegin(); it != hostInfo.constEnd(); ++it) {
        const QJsonValue value = it.value();
        if (value.isString()) {
            out.insert(it.key(), value.toString());
        } else if (value.isDouble()) {
            out.insert(it.key(), QString::number(value.toDouble()));
        } else if (value.isBool()) {
            out.insert(it.key(), value.toBool() ? QStringLiteral("true") : QStringLiteral("false"));
        }
    }
    return out;
}

TailnetDevice parseDevice(const QString& key, const QJsonObject& value)
{
    QJsonObject hostInfo = value.value(QStringLiteral("Hostinfo")).toObject();
    if (hostInfo.isEmpty()) {
        hostInfo = value.value(QStringLiteral("HostInfo")).toObject();
    }

    TailnetDevice device;
    device.hostInfo = flattenHostInfo(hostInfo);

    const QString dnsName = value.value(QStringLiteral("DNSName")).toString().trimmed();
    if (!dnsName.isEmpty() && !device.hostInfo.contains(QStringLiteral("DNSName"))) {
        device.hostInfo.insert(QStringLiteral("DNSName"), dnsName);
    }

    QString rawName = hostInfo.value(QStringLiteral("Hostname")).toString().trimmed();
    if (rawName.isEmpty()) {
        rawName = dnsName;
    }
    if (rawName.isEmpty()) {
        rawName = key;
    }
    const QString name = TailnetStatus::shortHostname(rawName);
    if (!name.isEmpty()) {
        device.name = name;
    }

    const QJsonValue addresses = value.value(QStringLiteral("TailscaleIPs"));
    if (addresses.isString()) {
        const QString text = addresses.toString().trimmed();
        if (!text.isEmpty()) {
            device.addresses.append(text);
        }
    } else {
        for (const QJsonValue& address : addresses.toArray()) {
            const QString text = address.toString().trimmed();
            if (!text.isEmpty()) {
                device.addresses.append(text);
            }
        }
    }

    QString os = firstString(hostInfo, {"OS", "OSVersion", "OperatingSystem", "OSName"});
    if (os.isEmpty()) {
        os = firstString(value, {"OS", "OSVersion"});
    }
    if (!os.isEmpty()) {
        device.os = os;
    }

    device.exitNodeOption = value.value(QStringLiteral("ExitNodeOption")).toBool(false)
        || value.value(QStringLiteral("ExitNodeAllowed")).toBool(false);
    device.activeExitNode = value.value(QStringLiteral("ExitNode")).toBool(false);

    // Only an explicit `false` marks a peer offline.
    const QJsonValue online = value.value(QStringLiteral("Online"));
    device.online = !(online.isBool() && !online.toBool());

    QString id = firstString(value, {"ID", "Id"});
    if (id.isEmpty()) {
        id = key;
    }
    if (!id.isEmpty()) {
        device.id = id;
    }
    return device;
}

QStringList collectExitNodeIds(const QJsonObject& exitStatus)
{
    QStringList ids;
    for (const char *key : {"ExitNodeID", "ExitNodeId", "ID", "Id", "PeerID", "PeerId"}) {
        const QString value = exitStatus.value(QLatin1String(key)).toString();
        if (!value.isEmpty()) {
            ids.append(value);
        }
    }

    const QJsonObject nested = exitStatus.value(QStringLiteral("ExitNode")).toObject();
    for (const char *key : {"ID", "Id", "NodeID", "NodeId", "PeerID", "PeerId"}) {
        const QString value = nested.value(QLatin1String(key)).toString();
        if (!value.isEmpty()) {
            ids.append(value);
        }
    }

    QJsonArray list = exitStatus.value(QStringLiteral("ExitNodeIDs")).toArray();
    if (list.isEmpty()) {
        list = exitStatus.value(QStringLiteral("ExitNodeIds")).toArray();
    }
    for (const QJsonValue& item : list) {
        if (item.isString() && !item.toString().isEmpty()) {
            ids.append(item.toString());
        }
    }
    return ids;
}
}

std::optional<QString> TailnetDevice::hostInfoValue(const QString& key) const
{
    const QString value = hostInfo.value(key).trimmed();
    if (value.isEmpty()) {
        return std::nullopt;
    }
    return value;
}

QString TailnetDevice::displayLabel() const
{
    if (name.has_value() && !name->isEmpty()) {
        return *name;
    }
    for (const QString& address : addresses) {
        if (!address.isEmpty()) {
            return address;
        }
    }
    return id.value_or(QStringLiteral("?"));
}

bool TailnetStatus::connected() const
{
    return isRunningState(backendState) && self.has_value() && !self->addresses.isEmpty();
}

bool TailnetStatus::isRunningState(const QString& backendState)
{
    return backendState.compare(QLatin1String(kRunningState), Qt::CaseInsensitive) == 0;
}

QString TailnetStatus::shortHostname(const QString& fullName)
{
    const int dot = fullName.indexOf('.');
    if (dot <= 0) {
        return fullName;
    }
    return fullName.left(dot);
}

std::optional<TailnetStatus> TailnetStatus::fromJson(const QByteArray& json, QString *errorMessage)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            const QString detail = parseError.error != QJsonParseError::NoError
                ? parseError.errorString()
                : QStringLiteral("root is not an object");
            *errorMessage = QStringLiteral("Invalid status JSON: %1\n%2")
                .arg(detail, QString::fromUtf8(json.left(500)));
        }
        return std::nullopt;
    }
    return fromJson(doc.object());
}

TailnetStatus TailnetStatus::fromJson(const QJsonObject& root)
{
    TailnetStatus status;
    status.backendState = root.value(QStringLiteral("BackendState")).toString();

    const QJsonObject selfObject = root.value(QStringLiteral("Self")).toObject();
    if (!selfObject.isEmpty()) {
        QString selfKey = selfObject.value(QStringLiteral("ID")).toString();
        if (selfKey.isEmpty()) {
            selfKey = QStringLiteral("self");
        }
        status.self = parseDevice(selfKey, selfObject);
        status.devices.append(*status.self);
    }

    QJsonObject peers = root.value(QStringLiteral("Peer")).toObject();
    if (peers.isEmpty()) {
        peers = root.value(QStringLiteral("Peers")).toObject();
    }
    for (auto it = peers.constBegin(); it != peers.constEnd(); ++it) {
        status.devices.append(parseDevice(it.key(), it.value().toObject()));
    }

    QStringList activeIds;
    const QJsonObject exitStatus = root.value(QStringLiteral("ExitNodeStatus")).toObject();
    const QJsonValue active = exitStatus.value(QStringLiteral("Active"));
    if (!(active.isBool() && !active.toBool())) {
        activeIds = collectExitNodeIds(exitStatus);
    }

    int activeIndex = -1;
    for (const QString& candidate : activeIds) {
        for (int i = 0; i < status.devices.size(); ++i) {
            if (status.devices.at(i).id == candidate) {
                activeIndex = i;
                break;
            }
        }
        if (activeIndex >= 0) {
            status.devices[activeIndex].activeExitNode = true;
            break;
        }
    }

    if (activeIndex < 0) {
        for (int i = 0; i < status.devices.size(); ++i) {
            if (status.devices.at(i).activeExitNode) {
                activeIndex = i;
                break;
            }
        }
    }

    if (activeIndex >= 0) {
        status.activeExitNode = status.devices.at(activeIndex);
    }

    for (const TailnetDevice& device : std::as_const(status.devices)) {
        if (device.exitNodeOption) {
            status.exitNodes.append(device);
        }
    }

    return status;
}
