#include "appsettings.hpp"

#include <QSettings>

AppSettings AppSettings::load()
{
    QSettings settings;
    return load(settings);
}

AppSettings AppSettings::load(QSettings& settings)
{
    AppSettings out;
    const QString executable = settings.value(QStringLiteral("tailscale/executable")).toString().trimmed();
    if (!executable.isEmpty()) {
        out.tailscaleExecutable = executable;
    }
    out.upArguments = settings.value(QStringLiteral("tailscale/upArguments")).toStringList();
    out.allowSudo = settings.value(QStringLiteral("tailscale/allowSudo"), true).toBool();

    const int interval = settings.value(QStringLiteral("refresh/intervalMs"), 5000).toInt();
    out.refreshIntervalMs = interval > 0 ? interval : 5000;

    out.loggingEnabled = settings.value(QStringLiteral("logs/enabled"), true).toBool();
    out.lastExitNode = settings.value(QStringLiteral("exitNode/lastChoice")).toString().trimmed();
    out.publicIpEnabled = settings.value(QStringLiteral("publicIp/enabled"), true).toBool();
    out.publicIpTtlSec = qMax(0, settings.value(QStringLiteral("publicIp/ttlSec"), 180).toInt());
    return out;
}

void AppSettings::save() const
{
    QSettings settings;
    save(settings);
}

void AppSettings::save(QSettings& settings) const
{
    settings.setValue(QStringLiteral("tailscale/executable"), tailscaleExecutable);
    settings.setValue(QStringLiteral("tailscale/upArguments"), upArguments);
    settings.setValue(QStringLiteral("tailscale/allowSudo"), allowSudo);
    settings.setValue(QStringLiteral("refresh/intervalMs"), refreshIntervalMs);
    settings.setValue(QStringLiteral("logs/enabled"), loggingEnabled);
    settings.setValue(QStringLiteral("exitNode/lastChoice"), lastExitNode);
    settings.setValue(QStringLiteral("publicIp/enabled"), publicIpEnabled);
    settings.setValue(QStringLiteral("publicIp/ttlSec"), publicIpTtlSec);
}
