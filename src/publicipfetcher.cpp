#include "publicipfetcher.hpp"

#include <QJsonDocument>
#include <QJsonValue>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QRegularExpression>

#include <utility>

namespace {
constexpr int kTransferTimeoutMs = 6000;

QString textValue(const QJsonObject& json, const QString& key)
{
    const QJsonValue value = json.value(key);
    if (value.isDouble()) {
        return QString::number(value.toInteger());
    }
    return value.toString().trimmed();
}
}

QString PublicIpInfo::summary() const
{
    QStringList parts;
    if (!org.isEmpty()) {
        parts.append(org);
    }
    if (!asn.isEmpty()) {
        const QStringList orgTokens = org.split(QLatin1Char(' '), Qt::SkipEmptyParts);
        if (!orgTokens.contains(asn)) {
            parts.append(QStringLiteral("ASN %1").arg(asn));
        }
    }

    QStringList location;
    if (!city.isEmpty()) {
        location.append(city);
    }
    if (!country.isEmpty()) {
        location.append(country);
    }
    if (!location.isEmpty()) {
        parts.append(location.join(QStringLiteral(", ")));
    }
    return parts.join(QStringLiteral(" | "));
}

PublicIpFetcher::PublicIpFetcher(int ttlSec, MonotonicClock clock, QObject *parent)
    : QObject(parent)
    , m_endpoints(defaultEndpoints())
    , m_clock(std::move(clock))
    , m_ttlSec(qMax(0, ttlSec))
{
}

void PublicIpFetcher::fetch(bool force)
{
    if (!m_reply.isNull()) {
        if (force) {
            m_forceQueued = true;
        }
        return;
    }

    if (!force && m_info.has_value() && m_cachedAtMs.has_value()
        && m_clock() - m_cachedAtMs.value() < static_cast<qint64>(m_ttlSec) * 1000) {
        return;
    }

    m_endpointIndex = 0;
    m_lastError.clear();
    requestCurrentEndpoint();
    emit changed();
}

std::optional<PublicIpInfo> PublicIpFetcher::info() const
{
    return m_info;
}

bool PublicIpFetcher::fetching() const
{
    return !m_reply.isNull();
}

void PublicIpFetcher::setEndpoints(const QList<Endpoint>& endpoints)
{
    if (!endpoints.isEmpty()) {
        m_endpoints = endpoints;
    }
}

QList<PublicIpFetcher::Endpoint> PublicIpFetcher::defaultEndpoints()
{
    return {
        {QUrl(QStringLiteral("https://ipinfo.io/json")), &PublicIpFetcher::parseIpinfo},
        {QUrl(QStringLiteral("https://ipapi.co/json")), &PublicIpFetcher::parseIpapi},
        {QUrl(QStringLiteral("https://ifconfig.co/json")), &PublicIpFetcher::parseIfconfig},
    };
}

void PublicIpFetcher::requestCurrentEndpoint()
{
    QNetworkRequest request(m_endpoints.at(m_endpointIndex).url);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setRawHeader("User-Agent", "TailControl/1.0");
    request.setRawHeader("Accept", "application/json");
    request.setTransferTimeout(kTransferTimeoutMs);

    QNetworkReply *reply = m_networkManager.get(request);
    m_reply = reply;
    connect(reply, &QNetworkReply::finished, this, &PublicIpFetcher::onReplyFinished);
}

void PublicIpFetcher::onReplyFinished()
{
    if (m_reply.isNull()) {
        return;
    }

    QNetworkReply *reply = m_reply;
    m_reply = nullptr;

    const bool hadError = (reply->error() != QNetworkReply::NoError);
    const QString networkError = reply->errorString().trimmed();
    const QByteArray payload = reply->readAll();
    reply->deleteLater();

    const Endpoint endpoint = m_endpoints.at(m_endpointIndex);

    std::optional<PublicIpInfo> parsed;
    if (hadError) {
        m_lastError = QStringLiteral("%1: %2").arg(endpoint.url.host(), networkError);
    } else {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            m_lastError = QStringLiteral("%1: invalid JSON response").arg(endpoint.url.host());
        } else {
            parsed = endpoint.parse(doc.object());
            if (!parsed.has_value()) {
                m_lastError = QStringLiteral("%1: response without an IP address").arg(endpoint.url.host());
            }
        }
    }

    if (parsed.has_value()) {
        m_info = parsed;
        m_cachedAtMs = m_clock();
        emit systemLog(QStringLiteral("[PublicIp] %1 (%2)").arg(parsed->ip, endpoint.url.host()));
        startQueuedLookup();
        emit changed();
        return;
    }

    ++m_endpointIndex;
    if (m_endpointIndex < m_endpoints.size()) {
        requestCurrentEndpoint();
        return;
    }

    emit systemLog(QStringLiteral("[PublicIp] Lookup failed: %1").arg(m_lastError));
    startQueuedLookup();
    emit changed();
}

void PublicIpFetcher::startQueuedLookup()
{
    if (!m_forceQueued) {
        return;
    }
    m_forceQueued = false;
    m_endpointIndex = 0;
    m_lastError.clear();
    requestCurrentEndpoint();
}

QString PublicIpFetcher::normalizeAsn(const QString& value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }

    static const QRegularExpression prefixed(QStringLiteral("^AS(\\d+)\\b"), QRegularExpression::CaseInsensitiveOption);
    const QRegularExpressionMatch match = prefixed.match(trimmed);
    if (match.hasMatch()) {
        return QStringLiteral("AS") + match.captured(1);
    }

    static const QRegularExpression digits(QStringLiteral("^\\d+$"));
    if (digits.match(trimmed).hasMatch()) {
        return QStringLiteral("AS") + trimmed;
    }
    return trimmed;
}

std::optional<PublicIpInfo> PublicIpFetcher::parseIpinfo(const QJsonObject& json)
{
    PublicIpInfo info;
    info.ip = textValue(json, QStringLiteral("ip"));
    if (info.ip.isEmpty()) {
        return std::nullopt;
    }

    // ipinfo reports "AS15169 Google LLC" in `org`.
    const QString org = textValue(json, QStringLiteral("org"));
    const int space = org.indexOf(QLatin1Char(' '));
    if (org.startsWith(QStringLiteral("AS"), Qt::CaseInsensitive) && space > 0) {
        info.asn = normalizeAsn(org.left(space));
        info.org = org.mid(space + 1).trimmed();
    } else {
        info.org = org;
    }
    info.city = textValue(json, QStringLiteral("city"));
    info.region = textValue(json, QStringLiteral("region"));
    info.country = textValue(json, QStringLiteral("country"));
    info.loc = textValue(json, QStringLiteral("loc"));
    return info;
}

std::optional<PublicIpInfo> PublicIpFetcher::parseIpapi(const QJsonObject& json)
{
    PublicIpInfo info;
    info.ip = textValue(json, QStringLiteral("ip"));
    if (info.ip.isEmpty()) {
        return std::nullopt;
    }

    info.org = textValue(json, QStringLiteral("org"));
    info.asn = normalizeAsn(textValue(json, QStringLiteral("asn")));
    info.city = textValue(json, QStringLiteral("city"));
    info.region = textValue(json, QStringLiteral("region"));
    info.country = textValue(json, QStringLiteral("country_name"));
    if (info.country.isEmpty()) {
        info.country = textValue(json, QStringLiteral("country"));
    }

    const QJsonValue latitude = json.value(QStringLiteral("latitude"));
    const QJsonValue longitude = json.value(QStringLiteral("longitude"));
    if (latitude.isDouble() && longitude.isDouble()) {
        info.loc = QStringLiteral("%1,%2").arg(latitude.toDouble()).arg(longitude.toDouble());
    }
    return info;
}

std::optional<PublicIpInfo> PublicIpFetcher::parseIfconfig(const QJsonObject& json)
{
    PublicIpInfo info;
    info.ip = textValue(json, QStringLiteral("ip"));
    if (info.ip.isEmpty()) {
        return std::nullopt;
    }

    info.org = textValue(json, QStringLiteral("asn_org"));
    info.asn = normalizeAsn(textValue(json, QStringLiteral("asn")));
    info.city = textValue(json, QStringLiteral("city"));
    info.region = textValue(json, QStringLiteral("region_name"));
    info.country = textValue(json, QStringLiteral("country"));

    const QJsonValue latitude = json.value(QStringLiteral("latitude"));
    const QJsonValue longitude = json.value(QStringLiteral("longitude"));
    if (latitude.isDouble() && longitude.isDouble()) {
        info.loc = QStringLiteral("%1,%2").arg(latitude.toDouble()).arg(longitude.toDouble());
    }
    return info;
}
