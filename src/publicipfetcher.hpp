/*!
 * @file        publicipfetcher.hpp
 * @brief       Public egress IP lookup.
 *
 * @details
 * Queries a short list of public "what is my IP" endpoints in order and
 * keeps the first usable answer in a TTL cache. Used to show which
 * address the local device currently egresses from after connection and
 * exit-node changes.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_PUBLICIPFETCHER_HPP
#define TAILCONTROL_PUBLICIPFETCHER_HPP

#include "monotonicclock.hpp"

#include <QJsonObject>
#include <QList>
#include <QNetworkAccessManager>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>

#include <functional>
#include <optional>

class QNetworkReply;

/**
 * @struct PublicIpInfo
 * @brief Normalized public IP details.
 */
struct PublicIpInfo {
    QString ip;      //!< Public address.
    QString org;     //!< Network operator.
    QString asn;     //!< Normalized `AS<digits>`.
    QString city;    //!< City.
    QString region;  //!< Region/state.
    QString country; //!< Country.
    QString loc;     //!< "lat,lon" when provided.

    /**
     * @brief Single-line description for the surface.
     * @return "org | ASN x | city, country" (parts omitted when empty).
     */
    QString summary() const;
};

/**
 * @class PublicIpFetcher
 * @brief Sequential endpoint fallback with TTL cache.
 */
class PublicIpFetcher : public QObject
{
    Q_OBJECT
    Q_PROPERTY(bool fetching READ fetching NOTIFY changed)

public:
    /**
     * @struct Endpoint
     * @brief Lookup URL and its response parser.
     */
    struct Endpoint {
        QUrl url;                                                            //!< Endpoint URL.
        std::function<std::optional<PublicIpInfo>(const QJsonObject&)> parse; //!< Response parser.
    };

    /**
     * @brief Construct fetcher.
     * @param ttlSec Cache lifetime in seconds.
     * @param clock Monotonic time source.
     * @param parent Optional QObject parent.
     */
    explicit PublicIpFetcher(int ttlSec = 180,
                             MonotonicClock clock = systemMonotonicClock(),
                             QObject *parent = nullptr);

    /**
     * @brief Start a lookup unless the cache is fresh.
     * @param force Ignore the cache. While a lookup is running, a forced
     *              call queues one more full lookup after it.
     */
    void fetch(bool force = false);

    /**
     * @brief Latest successful result.
     * @return Info or empty optional.
     */
    std::optional<PublicIpInfo> info() const;

    /**
     * @brief Whether a lookup is running.
     * @return True while requests are outstanding.
     */
    bool fetching() const;

    /**
     * @brief Replace the endpoint list.
     * @param endpoints Endpoints in fallback order; ignored when empty.
     */
    void setEndpoints(const QList<Endpoint>& endpoints);

    //! ipinfo.io, ipapi.co and ifconfig.co in that order.
    static QList<Endpoint> defaultEndpoints();

    /**
     * @brief Normalize ASN notations to `AS<digits>`.
     * @param value Raw value ("AS15169 Google", "13335", ...).
     * @return Normalized value, or input when unrecognized.
     */
    static QString normalizeAsn(const QString& value);

    //! Parse an ipinfo.io response.
    static std::optional<PublicIpInfo> parseIpinfo(const QJsonObject& json);
    //! Parse an ipapi.co response.
    static std::optional<PublicIpInfo> parseIpapi(const QJsonObject& json);
    //! Parse an ifconfig.co response.
    static std::optional<PublicIpInfo> parseIfconfig(const QJsonObject& json);

signals:
    //! Emitted when `fetching` or the cached info changes.
    void changed();
    //! Emitted for diagnostic log lines.
    void systemLog(const QString& line);

private slots:
    //! Handle the reply of the current endpoint.
    void onReplyFinished();

private:
    //! Issue the request for `m_endpointIndex`.
    void requestCurrentEndpoint();

    //! Restart from the first endpoint if a forced lookup was queued.
    void startQueuedLookup();

    QNetworkAccessManager m_networkManager; //!< Shared HTTP client.
    QPointer<QNetworkReply> m_reply;         //!< Reply in progress.
    QList<Endpoint> m_endpoints;             //!< Endpoints in fallback order.
    MonotonicClock m_clock;                  //!< Time source for the TTL.
    int m_ttlSec = 180;                      //!< Cache lifetime.
    int m_endpointIndex = 0;                 //!< Endpoint being tried.
    bool m_forceQueued = false;              //!< Forced lookup requested mid-flight.
    QString m_lastError;                     //!< Last endpoint error.
    std::optional<PublicIpInfo> m_info;      //!< Cached result.
    std::optional<qint64> m_cachedAtMs;      //!< Cache timestamp.
};

#endif // TAILCONTROL_PUBLICIPFETCHER_HPP
