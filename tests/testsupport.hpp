/**
 * @file testsupport.hpp
 * @brief Fakes and helpers shared by the TailControl tests.
 */

#ifndef TAILCONTROL_TESTSUPPORT_HPP
#define TAILCONTROL_TESTSUPPORT_HPP

#include "connectionstate.hpp"
#include "deviceidentity.hpp"
#include "enginetimings.hpp"
#include "monotonicclock.hpp"
#include "tailnetbackend.hpp"
#include "tailnetstatus.hpp"

#include <QCoreApplication>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QMutex>
#include <QMutexLocker>
#include <QThread>

#include <functional>
#include <memory>
#include <optional>

namespace testsupport {

/// Build a device the way the status parser would.
inline TailnetDevice makeDevice(const QString& name,
                                const QString& address,
                                const QString& id,
                                const QString& hostname = QString(),
                                bool exitNodeOption = false)
{
    TailnetDevice device;
    if (!name.isEmpty()) {
        device.name = name;
    }
    if (!address.isEmpty()) {
        device.addresses.append(address);
    }
    if (!id.isEmpty()) {
        device.id = id;
    }
    if (!hostname.isEmpty()) {
        device.hostInfo.insert(QStringLiteral("Hostname"), hostname);
    }
    device.exitNodeOption = exitNodeOption;
    return device;
}

/// Snapshot with a self device that is either a tailnet member or not.
inline TailnetStatus makeStatus(const QString& backendState, bool selfHasAddress)
{
    TailnetStatus status;
    status.backendState = backendState;
    status.self = makeDevice(QStringLiteral("laptop"),
                             selfHasAddress ? QStringLiteral("100.64.0.1") : QString(),
                             QStringLiteral("self"));
    status.devices.append(*status.self);
    return status;
}

/// Wall clock replacement advanced explicitly by the test.
class ManualClock
{
public:
    MonotonicClock clock() const
    {
        const std::shared_ptr<qint64> now = m_now;
        return [now]() { return *now; };
    }

    void advance(qint64 ms) { *m_now += ms; }
    qint64 now() const { return *m_now; }

private:
    std::shared_ptr<qint64> m_now = std::make_shared<qint64>(1000);
};

/// Spin the event loop until @p predicate holds or @p timeoutMs elapses.
inline bool waitUntil(const std::function<bool()>& predicate, int timeoutMs = 3000)
{
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
    return true;
}

/// Spin the event loop for a fixed time.
inline void spinFor(int ms)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(1);
    }
}

/// Timings scaled down so integration tests finish quickly.
inline EngineTimings fastTimings()
{
    EngineTimings timings;
    timings.refreshIntervalMs = 60000;
    timings.pollIntervalMs = 10;
    timings.connectTimeoutMs = 1500;
    timings.disconnectTimeoutMs = 800;
    timings.disconnectGraceMs = 100;
    timings.interactionDebounceMs = 35;
    timings.interactionRescheduleMs = 30;
    timings.minRefreshSpacingMs = 80;
    return timings;
}

/**
 * @class FakeBackend
 * @brief In-memory tailnet daemon.
 *
 * `up`/`down` flip the membership immediately unless a lag is configured;
 * `setExitNode` marks the matching peer active. Safe to call from workers.
 */
class FakeBackend final : public TailnetBackend
{
public:
    explicit FakeBackend(bool available = true)
        : m_available(available)
    {
    }

    bool isAvailable() const override { return m_available; }

    std::optional<TailnetStatus> status(QString *errorMessage = nullptr,
                                        TailnetErrorKind *errorKind = nullptr) override
    {
        QMutexLocker locker(&m_mutex);
        ++m_statusCalls;
        if (!m_statusError.isEmpty()) {
            if (errorMessage) {
                *errorMessage = m_statusError;
            }
            if (errorKind) {
                *errorKind = TailnetErrorKind::TransientStatus;
            }
            return std::nullopt;
        }
        return buildStatus();
    }

    bool up(const QStringList& extraArgs, QString *errorMessage = nullptr) override
    {
        QMutexLocker locker(&m_mutex);
        ++m_upCalls;
        m_lastUpArgs = extraArgs;
        if (!m_commandError.isEmpty()) {
            if (errorMessage) {
                *errorMessage = m_commandError;
            }
            return false;
        }
        m_running = true;
        return true;
    }

    bool down(QString *errorMessage = nullptr) override
    {
        QMutexLocker locker(&m_mutex);
        ++m_downCalls;
        if (!m_commandError.isEmpty()) {
            if (errorMessage) {
                *errorMessage = m_commandError;
            }
            return false;
        }
        m_running = false;
        return true;
    }

    bool setExitNode(const std::optional<QString>& argument, QString *errorMessage = nullptr) override
    {
        QMutexLocker locker(&m_mutex);
        ++m_exitNodeCalls;
        m_lastExitNodeArgument = argument;
        if (!m_exitNodeError.isEmpty()) {
            if (errorMessage) {
                *errorMessage = m_exitNodeError;
            }
            return false;
        }
        m_activeExitNode = argument;
        return true;
    }

    void addPeer(const TailnetDevice& device)
    {
        QMutexLocker locker(&m_mutex);
        m_peers.append(device);
    }

    void setRunning(bool running)
    {
        QMutexLocker locker(&m_mutex);
        m_running = running;
    }

    void setStatusError(const QString& error)
    {
        QMutexLocker locker(&m_mutex);
        m_statusError = error;
    }

    void setCommandError(const QString& error)
    {
        QMutexLocker locker(&m_mutex);
        m_commandError = error;
    }

    void setExitNodeError(const QString& error)
    {
        QMutexLocker locker(&m_mutex);
        m_exitNodeError = error;
    }

    /// Keep reporting the self address after `down` (address clearing lag).
    void setKeepAddressWhenStopped(bool keep)
    {
        QMutexLocker locker(&m_mutex);
        m_keepAddressWhenStopped = keep;
    }

    int statusCalls() const { QMutexLocker locker(&m_mutex); return m_statusCalls; }
    int upCalls() const { QMutexLocker locker(&m_mutex); return m_upCalls; }
    int downCalls() const { QMutexLocker locker(&m_mutex); return m_downCalls; }
    int exitNodeCalls() const { QMutexLocker locker(&m_mutex); return m_exitNodeCalls; }
    QStringList lastUpArgs() const { QMutexLocker locker(&m_mutex); return m_lastUpArgs; }

    std::optional<QString> lastExitNodeArgument() const
    {
        QMutexLocker locker(&m_mutex);
        return m_lastExitNodeArgument;
    }

private:
    TailnetStatus buildStatus() const
    {
        TailnetStatus status;
        status.backendState = m_running ? QStringLiteral("Running") : QStringLiteral("Stopped");
        const bool hasAddress = m_running || m_keepAddressWhenStopped;
        status.self = makeDevice(QStringLiteral("laptop"),
                                 hasAddress ? QStringLiteral("100.64.0.1") : QString(),
                                 QStringLiteral("self"));
        status.devices.append(*status.self);

        for (TailnetDevice peer : m_peers) {
            peer.activeExitNode = m_activeExitNode.has_value()
                && DeviceIdentity::aliasesFor(peer).contains(m_activeExitNode.value());
            status.devices.append(peer);
            if (peer.exitNodeOption) {
                status.exitNodes.append(peer);
            }
            if (peer.activeExitNode && !status.activeExitNode.has_value()) {
                status.activeExitNode = peer;
            }
        }
        return status;
    }

    mutable QMutex m_mutex;
    bool m_available = true;
    bool m_running = false;
    bool m_keepAddressWhenStopped = false;
    QList<TailnetDevice> m_peers;
    std::optional<QString> m_activeExitNode;
    QString m_statusError;
    QString m_commandError;
    QString m_exitNodeError;
    int m_statusCalls = 0;
    int m_upCalls = 0;
    int m_downCalls = 0;
    int m_exitNodeCalls = 0;
    QStringList m_lastUpArgs;
    std::optional<QString> m_lastExitNodeArgument;
};

} // namespace testsupport

#endif // TAILCONTROL_TESTSUPPORT_HPP
