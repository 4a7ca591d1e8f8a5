/*!
 * @file        commanddispatcher.hpp
 * @brief       Runs blocking backend calls off the interaction thread.
 *
 * @details
 * Each submitted task runs on a dispatcher-owned thread pool. Its outcome
 * is marshalled back to the thread owning the dispatcher and delivered to
 * exactly one of the success/failure callbacks. Submissions are
 * independent: nothing serializes them, callers gate through their own
 * busy flags.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_COMMANDDISPATCHER_HPP
#define TAILCONTROL_COMMANDDISPATCHER_HPP

#include <QMetaObject>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>

#include <exception>
#include <functional>
#include <optional>
#include <utility>

/**
 * @class CommandDispatcher
 * @brief Worker-pool bridge with exactly-once callback delivery.
 */
class CommandDispatcher : public QObject
{
    Q_OBJECT
    Q_PROPERTY(int inFlight READ inFlight NOTIFY inFlightChanged)

public:
    /**
     * @brief Blocking unit of work.
     *
     * @details
     * Returns the result on success. On failure returns an empty optional
     * and fills the message; throwing is tolerated and reported the same way.
     */
    template <typename Result>
    using Task = std::function<std::optional<Result>(QString *errorMessage)>;

    /**
     * @brief Construct dispatcher.
     * @param parent Optional QObject parent.
     */
    explicit CommandDispatcher(QObject *parent = nullptr);

    /**
     * @brief Wait for running tasks; pending callbacks are dropped.
     */
    ~CommandDispatcher() override;

    /**
     * @brief Run a task and deliver its outcome on this object's thread.
     * @param task Blocking operation.
     * @param onSuccess Called with the result.
     * @param onFailure Called with a non-empty message.
     */
    template <typename Result>
    void submit(Task<Result> task,
                std::function<void(const Result&)> onSuccess,
                std::function<void(const QString&)> onFailure);

    /**
     * @brief Number of submitted tasks whose callback has not run yet.
     * @return In-flight count.
     */
    int inFlight() const;

    /**
     * @brief Block until every worker returned.
     * @param timeoutMs Limit, -1 for no limit.
     * @return True when the pool drained.
     */
    bool waitForDone(int timeoutMs = -1);

signals:
    //! Emitted when `inFlight` changes.
    void inFlightChanged();

private:
    //! Account for a new submission.
    void beginTask();
    //! Account for a delivered callback.
    void endTask();

    QThreadPool m_pool; //!< Workers for blocking calls.
    int m_inFlight = 0; //!< Submitted but not yet delivered.
};

template <typename Result>
void CommandDispatcher::submit(Task<Result> task,
                               std::function<void(const Result&)> onSuccess,
                               std::function<void(const QString&)> onFailure)
{
    beginTask();
    const QPointer<CommandDispatcher> guard(this);

    [[maybe_unused]] auto future = QtConcurrent::run(&m_pool, [guard, task = std::move(task),
                                                               onSuccess = std::move(onSuccess),
                                                               onFailure = std::move(onFailure)]() {
        std::optional<Result> result;
        QString error;
        try {
            result = task(&error);
        } catch (const std::exception& e) {
            result.reset();
            error = QString::fromUtf8(e.what());
        } catch (...) {
            result.reset();
            error = QStringLiteral("Unexpected error in background command.");
        }

        if (!result.has_value() && error.trimmed().isEmpty()) {
            error = QStringLiteral("Command failed without an error message.");
        }

        if (!guard) {
            return;
        }

        QMetaObject::invokeMethod(guard.data(), [guard, result = std::move(result), error, onSuccess, onFailure]() {
            if (!guard) {
                return;
            }
            guard->endTask();
            if (result.has_value()) {
                if (onSuccess) {
                    onSuccess(*result);
                }
                return;
            }
            if (onFailure) {
                onFailure(error);
            }
        }, Qt::QueuedConnection);
    });
}

#endif // TAILCONTROL_COMMANDDISPATCHER_HPP
