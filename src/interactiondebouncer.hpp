/*!
 * @file        interactiondebouncer.hpp
 * @brief       Coalesces user-activity refreshes.
 *
 * @details
 * Every qualifying input event calls `notify()`. A burst of events results
 * in one delayed refresh request, and interaction refreshes never follow a
 * completed refresh closer than the configured spacing floor.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_INTERACTIONDEBOUNCER_HPP
#define TAILCONTROL_INTERACTIONDEBOUNCER_HPP

#include "enginetimings.hpp"
#include "monotonicclock.hpp"

#include <QObject>
#include <QTimer>

#include <optional>

/**
 * @class InteractionDebouncer
 * @brief Single-shot debounce timer with a minimum spacing floor.
 */
class InteractionDebouncer : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct debouncer.
     * @param timings Debounce delays and spacing floor.
     * @param clock Monotonic time source.
     * @param parent Optional QObject parent.
     */
    explicit InteractionDebouncer(const EngineTimings& timings = {},
                                  MonotonicClock clock = systemMonotonicClock(),
                                  QObject *parent = nullptr);

    /**
     * @brief Register one user interaction.
     */
    void notify();

    /**
     * @brief Record that a refresh of any origin completed now.
     */
    void markRefreshed();

    /**
     * @brief Whether a delayed refresh is scheduled.
     * @return True while the timer runs.
     */
    bool isPending() const;

signals:
    //! Perform the refresh now.
    void refreshRequested();

private slots:
    //! Debounce timer expiry.
    void onTimeout();

private:
    EngineTimings m_timings;                 //!< Delays and floor.
    MonotonicClock m_clock;                  //!< Time source.
    QTimer m_timer;                          //!< Single-shot debounce timer.
    std::optional<qint64> m_lastRefreshAtMs; //!< Last completed refresh.
};

#endif // TAILCONTROL_INTERACTIONDEBOUNCER_HPP
