/*!
 * @file        enginetimings.hpp
 * @brief       Timing constants of the reconciliation engine.
 *
 * @details
 * Groups every interval and timeout used by the refresh loop, the
 * convergence poller and the interaction debouncer. Values may be scaled
 * (tests do) but their relative ordering must be kept.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_ENGINETIMINGS_HPP
#define TAILCONTROL_ENGINETIMINGS_HPP

#include <QtGlobal>

/**
 * @struct EngineTimings
 * @brief Millisecond timing table.
 */
struct EngineTimings {
    int refreshIntervalMs = 5000;         //!< Periodic background refresh.
    int pollIntervalMs = 300;             //!< Convergence poll tick.
    qint64 connectTimeoutMs = 15000;      //!< Give up waiting for `up`.
    qint64 disconnectTimeoutMs = 6000;    //!< Give up waiting for `down`.
    qint64 disconnectGraceMs = 1500;      //!< Trust backend state after this.
    int interactionDebounceMs = 350;      //!< Delay after user activity.
    int interactionRescheduleMs = 300;    //!< Retry delay when refreshed too recently.
    qint64 minRefreshSpacingMs = 800;     //!< Floor between interaction refreshes.
};

#endif // TAILCONTROL_ENGINETIMINGS_HPP
