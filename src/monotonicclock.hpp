/*!
 * @file        monotonicclock.hpp
 * @brief       Injectable monotonic time source.
 *
 * @details
 * Time-dependent components (poller, debouncer) read the current time
 * through a `MonotonicClock` so tests can drive elapsed time explicitly.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_MONOTONICCLOCK_HPP
#define TAILCONTROL_MONOTONICCLOCK_HPP

#include <QtGlobal>

#include <functional>

//! Returns milliseconds on a monotonic scale with an arbitrary origin.
using MonotonicClock = std::function<qint64()>;

/**
 * @brief Process-wide clock backed by `QElapsedTimer`.
 * @return Clock functor safe to call from any thread.
 */
MonotonicClock systemMonotonicClock();

#endif // TAILCONTROL_MONOTONICCLOCK_HPP
