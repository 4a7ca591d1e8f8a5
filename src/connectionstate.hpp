/*!
 * @file        connectionstate.hpp
 * @brief       Connection state and error enums for TailControl.
 *
 * @details
 * Provides the canonical connection-state and error-kind enums used across
 * backend components and the tray surface. The enums are registered with
 * the Qt meta-object system so they can travel through signals and
 * properties.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_CONNECTIONSTATE_HPP
#define TAILCONTROL_CONNECTIONSTATE_HPP

#include <QObject>

namespace TailControl {
Q_NAMESPACE

/**
 * @enum ConnectionState
 * @brief High-level tailnet connection state.
 *
 * @details
 * Represents the user-visible lifecycle of the local tailnet membership.
 * `Connecting` and `Disconnecting` cover the window between issuing the
 * command and observing the converged state.
 */
enum class ConnectionState
{
    Unavailable,   //!< No tailscale binary or daemon reachable.
    Disconnected,  //!< Backend stopped or without tailnet addresses.
    Connecting,    //!< `up` issued, waiting for convergence.
    Connected,     //!< Backend running with at least one tailnet address.
    Disconnecting, //!< `down` issued, waiting for convergence.
    Error          //!< Last transition failed.
};

Q_ENUM_NS(ConnectionState)

/**
 * @enum TailnetErrorKind
 * @brief Classification of failures surfaced by the engine.
 */
enum class TailnetErrorKind
{
    None,               //!< No failure.
    Unavailable,        //!< Backing service not reachable at all.
    CommandFailed,      //!< Mutating command returned a non-success result.
    ConvergenceTimeout, //!< Desired state never observed in time.
    TransientStatus     //!< Single status fetch failed.
};

Q_ENUM_NS(TailnetErrorKind)

/**
 * @brief Return Qt meta-object for the `TailControl` namespace.
 * @return Namespace meta-object containing the registered enums.
 */
const QMetaObject& connectionStateMetaObject();

} // namespace TailControl

//! Convenience aliases used by the backend classes.
using ConnectionState = TailControl::ConnectionState;
using TailnetErrorKind = TailControl::TailnetErrorKind;

#endif // TAILCONTROL_CONNECTIONSTATE_HPP
