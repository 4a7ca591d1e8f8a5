/*!
 * @file        tailnetbackend.hpp
 * @brief       Status/command collaborator interface.
 *
 * @details
 * Abstracts the external service the engine drives. Every call blocks
 * and must therefore only be issued from worker threads. Implementations
 * must tolerate concurrent calls.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_TAILNETBACKEND_HPP
#define TAILCONTROL_TAILNETBACKEND_HPP

#include "connectionstate.hpp"
#include "tailnetstatus.hpp"

#include <QString>
#include <QStringList>

#include <optional>

/**
 * @class TailnetBackend
 * @brief Blocking status/command interface consumed by the engine.
 */
class TailnetBackend
{
public:
    virtual ~TailnetBackend() = default;

    /**
     * @brief Whether a backing service can be reached at all.
     * @return False when the engine must run in unavailable mode.
     */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Fetch one status snapshot.
     * @param errorMessage Optional output message on failure.
     * @param errorKind Optional output failure classification.
     * @return Snapshot or empty optional.
     */
    virtual std::optional<TailnetStatus> status(QString *errorMessage = nullptr,
                                                TailnetErrorKind *errorKind = nullptr) = 0;

    /**
     * @brief Bring the tailnet up.
     * @param extraArgs Additional `up` arguments.
     * @param errorMessage Optional output message on failure.
     * @return True when the command reported success.
     */
    virtual bool up(const QStringList& extraArgs, QString *errorMessage = nullptr) = 0;

    /**
     * @brief Bring the tailnet down.
     * @param errorMessage Optional output message on failure.
     * @return True when the command reported success.
     */
    virtual bool down(QString *errorMessage = nullptr) = 0;

    /**
     * @brief Select or clear the egress device.
     * @param argument Canonical argument, or empty optional to clear.
     * @param errorMessage Optional output message on failure.
     * @return True when the command reported success.
     */
    virtual bool setExitNode(const std::optional<QString>& argument, QString *errorMessage = nullptr) = 0;
};

#endif // TAILCONTROL_TAILNETBACKEND_HPP
