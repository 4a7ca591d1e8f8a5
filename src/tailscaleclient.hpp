/*!
 * @file        tailscaleclient.hpp
 * @brief       `tailscale` CLI backed implementation of TailnetBackend.
 *
 * @details
 * Runs the tailscale executable synchronously through `QProcess` and
 * converts exit codes and output into snapshots or error messages.
 * Every call creates its own process, so the client can be used from
 * several worker threads at once.
 *
 * @since       17 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap.
 * @license     See LICENSE in repository root.
 */

#ifndef TAILCONTROL_TAILSCALECLIENT_HPP
#define TAILCONTROL_TAILSCALECLIENT_HPP

#include "tailnetbackend.hpp"

#include <QByteArray>
#include <QString>
#include <QStringList>

#include <optional>

/**
 * @class TailscaleClient
 * @brief Drives the local tailscale daemon through its CLI.
 */
class TailscaleClient final : public TailnetBackend
{
public:
    /**
     * @struct ProcessResult
     * @brief Captured outcome of one CLI invocation.
     */
    struct ProcessResult {
        int exitCode = -1;  //!< Process exit code (124 on timeout).
        QByteArray stdOut;  //!< Captured standard output.
        QByteArray stdErr;  //!< Captured standard error.
    };

    /**
     * @brief Construct and resolve the executable.
     * @param executable Command name (searched in PATH) or absolute path.
     * @param allowSudo Retry exit-node changes through `sudo -n` on permission errors.
     */
    explicit TailscaleClient(const QString& executable = QStringLiteral("tailscale"), bool allowSudo = true);

    bool isAvailable() const override;
    std::optional<TailnetStatus> status(QString *errorMessage = nullptr,
                                        TailnetErrorKind *errorKind = nullptr) override;
    bool up(const QStringList& extraArgs, QString *errorMessage = nullptr) override;
    bool down(QString *errorMessage = nullptr) override;
    bool setExitNode(const std::optional<QString>& argument, QString *errorMessage = nullptr) override;

    /**
     * @brief Name of the currently active egress device.
     * @param errorMessage Optional output message on failure.
     * @return Device label or empty optional.
     */
    std::optional<QString> currentExitNode(QString *errorMessage = nullptr);

    /**
     * @brief Resolved executable path.
     * @return Absolute path, empty when not found.
     */
    QString executablePath() const;

    /**
     * @brief Decide whether a failed call is worth retrying with sudo.
     * @param exitCode Exit code of the failed call.
     * @param message Combined error output.
     * @return True for permission-style failures (never for timeouts).
     */
    static bool shouldRetryWithSudo(int exitCode, const QString& message);

    /**
     * @brief Resolve an executable name against PATH.
     * @param executable Name or absolute path.
     * @return Absolute path or empty string.
     */
    static QString resolveExecutable(const QString& executable);

    //! Exit code reported when a process exceeds its timeout.
    static constexpr int kTimeoutExitCode = 124;

private:
    /**
     * @brief Run one process to completion.
     * @param program Program path.
     * @param arguments Program arguments.
     * @param timeoutMs Wall-clock limit.
     * @return Captured result.
     */
    static ProcessResult run(const QString& program, const QStringList& arguments, int timeoutMs);

    /**
     * @brief Pick stderr, else stdout, as the user-facing message.
     * @param result Captured result.
     * @return Trimmed message.
     */
    static QString combinedOutput(const ProcessResult& result);

    /**
     * @brief Utility to write error text.
     * @param errorMessage Optional output pointer.
     * @param message Error string.
     */
    static void setError(QString *errorMessage, const QString& message);

    QString m_executablePath; //!< Resolved tailscale binary.
    bool m_allowSudo = true;  //!< Permit the sudo retry path.
};

#endif // TAILCONTROL_TAILSCALECLIENT_HPP
