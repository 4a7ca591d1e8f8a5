#include "tailscaleclient.hpp"

#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace {
constexpr int kStatusTimeoutMs = 10000;
constexpr int kUpTimeoutMs = 60000;
constexpr int kDefaultTimeoutMs = 15000;
}

TailscaleClient::TailscaleClient(const QString& executable, bool allowSudo)
    : m_executablePath(resolveExecutable(executable))
    , m_allowSudo(allowSudo)
{
}

bool TailscaleClient::isAvailable() const
{
    return !m_executablePath.isEmpty();
}

QString TailscaleClient::executablePath() const
{
    return m_executablePath;
}

QString TailscaleClient::resolveExecutable(const QString& executable)
{
    const QString trimmed = executable.trimmed();
    if (trimmed.isEmpty()) {
        return {};
    }

    const QString found = QStandardPaths::findExecutable(trimmed);
    if (!found.isEmpty()) {
        return found;
    }

    const QFileInfo info(trimmed);
    if (info.isAbsolute() && info.exists()) {
        return info.absoluteFilePath();
    }
    return {};
}

std::optional<TailnetStatus> TailscaleClient::status(QString *errorMessage, TailnetErrorKind *errorKind)
{
    if (!isAvailable()) {
        setError(errorMessage, QStringLiteral("The 'tailscale' command was not found in PATH."));
        if (errorKind) {
            *errorKind = TailnetErrorKind::Unavailable;
        }
        return std::nullopt;
    }

    const ProcessResult result = run(m_executablePath, {QStringLiteral("status"), QStringLiteral("--json")}, kStatusTimeoutMs);
    if (result.exitCode != 0) {
        setError(errorMessage, QStringLiteral("Failed to read tailscale status: %1").arg(combinedOutput(result)));
        if (errorKind) {
            *errorKind = TailnetErrorKind::TransientStatus;
        }
        return std::nullopt;
    }

    auto parsed = TailnetStatus::fromJson(result.stdOut, errorMessage);
    if (!parsed.has_value() && errorKind) {
        *errorKind = TailnetErrorKind::TransientStatus;
    }
    return parsed;
}

bool TailscaleClient::up(const QStringList& extraArgs, QString *errorMessage)
{
    if (!isAvailable()) {
        setError(errorMessage, QStringLiteral("The 'tailscale' command was not found in PATH."));
        return false;
    }

    QStringList arguments {QStringLiteral("up")};
    arguments.append(extraArgs);
    const ProcessResult result = run(m_executablePath, arguments, kUpTimeoutMs);
    if (result.exitCode != 0) {
        setError(errorMessage, QStringLiteral("Failed to bring tailscale up: %1").arg(combinedOutput(result)));
        return false;
    }
    return true;
}

bool TailscaleClient::down(QString *errorMessage)
{
    if (!isAvailable()) {
        setError(errorMessage, QStringLiteral("The 'tailscale' command was not found in PATH."));
        return false;
    }

    const ProcessResult result = run(m_executablePath, {QStringLiteral("down")}, kDefaultTimeoutMs);
    if (result.exitCode != 0) {
        setError(errorMessage, QStringLiteral("Failed to bring tailscale down: %1").arg(combinedOutput(result)));
        return false;
    }
    return true;
}

bool TailscaleClient::setExitNode(const std::optional<QString>& argument, QString *errorMessage)
{
    if (!isAvailable()) {
        setError(errorMessage, QStringLiteral("The 'tailscale' command was not found in PATH."));
        return false;
    }

    QStringList arguments {QStringLiteral("set")};
    if (argument.has_value() && !argument->isEmpty()) {
        arguments << QStringLiteral("--accept-routes=true")
                  << QStringLiteral("--exit-node=%1").arg(*argument);
    } else {
        arguments << QStringLiteral("--accept-routes=false") << QStringLiteral("--exit-node=");
    }

    const ProcessResult result = run(m_executablePath, arguments, kDefaultTimeoutMs);
    if (result.exitCode == 0) {
        return true;
    }

    QString combined = combinedOutput(result);
    if (m_allowSudo && shouldRetryWithSudo(result.exitCode, combined)) {
        const QString sudoPath = QStandardPaths::findExecutable(QStringLiteral("sudo"));
        if (!sudoPath.isEmpty()) {
            QStringList sudoArguments {QStringLiteral("-n"), m_executablePath};
            sudoArguments.append(arguments);
            const ProcessResult sudoResult = run(sudoPath, sudoArguments, kDefaultTimeoutMs);
            if (sudoResult.exitCode == 0) {
                return true;
            }
            const QString sudoOutput = combinedOutput(sudoResult);
            if (!sudoOutput.isEmpty()) {
                combined = sudoOutput;
            }
        }
    }

    setError(errorMessage, QStringLiteral("Failed to set exit node: %1").arg(combined));
    return false;
}

std::optional<QString> TailscaleClient::currentExitNode(QString *errorMessage)
{
    const auto snapshot = status(errorMessage);
    if (!snapshot.has_value() || !snapshot->activeExitNode.has_value()) {
        return std::nullopt;
    }
    return snapshot->activeExitNode->displayLabel();
}

bool TailscaleClient::shouldRetryWithSudo(int exitCode, const QString& message)
{
    if (exitCode == 0 || exitCode == kTimeoutExitCode) {
        return false;
    }

    const QString lowered = message.toLower();
    static const QStringList tokens {
        QStringLiteral("permission denied"),
        QStringLiteral("must be root"),
        QStringLiteral("requires root"),
        QStringLiteral("requires sudo"),
        QStringLiteral("sudo"),
        QStringLiteral("operation not permitted"),
    };
    for (const QString& token : tokens) {
        if (lowered.contains(token)) {
            return true;
        }
    }
    return false;
}

TailscaleClient::ProcessResult TailscaleClient::run(const QString& program, const QStringList& arguments, int timeoutMs)
{
    ProcessResult result;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(3000)) {
        result.exitCode = 127;
        result.stdErr = process.errorString().toUtf8();
        return result;
    }

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(500);
        result.exitCode = kTimeoutExitCode;
        result.stdErr = QStringLiteral("Timeout: %1 did not finish within %2 ms")
            .arg(QFileInfo(program).fileName(), QString::number(timeoutMs))
            .toUtf8();
        return result;
    }

    result.stdOut = process.readAllStandardOutput();
    result.stdErr = process.readAllStandardError();
    result.exitCode = process.exitStatus() == QProcess::CrashExit ? -1 : process.exitCode();
    return result;
}

QString TailscaleClient::combinedOutput(const ProcessResult& result)
{
    const QString err = QString::fromUtf8(result.stdErr).trimmed();
    if (!err.isEmpty()) {
        return err;
    }
    return QString::fromUtf8(result.stdOut).trimmed();
}

void TailscaleClient::setError(QString *errorMessage, const QString& message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}
