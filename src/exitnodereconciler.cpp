#include "exitnodereconciler.hpp"

#include <QPointer>

#include <utility>

ExitNodeReconciler::ExitNodeReconciler(CommandSubmitter submitter, QObject *parent)
    : QObject(parent)
    , m_submitter(std::move(submitter))
{
}

bool ExitNodeReconciler::request(bool enable, const std::optional<QString>& targetArgument, QString *errorMessage)
{
    if (m_inFlight) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("An exit node change is already in progress.");
        }
        return false;
    }

    if (!m_submitter) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("No tailscale client available.");
        }
        return false;
    }

    ExitNodeIntent intent;
    intent.enabled = enable;
    if (enable) {
        intent.target = chooseTarget(targetArgument);
        if (!intent.target.has_value()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("No exit nodes available.");
            }
            return false;
        }
    }

    m_pending = intent;
    m_inFlight = true;
    const quint64 requestId = ++m_requestId;

    emit systemLog(enable
        ? QStringLiteral("[ExitNode] Requesting exit node %1.").arg(intent.target.value())
        : QStringLiteral("[ExitNode] Requesting exit node off."));
    emit stateChanged();

    const QPointer<ExitNodeReconciler> guard(this);
    m_submitter(intent.target,
        [guard, requestId]() {
            if (!guard || guard->m_requestId != requestId) {
                return;
            }
            guard->m_inFlight = false;
            const ExitNodeIntent applied = guard->m_pending.value_or(ExitNodeIntent {});
            if (applied.enabled && applied.target.has_value()) {
                guard->m_lastAppliedTarget = applied.target.value();
            }
            emit guard->systemLog(QStringLiteral("[ExitNode] Command accepted, waiting for confirmation."));
            emit guard->commandSucceeded(applied.enabled, applied.target.value_or(QString()));
            emit guard->stateChanged();
        },
        [guard, requestId](const QString& error) {
            if (!guard || guard->m_requestId != requestId) {
                return;
            }
            guard->m_inFlight = false;
            guard->m_pending.reset();
            emit guard->systemLog(QStringLiteral("[ExitNode] Command failed: %1").arg(error));
            emit guard->commandFailed(error);
            emit guard->stateChanged();
        });
    return true;
}

void ExitNodeReconciler::reconcile(const TailnetStatus& status)
{
    m_eligible = status.exitNodes;
    m_aliases = DeviceIdentity::buildAliasMap(m_eligible);
    m_activeDevice = status.activeExitNode;
    m_activeArgument.reset();
    if (m_activeDevice.has_value()) {
        m_activeArgument = DeviceIdentity::resolveArgument(m_aliases, m_activeDevice.value());
    }

    settleIntent();
    emit stateChanged();
}

void ExitNodeReconciler::settleIntent()
{
    if (!m_pending.has_value() || m_inFlight) {
        return;
    }
    if (evaluateIntent()) {
        emit systemLog(QStringLiteral("[ExitNode] Exit node state confirmed."));
        m_pending.reset();
    }
}

bool ExitNodeReconciler::evaluateIntent() const
{
    if (!m_pending.has_value()) {
        return false;
    }

    const ExitNodeIntent& intent = m_pending.value();
    if (!intent.enabled) {
        return !m_activeDevice.has_value();
    }

    if (!m_activeDevice.has_value() || !intent.target.has_value()) {
        return false;
    }

    const QString& target = intent.target.value();
    if (m_activeArgument.has_value() && m_activeArgument.value() == target) {
        return true;
    }

    const QSet<QString> targetAliases = DeviceIdentity::aliasesOfArgument(m_aliases, target);
    const QSet<QString> activeAliases = DeviceIdentity::aliasesFor(m_activeDevice.value());
    return targetAliases.intersects(activeAliases);
}

std::optional<QString> ExitNodeReconciler::chooseTarget(const std::optional<QString>& selected) const
{
    if (selected.has_value() && !selected->trimmed().isEmpty()) {
        return m_aliases.value(selected->trimmed(), selected->trimmed());
    }

    if (!m_lastAppliedTarget.isEmpty()) {
        const auto it = m_aliases.constFind(m_lastAppliedTarget);
        if (it != m_aliases.constEnd()) {
            return it.value();
        }
    }

    for (const TailnetDevice& device : m_eligible) {
        const std::optional<QString> argument = DeviceIdentity::resolveArgument(m_aliases, device);
        if (argument.has_value()) {
            return argument;
        }
    }
    return std::nullopt;
}

bool ExitNodeReconciler::displayedEnabled() const
{
    if (m_pending.has_value() && !evaluateIntent()) {
        return m_pending->enabled;
    }
    return m_activeDevice.has_value();
}

std::optional<QString> ExitNodeReconciler::displayedTarget() const
{
    if (m_pending.has_value() && !evaluateIntent()) {
        return m_pending->target;
    }
    return m_activeArgument;
}

bool ExitNodeReconciler::busy() const
{
    return m_inFlight;
}

std::optional<ExitNodeIntent> ExitNodeReconciler::pendingIntent() const
{
    return m_pending;
}

bool ExitNodeReconciler::intentSatisfied() const
{
    return evaluateIntent();
}

std::optional<QString> ExitNodeReconciler::activeArgument() const
{
    return m_activeArgument;
}

const AliasMap& ExitNodeReconciler::aliasMap() const
{
    return m_aliases;
}

QList<ExitNodeOption> ExitNodeReconciler::options() const
{
    QList<ExitNodeOption> out;
    for (const TailnetDevice& device : m_eligible) {
        const std::optional<QString> argument = DeviceIdentity::resolveArgument(m_aliases, device);
        if (!argument.has_value()) {
            continue;
        }
        ExitNodeOption option;
        option.argument = argument.value();
        option.label = device.displayLabel();
        option.online = device.online;
        option.active = m_activeArgument.has_value() && m_activeArgument.value() == option.argument;
        out.append(option);
    }
    return out;
}

QString ExitNodeReconciler::lastAppliedTarget() const
{
    return m_lastAppliedTarget;
}

void ExitNodeReconciler::setLastAppliedTarget(const QString& argument)
{
    m_lastAppliedTarget = argument.trimmed();
}
