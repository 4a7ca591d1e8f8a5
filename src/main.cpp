#include <QAction>
#include <QActionGroup>
#include <QApplication>
#include <QEvent>
#include <QIcon>
#include <QMenu>
#include <QPointer>
#include <QStyle>
#include <QSystemTrayIcon>
#include <QTimer>
#include <QtCore/qglobal.h>

#include "connectionstate.hpp"
#include "tailnetcontroller.hpp"

namespace {
/**
 * @class InteractionFilter
 * @brief Forwards user activity on the control surface to the controller.
 */
class InteractionFilter final : public QObject
{
public:
    explicit InteractionFilter(TailnetController *controller, QObject *parent = nullptr)
        : QObject(parent)
        , m_controller(controller)
    {
    }

protected:
    bool eventFilter(QObject *watched, QEvent *event) override
    {
        switch (event->type()) {
        case QEvent::MouseButtonPress:
        case QEvent::KeyPress:
        case QEvent::Wheel:
        case QEvent::FocusIn:
            if (m_controller) {
                m_controller->notifyInteraction();
            }
            break;
        default:
            break;
        }
        return QObject::eventFilter(watched, event);
    }

private:
    QPointer<TailnetController> m_controller;
};
}

auto main(int argc, char *argv[]) -> int
{
    QApplication app(argc, argv);
    app.setQuitOnLastWindowClosed(false);
    QCoreApplication::setOrganizationName(QStringLiteral("TailControl"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("tailcontrol.local"));
    QCoreApplication::setApplicationName(QStringLiteral("TailControl"));
#ifdef APP_VERSION
    QCoreApplication::setApplicationVersion(QStringLiteral(APP_VERSION));
#else
    QCoreApplication::setApplicationVersion(QStringLiteral("0.0.0"));
#endif

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qCritical("TailControl needs a system tray.");
        return 1;
    }

    TailnetController controller;

    InteractionFilter interactionFilter(&controller);
    app.installEventFilter(&interactionFilter);

    QSystemTrayIcon trayIcon;
    trayIcon.setIcon(app.style()->standardIcon(QStyle::SP_DriveNetIcon));

    QMenu trayMenu;
    QAction stateAction(&trayMenu);
    stateAction.setEnabled(false);
    QAction publicIpAction(&trayMenu);
    publicIpAction.setEnabled(false);
    QAction toggleAction(&trayMenu);
    QAction exitNodeAction(QStringLiteral("Use exit node"), &trayMenu);
    exitNodeAction.setCheckable(true);
    QMenu exitNodeMenu(QStringLiteral("Exit node"), &trayMenu);
    QAction refreshAction(QStringLiteral("Refresh"), &trayMenu);
    QAction exitAction(QStringLiteral("Exit"), &trayMenu);

    trayMenu.addAction(&stateAction);
    trayMenu.addAction(&publicIpAction);
    trayMenu.addSeparator();
    trayMenu.addAction(&toggleAction);
    trayMenu.addSeparator();
    trayMenu.addAction(&exitNodeAction);
    trayMenu.addMenu(&exitNodeMenu);
    trayMenu.addSeparator();
    trayMenu.addAction(&refreshAction);
    trayMenu.addAction(&exitAction);
    trayIcon.setContextMenu(&trayMenu);

    QPointer<QActionGroup> exitNodeGroup;

    const auto updateTrayState = [&controller, &toggleAction, &stateAction, &trayIcon]() {
        const ConnectionState state = controller.connectionState();
        switch (state) {
        case ConnectionState::Connected:
            toggleAction.setText(QStringLiteral("Connected - Disconnect"));
            toggleAction.setEnabled(true);
            break;
        case ConnectionState::Connecting:
            toggleAction.setText(QStringLiteral("Connecting..."));
            toggleAction.setEnabled(false);
            break;
        case ConnectionState::Disconnecting:
            toggleAction.setText(QStringLiteral("Disconnecting..."));
            toggleAction.setEnabled(false);
            break;
        case ConnectionState::Error:
            toggleAction.setText(QStringLiteral("Failed - Connect"));
            toggleAction.setEnabled(true);
            break;
        case ConnectionState::Unavailable:
            toggleAction.setText(QStringLiteral("Tailscale unavailable"));
            toggleAction.setEnabled(false);
            break;
        case ConnectionState::Disconnected:
        default:
            toggleAction.setText(QStringLiteral("Disconnected - Connect"));
            toggleAction.setEnabled(true);
            break;
        }
        stateAction.setText(controller.statusText());
        trayIcon.setToolTip(QStringLiteral("TailControl\n%1").arg(controller.statusText()));
    };

    const auto updateExitNodes = [&]() {
        const bool controlsEnabled = controller.available() && !controller.busy() && !controller.exitNodeBusy();
        exitNodeAction.setChecked(controller.exitNodeEnabled());
        exitNodeAction.setEnabled(controlsEnabled);

        exitNodeMenu.clear();
        if (!exitNodeGroup.isNull()) {
            exitNodeGroup->deleteLater();
        }
        exitNodeGroup = new QActionGroup(&exitNodeMenu);
        exitNodeGroup->setExclusive(true);

        const QList<ExitNodeOption> options = controller.exitNodeOptions();
        if (options.isEmpty()) {
            QAction *empty = exitNodeMenu.addAction(QStringLiteral("No exit nodes available"));
            empty->setEnabled(false);
        }

        const QString selected = controller.selectedExitNode();
        for (const ExitNodeOption& option : options) {
            const QString text = option.online
                ? option.label
                : QStringLiteral("%1 (offline)").arg(option.label);
            QAction *action = exitNodeMenu.addAction(text);
            action->setCheckable(true);
            action->setChecked(option.argument == selected);
            action->setEnabled(controlsEnabled);
            exitNodeGroup->addAction(action);
            const QString argument = option.argument;
            QObject::connect(action, &QAction::triggered, &controller, [&controller, argument]() {
                controller.selectExitNode(argument);
            });
        }
    };

    // Rebuilding the submenu deletes the action that may be emitting right now.
    QObject::connect(&controller, &TailnetController::connectionStateChanged, &app, [&]() {
        updateTrayState();
        updateExitNodes();
    }, Qt::QueuedConnection);
    QObject::connect(&controller, &TailnetController::statusChanged, &app, [&]() {
        updateTrayState();
    });
    QObject::connect(&controller, &TailnetController::exitNodeChanged, &app, [&]() {
        updateExitNodes();
    }, Qt::QueuedConnection);
    QObject::connect(&controller, &TailnetController::publicIpChanged, &app, [&]() {
        publicIpAction.setText(controller.publicIpText());
    });
    QObject::connect(&controller, &TailnetController::statusMessage, &app,
                     [&trayIcon, &controller](const QString& text, int timeoutMs) {
        const bool isError = !controller.lastError().isEmpty() && text == controller.lastError();
        trayIcon.showMessage(QStringLiteral("TailControl"), text,
                             isError ? QSystemTrayIcon::Warning : QSystemTrayIcon::Information,
                             timeoutMs);
    });

    QObject::connect(&toggleAction, &QAction::triggered, &app, [&]() {
        controller.toggleConnection();
    });
    QObject::connect(&exitNodeAction, &QAction::triggered, &app, [&](bool checked) {
        controller.setExitNodeEnabled(checked);
    });
    QObject::connect(&refreshAction, &QAction::triggered, &app, [&]() {
        controller.refreshStatus(true);
        controller.refreshPublicIp(true);
    });
    QObject::connect(&exitAction, &QAction::triggered, &app, []() {
        QCoreApplication::quit();
    });

    QObject::connect(&trayIcon, &QSystemTrayIcon::activated, &app, [&](QSystemTrayIcon::ActivationReason reason) {
        if (reason == QSystemTrayIcon::Trigger) {
            controller.notifyInteraction();
        }
    });

    updateTrayState();
    updateExitNodes();
    publicIpAction.setText(controller.publicIpText());
    trayIcon.show();

    return app.exec();
}
