#include "tray/TongchiTray.hpp"

#include <QAction>
#include <QCoreApplication>
#include <QDateTime>
#include <QIcon>
#include <QMessageBox>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/process_registry.hpp"
#include "core/tongchi_coordinator.hpp"
#include "tray/ResourceMenu.hpp"

namespace {

constexpr int kRecentProcesses = 10;
constexpr int kMaxAlertLines = 5;

QString processLabel(const tongchi::ProcessHandle &handle)
{
    const double seconds = tongchi::runtimeSeconds(handle, std::chrono::system_clock::now());
    QString label = QStringLiteral("%1 [%2] %3")
                        .arg(QString::fromStdString(handle.name),
                             QString::fromStdString(tongchi::toProcessStatusString(handle.status)),
                             QString::fromStdString(tongchi::formatRuntime(seconds)));
    if (handle.status == tongchi::ProcessStatus::Running && handle.progress > 0) {
        label += QStringLiteral(" %1%").arg(handle.progress);
    }
    return label;
}

} // namespace

TongchiTray::TongchiTray(tongchi::TongchiCoordinator *coordinator, QObject *parent)
    : QObject(parent)
    , m_coordinator(coordinator)
{
    TLOG_INFO(QStringLiteral("TongchiTray"),
              QStringLiteral("TongchiTray"),
              QStringLiteral("tray_start"),
              QStringLiteral("user_start"),
              QStringLiteral("tray"),
              tongchi::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    setupTrayIcon();
    setupMenu();

    connect(m_coordinator, &tongchi::TongchiCoordinator::alertRaised,
            this, &TongchiTray::onAlertRaised);
    connect(m_coordinator, &tongchi::TongchiCoordinator::processChanged,
            this, &TongchiTray::onProcessChanged);
}

TongchiTray::~TongchiTray() = default;

void TongchiTray::setupTrayIcon()
{
    m_trayIcon.setIcon(QIcon::fromTheme(QStringLiteral("network-server")));
    m_trayIcon.setToolTip(QStringLiteral("Tongchi - Infrastructure tray"));

    connect(&m_trayIcon, &QSystemTrayIcon::activated,
            this, &TongchiTray::onTrayActivated);

    m_trayIcon.show();
}

void TongchiTray::setupMenu()
{
    m_rootsSeparator = m_menu.addSeparator();

    m_processesMenu = m_menu.addMenu(QStringLiteral("Processes"));
    connect(m_processesMenu, &QMenu::aboutToShow, this, &TongchiTray::refreshProcessesMenu);

    auto *alertsAction = m_menu.addAction(QStringLiteral("Show Today's Alerts"));
    connect(alertsAction, &QAction::triggered, this, &TongchiTray::showTodaysAlerts);

    m_menu.addSeparator();

    auto *reloadAction = m_menu.addAction(QStringLiteral("Reload All"));
    connect(reloadAction, &QAction::triggered, this, [this]() {
        m_coordinator->tree().invalidateAll();
        rebuildRootMenus();
    });

    auto *aboutAction = m_menu.addAction(QStringLiteral("About Tongchi"));
    connect(aboutAction, &QAction::triggered, this, &TongchiTray::showAboutDialog);

    auto *quitAction = m_menu.addAction(QStringLiteral("Quit"));
    connect(quitAction, &QAction::triggered, qApp, &QCoreApplication::quit);

    rebuildRootMenus();
    m_trayIcon.setContextMenu(&m_menu);
}

void TongchiTray::rebuildRootMenus()
{
    for (QMenu *menu : m_rootMenus) {
        m_menu.removeAction(menu->menuAction());
        menu->deleteLater();
    }
    m_rootMenus.clear();

    const auto roots = m_coordinator->roots();
    for (const tongchi::ListerBinding &root : roots) {
        const QString label = root.label.empty() ? QString::fromStdString(root.prefix)
                                                 : QString::fromStdString(root.label);
        auto *menu = new ResourceMenu(m_coordinator, QString::fromStdString(root.prefix), label, &m_menu);
        m_menu.insertMenu(m_rootsSeparator, menu);
        m_rootMenus.append(menu);
    }

    if (roots.empty()) {
        auto *placeholder = new QMenu(QStringLiteral("No backends configured"), &m_menu);
        placeholder->setEnabled(false);
        m_menu.insertMenu(m_rootsSeparator, placeholder);
        m_rootMenus.append(placeholder);
    }
}

void TongchiTray::refreshProcessesMenu()
{
    m_processesMenu->clear();

    const auto handles = m_coordinator->processes().recent(kRecentProcesses);
    if (handles.empty()) {
        m_processesMenu->addAction(QStringLiteral("No recent processes"))->setEnabled(false);
        return;
    }

    for (const tongchi::ProcessHandle &handle : handles) {
        QAction *action = m_processesMenu->addAction(processLabel(handle));
        const bool cancellable = handle.cancellable && !tongchi::isTerminal(handle.status)
            && !handle.cancelRequested;
        action->setEnabled(cancellable);
        if (!cancellable) {
            continue;
        }
        action->setToolTip(QStringLiteral("Cancel %1").arg(QString::fromStdString(handle.name)));
        const std::string id = handle.id;
        connect(action, &QAction::triggered, this, [this, id]() {
            m_coordinator->processes().cancel(id);
        });
    }
}

void TongchiTray::showTodaysAlerts()
{
    TLOG_INFO(QStringLiteral("TongchiTray"),
              QStringLiteral("showTodaysAlerts"),
              QStringLiteral("show_alerts_popup"),
              QStringLiteral("user_action"),
              QStringLiteral("tray_popup"),
              tongchi::logging::defaultWho(),
              QString(),
              nlohmann::json::object());

    const auto alerts = m_coordinator->todaysAlerts();
    if (alerts.empty()) {
        m_trayIcon.showMessage(QStringLiteral("Tongchi - Today's Alerts"),
                               QStringLiteral("No alerts today"),
                               QSystemTrayIcon::Information);
        return;
    }

    QStringList lines;
    for (auto it = alerts.rbegin(); it != alerts.rend() && lines.size() < kMaxAlertLines; ++it) {
        const QDateTime when = QDateTime::fromSecsSinceEpoch(
            std::chrono::duration_cast<std::chrono::seconds>(it->timestamp.time_since_epoch()).count());
        lines << QStringLiteral("%1 [%2] %3")
                     .arg(when.toLocalTime().toString(QStringLiteral("HH:mm")),
                          QString::fromStdString(tongchi::toAlertSeverityString(it->severity)),
                          QString::fromStdString(it->title));
    }

    m_trayIcon.showMessage(QStringLiteral("Tongchi - Today's Alerts"),
                           lines.join(QLatin1Char('\n')),
                           QSystemTrayIcon::Information);
}

void TongchiTray::showAboutDialog()
{
    QMessageBox box;
    box.setWindowTitle(QStringLiteral("About Tongchi"));
    box.setTextFormat(Qt::RichText);
    box.setStandardButtons(QMessageBox::Ok);
    box.setText(QStringLiteral("<b>Tongchi</b> %1<br/>"
                               "Tray browser for secrets, jobs and workspaces.")
                    .arg(QStringLiteral(TONGCHI_VERSION)));
    box.exec();
}

void TongchiTray::onAlertRaised(const QString &title, const QString &message)
{
    m_trayIcon.showMessage(title, message, QSystemTrayIcon::Warning);
}

void TongchiTray::onProcessChanged(const tongchi::ProcessHandle &handle)
{
    if (handle.status != tongchi::ProcessStatus::Failed) {
        return;
    }
    m_trayIcon.showMessage(QStringLiteral("%1 failed").arg(QString::fromStdString(handle.name)),
                           QString::fromStdString(handle.error),
                           QSystemTrayIcon::Critical);
}

void TongchiTray::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::DoubleClick) {
        showTodaysAlerts();
    }
}
