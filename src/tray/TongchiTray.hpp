#pragma once

#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>

#include "common/models.hpp"

namespace tongchi {
class TongchiCoordinator;
}

// TongchiTray is the tray front end: one resource menu per backend root,
// running processes, and alert balloons.
class TongchiTray : public QObject
{
    Q_OBJECT
public:
    explicit TongchiTray(tongchi::TongchiCoordinator *coordinator, QObject *parent = nullptr);
    ~TongchiTray() override;

private slots:
    void rebuildRootMenus();
    void refreshProcessesMenu();
    void showTodaysAlerts();
    void showAboutDialog();
    void onAlertRaised(const QString &title, const QString &message);
    void onProcessChanged(const tongchi::ProcessHandle &handle);
    void onTrayActivated(QSystemTrayIcon::ActivationReason reason);

private:
    tongchi::TongchiCoordinator *m_coordinator = nullptr;
    QSystemTrayIcon m_trayIcon;
    QMenu m_menu;
    QMenu *m_processesMenu = nullptr;
    QAction *m_rootsSeparator = nullptr;
    QList<QMenu *> m_rootMenus;

    void setupTrayIcon();
    void setupMenu();
};
