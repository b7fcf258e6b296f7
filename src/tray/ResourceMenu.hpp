#pragma once

#include <QMenu>
#include <QString>

namespace tongchi {
class TongchiCoordinator;
struct ExpandResult;
}

// ResourceMenu lists one node of the resource tree and creates child menus
// for containers. Contents are loaded when the menu is about to show.
class ResourceMenu : public QMenu
{
    Q_OBJECT
public:
    ResourceMenu(tongchi::TongchiCoordinator *coordinator,
                 const QString &path,
                 const QString &title,
                 QWidget *parent = nullptr);

    QString path() const { return m_path; }

private slots:
    void populate();
    void onNodeUpdated(const QString &path);
    void retry();

private:
    tongchi::TongchiCoordinator *m_coordinator = nullptr;
    QString m_path;

    void render(const tongchi::ExpandResult &result);
    void addPlaceholder(const QString &text);
};
