#include "tray/ResourceMenu.hpp"

#include <QAction>
#include <QApplication>
#include <QClipboard>
#include <QGuiApplication>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "core/tongchi_coordinator.hpp"

ResourceMenu::ResourceMenu(tongchi::TongchiCoordinator *coordinator,
                           const QString &path,
                           const QString &title,
                           QWidget *parent)
    : QMenu(title, parent)
    , m_coordinator(coordinator)
    , m_path(path)
{
    addPlaceholder(QStringLiteral("Loading..."));
    connect(this, &QMenu::aboutToShow, this, &ResourceMenu::populate);
    connect(m_coordinator, &tongchi::TongchiCoordinator::nodeUpdated,
            this, &ResourceMenu::onNodeUpdated);
}

void ResourceMenu::populate()
{
    const std::string path = m_path.toStdString();
    const tongchi::NodeView view = m_coordinator->tree().peek(path);

    if (view.status == tongchi::NodeStatus::Loading) {
        // Another expand owns the load; nodeUpdated repaints when it lands.
        clear();
        addPlaceholder(QStringLiteral("Loading..."));
        return;
    }

    if (view.status == tongchi::NodeStatus::Loaded && !view.stale) {
        tongchi::ExpandResult cached;
        cached.status = view.status;
        cached.children = view.children;
        render(cached);
        return;
    }

    QApplication::setOverrideCursor(Qt::WaitCursor);
    const tongchi::ExpandResult result = m_coordinator->tree().expand(path);
    QApplication::restoreOverrideCursor();
    render(result);
}

// Repaints from the cached node only. Loading here would turn every
// failed load's own update into another load.
void ResourceMenu::onNodeUpdated(const QString &path)
{
    if (path != m_path || !isVisible()) {
        return;
    }

    const tongchi::NodeView view = m_coordinator->tree().peek(m_path.toStdString());
    tongchi::ExpandResult cached;
    cached.status = view.status;
    cached.children = view.children;
    cached.stale = view.stale;
    switch (view.status) {
    case tongchi::NodeStatus::NotLoaded:
        // Invalidated while open; keep the last listing until the next show.
        return;
    case tongchi::NodeStatus::Error:
        cached.error = tongchi::Error{tongchi::ErrorKind::Internal, view.lastError};
        break;
    case tongchi::NodeStatus::Loading:
    case tongchi::NodeStatus::Loaded:
        break;
    }
    render(cached);
}

void ResourceMenu::retry()
{
    TLOG_INFO(QStringLiteral("ResourceMenu"),
              QStringLiteral("retry"),
              QStringLiteral("reload_node"),
              QStringLiteral("user_action"),
              QStringLiteral("invalidate_expand"),
              tongchi::logging::defaultWho(),
              QString(),
              nlohmann::json{{"path", m_path.toStdString()}});
    m_coordinator->tree().invalidate(m_path.toStdString());
    populate();
}

void ResourceMenu::render(const tongchi::ExpandResult &result)
{
    const auto submenus = findChildren<ResourceMenu *>(QString(), Qt::FindDirectChildrenOnly);
    for (ResourceMenu *submenu : submenus) {
        submenu->deleteLater();
    }
    clear();

    if (result.status == tongchi::NodeStatus::Loading) {
        addPlaceholder(QStringLiteral("Loading..."));
        return;
    }

    if (result.error) {
        addPlaceholder(QStringLiteral("Error: %1")
                           .arg(QString::fromStdString(result.error->message)));
        auto *retryAction = addAction(QStringLiteral("Retry"));
        connect(retryAction, &QAction::triggered, this, &ResourceMenu::retry);
        if (!result.children.empty()) {
            addSeparator();
        }
    }

    if (result.children.empty() && !result.error) {
        addPlaceholder(QStringLiteral("(empty)"));
    }

    for (const tongchi::ChildDescriptor &child : result.children) {
        const QString childPath = QString::fromStdString(child.path);
        const QString label = QString::fromStdString(child.displayLabel);
        if (child.isContainer) {
            addMenu(new ResourceMenu(m_coordinator, childPath, label, this));
        } else {
            auto *action = addAction(label);
            connect(action, &QAction::triggered, this, [childPath]() {
                QGuiApplication::clipboard()->setText(childPath);
            });
        }
    }

    if (result.stale) {
        addSeparator();
        addPlaceholder(QStringLiteral("(cached listing)"));
    }

    addSeparator();
    auto *refreshAction = addAction(QStringLiteral("Refresh"));
    connect(refreshAction, &QAction::triggered, this, &ResourceMenu::retry);
}

void ResourceMenu::addPlaceholder(const QString &text)
{
    QAction *action = addAction(text);
    action->setEnabled(false);
}
