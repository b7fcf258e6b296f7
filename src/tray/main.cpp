#include <QApplication>
#include <QDebug>
#include <QSystemTrayIcon>

#include <memory>
#include <stdexcept>

#include "clients/command_client.hpp"
#include "common/logging.hpp"
#include "common/settings.hpp"
#include "core/tongchi_coordinator.hpp"
#include "core/tongchi_store.hpp"
#include "tray/TongchiTray.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qWarning() << "System tray not available. Exiting.";
        return 1;
    }

    app.setQuitOnLastWindowClosed(false);

    bool trace = qEnvironmentVariableIntValue("TONGCHI_TRACE") == 1;
    for (int i = 1; i < argc; ++i) {
        if (QString::fromLocal8Bit(argv[i]) == QStringLiteral("--trace")) {
            trace = true;
        }
    }
    tongchi::logging::initLogging(QStringLiteral("tongchi-tray"), trace);
    TLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("tray_start"),
              QStringLiteral("user_start"),
              QStringLiteral("qt_app"),
              tongchi::logging::defaultWho(),
              QString(),
              nlohmann::json::object());

    const tongchi::Settings settings = tongchi::loadSettings();

    // History is optional; the tray keeps working without the database.
    std::unique_ptr<tongchi::TongchiStore> store;
    try {
        store = std::make_unique<tongchi::TongchiStore>();
    } catch (const std::exception &ex) {
        TLOG_WARN(QStringLiteral("main"),
                  QStringLiteral("main"),
                  QStringLiteral("store_unavailable"),
                  QStringLiteral("sqlite_open_failed"),
                  QStringLiteral("run_without_history"),
                  tongchi::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"error", ex.what()}});
    }

    tongchi::TongchiCoordinator coordinator(
        settings,
        std::make_shared<tongchi::CommandClientFactory>(settings),
        store.get());

    TongchiTray tray(&coordinator);
    coordinator.start();

    const int rc = app.exec();
    coordinator.stop();
    return rc;
}
