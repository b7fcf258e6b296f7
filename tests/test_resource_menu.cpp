#include <QtTest/QtTest>

#include <QAction>
#include <QTemporaryDir>

#include <atomic>
#include <memory>

#include "common/settings.hpp"
#include "core/client_factory.hpp"
#include "core/lister.hpp"
#include "core/tongchi_coordinator.hpp"
#include "test_support.hpp"
#include "tray/ResourceMenu.hpp"

namespace {

// Every listing under "jobs/" fails; counts how often the backend is asked.
class FailingListFactory : public tongchi::ClientFactory {
public:
    std::vector<tongchi::ListerBinding> createListers() override
    {
        auto calls = m_calls;
        tongchi::ListerBinding binding;
        binding.prefix = "jobs/";
        binding.label = "Jobs";
        binding.lister = std::make_shared<tongchi::FunctionLister>(
            [calls](const std::string &, const tongchi::OperationContext &) {
                ++*calls;
                return tongchi::ListResult{
                    {}, tongchi::Error{tongchi::ErrorKind::Transport, "connection refused"}};
            });
        return {binding};
    }

    tongchi::RenewFunction createTokenRenewer() override { return {}; }
    tongchi::LeaseTracker::RenewFunction createLeaseRenewer() override { return {}; }
    tongchi::PollFunction createStatusPoller() override { return {}; }

    int calls() const { return m_calls->load(); }

private:
    std::shared_ptr<std::atomic<int>> m_calls = std::make_shared<std::atomic<int>>(0);
};

QAction *findAction(const QMenu &menu, const QString &prefix)
{
    const auto actions = menu.actions();
    for (QAction *action : actions) {
        if (action->text().startsWith(prefix)) {
            return action;
        }
    }
    return nullptr;
}

} // namespace

class ResourceMenuTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testFailedLoadIsNotReloadedByUpdates();
    void testRetryLoadsOnce();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ResourceMenuTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ResourceMenuTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ResourceMenuTests::testFailedLoadIsNotReloadedByUpdates()
{
    ManualClock clock;
    auto factory = std::make_shared<FailingListFactory>();
    tongchi::TongchiCoordinator coordinator(tongchi::defaultSettings(), factory, nullptr, clock);

    ResourceMenu menu(&coordinator, QStringLiteral("jobs/"), QStringLiteral("Jobs"));
    menu.popup(QPoint(0, 0));
    QCOMPARE(factory->calls(), 1);

    // Let the update queued by the failed load reach the menu.
    QTest::qWait(200);
    QCOMPARE(factory->calls(), 1);
    QVERIFY(findAction(menu, QStringLiteral("Error:")) != nullptr);
    QVERIFY(findAction(menu, QStringLiteral("Retry")) != nullptr);

    emit coordinator.nodeUpdated(QStringLiteral("jobs/"));
    QTest::qWait(50);
    QCOMPARE(factory->calls(), 1);
    QVERIFY(findAction(menu, QStringLiteral("Error:")) != nullptr);

    menu.hide();
}

void ResourceMenuTests::testRetryLoadsOnce()
{
    ManualClock clock;
    auto factory = std::make_shared<FailingListFactory>();
    tongchi::TongchiCoordinator coordinator(tongchi::defaultSettings(), factory, nullptr, clock);

    ResourceMenu menu(&coordinator, QStringLiteral("jobs/"), QStringLiteral("Jobs"));
    menu.popup(QPoint(0, 0));
    QTest::qWait(100);
    QCOMPARE(factory->calls(), 1);

    QAction *retry = findAction(menu, QStringLiteral("Retry"));
    QVERIFY(retry != nullptr);
    retry->trigger();
    QCOMPARE(factory->calls(), 2);

    QTest::qWait(200);
    QCOMPARE(factory->calls(), 2);
    QVERIFY(findAction(menu, QStringLiteral("Error:")) != nullptr);

    menu.hide();
}

QTEST_MAIN(ResourceMenuTests)
#include "test_resource_menu.moc"
