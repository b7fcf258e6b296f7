#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <map>
#include <string>
#include <vector>

#include "core/lease_tracker.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

class LeaseTrackerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testOnlyLeasesInsideWindowAreRenewed();
    void testRenewalExtendsExpiry();
    void testZeroTtlOrNotFoundExpiresLease();
    void testTransportErrorKeepsLease();
    void testCancelledContextStopsRenewals();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void LeaseTrackerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LeaseTrackerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void LeaseTrackerTests::testOnlyLeasesInsideWindowAreRenewed()
{
    ManualClock clock;
    tongchi::LeaseTracker tracker(clock, 120s);
    tracker.addLease("database/creds/short", 60s);
    tracker.addLease("database/creds/long", 3600s);

    std::vector<std::string> renewed;
    tongchi::OperationContext context;
    const auto events = tracker.renewDue(
        [&renewed](const std::string &id, const tongchi::OperationContext &) {
            renewed.push_back(id);
            tongchi::LeaseRenewal renewal;
            renewal.ttl = 600s;
            return renewal;
        },
        context);

    QCOMPARE(renewed.size(), std::size_t(1));
    QCOMPARE(QString::fromStdString(renewed.front()), QStringLiteral("database/creds/short"));
    QCOMPARE(events.size(), std::size_t(1));
    QCOMPARE(events.front().outcome, tongchi::LeaseOutcome::Renewed);
}

void LeaseTrackerTests::testRenewalExtendsExpiry()
{
    ManualClock clock;
    tongchi::LeaseTracker tracker(clock, 120s);
    tracker.addLease("aws/creds/deploy", 100s);

    tongchi::OperationContext context;
    clock.advance(50s);
    tracker.renewDue([](const std::string &, const tongchi::OperationContext &) {
        tongchi::LeaseRenewal renewal;
        renewal.ttl = 900s;
        return renewal;
    }, context);

    const auto leases = tracker.leases();
    QCOMPARE(leases.size(), std::size_t(1));
    QVERIFY(leases.front().expiresAt == clock.now() + 900s);
    QVERIFY(leases.front().lastRenewedAt.has_value());
    QCOMPARE(leases.front().consecutiveFailures, 0);
}

void LeaseTrackerTests::testZeroTtlOrNotFoundExpiresLease()
{
    ManualClock clock;
    tongchi::LeaseTracker tracker(clock, 120s);
    tracker.addLease("a", 30s);
    tracker.addLease("b", 30s);

    tongchi::OperationContext context;
    const auto events = tracker.renewDue(
        [](const std::string &id, const tongchi::OperationContext &) {
            tongchi::LeaseRenewal renewal;
            if (id == "b") {
                renewal.error = tongchi::Error{tongchi::ErrorKind::NotFound, "lease not found or expired"};
            }
            return renewal;
        },
        context);

    QCOMPARE(events.size(), std::size_t(2));
    for (const auto &event : events) {
        QCOMPARE(event.outcome, tongchi::LeaseOutcome::Expired);
    }
    QVERIFY(tracker.leases().empty());
}

void LeaseTrackerTests::testTransportErrorKeepsLease()
{
    ManualClock clock;
    tongchi::LeaseTracker tracker(clock, 120s);
    tracker.addLease("a", 30s);

    tongchi::OperationContext context;
    for (int i = 1; i <= 2; ++i) {
        const auto events = tracker.renewDue(
            [](const std::string &, const tongchi::OperationContext &) {
                tongchi::LeaseRenewal renewal;
                renewal.error = tongchi::Error{tongchi::ErrorKind::Transport, "connection reset"};
                return renewal;
            },
            context);
        QCOMPARE(events.size(), std::size_t(1));
        QCOMPARE(events.front().outcome, tongchi::LeaseOutcome::Failed);
    }

    const auto leases = tracker.leases();
    QCOMPARE(leases.size(), std::size_t(1));
    QCOMPARE(leases.front().consecutiveFailures, 2);
    QVERIFY(QString::fromStdString(leases.front().lastError).contains(QStringLiteral("connection reset")));
}

void LeaseTrackerTests::testCancelledContextStopsRenewals()
{
    ManualClock clock;
    tongchi::LeaseTracker tracker(clock, 120s);
    tracker.addLease("a", 30s);
    tracker.addLease("b", 30s);

    tongchi::OperationContext context;
    context.cancel();
    int calls = 0;
    const auto events = tracker.renewDue(
        [&calls](const std::string &, const tongchi::OperationContext &) {
            ++calls;
            return tongchi::LeaseRenewal{};
        },
        context);

    QCOMPARE(calls, 0);
    QVERIFY(events.empty());
    QCOMPARE(tracker.leases().size(), std::size_t(2));
    QVERIFY(tracker.removeLease("a"));
    QVERIFY(!tracker.removeLease("a"));
}

QTEST_MAIN(LeaseTrackerTests)
#include "test_lease_tracker.moc"
