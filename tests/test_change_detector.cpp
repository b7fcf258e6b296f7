#include <QtTest/QtTest>

#include <QTemporaryDir>

#include "core/change_detector.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

class ChangeDetectorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testFirstObservationRaisesNothing();
    void testRunningToDeadRaisesOneAlert();
    void testStayingFailedDoesNotRepeat();
    void testRemovedResourceRaisesAlert();
    void testNewResourceRaisesNothing();
    void testStartAlertsAreOptIn();
    void testStatusComparisonIgnoresCase();
    void testResetForgetsBaseline();
    void testSnapshotIsReplacedNotMutated();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ChangeDetectorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ChangeDetectorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ChangeDetectorTests::testFirstObservationRaisesNothing()
{
    ManualClock clock;
    tongchi::ChangeDetector detector(clock);

    QVERIFY(!detector.snapshot());
    QVERIFY(detector.observe({{"a", "running"}}).empty());
    QVERIFY(detector.snapshot());
    QCOMPARE(QString::fromStdString(detector.snapshot()->at("a")), QStringLiteral("running"));
}

void ChangeDetectorTests::testRunningToDeadRaisesOneAlert()
{
    ManualClock clock;
    tongchi::AlertPolicy policy;
    policy.resourceLabel = "Job";
    tongchi::ChangeDetector detector(clock, policy);

    detector.observe({{"a", "running"}, {"b", "running"}});
    clock.advance(10s);
    const auto alerts = detector.observe({{"a", "dead"}, {"b", "running"}});

    QCOMPARE(alerts.size(), std::size_t(1));
    const tongchi::Alert &alert = alerts.front();
    QCOMPARE(QString::fromStdString(alert.resourceId), QStringLiteral("a"));
    QCOMPARE(alert.kind, tongchi::AlertKind::Failed);
    QCOMPARE(alert.severity, tongchi::AlertSeverity::Critical);
    QCOMPARE(QString::fromStdString(alert.previousStatus), QStringLiteral("running"));
    QCOMPARE(QString::fromStdString(alert.currentStatus), QStringLiteral("dead"));
    QCOMPARE(QString::fromStdString(alert.title), QStringLiteral("Job failed: a"));
    QVERIFY(!alert.id.empty());
    QVERIFY(alert.timestamp == clock.now());
}

void ChangeDetectorTests::testStayingFailedDoesNotRepeat()
{
    ManualClock clock;
    tongchi::ChangeDetector detector(clock);

    detector.observe({{"a", "running"}});
    QCOMPARE(detector.observe({{"a", "dead"}}).size(), std::size_t(1));
    QVERIFY(detector.observe({{"a", "dead"}}).empty());
    QVERIFY(detector.observe({{"a", "failed"}}).empty());
}

void ChangeDetectorTests::testRemovedResourceRaisesAlert()
{
    ManualClock clock;
    tongchi::ChangeDetector detector(clock);

    detector.observe({{"a", "running"}, {"b", "pending"}});
    const auto alerts = detector.observe({{"a", "running"}});

    QCOMPARE(alerts.size(), std::size_t(1));
    QCOMPARE(alerts.front().kind, tongchi::AlertKind::Removed);
    QCOMPARE(QString::fromStdString(alerts.front().resourceId), QStringLiteral("b"));
    QCOMPARE(QString::fromStdString(alerts.front().previousStatus), QStringLiteral("pending"));

    tongchi::AlertPolicy quiet;
    quiet.alertOnRemoval = false;
    detector.setPolicy(quiet);
    QVERIFY(detector.observe({}).empty());
}

void ChangeDetectorTests::testNewResourceRaisesNothing()
{
    ManualClock clock;
    tongchi::ChangeDetector detector(clock);

    detector.observe({{"a", "running"}});
    QVERIFY(detector.observe({{"a", "running"}, {"c", "dead"}}).empty());
}

void ChangeDetectorTests::testStartAlertsAreOptIn()
{
    ManualClock clock;
    tongchi::ChangeDetector detector(clock);

    detector.observe({{"a", "pending"}});
    QVERIFY(detector.observe({{"a", "running"}}).empty());

    tongchi::AlertPolicy policy;
    policy.alertOnStart = true;
    detector.setPolicy(policy);

    detector.observe({{"a", "pending"}});
    const auto alerts = detector.observe({{"a", "running"}});
    QCOMPARE(alerts.size(), std::size_t(1));
    QCOMPARE(alerts.front().kind, tongchi::AlertKind::Started);
    QCOMPARE(alerts.front().severity, tongchi::AlertSeverity::Info);
}

void ChangeDetectorTests::testStatusComparisonIgnoresCase()
{
    ManualClock clock;
    tongchi::ChangeDetector detector(clock);

    detector.observe({{"web", "Running"}});
    QVERIFY(detector.observe({{"web", "running"}}).empty());
    QCOMPARE(detector.observe({{"web", "DEAD"}}).size(), std::size_t(1));
}

void ChangeDetectorTests::testResetForgetsBaseline()
{
    ManualClock clock;
    tongchi::ChangeDetector detector(clock);

    detector.observe({{"a", "running"}});
    detector.reset();
    QVERIFY(!detector.snapshot());
    QVERIFY(detector.observe({{"a", "dead"}}).empty());
}

void ChangeDetectorTests::testSnapshotIsReplacedNotMutated()
{
    ManualClock clock;
    tongchi::ChangeDetector detector(clock);

    detector.observe({{"a", "running"}});
    const auto before = detector.snapshot();
    detector.observe({{"a", "dead"}});
    const auto after = detector.snapshot();

    QVERIFY(before != after);
    QCOMPARE(QString::fromStdString(before->at("a")), QStringLiteral("running"));
    QCOMPARE(QString::fromStdString(after->at("a")), QStringLiteral("dead"));
}

QTEST_MAIN(ChangeDetectorTests)
#include "test_change_detector.moc"
