#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/settings.hpp"

class SettingsTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void cleanup();

    void testDefaults();
    void testMissingFileYieldsDefaults();
    void testMalformedFileYieldsDefaults();
    void testParseOverridesDefaults();
    void testNonPositiveIntervalsKeepDefaults();
    void testEnvironmentOverrides();
    void testConfigPathOverride();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeConfig(const QByteArray &content) const;
};

void SettingsTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SettingsTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SettingsTests::cleanup()
{
    qunsetenv("TONGCHI_CONFIG");
    qunsetenv("TONGCHI_TREE_TTL");
    qunsetenv("TONGCHI_PROCESS_RETENTION");
}

QString SettingsTests::writeConfig(const QByteArray &content) const
{
    const QString path = m_tempDir.path() + QStringLiteral("/config.json");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

void SettingsTests::testDefaults()
{
    const tongchi::Settings settings = tongchi::defaultSettings();
    QCOMPARE(static_cast<int>(settings.treeTtl.count()), 0);
    QCOMPARE(static_cast<int>(settings.listerTimeout.count()), 30);
    QCOMPARE(static_cast<int>(settings.processRetention.count()), 3600);
    QCOMPARE(static_cast<int>(settings.sweepInterval.count()), 60);
    QCOMPARE(static_cast<int>(settings.leaseRenewWindow.count()), 120);
    QCOMPARE(settings.task(tongchi::kTokenRenewalTask).intervalSeconds, 300);
    QCOMPARE(settings.task(tongchi::kLeaseRenewalTask).intervalSeconds, 60);
    QCOMPARE(settings.task(tongchi::kStatusPollTask).intervalSeconds, 10);
    QVERIFY(settings.alerts.enabled);
    QVERIFY(settings.alerts.failureStatuses.count("dead") == 1);
    QVERIFY(!settings.alerts.alertOnStart);
    QVERIFY(settings.backends.empty());
    QVERIFY(!settings.statusPoll.has_value());
}

void SettingsTests::testMissingFileYieldsDefaults()
{
    const tongchi::Settings settings =
        tongchi::loadSettingsFrom((m_tempDir.path() + QStringLiteral("/absent.json")).toStdString());
    QCOMPARE(static_cast<int>(settings.processRetention.count()), 3600);
    QCOMPARE(settings.task(tongchi::kStatusPollTask).intervalSeconds, 10);
}

void SettingsTests::testMalformedFileYieldsDefaults()
{
    const QString path = writeConfig("{ \"tree\": { \"ttlSeconds\": ");
    const tongchi::Settings settings = tongchi::loadSettingsFrom(path.toStdString());
    QCOMPARE(static_cast<int>(settings.treeTtl.count()), 0);
    QCOMPARE(static_cast<int>(settings.processRetention.count()), 3600);
}

void SettingsTests::testParseOverridesDefaults()
{
    const nlohmann::json document = nlohmann::json::parse(R"({
        "tree": {"ttlSeconds": 300, "listerTimeoutSeconds": 5},
        "processes": {"retentionSeconds": 600},
        "tasks": {
            "status-poll": {"intervalSeconds": 30, "enabled": false},
            "token-renewal": {"timeoutSeconds": 20}
        },
        "alerts": {"failureStatuses": ["dead", "lost"], "alertOnStart": true, "resourceLabel": "Job"},
        "leases": {"renewWindowSeconds": 300},
        "backends": [
            {"name": "kv", "root": "secret/", "label": "Secrets",
             "list": {"program": "vault", "args": ["kv", "list", "-format=json", "{path}"],
                      "notFoundExitCode": 2},
             "ttlSeconds": 60},
            {"name": "broken", "root": "", "list": {"program": "x"}}
        ],
        "statusPoll": {"program": "nomad", "args": ["job", "status", "-json"]}
    })");

    const tongchi::Settings settings = tongchi::parseSettings(document);
    QCOMPARE(static_cast<int>(settings.treeTtl.count()), 300);
    QCOMPARE(static_cast<int>(settings.listerTimeout.count()), 5);
    QCOMPARE(static_cast<int>(settings.processRetention.count()), 600);
    QCOMPARE(static_cast<int>(settings.sweepInterval.count()), 60);

    const auto poll = settings.task(tongchi::kStatusPollTask);
    QCOMPARE(poll.intervalSeconds, 30);
    QVERIFY(!poll.enabled);
    const auto token = settings.task(tongchi::kTokenRenewalTask);
    QCOMPARE(token.intervalSeconds, 300);
    QCOMPARE(token.timeoutSeconds, 20);

    QCOMPARE(settings.alerts.failureStatuses.size(), std::size_t(2));
    QVERIFY(settings.alerts.failureStatuses.count("lost") == 1);
    QVERIFY(settings.alerts.alertOnStart);
    QCOMPARE(QString::fromStdString(settings.alerts.resourceLabel), QStringLiteral("Job"));
    QCOMPARE(static_cast<int>(settings.leaseRenewWindow.count()), 300);

    QCOMPARE(settings.backends.size(), std::size_t(1));
    const auto &backend = settings.backends.front();
    QCOMPARE(QString::fromStdString(backend.root), QStringLiteral("secret/"));
    QCOMPARE(QString::fromStdString(backend.label), QStringLiteral("Secrets"));
    QCOMPARE(backend.list.arguments.size(), std::size_t(4));
    QVERIFY(backend.list.notFoundExitCode.has_value());
    QCOMPARE(*backend.list.notFoundExitCode, 2);
    QVERIFY(backend.ttl.has_value());
    QCOMPARE(static_cast<int>(backend.ttl->count()), 60);

    QVERIFY(settings.statusPoll.has_value());
    QCOMPARE(QString::fromStdString(settings.statusPoll->program), QStringLiteral("nomad"));
    QVERIFY(!settings.tokenRenew.has_value());
}

void SettingsTests::testNonPositiveIntervalsKeepDefaults()
{
    const nlohmann::json document = nlohmann::json::parse(R"({
        "processes": {"sweepIntervalSeconds": 0},
        "tasks": {
            "status-poll": {"intervalSeconds": -5},
            "lease-renewal": {"intervalSeconds": 0},
            "custom": {"intervalSeconds": -1},
            "token-renewal": {"intervalSeconds": 120}
        }
    })");

    const tongchi::Settings settings = tongchi::parseSettings(document);
    QCOMPARE(static_cast<int>(settings.sweepInterval.count()), 60);
    QCOMPARE(settings.task(tongchi::kStatusPollTask).intervalSeconds, 10);
    QCOMPARE(settings.task(tongchi::kLeaseRenewalTask).intervalSeconds, 60);
    QCOMPARE(settings.task("custom").intervalSeconds, 60);
    QCOMPARE(settings.task(tongchi::kTokenRenewalTask).intervalSeconds, 120);
}

void SettingsTests::testEnvironmentOverrides()
{
    qputenv("TONGCHI_TREE_TTL", "45");
    qputenv("TONGCHI_PROCESS_RETENTION", "not-a-number");

    tongchi::Settings settings = tongchi::defaultSettings();
    tongchi::applyEnvironmentOverrides(settings);
    QCOMPARE(static_cast<int>(settings.treeTtl.count()), 45);
    QCOMPARE(static_cast<int>(settings.processRetention.count()), 3600);
}

void SettingsTests::testConfigPathOverride()
{
    const QString path = writeConfig(R"({"processes": {"sweepIntervalSeconds": 15}})");
    qputenv("TONGCHI_CONFIG", path.toUtf8());

    QCOMPARE(QString::fromStdString(tongchi::settingsFilePath()), path);
    const tongchi::Settings settings = tongchi::loadSettings();
    QCOMPARE(static_cast<int>(settings.sweepInterval.count()), 15);
}

QTEST_MAIN(SettingsTests)
#include "test_settings.moc"
