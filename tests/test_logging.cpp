#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugDroppedWithoutTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testMinimumLevel();
    void testLogDirOverride();
    void testRotation();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const;
};

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString LoggingTests::logPath(const QString &suffix) const
{
    return m_tempDir.path() + "/.local/share/tongchi/logs/tongchi-test" + suffix;
}

void LoggingTests::testLogEventWrites()
{
    tongchi::logging::initLogging(QStringLiteral("tongchi-test"), false);
    QFile::remove(logPath(QStringLiteral(".log")));

    tongchi::logging::logEvent(tongchi::logging::LogLevel::Info,
                               QStringLiteral("tongchi-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testLogEventWrites"),
                               QStringLiteral("test_log"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               tongchi::logging::defaultWho(),
                               QStringLiteral("corr-1"),
                               nlohmann::json{{"key", "value"}});

    QFile file(logPath(QStringLiteral(".log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    const auto parsed = nlohmann::json::parse(line.toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed["context"].value("key", "")), QStringLiteral("value"));
}

void LoggingTests::testDebugDroppedWithoutTrace()
{
    tongchi::logging::initLogging(QStringLiteral("tongchi-test"), false);
    QFile::remove(logPath(QStringLiteral(".log")));

    TLOG_DEBUG(QStringLiteral("Test"),
               QStringLiteral("testDebugDroppedWithoutTrace"),
               QStringLiteral("debug_line"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               tongchi::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));
}

void LoggingTests::testTraceWrites()
{
    tongchi::logging::initLogging(QStringLiteral("tongchi-test"), true);
    QVERIFY(tongchi::logging::isTraceEnabled());

    tongchi::logging::logEvent(tongchi::logging::LogLevel::Debug,
                               QStringLiteral("tongchi-test"),
                               QStringLiteral("Test"),
                               QStringLiteral("testTraceWrites"),
                               QStringLiteral("test_trace"),
                               QStringLiteral("unit_test"),
                               QStringLiteral("direct_call"),
                               tongchi::logging::defaultWho(),
                               QStringLiteral("corr-2"),
                               nlohmann::json::object());

    QFile file(logPath(QStringLiteral("-trace.log")));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    tongchi::logging::initLogging(QStringLiteral("tongchi-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    QVERIFY(tongchi::logging::currentCorrelationId().isEmpty());
    {
        const QString corr = tongchi::logging::newCorrelationId(QStringLiteral("load"));
        QVERIFY(corr.startsWith(QStringLiteral("load-")));
        QCOMPARE(corr.size(), qsizetype(13));

        tongchi::logging::CorrelationScope scope(corr);
        QCOMPARE(tongchi::logging::currentCorrelationId(), corr);
    }
    QVERIFY(tongchi::logging::currentCorrelationId().isEmpty());
}

void LoggingTests::testMinimumLevel()
{
    QCOMPARE(tongchi::logging::parseLogLevel(QStringLiteral(" Warning "), tongchi::logging::LogLevel::Info),
             tongchi::logging::LogLevel::Warn);
    QCOMPARE(tongchi::logging::parseLogLevel(QStringLiteral("verbose"), tongchi::logging::LogLevel::Info),
             tongchi::logging::LogLevel::Info);

    tongchi::logging::initLogging(QStringLiteral("tongchi-test"), false);
    tongchi::logging::setMinimumLevel(tongchi::logging::LogLevel::Warn);
    QFile::remove(logPath(QStringLiteral(".log")));

    TLOG_INFO(QStringLiteral("Test"),
              QStringLiteral("testMinimumLevel"),
              QStringLiteral("info_line"),
              QStringLiteral("unit_test"),
              QStringLiteral("macro"),
              tongchi::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    QVERIFY(!QFile::exists(logPath(QStringLiteral(".log"))));

    TLOG_ERROR(QStringLiteral("Test"),
               QStringLiteral("testMinimumLevel"),
               QStringLiteral("error_line"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               tongchi::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    QVERIFY(QFile::exists(logPath(QStringLiteral(".log"))));

    tongchi::logging::initLogging(QStringLiteral("tongchi-test"), false);
    QCOMPARE(tongchi::logging::minimumLevel(), tongchi::logging::LogLevel::Info);
}

void LoggingTests::testLogDirOverride()
{
    QTemporaryDir overrideDir;
    QVERIFY(overrideDir.isValid());
    qputenv("TONGCHI_LOG_DIR", overrideDir.path().toUtf8());
    QCOMPARE(tongchi::logging::logsDirPath(), overrideDir.path());

    tongchi::logging::initLogging(QStringLiteral("tongchi-test"), false);
    TLOG_WARN(QStringLiteral("Test"),
              QStringLiteral("testLogDirOverride"),
              QStringLiteral("override_line"),
              QStringLiteral("unit_test"),
              QStringLiteral("macro"),
              tongchi::logging::defaultWho(),
              QString(),
              nlohmann::json::object());
    qunsetenv("TONGCHI_LOG_DIR");

    QVERIFY(QFile::exists(overrideDir.path() + QStringLiteral("/tongchi-test.log")));
}

void LoggingTests::testRotation()
{
    tongchi::logging::initLogging(QStringLiteral("tongchi-test"), false);
    const QString path = logPath(QStringLiteral(".log"));
    QFile::remove(path);
    QFile::remove(path + QStringLiteral(".1"));

    {
        QFile big(path);
        QVERIFY(big.open(QIODevice::WriteOnly));
        QVERIFY(big.write(QByteArray(5 * 1024 * 1024, 'x')) > 0);
    }

    TLOG_INFO(QStringLiteral("Test"),
              QStringLiteral("testRotation"),
              QStringLiteral("after_rotation"),
              QStringLiteral("unit_test"),
              QStringLiteral("macro"),
              tongchi::logging::defaultWho(),
              QString(),
              nlohmann::json::object());

    QVERIFY(QFile::exists(path + QStringLiteral(".1")));
    QFile current(path);
    QVERIFY(current.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(current.readLine().toStdString());
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("after_rotation"));
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
