#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <stdexcept>
#include <thread>

#include "common/executor.hpp"
#include "core/scheduled_task_runner.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

namespace {

tongchi::ScheduledTask makeTask(const std::string &id, int intervalSeconds)
{
    tongchi::ScheduledTask task;
    task.id = id;
    task.intervalSeconds = intervalSeconds;
    return task;
}

std::optional<tongchi::Error> succeed(const tongchi::OperationContext &)
{
    return std::nullopt;
}

} // namespace

class ScheduledTaskRunnerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testFailingTaskDoesNotStopOtherTask();
    void testTasksKeepTheirOwnIntervals();
    void testDisableSuppressesTicks();
    void testDisableWhileRunningLetsRunFinish();
    void testTriggerRunsImmediately();
    void testExceptionRecordedAsFailure();
    void testExecutionTimeout();
    void testStopCancelsRunningTask();
    void testRescheduleAndUnschedule();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void ScheduledTaskRunnerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void ScheduledTaskRunnerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ScheduledTaskRunnerTests::testFailingTaskDoesNotStopOtherTask()
{
    InlineExecutor executor;
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    runner.schedule(makeTask("token-renewal", 10), [](const tongchi::OperationContext &) {
        return std::optional<tongchi::Error>(
            tongchi::Error{tongchi::ErrorKind::Transport, "403 permission denied"});
    });
    runner.schedule(makeTask("lease-renewal", 10), succeed);

    std::optional<std::chrono::system_clock::time_point> previousRun;
    for (int i = 1; i <= 5; ++i) {
        clock.advance(10s);
        QCOMPARE(runner.runDue(), 2);

        const auto failing = runner.task("token-renewal");
        QVERIFY(failing.has_value());
        QVERIFY(failing->enabled);
        QCOMPARE(failing->state, tongchi::TaskState::Idle);
        QCOMPARE(failing->consecutiveFailures, i);
        QVERIFY(QString::fromStdString(failing->lastError).contains(QStringLiteral("403")));

        const auto healthy = runner.task("lease-renewal");
        QVERIFY(healthy.has_value());
        QVERIFY(healthy->lastRunAt.has_value());
        QVERIFY(*healthy->lastRunAt == clock.now());
        if (previousRun) {
            QVERIFY(*healthy->lastRunAt > *previousRun);
        }
        previousRun = healthy->lastRunAt;
        QVERIFY(healthy->lastError.empty());
        QCOMPARE(healthy->runCount, i);
    }
}

void ScheduledTaskRunnerTests::testTasksKeepTheirOwnIntervals()
{
    InlineExecutor executor;
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    runner.schedule(makeTask("status-poll", 5), succeed);
    runner.schedule(makeTask("token-renewal", 20), succeed);

    for (int i = 0; i < 4; ++i) {
        clock.advance(5s);
        runner.runDue();
    }

    QCOMPARE(runner.task("status-poll")->runCount, 4);
    QCOMPARE(runner.task("token-renewal")->runCount, 1);
    QCOMPARE(runner.tasks().size(), std::size_t(2));
}

void ScheduledTaskRunnerTests::testDisableSuppressesTicks()
{
    InlineExecutor executor;
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    runner.schedule(makeTask("status-poll", 10), succeed);
    QVERIFY(runner.setEnabled("status-poll", false));
    QCOMPARE(runner.task("status-poll")->state, tongchi::TaskState::Disabled);

    clock.advance(60s);
    QCOMPARE(runner.runDue(), 0);
    QCOMPARE(runner.task("status-poll")->runCount, 0);

    QVERIFY(runner.setEnabled("status-poll", true));
    QCOMPARE(runner.task("status-poll")->state, tongchi::TaskState::Idle);
    QCOMPARE(runner.runDue(), 0);
    clock.advance(10s);
    QCOMPARE(runner.runDue(), 1);
    QVERIFY(!runner.setEnabled("missing", true));
}

void ScheduledTaskRunnerTests::testDisableWhileRunningLetsRunFinish()
{
    QueuedExecutor executor;
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    bool cancelled = false;
    runner.schedule(makeTask("lease-renewal", 10), [&cancelled](const tongchi::OperationContext &ctx) {
        cancelled = ctx.isCancelled();
        return std::optional<tongchi::Error>();
    });

    clock.advance(10s);
    QCOMPARE(runner.runDue(), 1);
    QCOMPARE(runner.task("lease-renewal")->state, tongchi::TaskState::Running);

    runner.setEnabled("lease-renewal", false);
    QCOMPARE(runner.task("lease-renewal")->state, tongchi::TaskState::Running);

    QCOMPARE(executor.runAll(), 1);
    QVERIFY(!cancelled);
    const auto task = runner.task("lease-renewal");
    QCOMPARE(task->state, tongchi::TaskState::Disabled);
    QCOMPARE(task->runCount, 1);
    QVERIFY(!task->nextDueAt.has_value());
}

void ScheduledTaskRunnerTests::testTriggerRunsImmediately()
{
    InlineExecutor executor;
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    runner.schedule(makeTask("status-poll", 30), succeed);
    QVERIFY(runner.trigger("status-poll"));

    auto task = runner.task("status-poll");
    QCOMPARE(task->runCount, 1);
    QVERIFY(task->nextDueAt.has_value());
    QVERIFY(*task->nextDueAt == clock.now() + 30s);

    runner.setEnabled("status-poll", false);
    QVERIFY(runner.trigger("status-poll"));
    task = runner.task("status-poll");
    QCOMPARE(task->runCount, 2);
    QCOMPARE(task->state, tongchi::TaskState::Disabled);

    QVERIFY(!runner.trigger("missing"));
}

void ScheduledTaskRunnerTests::testExceptionRecordedAsFailure()
{
    InlineExecutor executor;
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    runner.schedule(makeTask("token-renewal", 10),
                    [](const tongchi::OperationContext &) -> std::optional<tongchi::Error> {
                        throw std::runtime_error("token file unreadable");
                    });

    QVERIFY(runner.trigger("token-renewal"));
    const auto task = runner.task("token-renewal");
    QCOMPARE(task->state, tongchi::TaskState::Idle);
    QCOMPARE(task->consecutiveFailures, 1);
    QVERIFY(QString::fromStdString(task->lastError).contains(QStringLiteral("token file unreadable")));
}

void ScheduledTaskRunnerTests::testExecutionTimeout()
{
    tongchi::ThreadPoolExecutor executor(2);
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    tongchi::ScheduledTask task = makeTask("status-poll", 60);
    task.timeoutSeconds = 1;
    runner.schedule(task, [](const tongchi::OperationContext &ctx) {
        while (!ctx.isDone()) {
            std::this_thread::sleep_for(10ms);
        }
        return ctx.doneError();
    });

    QVERIFY(runner.trigger("status-poll"));
    QVERIFY(runner.waitForIdle(5s));

    const auto finished = runner.task("status-poll");
    QCOMPARE(finished->consecutiveFailures, 1);
    QVERIFY(QString::fromStdString(finished->lastError).startsWith(QStringLiteral("timeout")));
}

void ScheduledTaskRunnerTests::testStopCancelsRunningTask()
{
    tongchi::ThreadPoolExecutor executor(2);
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    std::atomic<bool> started{false};
    runner.schedule(makeTask("lease-renewal", 60), [&started](const tongchi::OperationContext &ctx) {
        started = true;
        while (!ctx.isDone()) {
            std::this_thread::sleep_for(5ms);
        }
        return ctx.doneError();
    });

    QVERIFY(runner.trigger("lease-renewal"));
    QTRY_VERIFY(started.load());

    runner.stop();
    QVERIFY(runner.isStopped());

    const auto task = runner.task("lease-renewal");
    QCOMPARE(task->state, tongchi::TaskState::Idle);
    QVERIFY(QString::fromStdString(task->lastError).startsWith(QStringLiteral("cancelled")));
    QVERIFY(!task->nextDueAt.has_value());

    clock.advance(120s);
    QCOMPARE(runner.runDue(), 0);
    QVERIFY(!runner.trigger("lease-renewal"));
}

void ScheduledTaskRunnerTests::testRescheduleAndUnschedule()
{
    InlineExecutor executor;
    ManualClock clock;
    tongchi::ScheduledTaskRunner runner(executor, clock);

    runner.schedule(makeTask("status-poll", 60), succeed);
    QVERIFY(runner.reschedule("status-poll", 5));
    QVERIFY(!runner.reschedule("status-poll", 0));
    clock.advance(5s);
    QCOMPARE(runner.runDue(), 1);

    QVERIFY(runner.unschedule("status-poll"));
    QVERIFY(!runner.task("status-poll").has_value());
    QVERIFY(!runner.unschedule("status-poll"));
}

QTEST_MAIN(ScheduledTaskRunnerTests)
#include "test_scheduled_task_runner.moc"
