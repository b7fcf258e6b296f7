#include "core/scheduled_task_runner.hpp"

#include <exception>
#include <utility>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace tongchi {

namespace {

QString qs(const std::string &value)
{
    return QString::fromStdString(value);
}

} // namespace

ScheduledTaskRunner::ScheduledTaskRunner(Executor &executor, const Clock &clock)
    : m_executor(executor)
    , m_clock(clock)
{
}

ScheduledTaskRunner::~ScheduledTaskRunner()
{
    stop();
}

void ScheduledTaskRunner::schedule(const ScheduledTask &task, TaskFunction function)
{
    const auto now = m_clock.now();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(task.id);
        if (it == m_entries.end()) {
            Entry entry;
            entry.task = task;
            entry.task.state = task.enabled ? TaskState::Idle : TaskState::Disabled;
            entry.task.nextDueAt = task.enabled
                ? std::optional<std::chrono::system_clock::time_point>(
                      now + std::chrono::seconds(task.intervalSeconds))
                : std::nullopt;
            entry.function = std::move(function);
            m_entries.emplace(task.id, std::move(entry));
        } else {
            Entry &entry = it->second;
            const bool running = entry.task.state == TaskState::Running;
            entry.task.intervalSeconds = task.intervalSeconds;
            entry.task.timeoutSeconds = task.timeoutSeconds;
            entry.task.enabled = task.enabled;
            if (!running) {
                entry.task.state = task.enabled ? TaskState::Idle : TaskState::Disabled;
                entry.task.nextDueAt = task.enabled
                    ? std::optional<std::chrono::system_clock::time_point>(
                          now + std::chrono::seconds(task.intervalSeconds))
                    : std::nullopt;
            }
            entry.function = std::move(function);
        }
    }

    TLOG_INFO(QStringLiteral("ScheduledTaskRunner"),
              QStringLiteral("schedule"),
              QStringLiteral("task_scheduled"),
              QStringLiteral("task_registration"),
              QStringLiteral("own_interval"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"taskId", task.id},
                             {"intervalSeconds", task.intervalSeconds},
                             {"enabled", task.enabled}});
}

bool ScheduledTaskRunner::unschedule(const std::string &id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end() || it->second.task.state == TaskState::Running) {
        return false;
    }
    m_entries.erase(it);
    return true;
}

bool ScheduledTaskRunner::setEnabled(const std::string &id, bool enabled)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return false;
        }

        ScheduledTask &task = it->second.task;
        if (task.enabled == enabled) {
            return true;
        }
        task.enabled = enabled;
        if (enabled) {
            task.nextDueAt = m_clock.now() + std::chrono::seconds(task.intervalSeconds);
            if (task.state == TaskState::Disabled) {
                task.state = TaskState::Idle;
            }
        } else {
            // A running execution finishes on its own and then parks as Disabled.
            task.nextDueAt.reset();
            if (task.state == TaskState::Idle) {
                task.state = TaskState::Disabled;
            }
        }
    }

    TLOG_INFO(QStringLiteral("ScheduledTaskRunner"),
              QStringLiteral("setEnabled"),
              enabled ? QStringLiteral("task_enabled") : QStringLiteral("task_disabled"),
              QStringLiteral("settings_change"),
              QStringLiteral("toggle_schedule"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"taskId", id}});
    return true;
}

bool ScheduledTaskRunner::reschedule(const std::string &id, int intervalSeconds)
{
    if (intervalSeconds <= 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return false;
    }
    ScheduledTask &task = it->second.task;
    task.intervalSeconds = intervalSeconds;
    if (task.enabled && task.state != TaskState::Running) {
        task.nextDueAt = m_clock.now() + std::chrono::seconds(intervalSeconds);
    }
    return true;
}

bool ScheduledTaskRunner::trigger(const std::string &id)
{
    Dispatch dispatch;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) {
            return false;
        }
        auto it = m_entries.find(id);
        if (it == m_entries.end() || it->second.task.state == TaskState::Running) {
            return false;
        }
        dispatch = beginRunLocked(it->second);
    }

    TLOG_INFO(QStringLiteral("ScheduledTaskRunner"),
              QStringLiteral("trigger"),
              QStringLiteral("task_triggered"),
              QStringLiteral("user_action"),
              QStringLiteral("run_now"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"taskId", id}});

    m_executor.post([this, dispatch]() mutable { execute(std::move(dispatch)); });
    return true;
}

int ScheduledTaskRunner::runDue()
{
    std::vector<Dispatch> due;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopped) {
            return 0;
        }
        const auto now = m_clock.now();
        for (auto &entry : m_entries) {
            const ScheduledTask &task = entry.second.task;
            if (!task.enabled || task.state != TaskState::Idle || !task.nextDueAt) {
                continue;
            }
            if (*task.nextDueAt > now) {
                continue;
            }
            due.push_back(beginRunLocked(entry.second));
        }
    }

    for (auto &dispatch : due) {
        m_executor.post([this, dispatch]() mutable { execute(std::move(dispatch)); });
    }
    return static_cast<int>(due.size());
}

void ScheduledTaskRunner::stop()
{
    std::vector<std::shared_ptr<OperationContext>> running;
    bool wasStopped = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        wasStopped = m_stopped;
        m_stopped = true;
        for (auto &entry : m_entries) {
            entry.second.task.nextDueAt.reset();
            if (entry.second.context) {
                running.push_back(entry.second.context);
            }
        }
    }

    if (!wasStopped) {
        TLOG_INFO(QStringLiteral("ScheduledTaskRunner"),
                  QStringLiteral("stop"),
                  QStringLiteral("runner_stopping"),
                  QStringLiteral("shutdown"),
                  QStringLiteral("cancel_running"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"running", running.size()}});
    }

    for (const auto &context : running) {
        context->cancel();
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this]() { return m_running == 0; });
}

bool ScheduledTaskRunner::isStopped() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stopped;
}

std::optional<ScheduledTask> ScheduledTaskRunner::task(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return std::nullopt;
    }
    return it->second.task;
}

std::vector<ScheduledTask> ScheduledTaskRunner::tasks() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ScheduledTask> out;
    out.reserve(m_entries.size());
    for (const auto &entry : m_entries) {
        out.push_back(entry.second.task);
    }
    return out;
}

bool ScheduledTaskRunner::waitForIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, timeout, [this]() { return m_running == 0; });
}

void ScheduledTaskRunner::setTaskListener(TaskListener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

ScheduledTaskRunner::Dispatch ScheduledTaskRunner::beginRunLocked(Entry &entry)
{
    entry.task.state = TaskState::Running;
    entry.task.lastRunAt = m_clock.now();
    entry.context = OperationContext::create(timeoutFor(entry.task));
    ++m_running;
    return Dispatch{entry.task.id, entry.function, entry.context};
}

void ScheduledTaskRunner::execute(Dispatch dispatch)
{
    logging::CorrelationScope corr(logging::newCorrelationId(QStringLiteral("task")));
    TLOG_DEBUG(QStringLiteral("ScheduledTaskRunner"),
               QStringLiteral("execute"),
               QStringLiteral("task_run_started"),
               QStringLiteral("timer_tick"),
               QStringLiteral("worker_pool"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"taskId", dispatch.id}});

    std::optional<Error> error;
    try {
        if (dispatch.function) {
            error = dispatch.function(*dispatch.context);
        }
    } catch (const std::exception &ex) {
        error = Error{ErrorKind::Internal, ex.what()};
    } catch (...) {
        error = Error{ErrorKind::Internal, "task raised an unknown exception"};
    }

    std::optional<ScheduledTask> finished;
    TaskListener listener;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(dispatch.id);
        if (it != m_entries.end()) {
            Entry &entry = it->second;
            ScheduledTask &task = entry.task;
            entry.context.reset();
            task.runCount++;
            if (error) {
                task.lastError = describeError(*error);
                task.consecutiveFailures++;
            } else {
                task.lastError.clear();
                task.consecutiveFailures = 0;
            }

            if (task.enabled && !m_stopped) {
                task.state = TaskState::Idle;
                task.nextDueAt = m_clock.now() + std::chrono::seconds(task.intervalSeconds);
            } else {
                task.state = task.enabled ? TaskState::Idle : TaskState::Disabled;
                task.nextDueAt.reset();
            }
            finished = task;
        }
        listener = m_listener;
    }

    if (error) {
        TLOG_WARN(QStringLiteral("ScheduledTaskRunner"),
                  QStringLiteral("execute"),
                  QStringLiteral("task_run_failed"),
                  qs(toErrorKindString(error->kind)),
                  QStringLiteral("reschedule_normal_interval"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"taskId", dispatch.id},
                                 {"error", error->message},
                                 {"consecutiveFailures",
                                  finished ? finished->consecutiveFailures : 0}});
    } else {
        TLOG_DEBUG(QStringLiteral("ScheduledTaskRunner"),
                   QStringLiteral("execute"),
                   QStringLiteral("task_run_finished"),
                   QStringLiteral("timer_tick"),
                   QStringLiteral("worker_pool"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"taskId", dispatch.id}});
    }

    if (listener && finished) {
        listener(*finished);
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    --m_running;
    m_idleCv.notify_all();
}

std::chrono::seconds ScheduledTaskRunner::timeoutFor(const ScheduledTask &task) const
{
    if (task.timeoutSeconds > 0) {
        return std::chrono::seconds(task.timeoutSeconds);
    }
    return std::chrono::seconds(task.intervalSeconds);
}

} // namespace tongchi
