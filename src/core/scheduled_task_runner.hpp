#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "common/clock.hpp"
#include "common/executor.hpp"
#include "common/models.hpp"
#include "common/operation_context.hpp"

namespace tongchi {

// ScheduledTaskRunner runs independent periodic tasks (token renewal, lease
// renewal, status polling). Each task keeps its own due time and history; a
// failing task is rescheduled normally and never touches another task.
class ScheduledTaskRunner {
public:
    using TaskFunction = std::function<std::optional<Error>(const OperationContext &)>;
    using TaskListener = std::function<void(const ScheduledTask &)>;

    ScheduledTaskRunner(Executor &executor, const Clock &clock);
    ~ScheduledTaskRunner();

    ScheduledTaskRunner(const ScheduledTaskRunner &) = delete;
    ScheduledTaskRunner &operator=(const ScheduledTaskRunner &) = delete;

    // Registering an existing id replaces its function and settings but
    // keeps lastRunAt/lastError.
    void schedule(const ScheduledTask &task, TaskFunction function);
    bool unschedule(const std::string &id);

    bool setEnabled(const std::string &id, bool enabled);
    bool reschedule(const std::string &id, int intervalSeconds);
    bool trigger(const std::string &id);

    // Dispatches every enabled, idle task whose due time has passed.
    int runDue();

    // Cancels running executions and blocks until they return.
    void stop();
    bool isStopped() const;

    std::optional<ScheduledTask> task(const std::string &id) const;
    std::vector<ScheduledTask> tasks() const;

    bool waitForIdle(std::chrono::milliseconds timeout);
    void setTaskListener(TaskListener listener);

private:
    struct Entry {
        ScheduledTask task;
        TaskFunction function;
        std::shared_ptr<OperationContext> context;
    };

    Executor &m_executor;
    const Clock &m_clock;

    mutable std::mutex m_mutex;
    std::condition_variable m_idleCv;
    std::map<std::string, Entry> m_entries;
    TaskListener m_listener;
    int m_running = 0;
    bool m_stopped = false;

    struct Dispatch {
        std::string id;
        TaskFunction function;
        std::shared_ptr<OperationContext> context;
    };

    Dispatch beginRunLocked(Entry &entry);
    void execute(Dispatch dispatch);
    std::chrono::seconds timeoutFor(const ScheduledTask &task) const;
};

} // namespace tongchi
