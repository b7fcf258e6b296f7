#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"
#include "common/executor.hpp"
#include "common/models.hpp"
#include "common/operation_context.hpp"

namespace tongchi {

struct OperationResult {
    nlohmann::json value;
    std::optional<Error> error;
};

struct ProcessRegistryOptions {
    std::chrono::seconds retention{3600};
    // Zero runs operations without a deadline.
    std::chrono::seconds operationTimeout{0};
};

/**
 * ProcessRegistry tracks long-running user operations (builds, applies,
 * connects) submitted from the tray.
 *
 * Status moves Pending -> Running -> {Completed, Failed, Cancelled} and
 * reaches a terminal state exactly once. Cancellation is cooperative: a
 * cancellable operation that ignores its context still finishes with its
 * natural status.
 *
 * Change events are queued under the registry lock in the order the
 * mutations happened and handed to the listener by one thread at a time,
 * so a listener never sees a stale snapshot after a terminal one.
 */
class ProcessRegistry {
public:
    using OperationFunction = std::function<OperationResult(const OperationContext &)>;
    using ChangeListener = std::function<void(const ProcessHandle &)>;

    ProcessRegistry(Executor &executor, const Clock &clock, ProcessRegistryOptions options = {});
    ~ProcessRegistry();

    ProcessRegistry(const ProcessRegistry &) = delete;
    ProcessRegistry &operator=(const ProcessRegistry &) = delete;

    ProcessHandle submit(const std::string &name,
                         const std::string &description,
                         bool cancellable,
                         OperationFunction function);

    bool cancel(const std::string &id);

    std::optional<ProcessHandle> get(const std::string &id) const;
    std::vector<ProcessHandle> list(std::optional<ProcessStatus> filter = std::nullopt) const;
    std::vector<ProcessHandle> recent(std::size_t limit) const;

    // Removes handles that have been terminal for longer than the retention window.
    int sweep();

    void setChangeListener(ChangeListener listener);
    void setRetention(std::chrono::seconds retention);

    bool waitForIdle(std::chrono::milliseconds timeout);

private:
    struct Record {
        ProcessHandle handle;
        OperationFunction function;
        std::shared_ptr<OperationContext> context;
    };

    Executor &m_executor;
    const Clock &m_clock;

    mutable std::mutex m_mutex;
    std::condition_variable m_idleCv;
    ProcessRegistryOptions m_options;
    std::map<std::string, std::shared_ptr<Record>> m_records;
    ChangeListener m_listener;
    std::deque<ProcessHandle> m_events;
    bool m_delivering = false;
    int m_active = 0;
    bool m_shuttingDown = false;

    std::string generateIdLocked() const;
    void execute(const std::shared_ptr<Record> &record);
    bool transitionLocked(Record &record, ProcessStatus status,
                          nlohmann::json result, std::string error);
    void updateProgress(const std::string &id, int percent, const std::string &message);
    bool idleLocked() const;
    void deliverEvents();
};

double runtimeSeconds(const ProcessHandle &handle,
                      std::chrono::system_clock::time_point now);
std::string formatRuntime(double seconds);

} // namespace tongchi
