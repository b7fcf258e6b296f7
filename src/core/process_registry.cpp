#include "core/process_registry.hpp"

#include <QUuid>
#include <QtGlobal>

#include <algorithm>
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

ProcessRegistry::ProcessRegistry(Executor &executor, const Clock &clock,
                                 ProcessRegistryOptions options)
    : m_executor(executor)
    , m_clock(clock)
    , m_options(options)
{
}

ProcessRegistry::~ProcessRegistry()
{
    std::vector<std::shared_ptr<OperationContext>> running;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shuttingDown = true;
        for (const auto &entry : m_records) {
            const Record &record = *entry.second;
            if (!isTerminal(record.handle.status) && record.handle.cancellable) {
                running.push_back(record.context);
            }
        }
    }

    for (const auto &context : running) {
        context->cancel();
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    m_idleCv.wait(lock, [this]() { return idleLocked(); });
}

ProcessHandle ProcessRegistry::submit(const std::string &name,
                                      const std::string &description,
                                      bool cancellable,
                                      OperationFunction function)
{
    auto record = std::make_shared<Record>();
    ProcessHandle handle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        record->handle.id = generateIdLocked();
        record->handle.name = name;
        record->handle.description = description;
        record->handle.cancellable = cancellable;
        record->handle.status = ProcessStatus::Pending;
        record->function = std::move(function);
        record->context = OperationContext::create(m_options.operationTimeout);
        const std::string id = record->handle.id;
        record->context->setProgressHandler(
            [this, id](int percent, const std::string &message) {
                updateProgress(id, percent, message);
            });
        m_records.emplace(record->handle.id, record);
        ++m_active;
        handle = record->handle;
        m_events.push_back(handle);
    }

    TLOG_INFO(QStringLiteral("ProcessRegistry"),
              QStringLiteral("submit"),
              QStringLiteral("process_submitted"),
              QStringLiteral("user_action"),
              QStringLiteral("worker_pool"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"processId", handle.id},
                             {"name", name},
                             {"cancellable", cancellable}});

    deliverEvents();
    m_executor.post([this, record]() { execute(record); });
    return handle;
}

bool ProcessRegistry::cancel(const std::string &id)
{
    std::shared_ptr<OperationContext> context;
    ProcessHandle changed;
    bool cancelledBeforeStart = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end()) {
            return false;
        }

        Record &record = *it->second;
        if (isTerminal(record.handle.status)) {
            return false;
        }

        if (!record.handle.cancellable) {
            changed = record.handle;
        } else if (record.handle.status == ProcessStatus::Pending) {
            record.handle.cancelRequested = true;
            context = record.context;
            cancelledBeforeStart = transitionLocked(record, ProcessStatus::Cancelled,
                                                    nlohmann::json(),
                                                    "cancelled before start");
            changed = record.handle;
            m_events.push_back(changed);
        } else {
            record.handle.cancelRequested = true;
            context = record.context;
            changed = record.handle;
            m_events.push_back(changed);
        }
    }

    if (!changed.cancellable) {
        TLOG_WARN(QStringLiteral("ProcessRegistry"),
                  QStringLiteral("cancel"),
                  QStringLiteral("cancel_ignored"),
                  QStringLiteral("not_cancellable"),
                  QStringLiteral("runs_to_completion"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"processId", id}, {"name", changed.name}});
        return false;
    }

    if (context) {
        context->cancel();
    }

    TLOG_INFO(QStringLiteral("ProcessRegistry"),
              QStringLiteral("cancel"),
              QStringLiteral("cancel_requested"),
              QStringLiteral("user_action"),
              cancelledBeforeStart ? QStringLiteral("cancel_pending")
                                   : QStringLiteral("context_cancel"),
              logging::defaultWho(),
              QString(),
              nlohmann::json{{"processId", id}, {"name", changed.name}});

    deliverEvents();
    return true;
}

std::optional<ProcessHandle> ProcessRegistry::get(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second->handle;
}

std::vector<ProcessHandle> ProcessRegistry::list(std::optional<ProcessStatus> filter) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ProcessHandle> out;
    for (const auto &entry : m_records) {
        const ProcessHandle &handle = entry.second->handle;
        if (filter && handle.status != *filter) {
            continue;
        }
        out.push_back(handle);
    }
    return out;
}

std::vector<ProcessHandle> ProcessRegistry::recent(std::size_t limit) const
{
    std::vector<ProcessHandle> out = list();
    std::sort(out.begin(), out.end(), [](const ProcessHandle &a, const ProcessHandle &b) {
        const auto aStart = a.startedAt.value_or(std::chrono::system_clock::time_point::max());
        const auto bStart = b.startedAt.value_or(std::chrono::system_clock::time_point::max());
        return aStart > bStart;
    });
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

int ProcessRegistry::sweep()
{
    int removed = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now = m_clock.now();
        for (auto it = m_records.begin(); it != m_records.end();) {
            const ProcessHandle &handle = it->second->handle;
            if (isTerminal(handle.status) && handle.finishedAt
                && now - *handle.finishedAt > m_options.retention) {
                it = m_records.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        TLOG_INFO(QStringLiteral("ProcessRegistry"),
                  QStringLiteral("sweep"),
                  QStringLiteral("processes_swept"),
                  QStringLiteral("retention_expired"),
                  QStringLiteral("periodic_cleanup"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"removed", removed}});
    }
    return removed;
}

void ProcessRegistry::setChangeListener(ChangeListener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listener = std::move(listener);
}

void ProcessRegistry::setRetention(std::chrono::seconds retention)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_options.retention = retention;
}

bool ProcessRegistry::waitForIdle(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_idleCv.wait_for(lock, timeout, [this]() { return idleLocked(); });
}

std::string ProcessRegistry::generateIdLocked() const
{
    for (;;) {
        const std::string id = QUuid::createUuid()
                                   .toString(QUuid::WithoutBraces)
                                   .left(8)
                                   .toStdString();
        if (m_records.count(id) == 0) {
            return id;
        }
    }
}

void ProcessRegistry::execute(const std::shared_ptr<Record> &record)
{
    logging::CorrelationScope corr(logging::newCorrelationId(QStringLiteral("proc")));

    bool skip = false;
    ProcessHandle started;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (record->handle.status != ProcessStatus::Pending) {
            skip = true;
        } else {
            record->handle.status = ProcessStatus::Running;
            record->handle.startedAt = m_clock.now();
            started = record->handle;
            m_events.push_back(started);
        }
    }

    if (!skip) {
        TLOG_INFO(QStringLiteral("ProcessRegistry"),
                  QStringLiteral("execute"),
                  QStringLiteral("process_started"),
                  QStringLiteral("submitted"),
                  QStringLiteral("worker_pool"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"processId", started.id}, {"name", started.name}});
        deliverEvents();

        OperationResult outcome;
        try {
            if (record->function) {
                outcome = record->function(*record->context);
            }
        } catch (const std::exception &ex) {
            outcome.error = Error{ErrorKind::Internal, ex.what()};
        } catch (...) {
            outcome.error = Error{ErrorKind::Internal, "operation raised an unknown exception"};
        }

        ProcessHandle finished;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            Record &current = *record;
            if (!outcome.error) {
                transitionLocked(current, ProcessStatus::Completed,
                                 std::move(outcome.value), std::string());
            } else if (current.handle.cancelRequested) {
                transitionLocked(current, ProcessStatus::Cancelled,
                                 nlohmann::json(), outcome.error->message);
            } else {
                transitionLocked(current, ProcessStatus::Failed,
                                 nlohmann::json(), describeError(*outcome.error));
            }
            finished = current.handle;
            m_events.push_back(finished);
        }

        if (finished.status == ProcessStatus::Failed) {
            TLOG_WARN(QStringLiteral("ProcessRegistry"),
                      QStringLiteral("execute"),
                      QStringLiteral("process_failed"),
                      QStringLiteral("operation_error"),
                      QStringLiteral("capture_error"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"processId", finished.id},
                                     {"name", finished.name},
                                     {"error", finished.error}});
        } else {
            TLOG_INFO(QStringLiteral("ProcessRegistry"),
                      QStringLiteral("execute"),
                      QStringLiteral("process_finished"),
                      qs(toProcessStatusString(finished.status)),
                      QStringLiteral("terminal_transition"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"processId", finished.id}, {"name", finished.name}});
        }
        deliverEvents();
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    record->function = nullptr;
    --m_active;
    m_idleCv.notify_all();
}

bool ProcessRegistry::transitionLocked(Record &record, ProcessStatus status,
                                       nlohmann::json result, std::string error)
{
    if (isTerminal(record.handle.status)) {
        // Only the runner and a cancel of a Pending handle ever transition,
        // and both check the current status under the same lock.
        TLOG_ERROR(QStringLiteral("ProcessRegistry"),
                   QStringLiteral("transitionLocked"),
                   QStringLiteral("double_terminal_transition"),
                   QStringLiteral("invariant_violation"),
                   QStringLiteral("ignored"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"processId", record.handle.id},
                                  {"current", toProcessStatusString(record.handle.status)},
                                  {"requested", toProcessStatusString(status)}});
        Q_ASSERT_X(false, "ProcessRegistry", "second terminal transition");
        return false;
    }

    record.handle.status = status;
    record.handle.finishedAt = m_clock.now();
    if (status == ProcessStatus::Completed) {
        record.handle.progress = 100;
        record.handle.result = std::move(result);
        record.handle.error.clear();
    } else {
        record.handle.result = nlohmann::json();
        record.handle.error = std::move(error);
    }
    return true;
}

void ProcessRegistry::updateProgress(const std::string &id, int percent,
                                     const std::string &message)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(id);
        if (it == m_records.end()) {
            return;
        }
        ProcessHandle &handle = it->second->handle;
        // Reports outside Running would reorder against the terminal event.
        if (handle.status != ProcessStatus::Running) {
            return;
        }
        const int clamped = std::clamp(percent, 0, 100);
        if (clamped == handle.progress && message == handle.progressMessage) {
            return;
        }
        handle.progress = clamped;
        handle.progressMessage = message;
        m_events.push_back(handle);
    }

    TLOG_DEBUG(QStringLiteral("ProcessRegistry"),
               QStringLiteral("updateProgress"),
               QStringLiteral("process_progress"),
               QStringLiteral("operation_report"),
               QStringLiteral("listener_event"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"processId", id}, {"progress", percent}, {"message", message}});
    deliverEvents();
}

bool ProcessRegistry::idleLocked() const
{
    return m_active == 0 && m_events.empty() && !m_delivering;
}

void ProcessRegistry::deliverEvents()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // The thread already draining picks up whatever was queued.
        if (m_delivering) {
            return;
        }
        m_delivering = true;
    }

    for (;;) {
        ProcessHandle handle;
        ChangeListener listener;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_events.empty()) {
                m_delivering = false;
                m_idleCv.notify_all();
                return;
            }
            handle = std::move(m_events.front());
            m_events.pop_front();
            listener = m_listener;
        }

        if (!listener) {
            continue;
        }
        try {
            listener(handle);
        } catch (const std::exception &ex) {
            TLOG_WARN(QStringLiteral("ProcessRegistry"),
                      QStringLiteral("deliverEvents"),
                      QStringLiteral("listener_failed"),
                      QStringLiteral("listener_exception"),
                      QStringLiteral("continue_delivery"),
                      logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"processId", handle.id}, {"error", ex.what()}});
        }
    }
}

double runtimeSeconds(const ProcessHandle &handle, std::chrono::system_clock::time_point now)
{
    if (!handle.startedAt) {
        return 0.0;
    }
    const auto end = handle.finishedAt.value_or(now);
    return std::chrono::duration<double>(end - *handle.startedAt).count();
}

std::string formatRuntime(double seconds)
{
    const long total = seconds < 0 ? 0 : static_cast<long>(seconds);
    if (total < 60) {
        return std::to_string(total) + "s";
    }
    if (total < 3600) {
        return std::to_string(total / 60) + "m " + std::to_string(total % 60) + "s";
    }
    return std::to_string(total / 3600) + "h " + std::to_string((total % 3600) / 60) + "m";
}

} // namespace tongchi
