#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace tongchi {

// Cooperative cancellation and deadline carried into every Lister call,
// scheduled task execution and long-running operation.
class OperationContext {
public:
    using SteadyClock = std::chrono::steady_clock;
    using CallbackId = std::uint64_t;
    using ProgressHandler = std::function<void(int percent, const std::string &message)>;

    OperationContext() = default;
    explicit OperationContext(SteadyClock::duration timeout);

    OperationContext(const OperationContext &) = delete;
    OperationContext &operator=(const OperationContext &) = delete;

    static std::shared_ptr<OperationContext> create(
        std::optional<SteadyClock::duration> timeout = std::nullopt);

    void cancel();
    bool isCancelled() const;
    bool isExpired() const;
    bool isDone() const { return isCancelled() || isExpired(); }

    std::optional<SteadyClock::time_point> deadline() const { return m_deadline; }

    // Cancelled or Timeout error describing why the context is done.
    std::optional<Error> doneError() const;

    // Runs the callback once on cancel(), or immediately if already cancelled.
    // Callbacks must not call back into this context.
    CallbackId onCancel(std::function<void()> callback) const;
    void removeCallback(CallbackId id) const;

    // No-op unless the owner installed a handler.
    void reportProgress(int percent, const std::string &message = std::string()) const;
    void setProgressHandler(ProgressHandler handler);

private:
    std::optional<SteadyClock::time_point> m_deadline;

    mutable std::mutex m_mutex;
    bool m_cancelled = false;
    mutable CallbackId m_nextCallbackId = 1;
    mutable std::map<CallbackId, std::function<void()>> m_callbacks;
    ProgressHandler m_progressHandler;
};

// Removes an onCancel registration when the waiting scope ends.
class CancelCallbackGuard {
public:
    CancelCallbackGuard(const OperationContext &context, std::function<void()> callback);
    ~CancelCallbackGuard();

    CancelCallbackGuard(const CancelCallbackGuard &) = delete;
    CancelCallbackGuard &operator=(const CancelCallbackGuard &) = delete;

private:
    const OperationContext &m_context;
    OperationContext::CallbackId m_id;
};

} // namespace tongchi
