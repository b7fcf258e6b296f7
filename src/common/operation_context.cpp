#include "common/operation_context.hpp"

#include <utility>
#include <vector>

namespace tongchi {

OperationContext::OperationContext(SteadyClock::duration timeout)
    : m_deadline(SteadyClock::now() + timeout)
{
}

std::shared_ptr<OperationContext> OperationContext::create(
    std::optional<SteadyClock::duration> timeout)
{
    if (timeout.has_value() && timeout->count() > 0) {
        return std::make_shared<OperationContext>(*timeout);
    }
    return std::make_shared<OperationContext>();
}

void OperationContext::cancel()
{
    std::vector<std::function<void()>> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled) {
            return;
        }
        m_cancelled = true;
        for (auto &entry : m_callbacks) {
            callbacks.push_back(std::move(entry.second));
        }
        m_callbacks.clear();
    }

    for (const auto &callback : callbacks) {
        callback();
    }
}

bool OperationContext::isCancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool OperationContext::isExpired() const
{
    return m_deadline.has_value() && SteadyClock::now() >= *m_deadline;
}

std::optional<Error> OperationContext::doneError() const
{
    if (isCancelled()) {
        return Error{ErrorKind::Cancelled, "operation cancelled"};
    }
    if (isExpired()) {
        return Error{ErrorKind::Timeout, "operation timed out"};
    }
    return std::nullopt;
}

OperationContext::CallbackId OperationContext::onCancel(std::function<void()> callback) const
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_cancelled) {
            const CallbackId id = m_nextCallbackId++;
            m_callbacks.emplace(id, std::move(callback));
            return id;
        }
    }

    callback();
    return 0;
}

void OperationContext::removeCallback(CallbackId id) const
{
    if (id == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_callbacks.erase(id);
}

void OperationContext::reportProgress(int percent, const std::string &message) const
{
    ProgressHandler handler;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        handler = m_progressHandler;
    }
    if (handler) {
        handler(percent, message);
    }
}

void OperationContext::setProgressHandler(ProgressHandler handler)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_progressHandler = std::move(handler);
}

CancelCallbackGuard::CancelCallbackGuard(const OperationContext &context,
                                         std::function<void()> callback)
    : m_context(context)
    , m_id(context.onCancel(std::move(callback)))
{
}

CancelCallbackGuard::~CancelCallbackGuard()
{
    m_context.removeCallback(m_id);
}

} // namespace tongchi
