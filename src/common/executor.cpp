#include "common/executor.hpp"

#include <QThreadPool>

#include <utility>

namespace tongchi {

ThreadPoolExecutor::ThreadPoolExecutor(int maxThreads)
    : m_ownedPool(std::make_unique<QThreadPool>())
    , m_pool(m_ownedPool.get())
{
    m_pool->setMaxThreadCount(maxThreads);
}

ThreadPoolExecutor::ThreadPoolExecutor(QThreadPool *pool)
    : m_pool(pool ? pool : QThreadPool::globalInstance())
{
}

ThreadPoolExecutor::~ThreadPoolExecutor()
{
    if (m_ownedPool) {
        m_ownedPool->waitForDone();
    }
}

void ThreadPoolExecutor::post(std::function<void()> work)
{
    m_pool->start(std::move(work));
}

bool ThreadPoolExecutor::waitForDone(int msecs)
{
    return m_pool->waitForDone(msecs);
}

} // namespace tongchi
