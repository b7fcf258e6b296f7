#pragma once

#include <functional>
#include <memory>

class QThreadPool;

namespace tongchi {

// Runs units of work off the caller's thread.
class Executor {
public:
    virtual ~Executor() = default;
    virtual void post(std::function<void()> work) = 0;
};

// Executor backed by a QThreadPool. Owns a private pool unless one is given.
class ThreadPoolExecutor : public Executor {
public:
    explicit ThreadPoolExecutor(int maxThreads = 4);
    explicit ThreadPoolExecutor(QThreadPool *pool);
    ~ThreadPoolExecutor() override;

    void post(std::function<void()> work) override;
    bool waitForDone(int msecs = -1);

private:
    std::unique_ptr<QThreadPool> m_ownedPool;
    QThreadPool *m_pool = nullptr;
};

} // namespace tongchi
