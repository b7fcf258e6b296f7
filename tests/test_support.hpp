#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>

#include "common/clock.hpp"
#include "common/executor.hpp"

// Clock advanced by hand so TTL, schedule and retention checks are exact.
class ManualClock : public tongchi::Clock {
public:
    ManualClock()
        : m_now(std::chrono::system_clock::time_point{std::chrono::hours(24 * 365 * 50)})
    {
    }

    std::chrono::system_clock::time_point now() const override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    void advance(std::chrono::system_clock::duration delta)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += delta;
    }

private:
    mutable std::mutex m_mutex;
    std::chrono::system_clock::time_point m_now;
};

// Runs posted work on the posting thread.
class InlineExecutor : public tongchi::Executor {
public:
    void post(std::function<void()> work) override
    {
        work();
    }
};

// Holds posted work until the test drains it.
class QueuedExecutor : public tongchi::Executor {
public:
    void post(std::function<void()> work) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(std::move(work));
    }

    int runAll()
    {
        int count = 0;
        for (;;) {
            std::function<void()> work;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_queue.empty()) {
                    return count;
                }
                work = std::move(m_queue.front());
                m_queue.pop_front();
            }
            work();
            ++count;
        }
    }

    std::size_t pending() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

private:
    mutable std::mutex m_mutex;
    std::deque<std::function<void()>> m_queue;
};

// Blocks worker threads until the test opens it.
struct Gate {
    std::mutex mutex;
    std::condition_variable cv;
    bool open = false;

    void wait()
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this]() { return open; });
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        cv.notify_all();
    }
};
