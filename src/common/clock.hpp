#pragma once

#include <chrono>

namespace tongchi {

// Wall-clock source for TTLs, schedules and retention. Tests substitute a
// manually advanced clock.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::chrono::system_clock::time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() const override
    {
        return std::chrono::system_clock::now();
    }
};

const Clock &systemClock();

} // namespace tongchi
