#include "common/clock.hpp"

namespace tongchi {

const Clock &systemClock()
{
    static const SystemClock clock;
    return clock;
}

} // namespace tongchi
