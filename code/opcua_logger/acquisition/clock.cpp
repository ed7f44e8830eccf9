#include "clock.hpp"

namespace opcualogger {

std::chrono::system_clock::time_point SystemClock::wallNow() const {
    return std::chrono::system_clock::now();
}

std::chrono::steady_clock::time_point SystemClock::steadyNow() const {
    return std::chrono::steady_clock::now();
}

bool SystemClock::sleepUntil(std::chrono::steady_clock::time_point deadline,
                             const CancellationToken& cancel) {
    return cancel.waitUntil(deadline);
}

} // namespace opcualogger
