#include "cancellation.hpp"

namespace opcualogger {

bool CancellationToken::cancel() {
    bool first = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        first = !cancelled_.exchange(true);
    }
    cv_.notify_all();
    return first;
}

bool CancellationToken::waitUntil(std::chrono::steady_clock::time_point deadline) const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this]() {
        return cancelled_.load();
    });
    return !cancelled_.load();
}

} // namespace opcualogger
