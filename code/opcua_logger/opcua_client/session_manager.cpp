#include "session_manager.hpp"
#include <algorithm>
#include <iostream>

namespace opcualogger {

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "Disconnected";
        case SessionState::Connecting: return "Connecting";
        case SessionState::Connected: return "Connected";
        case SessionState::Closing: return "Closing";
        default: return "Unknown";
    }
}

SessionManager::SessionManager(Endpoint endpoint,
                               std::unique_ptr<IRemoteClient> client,
                               ReconnectPolicy policy,
                               IClock& clock,
                               uint32_t seed)
    : endpoint_(std::move(endpoint))
    , client_(std::move(client))
    , policy_(policy)
    , clock_(clock)
    , rng_(seed)
    , state_(SessionState::Disconnected)
    , consecutive_failures_(0)
    , retry_armed_(false) {
}

SessionManager::~SessionManager() {
    disconnect();
}

IRemoteClient& SessionManager::connect() {
    if (getState() == SessionState::Connected) {
        if (client_->isAlive()) {
            return *client_;
        }
        closeSession("session no longer alive");
    }

    updateState(SessionState::Connecting, "connecting to " + endpoint_.url);

    try {
        client_->connect(endpoint_);
    } catch (const ConnectError& e) {
        client_->close();
        updateState(SessionState::Disconnected, e.what());
        if (!e.isFatal()) {
            scheduleRetry();
        }
        throw;
    }

    consecutive_failures_ = 0;
    retry_armed_ = false;
    updateState(SessionState::Connected, "session activated");
    return *client_;
}

IRemoteClient& SessionManager::ensureConnected() {
    if (getState() == SessionState::Connected) {
        if (client_->isAlive()) {
            return *client_;
        }
        closeSession("session no longer alive");
    }

    if (retry_armed_) {
        auto now = clock_.steadyNow();
        if (now < next_attempt_) {
            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(next_attempt_ - now);
            throw ConnectError(ErrorSeverity::Transient,
                               "reconnect backoff, next attempt in " + std::to_string(wait.count()) + " ms");
        }
    }

    return connect();
}

void SessionManager::markBroken(const std::string& reason) {
    if (getState() == SessionState::Connected) {
        closeSession(reason);
    }
}

void SessionManager::disconnect() {
    if (getState() == SessionState::Disconnected) {
        return;
    }
    closeSession("disconnect requested");
}

void SessionManager::closeSession(const std::string& reason) {
    updateState(SessionState::Closing, reason);
    client_->close();
    updateState(SessionState::Disconnected, reason);
}

void SessionManager::scheduleRetry() {
    // 指数退避: 逐次翻倍，达到上限即停止
    std::chrono::milliseconds delay = std::min(policy_.base_delay, policy_.max_delay);
    for (uint32_t i = 0; i < consecutive_failures_ && delay < policy_.max_delay; ++i) {
        delay = (delay > policy_.max_delay / 2) ? policy_.max_delay : delay * 2;
    }

    if (policy_.full_jitter) {
        std::uniform_int_distribution<int64_t> distribution(0, delay.count());
        delay = std::chrono::milliseconds(distribution(rng_));
    }

    ++consecutive_failures_;
    retry_armed_ = true;
    next_attempt_ = clock_.steadyNow() + delay;

    std::cerr << "Reconnect attempt " << consecutive_failures_ << " failed, next attempt in "
              << delay.count() << " ms" << std::endl;
}

void SessionManager::updateState(SessionState new_state, const std::string& reason) {
    SessionState old_state = state_.exchange(new_state);
    if (old_state == new_state) {
        return;
    }

    std::cout << "\rSession " << sessionStateName(old_state) << " -> " << sessionStateName(new_state)
              << " (" << reason << ")" << std::endl;

    if (listener_) {
        listener_(old_state, new_state, reason);
    }
}

} // namespace opcualogger
