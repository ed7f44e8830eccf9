#include "poller.hpp"
#include <iostream>

namespace opcualogger {

Poller::Poller(SessionManager& sessions, PollerOptions options, IClock& clock, const CancellationToken& cancel)
    : sessions_(sessions)
    , options_(std::move(options))
    , clock_(clock)
    , cancel_(cancel)
    , started_(false) {
}

std::optional<Reading> Poller::next() {
    if (cancel_.isCancelled()) {
        return std::nullopt;
    }

    auto now = clock_.steadyNow();
    if (!started_) {
        started_ = true;
        next_tick_ = now;
    } else if (next_tick_ > now) {
        if (!clock_.sleepUntil(next_tick_, cancel_)) {
            return std::nullopt;
        }
    } else if (next_tick_ < now) {
        // 上一次读取超时: 立即触发并重新对齐
        next_tick_ = now;
    }

    Reading reading = readOnce();
    next_tick_ += options_.interval;
    return reading;
}

size_t Poller::run(IReadingHandler& handler) {
    size_t count = 0;
    while (auto reading = next()) {
        handler.handleReading(*reading);
        ++count;
    }
    return count;
}

Reading Poller::readOnce() {
    auto timestamp = std::chrono::time_point_cast<std::chrono::milliseconds>(clock_.wallNow());

    try {
        IRemoteClient& session = sessions_.ensureConnected();
        RemoteValue value = session.readValue(options_.data_point);
        return Reading::ok(timestamp, value.value, value.unit.empty() ? options_.default_unit : value.unit);

    } catch (const ConnectError& e) {
        if (e.isFatal()) {
            throw;
        }
        std::cerr << "\rConnection unavailable: " << e.what() << std::endl;
        return Reading::failed(timestamp, e.what());

    } catch (const ReadError& e) {
        if (!e.isFatal()) {
            // 临时读错误视为会话故障，下一个周期重连
            sessions_.markBroken(e.what());
        }
        std::cerr << "\rError reading " << options_.data_point.toString() << ": " << e.what() << std::endl;
        return Reading::failed(timestamp, e.what());
    }
}

} // namespace opcualogger
