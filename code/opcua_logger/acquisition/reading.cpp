#include "reading.hpp"

namespace opcualogger {

Reading Reading::ok(std::chrono::system_clock::time_point timestamp, double value, std::string unit) {
    Reading reading;
    reading.timestamp = timestamp;
    reading.value = value;
    reading.unit = std::move(unit);
    reading.status = ReadingStatus::Ok;
    return reading;
}

Reading Reading::failed(std::chrono::system_clock::time_point timestamp, std::string reason) {
    Reading reading;
    reading.timestamp = timestamp;
    reading.status = ReadingStatus::Failed;
    for (auto& c : reason) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    reading.failure_reason = reason.empty() ? std::string("unknown") : std::move(reason);
    return reading;
}

} // namespace opcualogger
