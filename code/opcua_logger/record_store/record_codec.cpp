#include "record_codec.hpp"
#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>

namespace opcualogger {

namespace {

// 记录必须保持单行
std::string singleLine(const std::string& text) {
    std::string out = text;
    for (auto& c : out) {
        if (c == '\n' || c == '\r') {
            c = ' ';
        }
    }
    return out;
}

bool digitsAt(const std::string& text, size_t pos, size_t count) {
    if (pos + count > text.size()) {
        return false;
    }
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

int numberAt(const std::string& text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

} // anonymous namespace

RecordCodec::RecordCodec(TimestampZone zone)
    : zone_(zone) {
}

std::string RecordCodec::format(const Reading& reading) const {
    std::string line = formatTimestamp(reading.timestamp);
    line += ", ";

    if (reading.isOk()) {
        line += formatValue(reading.value);
        if (!reading.unit.empty()) {
            line += " ";
            line += singleLine(reading.unit);
        }
    } else {
        line += kFailedMarker;
        line += reading.failure_reason.empty() ? std::string("unknown") : singleLine(reading.failure_reason);
    }

    return line;
}

std::optional<Reading> RecordCodec::parse(const std::string& line) const {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }

    auto separator = text.find(", ");
    if (separator == std::string::npos) {
        return std::nullopt;
    }

    auto timestamp = parseTimestamp(text.substr(0, separator));
    if (!timestamp) {
        return std::nullopt;
    }

    std::string rest = text.substr(separator + 2);
    const std::string failed_marker = kFailedMarker;
    if (rest.rfind(failed_marker, 0) == 0) {
        return Reading::failed(*timestamp, rest.substr(failed_marker.size()));
    }

    auto space = rest.find(' ');
    auto value = parseValue(rest.substr(0, space));
    if (!value) {
        return std::nullopt;
    }

    std::string unit = (space == std::string::npos) ? std::string() : rest.substr(space + 1);
    return Reading::ok(*timestamp, *value, unit);
}

std::string RecordCodec::formatTimestamp(std::chrono::system_clock::time_point timestamp) const {
    auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp - seconds).count();

    std::time_t time = std::chrono::system_clock::to_time_t(seconds);
    std::tm tm{};
    if (zone_ == TimestampZone::Utc) {
        gmtime_r(&time, &tm);
    } else {
        localtime_r(&time, &tm);
    }

    char date_buffer[32];
    std::strftime(date_buffer, sizeof(date_buffer), "%Y-%m-%d %H:%M:%S", &tm);

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%s.%03d", date_buffer, static_cast<int>(millis));
    std::string text = buffer;

    // 本地时间附带 UTC 偏移，夏令时回拨的一小时内两个时刻仍可区分
    if (zone_ == TimestampZone::Local) {
        char offset_buffer[8];
        if (std::strftime(offset_buffer, sizeof(offset_buffer), "%z", &tm) == 5) {
            text += offset_buffer;
        }
    }
    return text;
}

std::optional<std::chrono::system_clock::time_point> RecordCodec::parseTimestamp(const std::string& text) const {
    // YYYY-MM-DD HH:MM:SS[.mmm][+HHMM]，不带毫秒或偏移的旧格式也接受
    size_t length = text.size();
    std::optional<int> offset_seconds;
    if (length == 24 || length == 28) {
        size_t pos = length - 5;
        if ((text[pos] != '+' && text[pos] != '-') || !digitsAt(text, pos + 1, 4)) {
            return std::nullopt;
        }
        int hours = numberAt(text, pos + 1, 2);
        int minutes = numberAt(text, pos + 3, 2);
        if (hours > 14 || minutes > 59) {
            return std::nullopt;
        }
        int offset = hours * 3600 + minutes * 60;
        offset_seconds = (text[pos] == '-') ? -offset : offset;
        length = pos;
    }
    if (length != 19 && length != 23) {
        return std::nullopt;
    }
    if (!digitsAt(text, 0, 4) || text[4] != '-' || !digitsAt(text, 5, 2) || text[7] != '-'
        || !digitsAt(text, 8, 2) || text[10] != ' ' || !digitsAt(text, 11, 2) || text[13] != ':'
        || !digitsAt(text, 14, 2) || text[16] != ':' || !digitsAt(text, 17, 2)) {
        return std::nullopt;
    }

    int millis = 0;
    if (length == 23) {
        if (text[19] != '.' || !digitsAt(text, 20, 3)) {
            return std::nullopt;
        }
        millis = numberAt(text, 20, 3);
    }

    std::tm tm{};
    tm.tm_year = numberAt(text, 0, 4) - 1900;
    tm.tm_mon = numberAt(text, 5, 2) - 1;
    tm.tm_mday = numberAt(text, 8, 2);
    tm.tm_hour = numberAt(text, 11, 2);
    tm.tm_min = numberAt(text, 14, 2);
    tm.tm_sec = numberAt(text, 17, 2);
    tm.tm_isdst = -1;

    if (tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
        return std::nullopt;
    }

    std::time_t time = 0;
    if (offset_seconds) {
        time = timegm(&tm) - *offset_seconds;
    } else {
        time = (zone_ == TimestampZone::Utc) ? timegm(&tm) : std::mktime(&tm);
    }
    return std::chrono::system_clock::from_time_t(time) + std::chrono::milliseconds(millis);
}

std::string RecordCodec::formatValue(double value) {
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    return std::string(buffer, result.ptr);
}

std::optional<double> RecordCodec::parseValue(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace opcualogger
