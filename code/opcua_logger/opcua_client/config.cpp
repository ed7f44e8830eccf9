#include "config.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace opcualogger {

std::optional<LoggerConfig> ConfigLoader::loadFromFile(const std::filesystem::path& config_file_path) {
    std::ifstream file(config_file_path);
    if (!file.is_open()) {
        std::cerr << "Cannot open config file: " << config_file_path << std::endl;
        return std::nullopt;
    }

    auto config = parse(file);
    if (!config) {
        std::cerr << "Failed to parse config file: " << config_file_path << std::endl;
        return std::nullopt;
    }

    std::cout << "Configuration loaded successfully:" << std::endl;
    std::cout << "- Server URL: " << config->server_url << std::endl;
    std::cout << "- Security Mode: " << config->security_mode << std::endl;
    if (config->data_point) {
        std::cout << "- Data point: " << config->data_point->toString() << std::endl;
    }
    std::cout << "- Log file: " << config->log_file.string() << std::endl;
    std::cout << "- Poll interval: " << config->poll_interval_seconds << "s" << std::endl;

    return config;
}

std::optional<LoggerConfig> ConfigLoader::parse(std::istream& input) {
    LoggerConfig config;

    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);

        // 跳过空行和注释
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // 解析键值对
        auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, pos));
        std::string value = trim(line.substr(pos + 1));

        // 移除方括号（如果有）
        if (key.size() >= 2 && key[0] == '[' && key.back() == ']') {
            key = key.substr(1, key.size() - 2);
        }

        if (key == "OPC_UA_URL") {
            config.server_url = value;
        } else if (key == "OPC_UA_SecurityMode") {
            config.security_mode = value;
        } else if (key == "OPC_UA_Username") {
            config.username = value;
        } else if (key == "OPC_UA_Password") {
            config.password = value;
        } else if (key == "DataPointId") {
            config.data_point = DataPointId::parse(value);
            if (!config.data_point) {
                std::cerr << "Invalid DataPointId value: " << value << std::endl;
                return std::nullopt;
            }
        } else if (key == "Unit") {
            config.unit = value;
        } else if (key == "LogFile") {
            config.log_file = value;
        } else if (key == "PollIntervalSeconds") {
            parseSeconds(key, value, config.poll_interval_seconds);
        } else if (key == "ConnectTimeoutSeconds") {
            parseSeconds(key, value, config.connect_timeout_seconds);
        } else if (key == "ReconnectBaseSeconds") {
            parseSeconds(key, value, config.reconnect_base_seconds);
        } else if (key == "ReconnectMaxSeconds") {
            parseSeconds(key, value, config.reconnect_max_seconds);
        } else if (key == "ReconnectJitter") {
            config.reconnect_jitter = parseBool(value);
        } else if (key == "MaxBrowseDepth") {
            try {
                size_t consumed = 0;
                long long depth = std::stoll(value, &consumed);
                if (consumed != value.size()) {
                    throw std::invalid_argument(value);
                }
                if (depth < 1 || depth > static_cast<long long>(kMaxBrowseDepth)) {
                    std::cerr << "MaxBrowseDepth must be between 1 and " << kMaxBrowseDepth << std::endl;
                    return std::nullopt;
                }
                config.max_browse_depth = static_cast<uint32_t>(depth);
            } catch (const std::exception&) {
                std::cerr << "Invalid MaxBrowseDepth value: " << value << std::endl;
            }
        } else if (key == "BrowseRoot") {
            auto root = DataPointId::parse(value);
            if (!root) {
                std::cerr << "Invalid BrowseRoot value: " << value << std::endl;
                return std::nullopt;
            }
            config.browse_root = *root;
        } else if (key == "TimestampUtc") {
            config.timestamp_utc = parseBool(value);
        } else if (key == "Verbose") {
            config.verbose = parseBool(value);
        } else {
            std::cerr << "Ignoring unknown config key: " << key << std::endl;
        }
    }

    // 验证必要配置
    if (config.server_url.empty()) {
        std::cerr << "Server URL is required in config file" << std::endl;
        return std::nullopt;
    }

    // 时间值必须有限且不超过一天，换算成毫秒后不会溢出
    const std::pair<const char*, double> durations[] = {
        {"PollIntervalSeconds", config.poll_interval_seconds},
        {"ConnectTimeoutSeconds", config.connect_timeout_seconds},
        {"ReconnectBaseSeconds", config.reconnect_base_seconds},
        {"ReconnectMaxSeconds", config.reconnect_max_seconds},
    };
    for (const auto& duration : durations) {
        if (!std::isfinite(duration.second) || duration.second > kMaxSeconds) {
            std::cerr << duration.first << " must be a finite number of at most " << kMaxSeconds
                      << " seconds" << std::endl;
            return std::nullopt;
        }
    }

    if (config.poll_interval_seconds <= 0.0) {
        std::cerr << "PollIntervalSeconds must be greater than zero" << std::endl;
        return std::nullopt;
    }

    if (config.connect_timeout_seconds <= 0.0) {
        std::cerr << "ConnectTimeoutSeconds must be greater than zero" << std::endl;
        return std::nullopt;
    }

    if (config.reconnect_base_seconds <= 0.0 || config.reconnect_max_seconds < config.reconnect_base_seconds) {
        std::cerr << "Reconnect backoff requires 0 < ReconnectBaseSeconds <= ReconnectMaxSeconds" << std::endl;
        return std::nullopt;
    }

    if (config.max_browse_depth == 0) {
        std::cerr << "MaxBrowseDepth must be at least 1" << std::endl;
        return std::nullopt;
    }

    if (config.log_file.empty()) {
        std::cerr << "LogFile must not be empty" << std::endl;
        return std::nullopt;
    }

    return config;
}

bool ConfigLoader::parseSeconds(const std::string& key, const std::string& value, double& out) {
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        std::cerr << "Invalid " << key << " value: " << value << std::endl;
        return false;
    }
}

bool ConfigLoader::parseBool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower == "true" || lower == "1" || lower == "yes";
}

std::string ConfigLoader::trim(const std::string& str) {
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }

    return std::string(start, end);
}

} // namespace opcualogger
