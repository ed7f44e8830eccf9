#include "opcua_client/config.hpp"
#include "opcua_client/open62541_client.hpp"
#include "lifecycle/lifecycle_controller.hpp"
#include "catalog/catalog_json.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <cmath>
#include <memory>
#include <string>

namespace {

// 全局运行标志
std::atomic<bool> g_running{true};
std::atomic<int> g_signal{0};

/**
 * @brief 信号处理函数
 */
void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_signal = signal;
        g_running = false;
    }
}

/**
 * @brief 显示使用帮助
 */
void showUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--browse [--json]] [config_file]" << std::endl;
    std::cout << "  --browse:    List the server's data points and exit" << std::endl;
    std::cout << "  --json:      Print the browse listing as JSON" << std::endl;
    std::cout << "  config_file: Path to configuration file (default: logger.conf)" << std::endl;
    std::cout << std::endl;
    std::cout << "Exit codes: 0 clean, 1 config error, 2 connect fatal, 3 write fatal, 4 browse failed, 5 unexpected" << std::endl;
    std::cout << std::endl;
    std::cout << "Example:" << std::endl;
    std::cout << "  " << program_name << " logger.conf" << std::endl;
    std::cout << "  " << program_name << " --browse logger.conf" << std::endl;
}

int toInt(opcualogger::ExitCode code) {
    return static_cast<int>(code);
}

int runBrowse(opcualogger::LifecycleController& controller, bool json) {
    using opcualogger::ExitCode;

    opcualogger::BrowseResult result = controller.browseWhile(g_running);

    if (g_signal != 0) {
        std::cout << "Received signal " << g_signal << ", browse stopped early" << std::endl;
    }

    if (json) {
        std::cout << opcualogger::CatalogJsonWriter::render(result) << std::endl;
    } else {
        std::cout << opcualogger::CatalogBrowser::formatListing(result);
        std::cout << result.entries.size() << " nodes listed" << std::endl;
    }

    if (result.error) {
        std::cerr << "Browse incomplete (" << opcualogger::severityName(result.error->severity())
                  << "): " << result.error->what() << std::endl;
        return toInt(ExitCode::BrowseFailed);
    }
    return toInt(ExitCode::Clean);
}

int runAcquisition(opcualogger::LifecycleController& controller) {
    using opcualogger::ExitCode;

    ExitCode code = controller.start();
    if (code != ExitCode::Clean) {
        controller.stop();
        return toInt(code);
    }

    std::cout << "Data acquisition started. Press Ctrl+C to stop." << std::endl;
    std::cout << std::endl;

    // 主循环：显示状态信息
    while (g_running && controller.isRunning()) {
        std::cout << "\rSession: " << opcualogger::sessionStateName(controller.getSessionState())
                  << " | Records: " << controller.recordsWritten() << "   " << std::flush;
        std::this_thread::sleep_for(std::chrono::milliseconds(500));
    }
    std::cout << std::endl;

    if (g_signal != 0) {
        std::cout << "Received signal " << g_signal << ", shutting down..." << std::endl;
    }

    code = controller.stop();
    if (code == ExitCode::Clean) {
        std::cout << "Data acquisition stopped. Goodbye!" << std::endl;
    } else {
        std::cerr << "Data acquisition terminated: " << opcualogger::exitCodeName(code) << std::endl;
    }
    return toInt(code);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using opcualogger::ExitCode;

    // 解析命令行参数
    std::string config_file = "logger.conf";
    bool browse_mode = false;
    bool json_output = false;
    bool config_given = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            showUsage(argv[0]);
            return toInt(ExitCode::Clean);
        } else if (arg == "--browse") {
            browse_mode = true;
        } else if (arg == "--json") {
            json_output = true;
        } else if (!config_given && !arg.empty() && arg[0] != '-') {
            config_file = arg;
            config_given = true;
        } else {
            showUsage(argv[0]);
            return toInt(ExitCode::ConfigError);
        }
    }

    if (json_output && !browse_mode) {
        std::cerr << "--json is only valid together with --browse" << std::endl;
        return toInt(ExitCode::ConfigError);
    }

    std::cout << "OPC UA Telemetry Logger" << std::endl;
    std::cout << "Loading configuration from: " << config_file << std::endl;
    std::cout << std::endl;

    // 加载配置
    auto config = opcualogger::ConfigLoader::loadFromFile(config_file);
    if (!config) {
        std::cerr << "Failed to load configuration" << std::endl;
        return toInt(ExitCode::ConfigError);
    }

    // 设置信号处理 (采集与浏览模式都在收到信号后正常关闭会话)
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        opcualogger::SystemClock clock;
        auto timeout = std::chrono::milliseconds(std::llround(config->connect_timeout_seconds * 1000.0));
        auto client = std::make_unique<opcualogger::Open62541Client>(timeout);

        opcualogger::LifecycleController controller(*config, std::move(client), clock);

        if (browse_mode) {
            return runBrowse(controller, json_output);
        }
        return runAcquisition(controller);

    } catch (const opcualogger::ConnectError& e) {
        std::cerr << "Connect error (" << opcualogger::severityName(e.severity()) << "): " << e.what() << std::endl;
        return toInt(ExitCode::ConnectFatal);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return toInt(ExitCode::Unexpected);
    }
}
