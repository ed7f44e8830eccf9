#include "lifecycle_controller.hpp"
#include <cmath>
#include <future>
#include <iostream>

namespace opcualogger {

namespace {

std::chrono::milliseconds toMillis(double seconds) {
    auto millis = static_cast<int64_t>(std::llround(seconds * 1000.0));
    return std::chrono::milliseconds(millis < 1 ? 1 : millis);
}

ReconnectPolicy makePolicy(const LoggerConfig& config) {
    ReconnectPolicy policy;
    policy.base_delay = toMillis(config.reconnect_base_seconds);
    policy.max_delay = toMillis(config.reconnect_max_seconds);
    policy.full_jitter = config.reconnect_jitter;
    return policy;
}

} // anonymous namespace

const char* exitCodeName(ExitCode code) {
    switch (code) {
        case ExitCode::Clean: return "Clean";
        case ExitCode::ConfigError: return "ConfigError";
        case ExitCode::ConnectFatal: return "ConnectFatal";
        case ExitCode::WriteFatal: return "WriteFatal";
        case ExitCode::BrowseFailed: return "BrowseFailed";
        case ExitCode::Unexpected: return "Unexpected";
        default: return "Unknown";
    }
}

LifecycleController::LifecycleController(const LoggerConfig& config,
                                         std::unique_ptr<IRemoteClient> client,
                                         IClock& clock)
    : config_(config)
    , clock_(clock)
    , sessions_(Endpoint::parse(config.server_url, config.security_mode, config.username, config.password),
                std::move(client), makePolicy(config), clock)
    , running_(false)
    , exit_code_(ExitCode::Clean) {
}

LifecycleController::~LifecycleController() {
    stop();
}

ExitCode LifecycleController::start() {
    if (running_) {
        std::cout << "Acquisition is already running" << std::endl;
        return ExitCode::Clean;
    }

    // 取消标志只能置位一次，停止后不能再次启动
    if (cancel_.isCancelled()) {
        std::cerr << "Acquisition was already stopped" << std::endl;
        return exitCode();
    }

    if (!config_.data_point) {
        std::cerr << "DataPointId is required for acquisition" << std::endl;
        fail(ExitCode::ConfigError);
        return ExitCode::ConfigError;
    }

    // 启动时的致命连接错误直接退出，不触碰记录存储
    try {
        sessions_.connect();
    } catch (const ConnectError& e) {
        if (e.isFatal()) {
            std::cerr << "Fatal connect error: " << e.what() << std::endl;
            fail(ExitCode::ConnectFatal);
            return ExitCode::ConnectFatal;
        }
        std::cerr << "Initial connection failed, will keep retrying: " << e.what() << std::endl;
    }

    RecordCodec codec(config_.timestamp_utc ? TimestampZone::Utc : TimestampZone::Local);
    logger_ = std::make_shared<DurableLogger>(config_.log_file, codec);
    try {
        logger_->recover();
    } catch (const WriteError& e) {
        std::cerr << "Fatal write error: " << e.what() << std::endl;
        fail(ExitCode::WriteFatal);
        sessions_.disconnect();
        return ExitCode::WriteFatal;
    }

    auto console_handler = std::make_shared<ConsoleReadingHandler>(codec);
    console_handler->setVerbose(config_.verbose);
    handler_ = std::make_shared<CompositeReadingHandler>(logger_, console_handler);

    PollerOptions options;
    options.data_point = *config_.data_point;
    options.interval = toMillis(config_.poll_interval_seconds);
    options.default_unit = config_.unit;
    poller_ = std::make_unique<Poller>(sessions_, options, clock_, cancel_);

    running_ = true;
    worker_thread_ = std::thread(&LifecycleController::acquisitionLoop, this);

    std::cout << "Logging " << options.data_point.toString() << " every " << options.interval.count()
              << " ms to " << config_.log_file.string() << std::endl;
    return ExitCode::Clean;
}

void LifecycleController::requestStop() {
    cancel_.cancel();
}

ExitCode LifecycleController::stop() {
    cancel_.cancel();

    // 等待当前读取和写入完成
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    sessions_.disconnect();
    return exitCode();
}

ExitCode LifecycleController::runAcquisition() {
    ExitCode code = start();
    if (code != ExitCode::Clean) {
        sessions_.disconnect();
        return code;
    }

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    sessions_.disconnect();
    return exitCode();
}

BrowseResult LifecycleController::browse() {
    IRemoteClient& session = sessions_.connect();

    CatalogBrowser browser(config_.max_browse_depth, &cancel_);
    BrowseResult result = browser.browse(session, config_.browse_root);

    sessions_.disconnect();
    return result;
}

BrowseResult LifecycleController::browseWhile(const std::atomic<bool>& keep_running,
                                              std::chrono::milliseconds check_interval) {
    auto pending = std::async(std::launch::async, [this] { return browse(); });

    bool stop_requested = false;
    while (pending.wait_for(check_interval) != std::future_status::ready) {
        if (!stop_requested && !keep_running.load()) {
            requestStop();
            stop_requested = true;
        }
    }

    // 浏览线程中的 ConnectError 在这里重新抛出
    return pending.get();
}

void LifecycleController::acquisitionLoop() {
    try {
        size_t count = poller_->run(*handler_);
        std::cout << "\rAcquisition stopped after " << count << " readings" << std::endl;

    } catch (const ConnectError& e) {
        std::cerr << "\rFatal connect error: " << e.what() << std::endl;
        fail(ExitCode::ConnectFatal);
    } catch (const WriteError& e) {
        std::cerr << "\rFatal write error: " << e.what() << std::endl;
        fail(ExitCode::WriteFatal);
    } catch (const std::exception& e) {
        std::cerr << "\rUnexpected error: " << e.what() << std::endl;
        fail(ExitCode::Unexpected);
    }

    running_ = false;
}

void LifecycleController::fail(ExitCode code) {
    ExitCode expected = ExitCode::Clean;
    exit_code_.compare_exchange_strong(expected, code);
    cancel_.cancel();
}

} // namespace opcualogger
