#include "MyLog.h"

#include <iostream>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

const char* kLoggerName = "fast_pubsub";
const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

std::mutex g_log_mtx;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> makeConsoleLogger() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_pattern(kDefaultPattern);
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace

bool MyLog::Init(const nlohmann::json& config) {
    const nlohmann::json cfg = config.is_object() ? config : nlohmann::json::object();

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    const std::string file = cfg.value("file", std::string());
    if (!file.empty()) {
        const size_t max_size = static_cast<size_t>(cfg.value("max_size_mb", 10)) * 1024 * 1024;
        const size_t max_files = static_cast<size_t>(cfg.value("max_files", 3));
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, max_size, max_files));
        } catch (const spdlog::spdlog_ex& e) {
            // 文件 sink 创建失败时退化为仅控制台
            std::cerr << "[MyLog] failed to open log file " << file << ": " << e.what() << std::endl;
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_pattern(cfg.value("pattern", std::string(kDefaultPattern)));

    const std::string level = cfg.value("level", std::string("info"));
    logger->set_level(spdlog::level::from_str(level));
    logger->flush_on(spdlog::level::warn);

    {
        std::lock_guard<std::mutex> lk(g_log_mtx);
        g_logger = logger;
    }
    logger->info("MyLog initialized level={} file={}", level, file.empty() ? "<console>" : file);
    return true;
}

void MyLog::Shutdown() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_logger) {
        g_logger->flush();
    }
    g_logger.reset();
}

std::shared_ptr<spdlog::logger> MyLog::Logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_logger) {
        g_logger = makeConsoleLogger();
    }
    return g_logger;
}

void MyLog::Info(const std::string& msg) {
    Logger()->info("{}", msg);
}

void MyLog::Warn(const std::string& msg) {
    Logger()->warn("{}", msg);
}

void MyLog::Error(const std::string& msg) {
    Logger()->error("{}", msg);
}
