#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

/**
 * @brief 项目统一日志入口（基于 spdlog）
 *
 * 宏使用 fmt 风格占位符：MYLOG_INFO("host={} port={}", host, port);
 * 未调用 Init 之前使用默认控制台 logger。
 */
class MyLog {
public:
    /**
     * @brief 根据 json 初始化日志
     *
     * cfg 示例：
     * {
     *   "level": "info",            // trace/debug/info/warn/error/off
     *   "pattern": "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v",
     *   "file": "logs/fast_pubsub.log",   // 为空则只输出到控制台
     *   "max_size_mb": 10,
     *   "max_files": 3
     * }
     */
    static bool Init(const nlohmann::json& cfg);

    static void Shutdown();

    static std::shared_ptr<spdlog::logger> Logger();

    static void Info(const std::string& msg);
    static void Warn(const std::string& msg);
    static void Error(const std::string& msg);
};

#define MYLOG_DEBUG(...) MyLog::Logger()->debug(__VA_ARGS__)
#define MYLOG_INFO(...)  MyLog::Logger()->info(__VA_ARGS__)
#define MYLOG_WARN(...)  MyLog::Logger()->warn(__VA_ARGS__)
#define MYLOG_ERROR(...) MyLog::Logger()->error(__VA_ARGS__)
