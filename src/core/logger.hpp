#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

namespace mydbd::core {

enum class LogLevel {
    Trace = 0,  //指定枚举从0开始，后面的都等于前项+1
    Debug,
    Info,
    Warn,
    Error,
    Critical
};

// 从配置里的字符串（"debug"、"info"...）解析日志级别，不认识的返回 fallback
LogLevel parseLogLevel(std::string_view text, LogLevel fallback = LogLevel::Info);

// Logger 类（单例模式）
class Logger {
public:
    // 获取全局唯一的 Logger 实例
    static Logger& instance();

    // 配置日志（启动时调用一次）
    // level: 最低日志级别
    // filePath: 日志文件路径（为空则不写文件）
    // useConsole: 是否同时输出到控制台
    void configure(LogLevel level, const std::string& filePath = "", bool useConsole = true);

    LogLevel level() const { return minLevel_.load(); }

    // 可变参数模板日志函数
    // MYDBD_LOG_INFO("connection", "Connected to ", host, ":", port);
    template <typename... Args>
    void log(LogLevel level, std::string_view component, Args&&... args) {
        // 不符合级别就直接返回，避免格式化开销
        if (level < minLevel_.load()) {
            return;
        }

        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));   // 折叠表达式

        write(level, component, oss.str());
    }

private:
    Logger() = default;
    ~Logger() = default;

    // 实际的日志写入逻辑
    void write(LogLevel level, std::string_view component, const std::string& message);

    std::string levelToString(LogLevel level) const;

    std::mutex mutex_;
    std::atomic<LogLevel> minLevel_{LogLevel::Info};    // 最低日志级别
    std::ofstream fileStream_;
    bool consoleEnabled_{true};
    bool fileEnabled_{false};
};

} // namespace mydbd::core

#define MYDBD_LOG_TRACE(component, ...) ::mydbd::core::Logger::instance().log(::mydbd::core::LogLevel::Trace, component, __VA_ARGS__)
#define MYDBD_LOG_DEBUG(component, ...) ::mydbd::core::Logger::instance().log(::mydbd::core::LogLevel::Debug, component, __VA_ARGS__)
#define MYDBD_LOG_INFO(component, ...)  ::mydbd::core::Logger::instance().log(::mydbd::core::LogLevel::Info, component, __VA_ARGS__)
#define MYDBD_LOG_WARN(component, ...)  ::mydbd::core::Logger::instance().log(::mydbd::core::LogLevel::Warn, component, __VA_ARGS__)
#define MYDBD_LOG_ERROR(component, ...) ::mydbd::core::Logger::instance().log(::mydbd::core::LogLevel::Error, component, __VA_ARGS__)
#define MYDBD_LOG_CRITICAL(component, ...) ::mydbd::core::Logger::instance().log(::mydbd::core::LogLevel::Critical, component, __VA_ARGS__)
