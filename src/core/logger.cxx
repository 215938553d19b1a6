#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iostream>

namespace mydbd::core {

LogLevel parseLogLevel(std::string_view text, LogLevel fallback) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    return fallback;
}

//单例（C++11 保证静态局部变量初始化线程安全）
Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

//配置方法（设置最低日志级别、打印到哪个文件、是否要输出到控制台）
void Logger::configure(LogLevel level, const std::string& filePath, bool useConsole) {
    std::lock_guard<std::mutex> lk(mutex_);

    minLevel_.store(level);
    consoleEnabled_ = useConsole;

    // 重新配置时先关闭旧文件
    if (fileStream_.is_open()) {
        fileStream_.close();
    }
    fileEnabled_ = false;

    if (!filePath.empty()) {
        auto parent = std::filesystem::path(filePath).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
        fileStream_.open(filePath, std::ios::out | std::ios::app);  // 追加写入
        fileEnabled_ = fileStream_.is_open();
    }
}

std::string Logger::levelToString(LogLevel level) const {
    switch (level) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    default: return "UNKNOWN";
    }
}

// 核心日志写入逻辑
void Logger::write(LogLevel level, std::string_view component, const std::string& message) {
    std::lock_guard<std::mutex> lk(mutex_);

    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};

#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    // 格式化前缀：[2024-01-14 10:30:45] [INFO] [connection]
    std::ostringstream prefix;
    prefix << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
           << " [" << levelToString(level) << "]"
           << " [" << component << "] ";

    if (consoleEnabled_) {
        // 错误级别走 stderr，其余走 stdout
        auto& out = level >= LogLevel::Error ? std::cerr : std::cout;
        out << prefix.str() << message << std::endl;
    }
    if (fileEnabled_) {
        fileStream_ << prefix.str() << message << std::endl;
    }
}

} // namespace mydbd::core
