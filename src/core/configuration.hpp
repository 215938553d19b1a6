#pragma once

#include <cstdint>
#include <string>

#include "core/logger.hpp"

namespace mydbd::core {

// 连接信息（空字符串表示交给客户端库使用默认值）
struct ConnectionInfo {
    std::string hostname;   // 主机名或 IP，空或 "localhost" 时走本地 socket
    std::string username;
    std::string password;
    std::string database;   // 默认数据库
    uint16_t port = 0;  // 0 表示默认端口 3306
    std::string socket; // unix socket 路径
};

// 连接行为选项
struct ConnectionOptions {
    bool compression = false;   // 压缩协议
    bool ssl = false;
    bool foundRows = false; // 返回匹配行数而不是受影响行数
    bool ignoreSpace = false;   // 允许函数名后有空格
    bool readonly = false;  // 只读连接，写语句会抛 ReadOnlyError
    bool queryLog = false;  // 所有命令写入 QueryLog
    bool queryPrepareCache = false; // query() 带参数时使用 prepareCached()
    bool clientInteractive = false; // 使用 interactive_timeout 而不是 wait_timeout
    unsigned connectTimeout = 0;    // 连接超时（秒），0 表示不设置
    unsigned waitTimeout = 0;   // 连接建立后执行 SET wait_timeout，0 表示不设置
};

// 日志配置
struct LoggingConfig {
    LogLevel level = LogLevel::Info;
    std::string file;   // 为空则只输出到控制台
    bool console = true;
};

// 聚合所有配置
struct Configuration {
    ConnectionInfo connection;
    ConnectionOptions options;
    LoggingConfig logging;
};

// 配置管理器
class ConfigurationManager {
public:
    // 构造函数：加载配置文件，文件不存在时生成默认模板
    explicit ConfigurationManager(std::string path);

    const Configuration& get() const { return config_; }

    // 从 JSON 字符串解析配置，解析失败时记录日志并返回默认值
    static Configuration fromJson(const std::string& jsonText);

    // 生成默认配置 JSON（文件不存在时写入磁盘）
    static std::string defaultJson();

private:
    void loadFromDisk();

    Configuration config_;
    std::string path_;
};

} // namespace mydbd::core
