#include "core/configuration.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace mydbd::core {

// 构造函数：初始化时加载配置
ConfigurationManager::ConfigurationManager(std::string path)
    : path_(std::move(path)) {
    loadFromDisk(); // 从文件加载（覆盖默认值）
}

// 从磁盘加载配置文件
void ConfigurationManager::loadFromDisk() {
    std::ifstream in(path_);

    if (!in.good()) {   // 文件不存在，则创建目录并生成默认配置
        auto parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
        std::ofstream out(path_);
        out << defaultJson();
        out.close();
        MYDBD_LOG_WARN("config", "Configuration file missing. A default template was created at ", path_);
        config_ = fromJson(defaultJson());
        return;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    config_ = fromJson(buffer.str());
}

// 从 JSON 解析配置内容并返回聚合配置
Configuration ConfigurationManager::fromJson(const std::string& jsonText) {
    Configuration cfg;
    try {
        auto json = nlohmann::json::parse(jsonText);

        if (auto it = json.find("connection"); it != json.end()) {
            cfg.connection.hostname = it->value("hostname", cfg.connection.hostname);
            cfg.connection.username = it->value("username", cfg.connection.username);
            cfg.connection.password = it->value("password", cfg.connection.password);
            cfg.connection.database = it->value("database", cfg.connection.database);
            cfg.connection.port = it->value("port", cfg.connection.port);
            cfg.connection.socket = it->value("socket", cfg.connection.socket);
        }

        if (auto it = json.find("options"); it != json.end()) {
            cfg.options.compression = it->value("compression", cfg.options.compression);
            cfg.options.ssl = it->value("ssl", cfg.options.ssl);
            cfg.options.foundRows = it->value("foundRows", cfg.options.foundRows);
            cfg.options.ignoreSpace = it->value("ignoreSpace", cfg.options.ignoreSpace);
            cfg.options.readonly = it->value("readonly", cfg.options.readonly);
            cfg.options.queryLog = it->value("queryLog", cfg.options.queryLog);
            cfg.options.queryPrepareCache = it->value("queryPrepareCache", cfg.options.queryPrepareCache);
            cfg.options.clientInteractive = it->value("clientInteractive", cfg.options.clientInteractive);
            cfg.options.connectTimeout = it->value("connectTimeout", cfg.options.connectTimeout);
            cfg.options.waitTimeout = it->value("waitTimeout", cfg.options.waitTimeout);
        }

        if (auto it = json.find("logging"); it != json.end()) {
            cfg.logging.level = parseLogLevel(it->value("level", std::string("info")), cfg.logging.level);
            cfg.logging.file = it->value("file", cfg.logging.file);
            cfg.logging.console = it->value("console", cfg.logging.console);
        }

    } catch (const std::exception& ex) {
        MYDBD_LOG_ERROR("config", "Failed to parse configuration. Using defaults. Error: ", ex.what());
        return Configuration{};
    }
    return cfg;
}

// 生成默认json
std::string ConfigurationManager::defaultJson() {
    nlohmann::json json{
        {"connection",
         {{"hostname", "127.0.0.1"},
          {"username", "root"},
          {"password", ""},
          {"database", "test"},
          {"port", 3306},
          {"socket", ""}}},
        {"options",
         {{"compression", false},
          {"ssl", false},
          {"foundRows", false},
          {"ignoreSpace", false},
          {"readonly", false},
          {"queryLog", false},
          {"queryPrepareCache", false},
          {"clientInteractive", false},
          {"connectTimeout", 0},
          {"waitTimeout", 0}}},
        {"logging",
         {{"level", "info"},
          {"file", ""},
          {"console", true}}}
    };

    return json.dump(4);    //缩进4个空格
}

} // namespace mydbd::core
