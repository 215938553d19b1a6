// mydbd_shell：命令行执行 SQL，结果按行输出为 JSON
//
// 用法：mydbd_shell [--config path] [--readonly] [--log] SQL...

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "core/configuration.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "database/connection.hpp"
#include "database/mariadb_driver.hpp"
#include "monitoring/query_log.hpp"

namespace {

struct ShellArguments {
    std::string configPath{"config/mydbd.json"};
    bool readonly = false;
    bool log = false;
    std::vector<std::string> queries;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config path] [--readonly] [--log] SQL..." << std::endl;
}

bool parseArguments(int argc, char** argv, ShellArguments& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return false;
            }
            args.configPath = argv[++i];
        } else if (arg == "--readonly") {
            args.readonly = true;
        } else if (arg == "--log") {
            args.log = true;
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else {
            args.queries.push_back(arg);
        }
    }
    return !args.queries.empty();
}

} // namespace

int main(int argc, char** argv) {
    using namespace mydbd;

    ShellArguments args;
    if (!parseArguments(argc, argv, args)) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    // 加载配置，文件不存在时会生成默认模板
    core::ConfigurationManager configManager(args.configPath);
    auto config = configManager.get();

    core::Logger::instance().configure(config.logging.level, config.logging.file, config.logging.console);

    // 命令行参数优先于配置文件
    if (args.readonly) {
        config.options.readonly = true;
    }
    if (args.log) {
        config.options.queryLog = true;
    }

    database::Connection connection(database::createMariaDbLink(), config.connection, config.options);
    connection.setExtendedConnectionInfo("client", "mydbd_shell");

    int status = EXIT_SUCCESS;
    for (const auto& sql : args.queries) {
        MYDBD_CALL_SITE();
        try {
            auto result = connection.query(sql);
            if (!result) {
                std::cout << nlohmann::json{{"affectedRows", connection.getAffectedRows()}}.dump() << std::endl;
                continue;
            }

            result->setFetchMode(database::FetchMode::Assoc);
            while (auto row = result->next()) {
                std::cout << domain::toJson(*row).dump() << std::endl;
            }
        } catch (const core::SqlError& e) {
            MYDBD_LOG_ERROR("shell", e.formatDiagnostics());
            status = EXIT_FAILURE;
            break;
        }
    }

    if (config.options.queryLog) {
        std::cout << monitoring::QueryLog::instance().toJson().dump(2) << std::endl;
    }

    connection.disconnect();
    return status;
}
