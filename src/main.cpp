#include "Config.hpp"
#include "ErrorHandler.hpp"
#include "SchemaDumper.hpp"
#include "OracleConnection.hpp"
#include "OracleSchemaManager.hpp"
#include "OracleDialectTranslator.hpp"
#include "OraclePrimaryKeyResolver.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace oraenhanced;

namespace {

void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // Console logs go to stderr so stdout carries only the dump
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::warn);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("ora-enhanced", sinks.begin(), sinks.end());
        logger->set_level(debug ? spdlog::level::debug : spdlog::level::info);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    setupLogging(config.debug, config.log_file);

    if (!config.validate()) {
        return 1;
    }

    spdlog::info("Connecting to {}:{} as {}", config.connection.host,
                 config.connection.port, config.connection.user);

    try {
        OracleConnection connection(config.connection, config.adapter);
        connection.open();

        std::vector<int> version = connection.databaseVersion();
        spdlog::info("Oracle Database version {}", version.empty() ? 0 : version[0]);

        OracleSchemaManager schema(connection, config.adapter);
        OracleDialectTranslator translator(config.adapter, version);
        OraclePrimaryKeyResolver keys(connection, schema, translator);

        DumpOptions options;
        options.pretty = config.pretty;
        SchemaDumper dumper(schema, &keys, options);

        json document = config.table.empty() ? dumper.dumpSchema() : dumper.dumpTable(config.table);
        std::cout << dumper.toString(document) << std::endl;

        connection.close();
    } catch (const ConnectionException& e) {
        spdlog::error("Connection failed: {}", e.what());
        return 2;
    } catch (const DatabaseError& e) {
        spdlog::error("Dump failed (ORA-{:05d}): {}", e.errorCode(), e.what());
        return 1;
    }

    return 0;
}
