#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace oraenhanced {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool parseBool(const std::string& value) {
    std::string lower = toLower(value);
    return lower == "true" || lower == "1" || lower == "yes" || lower == "on";
}

// "table=TS_DATA,index=TS_INDEX"
std::map<std::string, std::string> parseTablespaces(const std::string& str) {
    std::map<std::string, std::string> result;
    std::string current;
    auto flush = [&result](const std::string& item) {
        auto eq = item.find('=');
        if (eq == std::string::npos) return;
        std::string kind = toLower(trim(item.substr(0, eq)));
        std::string ts = trim(item.substr(eq + 1));
        if (!kind.empty() && !ts.empty()) {
            result[kind] = ts;
        }
    };
    for (char c : str) {
        if (c == ',') {
            flush(current);
            current.clear();
        } else {
            current += c;
        }
    }
    flush(current);
    return result;
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    int line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = toLower(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq_pos)));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "connection") {
                if (key == "host") config.connection.host = value;
                else if (key == "port") config.connection.port = static_cast<uint16_t>(std::stoi(value));
                else if (key == "user" || key == "username") config.connection.user = value;
                else if (key == "password") config.connection.password = value;
                else if (key == "database") config.connection.database = value;
                else if (key == "privilege") config.connection.privilege = value;
                else if (key == "prefetch_rows")
                    config.connection.prefetch_rows = static_cast<uint32_t>(std::stoul(value));
                else if (key == "cursor_sharing") config.connection.cursor_sharing = value;
                else if (key == "time_zone") config.connection.time_zone = value;
                else if (key == "connect_timeout")
                    config.connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
            }
            else if (current_section == "nls") {
                // Empty value removes a default NLS setting
                if (value.empty()) config.connection.nls.erase(key);
                else config.connection.nls[key] = value;
            }
            else if (current_section == "adapter") {
                if (key == "emulate_booleans")
                    config.adapter.emulate_booleans = parseBool(value);
                else if (key == "emulate_booleans_from_strings")
                    config.adapter.emulate_booleans_from_strings = parseBool(value);
                else if (key == "use_old_oracle_visitor")
                    config.adapter.use_old_oracle_visitor = parseBool(value);
                else if (key == "default_sequence_start_value")
                    config.adapter.default_sequence_start_value = std::stoll(value);
                else if (key == "auto_retry")
                    config.adapter.auto_retry = parseBool(value);
            }
            else if (current_section == "tablespaces") {
                if (!value.empty()) config.adapter.default_tablespaces[key] = value;
            }
        } catch (const std::logic_error&) {
            spdlog::warn("Ignoring invalid value for '{}' at line {}: {}", key, line_no, value);
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    CLI::App app{"ora-enhanced-dump - Dump an Oracle schema as seen by the adapter"};

    // Connection options
    app.add_option("-H,--host", config.connection.host,
                   "Database host; with no -D, a TNS alias or full connect descriptor")
        ->default_val("localhost");
    app.add_option("-P,--port", config.connection.port, "Listener port")
        ->default_val(1521);
    app.add_option("-u,--user", config.connection.user, "Database username");
    app.add_option("-p,--password", config.connection.password, "Database password");
    app.add_option("-D,--database", config.connection.database, "Service name");
    app.add_option("--privilege", config.connection.privilege, "SYSDBA or SYSOPER");
    app.add_option("--prefetch-rows", config.connection.prefetch_rows,
                   "Rows fetched per round trip")
        ->default_val(100);

    // Adapter options
    bool no_boolean_emulation = false;
    app.add_flag("--no-emulate-booleans", no_boolean_emulation,
                 "Do not map NUMBER(1) columns to booleans");
    bool booleans_from_strings = false;
    app.add_flag("--emulate-booleans-from-strings", booleans_from_strings,
                 "Map VARCHAR2(1) columns to booleans");
    bool old_visitor = false;
    app.add_flag("--old-visitor", old_visitor,
                 "Use ROWNUM pagination even on 12c and later");
    std::string tablespaces_str;
    app.add_option("--tablespaces", tablespaces_str,
                   "Default tablespaces, e.g. table=TS_DATA,index=TS_INDEX");

    // Output options
    app.add_option("-t,--table", config.table, "Dump a single table");
    app.add_option("-o,--output", config.output_format, "Output format")
        ->check(CLI::IsMember({"json"}))
        ->default_val("json");
    app.add_flag_function("--compact", [&config](int64_t) { config.pretty = false; },
                 "Compact JSON output");
    app.add_flag("-d,--debug", config.debug, "Enable debug output");
    app.add_option("--log-file", config.log_file, "Write logs to this file");

    // Config file
    std::string config_file;
    app.add_option("-c,--config", config_file, "Path to configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            // Command line args override file config
            if (config.connection.host == "localhost") {
                config.connection.host = file_config->connection.host;
            }
            if (config.connection.port == 1521) {
                config.connection.port = file_config->connection.port;
            }
            if (config.connection.user.empty()) {
                config.connection.user = file_config->connection.user;
            }
            if (config.connection.password.empty()) {
                config.connection.password = file_config->connection.password;
            }
            if (config.connection.database.empty()) {
                config.connection.database = file_config->connection.database;
            }
            if (config.connection.privilege.empty()) {
                config.connection.privilege = file_config->connection.privilege;
            }
            if (config.connection.prefetch_rows == 100) {
                config.connection.prefetch_rows = file_config->connection.prefetch_rows;
            }
            config.connection.connect_timeout = file_config->connection.connect_timeout;
            config.connection.cursor_sharing = file_config->connection.cursor_sharing;
            config.connection.time_zone = file_config->connection.time_zone;
            config.connection.nls = file_config->connection.nls;
            config.adapter = file_config->adapter;
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    // Adapter flags given on the command line win over the file
    if (no_boolean_emulation) {
        config.adapter.emulate_booleans = false;
    }
    if (booleans_from_strings) {
        config.adapter.emulate_booleans_from_strings = true;
    }
    if (old_visitor) {
        config.adapter.use_old_oracle_visitor = true;
    }
    if (!tablespaces_str.empty()) {
        for (const auto& [kind, ts] : parseTablespaces(tablespaces_str)) {
            config.adapter.default_tablespaces[kind] = ts;
        }
    }

    config.resolvePassword();

    return config;
}

bool Config::validate() const {
    if (connection.user.empty()) {
        spdlog::error("Database username is required (use -u option)");
        return false;
    }

    if (!connection.privilege.empty() &&
        connection.privilege != "SYSDBA" && connection.privilege != "SYSOPER") {
        spdlog::error("Unsupported privilege: {}", connection.privilege);
        return false;
    }

    if (connection.prefetch_rows == 0) {
        spdlog::error("prefetch_rows must be positive");
        return false;
    }

    if (adapter.default_sequence_start_value < 1) {
        spdlog::error("default_sequence_start_value must be positive");
        return false;
    }

    static const std::vector<std::string> kinds = {"table", "index", "clob", "blob", "nclob"};
    for (const auto& [kind, ts] : adapter.default_tablespaces) {
        if (std::find(kinds.begin(), kinds.end(), kind) == kinds.end()) {
            spdlog::error("Unknown tablespace object kind: {}", kind);
            return false;
        }
    }

    if (output_format != "json") {
        spdlog::error("Unsupported output format: {}", output_format);
        return false;
    }

    return true;
}

std::string ConnectionConfig::connectString() const {
    if (host.empty()) {
        return database;
    }

    // Alias, descriptor, or an Easy Connect string written out in full
    if (database.empty() ||
        host.find("DESCRIPTION") != std::string::npos ||
        host.find('/') != std::string::npos ||
        host.find(':') != std::string::npos) {
        return host;
    }

    std::string connStr = host + ":" + std::to_string(port > 0 ? port : 1521) + "/" + database;

    // Easy Connect Plus takes the timeout in whole seconds
    if (connect_timeout.count() > 0) {
        auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
            connect_timeout + std::chrono::milliseconds(999));
        connStr += "?connect_timeout=" + std::to_string(seconds.count());
    }

    return connStr;
}

void Config::resolvePassword() {
    if (connection.password.empty()) {
        const char* env_pwd = std::getenv("ORACLE_PWD");
        if (env_pwd) {
            connection.password = env_pwd;
        }
    }
}

}  // namespace oraenhanced
