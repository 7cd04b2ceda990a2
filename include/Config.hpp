#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace oraenhanced {

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 1521;
    std::string user;
    std::string password;
    std::string database;   // service name, TNS alias or full descriptor
    std::string privilege;  // SYSDBA, SYSOPER or empty

    // Session setup
    uint32_t prefetch_rows = 100;
    std::string cursor_sharing = "force";
    std::string time_zone;
    std::map<std::string, std::string> nls = {
        {"nls_date_format", "YYYY-MM-DD HH24:MI:SS"},
        {"nls_length_semantics", "CHAR"},
        {"nls_timestamp_format", "YYYY-MM-DD HH24:MI:SS:FF6"},
    };

    std::chrono::milliseconds connect_timeout{5000};

    // Connect identifier handed to the Oracle client. Without a service name
    // the host is a TNS alias or a full descriptor and is used as-is;
    // otherwise an Easy Connect string host:port/service is built.
    std::string connectString() const;
};

// Adapter-wide toggles, injected into every component that reads them
struct AdapterConfig {
    bool emulate_booleans = true;
    bool emulate_booleans_from_strings = false;

    // Object kind (table, index, clob, blob, nclob) -> tablespace
    std::map<std::string, std::string> default_tablespaces;

    // Forces ROWNUM pagination on 12c and later
    bool use_old_oracle_visitor = false;

    int64_t default_sequence_start_value = 10000;

    // Reconnect and retry a statement once after a lost connection
    bool auto_retry = false;
};

struct Config {
    ConnectionConfig connection;
    AdapterConfig adapter;

    std::string table;               // dump a single table when set
    std::string output_format = "json";
    std::string log_file;
    bool pretty = true;
    bool debug = false;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Get password from environment if not set
    void resolvePassword();
};

}  // namespace oraenhanced
