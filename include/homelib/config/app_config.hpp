#pragma once

#include <optional>
#include <string>

namespace homelib {

constexpr const char* kDefaultDatabasePath = "library.db";
constexpr const char* kDefaultConfigFile = "homelib.yaml";
constexpr const char* kDatabaseEnvVar = "HOMELIB_DB";
constexpr int kDefaultBusyTimeoutMs = 5000;

struct AppConfig {
    std::optional<std::string> config_path;  // --config, command line only
    std::string database_path;  // empty until resolved by ApplyEnvironment
    int busy_timeout_ms = kDefaultBusyTimeoutMs;
    bool cascade_orphans = false;
    std::optional<std::string> log_file;
    bool log_json = false;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
};

} // namespace homelib
