#include <homelib/config/config_loader.hpp>

#include <homelib/core/log.hpp>
#include <homelib/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace homelib {

namespace {

template <typename T>
Result<void, Error> ReadScalar(const YAML::Node& root, const char* key, T& out) {
    if (!root[key]) {
        return Result<void, Error>::Ok();
    }
    try {
        out = root[key].as<T>();
    } catch (const YAML::Exception& e) {
        return Result<void, Error>::Err(
            Error::Config(std::string("Invalid value for '") + key + "': " + e.what()));
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            Error::Config("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    if (!root || root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            Error::Config("Config file must contain a mapping: " + std::string(file_path)));
    }

    std::string log_file;
    const Result<void, Error> reads[] = {
        ReadScalar(root, "database", config.database_path),
        ReadScalar(root, "busy_timeout_ms", config.busy_timeout_ms),
        ReadScalar(root, "cascade_orphans", config.cascade_orphans),
        ReadScalar(root, "json_output", config.json_output),
        ReadScalar(root, "verbose", config.verbose),
        ReadScalar(root, "quiet", config.quiet),
        ReadScalar(root, "log_file", log_file),
        ReadScalar(root, "log_json", config.log_json),
    };
    for (const auto& read : reads) {
        if (read.IsErr()) return Result<AppConfig, Error>::Err(read.Error());
    }
    if (!log_file.empty()) {
        config.log_file = log_file;
    }

    LogDebug("config", "Loaded " + std::string(file_path));
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("homelib", kVersion,
                                     argparse::default_arguments::none);

    program.add_argument("--db")
        .help("Path to the SQLite library database");
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--busy-timeout")
        .help("SQLite busy timeout in milliseconds")
        .scan<'i', int>();
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);

    try {
        // Everything else on the line belongs to the command.
        (void)program.parse_known_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<AppConfig, Error>::Err(
            Error::Config("CLI parse error: " + std::string(e.what())));
    } catch (const std::invalid_argument& e) {
        // Thrown by scan<> for a non-numeric --busy-timeout.
        return Result<AppConfig, Error>::Err(
            Error::Config("CLI parse error: " + std::string(e.what())));
    }

    AppConfig config;
    if (auto val = program.present("--db")) {
        config.database_path = *val;
    }
    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (auto val = program.present<int>("--busy-timeout")) {
        config.busy_timeout_ms = *val;
    }
    if (program.get<bool>("--json")) {
        config.json_output = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (program.get<bool>("--log-json")) {
        config.log_json = true;
    }
    if (program.get<bool>("--quiet")) {
        config.quiet = true;
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& cli_overrides) {
    AppConfig merged = base;

    if (!cli_overrides.database_path.empty()) {
        merged.database_path = cli_overrides.database_path;
    }
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }
    if (cli_overrides.busy_timeout_ms != kDefaultBusyTimeoutMs) {
        merged.busy_timeout_ms = cli_overrides.busy_timeout_ms;
    }
    if (cli_overrides.cascade_orphans) {
        merged.cascade_orphans = true;
    }
    if (cli_overrides.json_output) {
        merged.json_output = true;
    }
    if (cli_overrides.verbose) {
        merged.verbose = true;
    }
    if (cli_overrides.quiet) {
        merged.quiet = true;
    }
    if (cli_overrides.log_json) {
        merged.log_json = true;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
AppConfig ApplyEnvironment(AppConfig config) {
    const char* env_db = std::getenv(kDatabaseEnvVar);
    if (env_db != nullptr && *env_db != '\0') {
        config.database_path = env_db;
    }
    if (config.database_path.empty()) {
        config.database_path = kDefaultDatabasePath;
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.database_path.empty()) {
        return Result<void, Error>::Err(Error::Config("Missing required field: database"));
    }
    if (config.busy_timeout_ms <= 0) {
        return Result<void, Error>::Err(
            Error::Config("Busy timeout must be positive, got " +
                          std::to_string(config.busy_timeout_ms)));
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(Error::Config("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

} // namespace homelib
