#pragma once

#include <homelib/config/app_config.hpp>
#include <homelib/core/result.hpp>

#include <string>
#include <string_view>

namespace homelib {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse the global flags (--db, --config, --json, --quiet, --log-file,
// --log-json, --busy-timeout) out of a full command line. Command tokens
// and command flags are left alone.
Result<AppConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: cli_overrides take precedence over base.
// Fields set in cli_overrides replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& cli_overrides);

// HOMELIB_DB overrides the database path from the file; an unset path
// falls back to library.db.
AppConfig ApplyEnvironment(AppConfig config);

// Validate that all required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace homelib
