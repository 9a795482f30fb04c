#include <catch2/catch_test_macros.hpp>

#include <homelib/config/config_loader.hpp>

#include <cstdlib>
#include <string>
#include <vector>

using namespace homelib;

namespace {

void SetEnv(const char* name, const char* value) { setenv(name, value, 1); }
void UnsetEnv(const char* name) { unsetenv(name); }

// Tests run from the build directory; testdata lives beside the test sources.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));   // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));    // .../test
    return test_root + "/testdata/" + filename;
}

Result<AppConfig, Error> ParseCli(std::vector<const char*> args) {
    args.insert(args.begin(), "homelib");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // anonymous namespace

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: every key", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.database_path == "/var/lib/homelib/books.db");
    CHECK(config.busy_timeout_ms == 2500);
    CHECK(config.cascade_orphans);
    CHECK(config.json_output);
    CHECK(config.verbose);
    CHECK_FALSE(config.quiet);
    REQUIRE(config.log_file.has_value());
    CHECK(*config.log_file == "/var/log/homelib.log");
    CHECK(config.log_json);
}

TEST_CASE("LoadFromYaml: minimal file keeps defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().database_path == "books.db");
    CHECK(result.Value().busy_timeout_ms == kDefaultBusyTimeoutMs);
    CHECK_FALSE(result.Value().cascade_orphans);
    CHECK_FALSE(result.Value().log_file.has_value());
}

TEST_CASE("LoadFromYaml: empty file is an empty config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("empty_config.yaml"));
    REQUIRE(result.IsOk());
    CHECK(result.Value().database_path.empty());
}

TEST_CASE("LoadFromYaml: errors", "[config][yaml]") {
    SECTION("missing file") {
        auto result = LoadFromYaml(TestDataPath("no_such_config.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
        CHECK(result.Error().ExitCode() == 7);
        CHECK(result.Error().message.find("Failed to parse YAML file") == 0);
    }
    SECTION("malformed YAML") {
        auto result = LoadFromYaml(TestDataPath("malformed_config.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Config);
    }
    SECTION("top level is not a mapping") {
        auto result = LoadFromYaml(TestDataPath("list_config.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("Config file must contain a mapping") == 0);
    }
    SECTION("wrongly typed value") {
        auto result = LoadFromYaml(TestDataPath("invalid_config.yaml"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("Invalid value for 'busy_timeout_ms'") == 0);
    }
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: global flags", "[config][cli]") {
    auto result = ParseCli({"--db", "shelf.db", "--json", "--busy-timeout", "900", "--log-file",
                            "run.log", "--log-json", "-q"});
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.database_path == "shelf.db");
    CHECK(config.json_output);
    CHECK(config.busy_timeout_ms == 900);
    CHECK(config.log_file == std::optional<std::string>("run.log"));
    CHECK(config.log_json);
    CHECK(config.quiet);
}

TEST_CASE("LoadFromCli: command tokens are left alone", "[config][cli]") {
    auto result = ParseCli({"book", "delete", "b1", "--cascade", "--config", "home.yaml"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().config_path == std::optional<std::string>("home.yaml"));
    CHECK(result.Value().database_path.empty());
    CHECK_FALSE(result.Value().cascade_orphans);
}

TEST_CASE("LoadFromCli: no flags gives defaults", "[config][cli]") {
    auto result = ParseCli({});
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().json_output);
    CHECK(result.Value().busy_timeout_ms == kDefaultBusyTimeoutMs);
}

TEST_CASE("LoadFromCli: non-numeric busy timeout", "[config][cli]") {
    auto result = ParseCli({"--busy-timeout", "soon"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Config);
    CHECK(result.Error().message.find("CLI parse error") == 0);
}

// ===========================================================================
// MergeConfigs / ApplyEnvironment / ValidateConfig
// ===========================================================================

TEST_CASE("MergeConfigs: command line wins", "[config][merge]") {
    AppConfig file;
    file.database_path = "file.db";
    file.busy_timeout_ms = 1000;
    file.log_file = "file.log";
    file.cascade_orphans = true;

    AppConfig cli;
    cli.database_path = "cli.db";
    cli.json_output = true;

    auto merged = MergeConfigs(file, cli);
    CHECK(merged.database_path == "cli.db");
    CHECK(merged.busy_timeout_ms == 1000);
    CHECK(merged.log_file == std::optional<std::string>("file.log"));
    CHECK(merged.cascade_orphans);
    CHECK(merged.json_output);
}

TEST_CASE("MergeConfigs: unset command line keeps the file", "[config][merge]") {
    AppConfig file;
    file.database_path = "file.db";
    auto merged = MergeConfigs(file, AppConfig{});
    CHECK(merged.database_path == "file.db");
    CHECK_FALSE(merged.quiet);
}

TEST_CASE("ApplyEnvironment: HOMELIB_DB and the default path", "[config][env]") {
    AppConfig config;
    config.database_path = "file.db";

    SECTION("variable overrides the file") {
        SetEnv(kDatabaseEnvVar, "/tmp/env.db");
        CHECK(ApplyEnvironment(config).database_path == "/tmp/env.db");
        UnsetEnv(kDatabaseEnvVar);
    }
    SECTION("empty variable is ignored") {
        SetEnv(kDatabaseEnvVar, "");
        CHECK(ApplyEnvironment(config).database_path == "file.db");
        UnsetEnv(kDatabaseEnvVar);
    }
    SECTION("nothing set falls back to library.db") {
        UnsetEnv(kDatabaseEnvVar);
        CHECK(ApplyEnvironment(AppConfig{}).database_path == kDefaultDatabasePath);
    }
}

TEST_CASE("ValidateConfig", "[config][validate]") {
    AppConfig config;
    config.database_path = "library.db";
    CHECK(ValidateConfig(config).IsOk());

    SECTION("missing database") {
        config.database_path.clear();
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Missing required field: database");
    }
    SECTION("non-positive busy timeout") {
        config.busy_timeout_ms = 0;
        auto r = ValidateConfig(config);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Busy timeout must be positive, got 0");
    }
    SECTION("verbose and quiet together") {
        config.verbose = true;
        config.quiet = true;
        CHECK(ValidateConfig(config).IsErr());
    }
}
