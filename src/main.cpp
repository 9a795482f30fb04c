#include <homelib/cli/command_executor.hpp>
#include <homelib/cli/command_router.hpp>
#include <homelib/config/config_loader.hpp>
#include <homelib/core/log.hpp>
#include <homelib/core/terminal.hpp>
#include <homelib/core/version.hpp>
#include <homelib/mcp/library_tools.hpp>
#include <homelib/mcp/mcp_server.hpp>
#include <homelib/store/sqlite_entity_store.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitSuccess = 0;

bool ResolveColorForHelp(int argc, const char* const* argv) {
    bool force_color = false;
    bool force_no_color = false;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "--color") force_color = true;
        if (arg == "--no-color") force_no_color = true;
    }
    return homelib::ResolveColor(force_color, force_no_color, homelib::IsStdoutTty());
}

// Index of the first positional argument (the command group), or argc.
int FirstPositional(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-v" || arg == "-vv" || arg == "-q" || arg == "-h") continue;
        if (arg == "-c") {
            ++i;
            continue;
        }
        if (arg.substr(0, 2) == "--") {
            if (arg.find('=') == std::string_view::npos &&
                !homelib::CommandRouter::IsBooleanFlag(arg) && i + 1 < argc &&
                std::string_view{argv[i + 1]}.substr(0, 2) != "--") {
                ++i;
            }
            continue;
        }
        return i;
    }
    return argc;
}

bool HasGlobalFlag(int argc, const char* const* argv, std::string_view flag) {
    int end = FirstPositional(argc, argv);
    for (int i = 1; i < end; ++i) {
        if (std::string_view{argv[i]} == flag) return true;
    }
    return false;
}

homelib::LogLevel ResolveLogLevel(int argc, const char* const* argv,
                                  const homelib::AppConfig& config) {
    auto level = config.verbose ? homelib::LogLevel::Info : homelib::LogLevel::Warn;
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == "-vv") level = homelib::LogLevel::Debug;
        else if (arg == "-v" && level != homelib::LogLevel::Debug) level = homelib::LogLevel::Info;
    }
    if (config.quiet) level = homelib::LogLevel::Error;
    return level;
}

void InitLogging(int argc, const char* const* argv, const homelib::AppConfig& config) {
    using namespace homelib;
    auto sinks = std::make_unique<MultiSink>();
    if (config.log_json) {
        sinks->Add(std::make_unique<JsonSink>(std::cerr));
    } else {
        bool force_color = HasGlobalFlag(argc, argv, "--color");
        bool force_no_color = HasGlobalFlag(argc, argv, "--no-color");
        sinks->Add(std::make_unique<ConsoleSink>(
            ResolveColor(force_color, force_no_color, IsStderrTty())));
    }

    bool log_file_failed = false;
    if (config.log_file) {
        auto file = std::make_unique<FileSink>(*config.log_file);
        log_file_failed = !file->IsOpen();
        if (!log_file_failed) sinks->Add(std::move(file));
    }

    InitGlobalLogger(std::move(sinks), ResolveLogLevel(argc, argv, config));
    if (log_file_failed) {
        LogWarn("config", "Cannot open log file " + *config.log_file);
    }
}

void PrintConfigError(const homelib::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// CLI flags > HOMELIB_DB > YAML file > defaults.
homelib::Result<homelib::AppConfig, homelib::Error> ResolveConfig(int argc,
                                                                  const char* const* argv) {
    using namespace homelib;
    using R = Result<AppConfig, Error>;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) return cli;
    auto cli_config = std::move(cli).Value();

    AppConfig base;
    std::string config_path = cli_config.config_path.value_or("");
    if (config_path.empty() && std::ifstream(kDefaultConfigFile).good()) {
        config_path = kDefaultConfigFile;
    }
    if (!config_path.empty()) {
        auto yaml = LoadFromYaml(config_path);
        if (yaml.IsErr()) return yaml;
        base = std::move(yaml).Value();
        base.config_path = config_path;
    }

    // The environment sits between the file and the command line.
    auto config = ApplyEnvironment(std::move(base));
    config = MergeConfigs(config, cli_config);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) return R::Err(valid.Error());
    return R::Ok(std::move(config));
}

homelib::SqliteStoreOptions StoreOptions(const homelib::AppConfig& config) {
    homelib::SqliteStoreOptions options;
    options.busy_timeout_ms = config.busy_timeout_ms;
    return options;
}

int RunMcpServer(const homelib::AppConfig& config) {
    using namespace homelib;

    auto store = SqliteEntityStore::Open(config.database_path, StoreOptions(config));
    if (store.IsErr()) {
        PrintConfigError(store.Error(), true);
        return store.Error().ExitCode();
    }
    auto owned = std::move(store).Value();

    ToolRegistry registry;
    RegisterLibraryTools(registry, *owned);

    McpServer server(std::move(registry));
    server.Run();
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace homelib;

    if (argc == 1 || (FirstPositional(argc, argv) == argc &&
                      (HasGlobalFlag(argc, argv, "--help") || HasGlobalFlag(argc, argv, "-h")))) {
        CommandContext help_context;
        CommandRouter router;
        RegisterAllCommands(router, help_context);
        PrintTopLevelHelp(router, std::cout, ResolveColorForHelp(argc, argv));
        return kExitSuccess;
    }

    if (HasGlobalFlag(argc, argv, "--version")) {
        std::cout << "homelib " << kVersion << "\n";
        return kExitSuccess;
    }

    bool json_flag = HasGlobalFlag(argc, argv, "--json");
    auto resolved = ResolveConfig(argc, argv);
    if (resolved.IsErr()) {
        PrintConfigError(resolved.Error(), json_flag);
        return resolved.Error().ExitCode();
    }
    const auto config = std::move(resolved).Value();

    InitLogging(argc, argv, config);
    LogDebug("config", "Database: " + config.database_path);

    int group_index = FirstPositional(argc, argv);
    if (group_index < argc && std::string_view{argv[group_index]} == "mcp") {
        bool serve = group_index + 1 < argc && std::string_view{argv[group_index + 1]} == "serve";
        if (!serve) {
            std::cerr << "Usage: homelib [--db <path>] mcp serve\n";
            return 1;
        }
        return RunMcpServer(config);
    }

    std::unique_ptr<SqliteEntityStore> store;
    CommandContext context;
    context.cascade_default = config.cascade_orphans;
    context.json_default = config.json_output;
    context.color_default = ResolveColor(false, false, IsStdoutTty());
    context.open_store = [&store, &config]() -> Result<IEntityStore*, Error> {
        if (!store) {
            auto opened = SqliteEntityStore::Open(config.database_path, StoreOptions(config));
            if (opened.IsErr()) return Result<IEntityStore*, Error>::Err(opened.Error());
            store = std::move(opened).Value();
        }
        return Result<IEntityStore*, Error>::Ok(store.get());
    };

    CommandRouter router;
    RegisterAllCommands(router, context);
    return router.Dispatch(argc, argv);
}
