#pragma once

#include <homelib/core/result.hpp>

#include <functional>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace homelib {

// "homelib [globals] <group> <action> [positional...] [--flag[=value]...]"
struct CommandArgs {
    std::string group;
    std::string action;
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;  // boolean flags hold "true"
};

// The handler's return value becomes the process exit code.
using CommandHandler = std::function<int(const CommandArgs& args)>;

struct FlagHelp {
    std::string name;  // without the leading "--"
    std::string placeholder;
    std::string description;
    bool required = false;
};

struct CommandHelp {
    std::string usage;
    std::string args_description;
    std::string long_description;
    std::vector<FlagHelp> flags;
    std::vector<std::string> examples;
};

struct CommandInfo {
    std::string group;
    std::string action;
    std::string description;
    CommandHandler handler;
    std::optional<CommandHelp> help;
};

// ---------------------------------------------------------------------------
// CommandRouter
//
// Maps "<group> <action>" to a handler. Global flags may precede the group
// and land in CommandArgs::flags with the rest. "--help" or "-h" anywhere
// prints help for the deepest level named instead of running a handler.
// Unknown groups and actions exit with 1 and never reach a handler.
// ---------------------------------------------------------------------------
class CommandRouter {
public:
    void Register(const std::string& group, const std::string& action,
                  const std::string& description, CommandHandler handler,
                  std::optional<CommandHelp> help = std::nullopt);

    void DescribeGroup(const std::string& group, std::string description,
                       std::vector<std::string> examples = {});

    int Dispatch(int argc, const char* const* argv,
                 std::ostream& out, std::ostream& err) const;
    int Dispatch(int argc, const char* const* argv) const;

    static Result<CommandArgs, std::string> Parse(int argc, const char* const* argv);

    // --json, --cascade and the other switches that never take a value.
    static bool IsBooleanFlag(std::string_view arg);

    [[nodiscard]] std::vector<std::string> Groups() const;
    [[nodiscard]] bool HasGroup(const std::string& group) const;
    [[nodiscard]] std::vector<CommandInfo> CommandsForGroup(const std::string& group) const;
    [[nodiscard]] std::string GroupDescription(const std::string& group) const;

    void PrintHelp(std::ostream& out) const;
    void PrintGroupHelp(const std::string& group, std::ostream& out) const;
    void PrintCommandHelp(const std::string& group, const std::string& action,
                          std::ostream& out) const;

private:
    struct GroupInfo {
        std::string description;
        std::vector<std::string> examples;
    };

    int RoutingError(const std::string& message, bool json_mode,
                     const std::string& group, std::ostream& err) const;

    std::map<std::string, CommandInfo> commands_;  // keyed "group:action"
    std::map<std::string, GroupInfo> groups_;
};

} // namespace homelib
