#include <homelib/cli/command_router.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <iostream>
#include <set>
#include <utility>

namespace homelib {

namespace {

constexpr std::array<std::string_view, 7> kBooleanFlags = {
    "--cascade", "--json", "--color", "--no-color", "--help", "--log-json", "--quiet"};

constexpr int kUsageExitCode = 1;

bool StartsWithDashes(std::string_view arg) {
    return arg.size() >= 2 && arg[0] == '-' && arg[1] == '-';
}

bool HasJsonFlag(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        if (std::string_view{argv[i]} == "--json") return true;
    }
    return false;
}

// Consume one "--key", "--key=value" or "--key value" token starting at argv[i].
// Returns the index of the next unconsumed token.
int ConsumeLongFlag(int argc, const char* const* argv, int i,
                    std::map<std::string, std::string>& flags) {
    std::string_view arg{argv[i]};
    auto eq = arg.find('=');
    if (eq != std::string_view::npos) {
        flags[std::string(arg.substr(2, eq - 2))] = std::string(arg.substr(eq + 1));
        return i + 1;
    }
    auto key = std::string(arg.substr(2));
    bool takes_value = !CommandRouter::IsBooleanFlag(arg) && i + 1 < argc &&
                       !StartsWithDashes(argv[i + 1]);
    flags[key] = takes_value ? argv[i + 1] : "true";
    return takes_value ? i + 2 : i + 1;
}

// Two-column listing; the second column starts `gap` spaces after the
// widest first column.
void PrintColumns(std::ostream& out,
                  const std::vector<std::pair<std::string, std::string>>& rows,
                  size_t gap) {
    size_t width = 0;
    for (const auto& row : rows) width = std::max(width, row.first.size());
    for (const auto& row : rows) {
        out << "  " << row.first << std::string(width - row.first.size() + gap, ' ')
            << row.second << "\n";
    }
}

} // anonymous namespace

bool CommandRouter::IsBooleanFlag(std::string_view arg) {
    return std::find(kBooleanFlags.begin(), kBooleanFlags.end(), arg) != kBooleanFlags.end();
}

void CommandRouter::Register(const std::string& group, const std::string& action,
                             const std::string& description, CommandHandler handler,
                             std::optional<CommandHelp> help) {
    commands_[group + ":" + action] =
        CommandInfo{group, action, description, std::move(handler), std::move(help)};
}

void CommandRouter::DescribeGroup(const std::string& group, std::string description,
                                  std::vector<std::string> examples) {
    groups_[group] = GroupInfo{std::move(description), std::move(examples)};
}

int CommandRouter::Dispatch(int argc, const char* const* argv) const {
    return Dispatch(argc, argv, std::cout, std::cerr);
}

// Routing failures never reach a handler. In JSON mode they are a single
// validation error object on `err`; otherwise a message followed by the
// most specific help available.
int CommandRouter::RoutingError(const std::string& message, bool json_mode,
                                const std::string& group, std::ostream& err) const {
    if (json_mode) {
        nlohmann::json j = {{"error", {{"category", "validation"}, {"message", message}}}};
        err << j.dump() << "\n";
        return kUsageExitCode;
    }
    err << "Error: " << message << "\n";
    if (!group.empty() && HasGroup(group)) {
        PrintGroupHelp(group, err);
    } else {
        PrintHelp(err);
    }
    return kUsageExitCode;
}

int CommandRouter::Dispatch(int argc, const char* const* argv,
                            std::ostream& out, std::ostream& err) const {
    const bool json_mode = HasJsonFlag(argc, argv);
    auto parsed = Parse(argc, argv);
    if (parsed.IsErr()) {
        return RoutingError(parsed.Error(), json_mode, "", err);
    }
    auto args = std::move(parsed).Value();

    const bool wants_help = args.flags.count("help") > 0;
    if (args.action.empty() || args.action == "help" || args.action == "-h") {
        if (!HasGroup(args.group)) {
            return RoutingError("Unknown command group '" + args.group + "'", json_mode, "", err);
        }
        if (args.action.empty() && !wants_help && json_mode) {
            return RoutingError("Missing action for group '" + args.group + "'", json_mode,
                                args.group, err);
        }
        PrintGroupHelp(args.group, out);
        return 0;
    }

    auto it = commands_.find(args.group + ":" + args.action);
    if (it == commands_.end()) {
        return RoutingError("Unknown command '" + args.group + " " + args.action + "'",
                            json_mode, args.group, err);
    }
    if (wants_help) {
        PrintCommandHelp(args.group, args.action, out);
        return 0;
    }
    return it->second.handler(args);
}

Result<CommandArgs, std::string> CommandRouter::Parse(
    int argc, const char* const* argv) {
    CommandArgs args;
    int i = 1;

    // Global flags before the group. Verbosity switches are read by the
    // config loader and skipped here.
    for (; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (arg == "-v" || arg == "-vv" || arg == "-q") continue;
        if (arg == "-h") {
            args.flags["help"] = "true";
        } else if (arg == "-c") {
            if (i + 1 < argc) args.flags["config"] = argv[++i];
        } else if (StartsWithDashes(arg)) {
            i = ConsumeLongFlag(argc, argv, i, args.flags) - 1;
        } else {
            break;
        }
    }

    if (i >= argc) {
        return Result<CommandArgs, std::string>::Err(
            "Missing command group. Usage: homelib <group> <action> [args]");
    }
    args.group = argv[i++];
    if (i < argc && !StartsWithDashes(argv[i])) {
        args.action = argv[i++];
    }

    while (i < argc) {
        std::string_view arg{argv[i]};
        if (StartsWithDashes(arg)) {
            i = ConsumeLongFlag(argc, argv, i, args.flags);
            continue;
        }
        if (arg == "-h") {
            args.flags["help"] = "true";
        } else {
            args.positional.emplace_back(arg);
        }
        ++i;
    }

    return Result<CommandArgs, std::string>::Ok(std::move(args));
}

std::vector<std::string> CommandRouter::Groups() const {
    std::set<std::string> groups;
    for (const auto& entry : commands_) groups.insert(entry.second.group);
    return {groups.begin(), groups.end()};
}

bool CommandRouter::HasGroup(const std::string& group) const {
    return std::any_of(commands_.begin(), commands_.end(),
                       [&](const auto& entry) { return entry.second.group == group; });
}

// Keys are "group:action", so one group's commands are already contiguous
// and sorted by action.
std::vector<CommandInfo> CommandRouter::CommandsForGroup(const std::string& group) const {
    std::vector<CommandInfo> result;
    for (auto it = commands_.lower_bound(group + ":"); it != commands_.end(); ++it) {
        if (it->second.group != group) break;
        result.push_back(it->second);
    }
    return result;
}

std::string CommandRouter::GroupDescription(const std::string& group) const {
    auto it = groups_.find(group);
    return it != groups_.end() ? it->second.description : std::string();
}

void CommandRouter::PrintHelp(std::ostream& out) const {
    out << "\nUsage: homelib [--db <path>] [--json] <group> <action> [options]\n";
    for (const auto& group : Groups()) {
        auto desc = GroupDescription(group);
        out << "\n  " << group << (desc.empty() ? "" : "  (" + desc + ")") << "\n";
        for (const auto& cmd : CommandsForGroup(group)) {
            out << "    " << cmd.action;
            if (!cmd.description.empty()) out << " - " << cmd.description;
            out << "\n";
        }
    }
    out << "\nRun \"homelib <group> --help\" for the actions of one group.\n";
}

void CommandRouter::PrintGroupHelp(const std::string& group, std::ostream& out) const {
    auto desc = GroupDescription(group);
    out << "homelib " << group << " - " << (desc.empty() ? group : desc) << "\n";

    std::vector<std::pair<std::string, std::string>> rows;
    for (const auto& cmd : CommandsForGroup(group)) {
        rows.emplace_back(cmd.action, cmd.description);
    }
    out << "\nActions:\n";
    PrintColumns(out, rows, 6);

    auto info = groups_.find(group);
    if (info != groups_.end() && !info->second.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : info->second.examples) out << "  " << ex << "\n";
    }
    out << "\nUse \"homelib " << group
        << " <action> --help\" for details on a specific action.\n";
}

void CommandRouter::PrintCommandHelp(const std::string& group,
                                     const std::string& action,
                                     std::ostream& out) const {
    auto it = commands_.find(group + ":" + action);
    if (it == commands_.end()) {
        out << "Error: Unknown command '" << group << " " << action << "'\n";
        return;
    }

    const auto& cmd = it->second;
    out << "homelib " << group << " " << action << " - " << cmd.description << "\n";
    if (!cmd.help) return;
    const auto& help = *cmd.help;

    if (!help.usage.empty()) out << "\nUsage:\n  " << help.usage << "\n";
    if (!help.args_description.empty()) {
        out << "\nArguments:\n  " << help.args_description << "\n";
    }
    if (!help.flags.empty()) {
        std::vector<std::pair<std::string, std::string>> rows;
        for (const auto& f : help.flags) {
            std::string name = "--" + f.name;
            if (!f.placeholder.empty()) name += " " + f.placeholder;
            rows.emplace_back(std::move(name),
                              f.description + (f.required ? " (required)" : ""));
        }
        out << "\nFlags:\n";
        PrintColumns(out, rows, 4);
    }
    if (!help.long_description.empty()) out << "\n" << help.long_description << "\n";
    if (!help.examples.empty()) {
        out << "\nExamples:\n";
        for (const auto& ex : help.examples) out << "  " << ex << "\n";
    }
}

} // namespace homelib
