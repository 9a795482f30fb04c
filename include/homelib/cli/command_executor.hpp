#pragma once

#include <homelib/cli/command_router.hpp>
#include <homelib/core/result.hpp>
#include <homelib/store/i_entity_store.hpp>

#include <functional>
#include <iostream>
#include <iosfwd>

namespace homelib {

// Opens (or returns the already open) library store. Called lazily by the
// handlers, so help and routing errors never touch the database.
using StoreProvider = std::function<Result<IEntityStore*, Error>()>;

// ---------------------------------------------------------------------------
// CommandContext — state shared by all command handlers. Must outlive the
// router the commands are registered with.
// ---------------------------------------------------------------------------
struct CommandContext {
    StoreProvider open_store;
    bool cascade_default = false;  // cascade_orphans from the config file
    bool json_default = false;     // json_output from the config file
    bool color_default = false;    // stdout is a terminal and NO_COLOR unset
    std::ostream* out = &std::cout;
    std::ostream* err = &std::cerr;
};

// Register the book, author, publisher, series, category, genre, topic,
// library and maintenance commands.
void RegisterAllCommands(CommandRouter& router, CommandContext& context);

// Print top-level help (all groups, global flags, examples).
void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color);

} // namespace homelib
