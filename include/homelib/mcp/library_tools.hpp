#pragma once

#include <homelib/mcp/tool_registry.hpp>
#include <homelib/store/i_entity_store.hpp>

namespace homelib {

// Register the catalogue tools (delete_book, update_book, create_book,
// get_book, the impact checks, the single-entity deletes, the record
// updates, update_reading_progress, list_entities, integrity_check,
// cleanup_orphans, import_batch, export_library, library_stats).
// Handlers capture &store; calls are served one at a time.
void RegisterLibraryTools(ToolRegistry& registry, IEntityStore& store);

} // namespace homelib
