#pragma once

#include <homelib/core/result.hpp>
#include <homelib/store/i_entity_store.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace homelib {

// ---------------------------------------------------------------------------
// LibraryStats — record totals per kind and the reading-status breakdown.
// ---------------------------------------------------------------------------
struct LibraryStats {
    int64_t books = 0;
    int64_t authors = 0;
    int64_t publishers = 0;
    int64_t series = 0;
    int64_t genres = 0;
    int64_t topics = 0;
    int64_t categories = 0;

    int64_t unread = 0;
    int64_t reading = 0;
    int64_t completed = 0;
};

[[nodiscard]] Result<LibraryStats, Error> ComputeLibraryStats(IEntityStore& store);

// ---------------------------------------------------------------------------
// EntitySummary — one listing row: the record, how many books link it and,
// for series, its authors. Books carry no book count.
// ---------------------------------------------------------------------------
struct EntitySummary {
    EntityRef ref;
    std::optional<int64_t> book_count;
    std::vector<EntityRef> authors;
};

// All records of `kind` ordered by name.
[[nodiscard]] Result<std::vector<EntitySummary>, Error> ListEntities(IEntityStore& store,
                                                                     EntityKind kind);

} // namespace homelib
