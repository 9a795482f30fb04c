#pragma once

#include <homelib/core/result.hpp>
#include <homelib/engine/lifecycle_enforcer.hpp>
#include <homelib/model/entities.hpp>
#include <homelib/store/i_entity_store.hpp>

#include <string>
#include <vector>

namespace homelib {

// ---------------------------------------------------------------------------
// LibraryBatch — external records to merge. Supplied ids are kept.
// `rejected` holds records the decoder could not turn into entities; they
// are reported with the import errors.
// ---------------------------------------------------------------------------
struct LibraryBatch {
    std::vector<Category> categories;
    std::vector<Author> authors;
    std::vector<Publisher> publishers;
    std::vector<Genre> genres;
    std::vector<Topic> topics;
    std::vector<SeriesRecord> series;
    std::vector<BookRecord> books;
    std::vector<std::string> rejected;
};

struct ImportCounts {
    int categories = 0;
    int authors = 0;
    int publishers = 0;
    int genres = 0;
    int topics = 0;
    int series = 0;
    int books = 0;

    [[nodiscard]] int Total() const {
        return categories + authors + publishers + genres + topics + series + books;
    }
};

struct ImportResult {
    bool success = false;
    ImportCounts imported;
    ImportCounts skipped;  // already present
    std::vector<std::string> errors;
    CleanupResult cleanup;
};

// ---------------------------------------------------------------------------
// ImportBatch — idempotent merge in dependency order: categories, authors,
// publishers, genres, topics, series, books.
//
// Records whose id already exists are skipped. Each new record is written
// under its own savepoint, so a failing record is undone and reported while
// the rest continue. A series without authors is refused. Afterwards an
// orphan cleanup runs in the same transaction and every removal is listed
// in `errors`. The whole merge is one transaction; only a failure to open,
// clean up or commit it is returned as an Error.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<ImportResult, Error> ImportBatch(IEntityStore& store,
                                                      const LibraryBatch& batch);

} // namespace homelib
