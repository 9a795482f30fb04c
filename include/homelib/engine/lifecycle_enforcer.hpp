#pragma once

#include <homelib/core/result.hpp>
#include <homelib/engine/impact_analyzer.hpp>
#include <homelib/model/entities.hpp>
#include <homelib/store/i_entity_store.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace homelib {

// ---------------------------------------------------------------------------
// OperationState — lifecycle of one destructive operation.
//
//   Requested -> ImpactChecked -> Blocked | CommittedPlain | CommittedWithCascade
//
// Nothing is persisted between states: everything after ImpactChecked runs
// in one transaction, and any failure rolls it back.
// ---------------------------------------------------------------------------
enum class OperationState {
    Requested,
    ImpactChecked,
    Blocked,
    CommittedPlain,
    CommittedWithCascade,
};

[[nodiscard]] const char* OperationStateName(OperationState state);

struct DeletionResult {
    OperationState state = OperationState::Requested;
    std::vector<EntityRef> deleted;  // primary entity first, then the cascade

    // "Book: Dune", "Author: Frank Herbert", ...
    [[nodiscard]] std::vector<std::string> Labels() const;
};

struct UpdateResult {
    OperationState state = OperationState::Requested;
    BookRecord record;
    std::vector<EntityRef> deleted;
};

struct CleanupResult {
    std::vector<EntityRef> deleted_authors;
    std::vector<EntityRef> deleted_publishers;
    std::vector<EntityRef> deleted_series;
    int passes = 0;

    [[nodiscard]] size_t Total() const {
        return deleted_authors.size() + deleted_publishers.size() + deleted_series.size();
    }
};

// ---------------------------------------------------------------------------
// Books
// ---------------------------------------------------------------------------

// Deletes a book. When the deletion would orphan authors, the publisher or
// the series, it is blocked unless `cascade_orphans` is set, in which case
// those entities go in the same transaction.
[[nodiscard]] Result<DeletionResult, Error> DeleteBook(
    IEntityStore& store, std::string_view book_id, bool cascade_orphans);

// Replaces the book's fields and all of its links with `input`.
[[nodiscard]] Result<UpdateResult, Error> UpdateBook(
    IEntityStore& store, std::string_view book_id, const BookInput& input,
    bool cascade_orphans);

// Creates a book. `id` is generated when not supplied.
[[nodiscard]] Result<BookRecord, Error> CreateBook(
    IEntityStore& store, const BookInput& input,
    const std::optional<std::string>& id = std::nullopt);

[[nodiscard]] Result<BookRecord, Error> GetBook(IEntityStore& store, std::string_view book_id);

// Field and reference checks shared by create, update and import.
// Malformed fields are Validation, unknown referenced ids NotFound.
[[nodiscard]] Result<void, Error> ValidateBookInput(
    IEntityStore& store, const BookInput& input, const std::string& operation);

// ---------------------------------------------------------------------------
// Standalone records. An empty id is generated; a supplied one is kept.
// Authors and publishers created this way are orphans until a book links
// them.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<Author, Error> CreateAuthor(IEntityStore& store, Author author);
[[nodiscard]] Result<Publisher, Error> CreatePublisher(IEntityStore& store, Publisher publisher);
[[nodiscard]] Result<SeriesRecord, Error> CreateSeries(
    IEntityStore& store, Series series, const std::vector<std::string>& author_ids);
[[nodiscard]] Result<Genre, Error> CreateGenre(IEntityStore& store, Genre genre);
[[nodiscard]] Result<Topic, Error> CreateTopic(IEntityStore& store, Topic topic);
[[nodiscard]] Result<Category, Error> CreateCategory(IEntityStore& store, Category category);

// ---------------------------------------------------------------------------
// Standalone record updates. The record keeps its id and created_at; all
// other fields are replaced by the given ones. Links are left alone.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<Author, Error> UpdateAuthor(IEntityStore& store, std::string_view id,
                                                 Author author);
[[nodiscard]] Result<Publisher, Error> UpdatePublisher(IEntityStore& store, std::string_view id,
                                                       Publisher publisher);
[[nodiscard]] Result<Genre, Error> UpdateGenre(IEntityStore& store, std::string_view id,
                                               Genre genre);
[[nodiscard]] Result<Topic, Error> UpdateTopic(IEntityStore& store, std::string_view id,
                                               Topic topic);
[[nodiscard]] Result<Category, Error> UpdateCategory(IEntityStore& store, std::string_view id,
                                                     Category category);

// Replaces the series' fields and its whole author set in one transaction.
// An empty author set is rejected: a series always keeps an author.
[[nodiscard]] Result<SeriesRecord, Error> UpdateSeries(
    IEntityStore& store, std::string_view id, Series series,
    const std::vector<std::string>& author_ids);

// Sets the reading status. Notes are replaced only when given; an empty
// string clears them.
[[nodiscard]] Result<BookRecord, Error> UpdateReadingProgress(
    IEntityStore& store, std::string_view book_id, ReadingStatus status,
    const std::optional<std::string>& notes = std::nullopt);

// ---------------------------------------------------------------------------
// Single-entity deletes. These never cascade: while books still link the
// entity, or an author is the sole author of a series, they are blocked.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<DeletionResult, Error> DeleteAuthor(IEntityStore& store, std::string_view id);
[[nodiscard]] Result<DeletionResult, Error> DeletePublisher(IEntityStore& store, std::string_view id);
[[nodiscard]] Result<DeletionResult, Error> DeleteSeries(IEntityStore& store, std::string_view id);
[[nodiscard]] Result<DeletionResult, Error> DeleteCategory(IEntityStore& store, std::string_view id);
[[nodiscard]] Result<DeletionResult, Error> DeleteGenre(IEntityStore& store, std::string_view id);
[[nodiscard]] Result<DeletionResult, Error> DeleteTopic(IEntityStore& store, std::string_view id);

// Deletes every orphan author, publisher and series, repeating until a
// pass finds none. Joins the caller's transaction when one is open.
[[nodiscard]] Result<CleanupResult, Error> CleanupOrphans(IEntityStore& store);

} // namespace homelib
