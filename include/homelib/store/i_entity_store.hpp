#pragma once

#include <homelib/catalog/relationship_catalog.hpp>
#include <homelib/core/result.hpp>
#include <homelib/model/entities.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace homelib {

// ---------------------------------------------------------------------------
// IEntityStore — abstract persistence interface for catalogue records.
//
// The engine (impact analyzer, lifecycle enforcer, bulk merge) depends on
// this interface rather than on SQLite, so transaction scoping and failure
// injection can be tested with decorators.
//
// Link queries are addressed by (Relation, LinkSide): `side` names the end
// of the relation on which `id` sits. CountLinks(BookAuthor, Target, a)
// counts the books of author `a`; CountLinks(BookAuthor, Source, b) counts
// the authors of book `b`.
//
// Methods return Result<T, Error> — never throw on expected failures. Store
// failures carry ErrorCategory::Storage.
// ---------------------------------------------------------------------------
class IEntityStore {
public:
    virtual ~IEntityStore() = default;

    // Non-copyable, non-movable (polymorphic base).
    IEntityStore(const IEntityStore&) = delete;
    IEntityStore& operator=(const IEntityStore&) = delete;
    IEntityStore(IEntityStore&&) = delete;
    IEntityStore& operator=(IEntityStore&&) = delete;

    // -- Point lookups -------------------------------------------------------

    [[nodiscard]] virtual Result<std::optional<Book>, Error> FindBook(
        std::string_view id) = 0;
    [[nodiscard]] virtual Result<std::optional<Author>, Error> FindAuthor(
        std::string_view id) = 0;
    [[nodiscard]] virtual Result<std::optional<Publisher>, Error> FindPublisher(
        std::string_view id) = 0;
    [[nodiscard]] virtual Result<std::optional<Series>, Error> FindSeries(
        std::string_view id) = 0;
    [[nodiscard]] virtual Result<std::optional<Genre>, Error> FindGenre(
        std::string_view id) = 0;
    [[nodiscard]] virtual Result<std::optional<Topic>, Error> FindTopic(
        std::string_view id) = 0;
    [[nodiscard]] virtual Result<std::optional<Category>, Error> FindCategory(
        std::string_view id) = 0;

    // Identity and display name of any record.
    [[nodiscard]] virtual Result<std::optional<EntityRef>, Error> FindRef(
        EntityKind kind, std::string_view id) = 0;

    // All ids of a kind, ordered by display name.
    [[nodiscard]] virtual Result<std::vector<std::string>, Error> ListIds(
        EntityKind kind) = 0;

    [[nodiscard]] virtual Result<int64_t, Error> CountAll(EntityKind kind) = 0;

    [[nodiscard]] virtual Result<int64_t, Error> CountBooksWithStatus(
        ReadingStatus status) = 0;

    // -- Link queries --------------------------------------------------------

    [[nodiscard]] virtual Result<int64_t, Error> CountLinks(
        Relation relation, LinkSide side, std::string_view id) = 0;

    // Ids at the opposite end of the links of `id`.
    [[nodiscard]] virtual Result<std::vector<std::string>, Error> ListLinkedIds(
        Relation relation, LinkSide side, std::string_view id) = 0;

    // Entities on `side` of `relation` that have zero links (orphan scan).
    [[nodiscard]] virtual Result<std::vector<EntityRef>, Error> ListUnlinked(
        Relation relation, LinkSide side) = 0;

    // Sources whose foreign key is NULL or does not resolve.
    [[nodiscard]] virtual Result<std::vector<EntityRef>, Error> ListDanglingReferences(
        Relation relation) = 0;

    // -- Writes --------------------------------------------------------------

    [[nodiscard]] virtual Result<void, Error> InsertBook(const Book& book) = 0;
    [[nodiscard]] virtual Result<void, Error> InsertAuthor(const Author& author) = 0;
    [[nodiscard]] virtual Result<void, Error> InsertPublisher(const Publisher& publisher) = 0;
    [[nodiscard]] virtual Result<void, Error> InsertSeries(const Series& series) = 0;
    [[nodiscard]] virtual Result<void, Error> InsertGenre(const Genre& genre) = 0;
    [[nodiscard]] virtual Result<void, Error> InsertTopic(const Topic& topic) = 0;
    [[nodiscard]] virtual Result<void, Error> InsertCategory(const Category& category) = 0;

    // Row updates address the record by id; NotFound when no row matched.
    [[nodiscard]] virtual Result<void, Error> UpdateBookRow(const Book& book) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateAuthorRow(const Author& author) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdatePublisherRow(const Publisher& publisher) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateSeriesRow(const Series& series) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateGenreRow(const Genre& genre) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateTopicRow(const Topic& topic) = 0;
    [[nodiscard]] virtual Result<void, Error> UpdateCategoryRow(const Category& category) = 0;

    // NotFound when no row was deleted.
    [[nodiscard]] virtual Result<void, Error> DeleteEntity(
        EntityKind kind, std::string_view id) = 0;

    // Junction: inserts a row. Foreign key: sets the source's column.
    [[nodiscard]] virtual Result<void, Error> InsertLink(
        Relation relation, std::string_view source_id, std::string_view target_id) = 0;

    // Junction: deletes the rows of `id`. Nullable foreign key: clears the
    // reference. Required foreign keys cannot be cleared (Validation).
    // Returns the number of affected rows.
    [[nodiscard]] virtual Result<int64_t, Error> DeleteLinks(
        Relation relation, LinkSide side, std::string_view id) = 0;

    // -- Transactions --------------------------------------------------------

    [[nodiscard]] virtual Result<void, Error> Begin() = 0;
    [[nodiscard]] virtual Result<void, Error> Commit() = 0;
    [[nodiscard]] virtual Result<void, Error> Rollback() = 0;
    [[nodiscard]] virtual bool InTransaction() const = 0;

    [[nodiscard]] virtual Result<void, Error> Savepoint(std::string_view name) = 0;
    [[nodiscard]] virtual Result<void, Error> ReleaseSavepoint(std::string_view name) = 0;
    [[nodiscard]] virtual Result<void, Error> RollbackToSavepoint(std::string_view name) = 0;

protected:
    IEntityStore() = default;
};

} // namespace homelib
