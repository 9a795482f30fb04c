#pragma once

#include <homelib/store/i_entity_store.hpp>

#include <memory>
#include <string>

struct sqlite3;

namespace homelib {

struct SqliteStoreOptions {
    int busy_timeout_ms = 5000;
    bool wal = true;  // ignored for in-memory databases
};

// ---------------------------------------------------------------------------
// SqliteEntityStore — IEntityStore over a single SQLite connection.
//
// Open() enables foreign keys, applies pending schema migrations and seeds
// the default category and genres. All identifiers in generated SQL come
// from the relationship catalog; values are always bound parameters.
//
// The connection is exclusively owned: one store, one connection, one
// transaction at a time. Begin() inside an open transaction is an error;
// callers join an open transaction through TransactionGuard instead.
// ---------------------------------------------------------------------------
class SqliteEntityStore final : public IEntityStore {
public:
    static Result<std::unique_ptr<SqliteEntityStore>, Error> Open(
        const std::string& path, const SqliteStoreOptions& options = {});

    static Result<std::unique_ptr<SqliteEntityStore>, Error> OpenInMemory();

    ~SqliteEntityStore() override;

    [[nodiscard]] const std::string& Path() const noexcept { return path_; }
    [[nodiscard]] int SchemaVersion() const noexcept { return schema_version_; }

    // -- IEntityStore --------------------------------------------------------

    Result<std::optional<Book>, Error> FindBook(std::string_view id) override;
    Result<std::optional<Author>, Error> FindAuthor(std::string_view id) override;
    Result<std::optional<Publisher>, Error> FindPublisher(std::string_view id) override;
    Result<std::optional<Series>, Error> FindSeries(std::string_view id) override;
    Result<std::optional<Genre>, Error> FindGenre(std::string_view id) override;
    Result<std::optional<Topic>, Error> FindTopic(std::string_view id) override;
    Result<std::optional<Category>, Error> FindCategory(std::string_view id) override;

    Result<std::optional<EntityRef>, Error> FindRef(
        EntityKind kind, std::string_view id) override;
    Result<std::vector<std::string>, Error> ListIds(EntityKind kind) override;
    Result<int64_t, Error> CountAll(EntityKind kind) override;
    Result<int64_t, Error> CountBooksWithStatus(ReadingStatus status) override;

    Result<int64_t, Error> CountLinks(
        Relation relation, LinkSide side, std::string_view id) override;
    Result<std::vector<std::string>, Error> ListLinkedIds(
        Relation relation, LinkSide side, std::string_view id) override;
    Result<std::vector<EntityRef>, Error> ListUnlinked(
        Relation relation, LinkSide side) override;
    Result<std::vector<EntityRef>, Error> ListDanglingReferences(
        Relation relation) override;

    Result<void, Error> InsertBook(const Book& book) override;
    Result<void, Error> InsertAuthor(const Author& author) override;
    Result<void, Error> InsertPublisher(const Publisher& publisher) override;
    Result<void, Error> InsertSeries(const Series& series) override;
    Result<void, Error> InsertGenre(const Genre& genre) override;
    Result<void, Error> InsertTopic(const Topic& topic) override;
    Result<void, Error> InsertCategory(const Category& category) override;
    Result<void, Error> UpdateBookRow(const Book& book) override;
    Result<void, Error> UpdateAuthorRow(const Author& author) override;
    Result<void, Error> UpdatePublisherRow(const Publisher& publisher) override;
    Result<void, Error> UpdateSeriesRow(const Series& series) override;
    Result<void, Error> UpdateGenreRow(const Genre& genre) override;
    Result<void, Error> UpdateTopicRow(const Topic& topic) override;
    Result<void, Error> UpdateCategoryRow(const Category& category) override;
    Result<void, Error> DeleteEntity(EntityKind kind, std::string_view id) override;
    Result<void, Error> InsertLink(
        Relation relation, std::string_view source_id,
        std::string_view target_id) override;
    Result<int64_t, Error> DeleteLinks(
        Relation relation, LinkSide side, std::string_view id) override;

    Result<void, Error> Begin() override;
    Result<void, Error> Commit() override;
    Result<void, Error> Rollback() override;
    bool InTransaction() const override;
    Result<void, Error> Savepoint(std::string_view name) override;
    Result<void, Error> ReleaseSavepoint(std::string_view name) override;
    Result<void, Error> RollbackToSavepoint(std::string_view name) override;

private:
    struct DbCloser {
        void operator()(sqlite3* db) const;
    };

    SqliteEntityStore(sqlite3* db, std::string path);

    static Result<std::unique_ptr<SqliteEntityStore>, Error> OpenWith(
        const std::string& path, const SqliteStoreOptions& options, bool in_memory);

    Result<int64_t, Error> CountQuery(const std::string& sql,
                                      const std::string& operation,
                                      std::string_view param);
    Result<std::vector<EntityRef>, Error> RefQuery(const std::string& sql,
                                                   EntityKind kind,
                                                   const std::string& operation);

    std::unique_ptr<sqlite3, DbCloser> db_;
    std::string path_;
    int schema_version_ = 0;
};

} // namespace homelib
