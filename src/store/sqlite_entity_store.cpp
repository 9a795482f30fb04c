#include <homelib/store/sqlite_entity_store.hpp>

#include <homelib/core/log.hpp>
#include <homelib/core/types.hpp>

#include "sqlite_util.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cctype>

namespace homelib {

namespace {

using sqlite::Statement;

constexpr const char* kBookColumns =
    "id, title, isbn, publication_year, pages, description, cover_image, "
    "reading_status, notes, rating, publisher_id, series_id, series_order, "
    "category_id, created_at, updated_at";

// ---------------------------------------------------------------------------
// Row mappers — one per entity kind, total over the selected columns.
// ---------------------------------------------------------------------------

Book ReadBook(const Statement& s) {
    Book b;
    b.id = s.Text(0);
    b.title = s.Text(1);
    b.isbn = s.OptText(2);
    b.publication_year = s.OptInt(3);
    b.pages = s.OptInt(4);
    b.description = s.OptText(5);
    b.cover_image = s.OptText(6);
    auto status = ParseReadingStatus(s.Text(7));
    b.reading_status = status.IsOk() ? status.Value() : ReadingStatus::Unread;
    b.notes = s.OptText(8);
    b.rating = s.OptInt(9);
    b.publisher_id = s.Text(10);
    b.series_id = s.OptText(11);
    b.series_order = s.OptInt(12);
    b.category_id = s.Text(13);
    b.created_at = s.Text(14);
    b.updated_at = s.Text(15);
    return b;
}

Author ReadAuthor(const Statement& s) {
    return Author{s.Text(0), s.Text(1), s.OptText(2), s.Text(3), s.Text(4)};
}

Publisher ReadPublisher(const Statement& s) {
    return Publisher{s.Text(0), s.Text(1), s.OptText(2), s.OptText(3),
                     s.Text(4), s.Text(5)};
}

Series ReadSeries(const Statement& s) {
    return Series{s.Text(0), s.Text(1), s.OptText(2), s.Text(3), s.Text(4)};
}

Genre ReadGenre(const Statement& s) {
    return Genre{s.Text(0), s.Text(1), s.OptText(2), s.Text(3), s.Text(4)};
}

Topic ReadTopic(const Statement& s) {
    return Topic{s.Text(0), s.Text(1), s.OptText(2), s.Text(3), s.Text(4)};
}

Category ReadCategory(const Statement& s) {
    return Category{s.Text(0), s.Text(1), s.OptText(2), s.OptText(3),
                    s.Text(4), s.Text(5)};
}

template <typename T, typename Mapper>
Result<std::optional<T>, Error> FindOne(sqlite3* db, const std::string& sql,
                                        std::string_view id,
                                        const std::string& operation,
                                        Mapper mapper) {
    auto prepared = Statement::Prepare(db, sql, operation);
    if (prepared.IsErr()) {
        return Result<std::optional<T>, Error>::Err(std::move(prepared).Error());
    }
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, id);
    auto row = stmt.Step();
    if (row.IsErr()) return Result<std::optional<T>, Error>::Err(std::move(row).Error());
    if (!row.Value()) return Result<std::optional<T>, Error>::Ok(std::nullopt);
    return Result<std::optional<T>, Error>::Ok(mapper(stmt));
}

std::string OrNow(const std::string& timestamp) {
    return timestamp.empty() ? CurrentTimestamp() : timestamp;
}

// Runs a prepared UPDATE; an update that touched no row is NotFound.
Result<void, Error> RunRowUpdate(sqlite3* db, Statement& stmt, const char* operation,
                                 const char* kind, const std::string& id) {
    auto ran = stmt.Run();
    if (ran.IsErr()) return ran;
    if (sqlite3_changes(db) == 0) {
        return Result<void, Error>::Err(Error::NotFound(operation, kind, id));
    }
    return Result<void, Error>::Ok();
}

bool IsValidSavepointName(std::string_view name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Lifetime
// ---------------------------------------------------------------------------
void SqliteEntityStore::DbCloser::operator()(sqlite3* db) const {
    sqlite3_close_v2(db);
}

SqliteEntityStore::SqliteEntityStore(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

SqliteEntityStore::~SqliteEntityStore() {
    if (db_ && InTransaction()) {
        LogWarn("store", "Closing " + path_ + " with an open transaction; rolling back");
        auto rolled_back = sqlite::Exec(db_.get(), "ROLLBACK", "Close");
        if (rolled_back.IsErr()) {
            LogError("store", rolled_back.Error().ToString());
        }
    }
}

Result<std::unique_ptr<SqliteEntityStore>, Error> SqliteEntityStore::Open(
    const std::string& path, const SqliteStoreOptions& options) {
    return OpenWith(path, options, path == ":memory:");
}

Result<std::unique_ptr<SqliteEntityStore>, Error> SqliteEntityStore::OpenInMemory() {
    return OpenWith(":memory:", SqliteStoreOptions{}, true);
}

Result<std::unique_ptr<SqliteEntityStore>, Error> SqliteEntityStore::OpenWith(
    const std::string& path, const SqliteStoreOptions& options, bool in_memory) {
    using R = Result<std::unique_ptr<SqliteEntityStore>, Error>;

    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &raw,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    std::unique_ptr<SqliteEntityStore> store(new SqliteEntityStore(raw, path));
    if (rc != SQLITE_OK) {
        auto err = sqlite::MakeError(raw, "Open", rc);
        err.entity = path;
        return R::Err(std::move(err));
    }

    sqlite3_busy_timeout(raw, options.busy_timeout_ms);

    auto fk = sqlite::Exec(raw, "PRAGMA foreign_keys = ON", "Open");
    if (fk.IsErr()) return R::Err(std::move(fk).Error());

    if (options.wal && !in_memory) {
        auto wal = sqlite::Exec(raw, "PRAGMA journal_mode = WAL", "Open");
        if (wal.IsErr()) return R::Err(std::move(wal).Error());
    }

    auto version = sqlite::ApplyMigrations(raw);
    if (version.IsErr()) return R::Err(std::move(version).Error());
    store->schema_version_ = version.Value();

    LogDebug("store", "Opened " + path + " at schema version " +
                          std::to_string(store->schema_version_));
    return R::Ok(std::move(store));
}

// ---------------------------------------------------------------------------
// Point lookups
// ---------------------------------------------------------------------------
Result<std::optional<Book>, Error> SqliteEntityStore::FindBook(std::string_view id) {
    return FindOne<Book>(db_.get(),
                         std::string("SELECT ") + kBookColumns + " FROM books WHERE id = ?",
                         id, "FindBook", ReadBook);
}

Result<std::optional<Author>, Error> SqliteEntityStore::FindAuthor(std::string_view id) {
    return FindOne<Author>(db_.get(),
                           "SELECT id, name, bio, created_at, updated_at "
                           "FROM authors WHERE id = ?",
                           id, "FindAuthor", ReadAuthor);
}

Result<std::optional<Publisher>, Error> SqliteEntityStore::FindPublisher(
    std::string_view id) {
    return FindOne<Publisher>(db_.get(),
                              "SELECT id, name, location, website, created_at, updated_at "
                              "FROM publishers WHERE id = ?",
                              id, "FindPublisher", ReadPublisher);
}

Result<std::optional<Series>, Error> SqliteEntityStore::FindSeries(std::string_view id) {
    return FindOne<Series>(db_.get(),
                           "SELECT id, name, description, created_at, updated_at "
                           "FROM series WHERE id = ?",
                           id, "FindSeries", ReadSeries);
}

Result<std::optional<Genre>, Error> SqliteEntityStore::FindGenre(std::string_view id) {
    return FindOne<Genre>(db_.get(),
                          "SELECT id, name, description, created_at, updated_at "
                          "FROM genres WHERE id = ?",
                          id, "FindGenre", ReadGenre);
}

Result<std::optional<Topic>, Error> SqliteEntityStore::FindTopic(std::string_view id) {
    return FindOne<Topic>(db_.get(),
                          "SELECT id, name, description, created_at, updated_at "
                          "FROM topics WHERE id = ?",
                          id, "FindTopic", ReadTopic);
}

Result<std::optional<Category>, Error> SqliteEntityStore::FindCategory(
    std::string_view id) {
    return FindOne<Category>(db_.get(),
                             "SELECT id, name, description, color, created_at, updated_at "
                             "FROM categories WHERE id = ?",
                             id, "FindCategory", ReadCategory);
}

Result<std::optional<EntityRef>, Error> SqliteEntityStore::FindRef(
    EntityKind kind, std::string_view id) {
    const auto& t = TableFor(kind);
    return FindOne<EntityRef>(
        db_.get(),
        std::string("SELECT id, ") + t.name_column + " FROM " + t.table + " WHERE id = ?",
        id, "FindRef",
        [kind](const Statement& s) { return EntityRef{kind, s.Text(0), s.Text(1)}; });
}

Result<std::vector<std::string>, Error> SqliteEntityStore::ListIds(EntityKind kind) {
    using R = Result<std::vector<std::string>, Error>;
    const auto& t = TableFor(kind);
    auto prepared = Statement::Prepare(
        db_.get(),
        std::string("SELECT id FROM ") + t.table + " ORDER BY " + t.name_column + ", id",
        "ListIds");
    if (prepared.IsErr()) return R::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();

    std::vector<std::string> ids;
    while (true) {
        auto row = stmt.Step();
        if (row.IsErr()) return R::Err(std::move(row).Error());
        if (!row.Value()) break;
        ids.push_back(stmt.Text(0));
    }
    return R::Ok(std::move(ids));
}

Result<int64_t, Error> SqliteEntityStore::CountQuery(const std::string& sql,
                                                     const std::string& operation,
                                                     std::string_view param) {
    auto prepared = Statement::Prepare(db_.get(), sql, operation);
    if (prepared.IsErr()) return Result<int64_t, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    if (!param.empty()) {
        stmt.Bind(1, param);
    }
    auto row = stmt.Step();
    if (row.IsErr()) return Result<int64_t, Error>::Err(std::move(row).Error());
    return Result<int64_t, Error>::Ok(row.Value() ? stmt.Int(0) : 0);
}

Result<int64_t, Error> SqliteEntityStore::CountAll(EntityKind kind) {
    return CountQuery(std::string("SELECT COUNT(*) FROM ") + TableFor(kind).table,
                      "CountAll", {});
}

Result<int64_t, Error> SqliteEntityStore::CountBooksWithStatus(ReadingStatus status) {
    return CountQuery("SELECT COUNT(*) FROM books WHERE reading_status = ?",
                      "CountBooksWithStatus", ReadingStatusName(status));
}

// ---------------------------------------------------------------------------
// Link queries
// ---------------------------------------------------------------------------
Result<int64_t, Error> SqliteEntityStore::CountLinks(Relation relation, LinkSide side,
                                                     std::string_view id) {
    const auto& spec = Spec(relation);
    std::string sql = std::string("SELECT COUNT(*) FROM ") + spec.table +
                      " WHERE " + ColumnAt(spec, side) + " = ?";
    if (spec.storage == LinkStorage::ForeignKey && side == LinkSide::Source) {
        sql += std::string(" AND ") + spec.target_column + " IS NOT NULL";
    }
    auto count = CountQuery(sql, std::string("CountLinks ") + spec.name, id);
    if (count.IsOk()) {
        LogDebug("store", std::string("CountLinks ") + spec.name + " " +
                              std::string(id) + " = " + std::to_string(count.Value()));
    }
    return count;
}

Result<std::vector<std::string>, Error> SqliteEntityStore::ListLinkedIds(
    Relation relation, LinkSide side, std::string_view id) {
    using R = Result<std::vector<std::string>, Error>;
    const auto& spec = Spec(relation);
    const char* wanted = ColumnAt(spec, Opposite(side));
    std::string sql = std::string("SELECT ") + wanted + " FROM " + spec.table +
                      " WHERE " + ColumnAt(spec, side) + " = ? AND " + wanted +
                      " IS NOT NULL ORDER BY rowid";

    auto prepared = Statement::Prepare(db_.get(), sql,
                                       std::string("ListLinkedIds ") + spec.name);
    if (prepared.IsErr()) return R::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, id);

    std::vector<std::string> ids;
    while (true) {
        auto row = stmt.Step();
        if (row.IsErr()) return R::Err(std::move(row).Error());
        if (!row.Value()) break;
        ids.push_back(stmt.Text(0));
    }
    return R::Ok(std::move(ids));
}

Result<std::vector<EntityRef>, Error> SqliteEntityStore::RefQuery(
    const std::string& sql, EntityKind kind, const std::string& operation) {
    using R = Result<std::vector<EntityRef>, Error>;
    auto prepared = Statement::Prepare(db_.get(), sql, operation);
    if (prepared.IsErr()) return R::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();

    std::vector<EntityRef> refs;
    while (true) {
        auto row = stmt.Step();
        if (row.IsErr()) return R::Err(std::move(row).Error());
        if (!row.Value()) break;
        refs.push_back(EntityRef{kind, stmt.Text(0), stmt.Text(1)});
    }
    return R::Ok(std::move(refs));
}

Result<std::vector<EntityRef>, Error> SqliteEntityStore::ListUnlinked(
    Relation relation, LinkSide side) {
    const auto& spec = Spec(relation);
    const auto kind = KindAt(spec, side);
    const auto& t = TableFor(kind);

    std::string sql = std::string("SELECT e.id, e.") + t.name_column + " FROM " +
                      t.table + " e WHERE NOT EXISTS (SELECT 1 FROM " + spec.table +
                      " l WHERE l." + ColumnAt(spec, side) + " = e.id";
    if (spec.storage == LinkStorage::ForeignKey && side == LinkSide::Source) {
        sql += std::string(" AND l.") + spec.target_column + " IS NOT NULL";
    }
    sql += std::string(") ORDER BY e.") + t.name_column + ", e.id";
    return RefQuery(sql, kind, std::string("ListUnlinked ") + spec.name);
}

Result<std::vector<EntityRef>, Error> SqliteEntityStore::ListDanglingReferences(
    Relation relation) {
    const auto& spec = Spec(relation);
    if (spec.storage != LinkStorage::ForeignKey) {
        return Result<std::vector<EntityRef>, Error>::Err(Error::Validation(
            "ListDanglingReferences",
            std::string("relation ") + spec.name + " is not a foreign key"));
    }
    const auto& src = TableFor(spec.source);
    const auto& dst = TableFor(spec.target);

    std::string sql = std::string("SELECT s.id, s.") + src.name_column + " FROM " +
                      src.table + " s LEFT JOIN " + dst.table + " t ON s." +
                      spec.target_column + " = t.id WHERE t.id IS NULL";
    if (IsNullableReference(spec)) {
        sql += std::string(" AND s.") + spec.target_column + " IS NOT NULL";
    }
    sql += std::string(" ORDER BY s.") + src.name_column + ", s.id";
    return RefQuery(sql, spec.source, std::string("ListDanglingReferences ") + spec.name);
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------
Result<void, Error> SqliteEntityStore::InsertBook(const Book& book) {
    auto prepared = Statement::Prepare(
        db_.get(),
        std::string("INSERT INTO books (") + kBookColumns +
            ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        "InsertBook");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    const auto created = OrNow(book.created_at);
    stmt.Bind(1, book.id)
        .Bind(2, book.title)
        .BindOpt(3, book.isbn)
        .BindOptInt(4, book.publication_year)
        .BindOptInt(5, book.pages)
        .BindOpt(6, book.description)
        .BindOpt(7, book.cover_image)
        .Bind(8, ReadingStatusName(book.reading_status))
        .BindOpt(9, book.notes)
        .BindOptInt(10, book.rating)
        .Bind(11, book.publisher_id)
        .BindOpt(12, book.series_id)
        .BindOptInt(13, book.series_order)
        .Bind(14, book.category_id)
        .Bind(15, created)
        .Bind(16, book.updated_at.empty() ? created : book.updated_at);
    return stmt.Run();
}

Result<void, Error> SqliteEntityStore::InsertAuthor(const Author& author) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "INSERT INTO authors (id, name, bio, created_at, updated_at) VALUES (?, ?, ?, ?, ?)",
        "InsertAuthor");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    const auto created = OrNow(author.created_at);
    stmt.Bind(1, author.id).Bind(2, author.name).BindOpt(3, author.bio)
        .Bind(4, created)
        .Bind(5, author.updated_at.empty() ? created : author.updated_at);
    return stmt.Run();
}

Result<void, Error> SqliteEntityStore::InsertPublisher(const Publisher& publisher) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "INSERT INTO publishers (id, name, location, website, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?)",
        "InsertPublisher");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    const auto created = OrNow(publisher.created_at);
    stmt.Bind(1, publisher.id).Bind(2, publisher.name)
        .BindOpt(3, publisher.location).BindOpt(4, publisher.website)
        .Bind(5, created)
        .Bind(6, publisher.updated_at.empty() ? created : publisher.updated_at);
    return stmt.Run();
}

Result<void, Error> SqliteEntityStore::InsertSeries(const Series& series) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "INSERT INTO series (id, name, description, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?)",
        "InsertSeries");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    const auto created = OrNow(series.created_at);
    stmt.Bind(1, series.id).Bind(2, series.name).BindOpt(3, series.description)
        .Bind(4, created)
        .Bind(5, series.updated_at.empty() ? created : series.updated_at);
    return stmt.Run();
}

Result<void, Error> SqliteEntityStore::InsertGenre(const Genre& genre) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "INSERT INTO genres (id, name, description, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?)",
        "InsertGenre");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    const auto created = OrNow(genre.created_at);
    stmt.Bind(1, genre.id).Bind(2, genre.name).BindOpt(3, genre.description)
        .Bind(4, created)
        .Bind(5, genre.updated_at.empty() ? created : genre.updated_at);
    return stmt.Run();
}

Result<void, Error> SqliteEntityStore::InsertTopic(const Topic& topic) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "INSERT INTO topics (id, name, description, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?)",
        "InsertTopic");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    const auto created = OrNow(topic.created_at);
    stmt.Bind(1, topic.id).Bind(2, topic.name).BindOpt(3, topic.description)
        .Bind(4, created)
        .Bind(5, topic.updated_at.empty() ? created : topic.updated_at);
    return stmt.Run();
}

Result<void, Error> SqliteEntityStore::InsertCategory(const Category& category) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "INSERT INTO categories (id, name, description, color, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?)",
        "InsertCategory");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    const auto created = OrNow(category.created_at);
    stmt.Bind(1, category.id).Bind(2, category.name)
        .BindOpt(3, category.description).BindOpt(4, category.color)
        .Bind(5, created)
        .Bind(6, category.updated_at.empty() ? created : category.updated_at);
    return stmt.Run();
}

Result<void, Error> SqliteEntityStore::UpdateBookRow(const Book& book) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "UPDATE books SET title = ?, isbn = ?, publication_year = ?, pages = ?, "
        "description = ?, cover_image = ?, reading_status = ?, notes = ?, rating = ?, "
        "publisher_id = ?, series_id = ?, series_order = ?, category_id = ?, "
        "updated_at = ? WHERE id = ?",
        "UpdateBookRow");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, book.title)
        .BindOpt(2, book.isbn)
        .BindOptInt(3, book.publication_year)
        .BindOptInt(4, book.pages)
        .BindOpt(5, book.description)
        .BindOpt(6, book.cover_image)
        .Bind(7, ReadingStatusName(book.reading_status))
        .BindOpt(8, book.notes)
        .BindOptInt(9, book.rating)
        .Bind(10, book.publisher_id)
        .BindOpt(11, book.series_id)
        .BindOptInt(12, book.series_order)
        .Bind(13, book.category_id)
        .Bind(14, OrNow(book.updated_at))
        .Bind(15, book.id);
    return RunRowUpdate(db_.get(), stmt, "UpdateBookRow", "book", book.id);
}

Result<void, Error> SqliteEntityStore::UpdateAuthorRow(const Author& author) {
    auto prepared = Statement::Prepare(
        db_.get(), "UPDATE authors SET name = ?, bio = ?, updated_at = ? WHERE id = ?",
        "UpdateAuthorRow");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, author.name).BindOpt(2, author.bio)
        .Bind(3, OrNow(author.updated_at)).Bind(4, author.id);
    return RunRowUpdate(db_.get(), stmt, "UpdateAuthorRow", "author", author.id);
}

Result<void, Error> SqliteEntityStore::UpdatePublisherRow(const Publisher& publisher) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "UPDATE publishers SET name = ?, location = ?, website = ?, updated_at = ? "
        "WHERE id = ?",
        "UpdatePublisherRow");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, publisher.name)
        .BindOpt(2, publisher.location).BindOpt(3, publisher.website)
        .Bind(4, OrNow(publisher.updated_at)).Bind(5, publisher.id);
    return RunRowUpdate(db_.get(), stmt, "UpdatePublisherRow", "publisher", publisher.id);
}

Result<void, Error> SqliteEntityStore::UpdateSeriesRow(const Series& series) {
    auto prepared = Statement::Prepare(
        db_.get(), "UPDATE series SET name = ?, description = ?, updated_at = ? WHERE id = ?",
        "UpdateSeriesRow");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, series.name).BindOpt(2, series.description)
        .Bind(3, OrNow(series.updated_at)).Bind(4, series.id);
    return RunRowUpdate(db_.get(), stmt, "UpdateSeriesRow", "series", series.id);
}

Result<void, Error> SqliteEntityStore::UpdateGenreRow(const Genre& genre) {
    auto prepared = Statement::Prepare(
        db_.get(), "UPDATE genres SET name = ?, description = ?, updated_at = ? WHERE id = ?",
        "UpdateGenreRow");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, genre.name).BindOpt(2, genre.description)
        .Bind(3, OrNow(genre.updated_at)).Bind(4, genre.id);
    return RunRowUpdate(db_.get(), stmt, "UpdateGenreRow", "genre", genre.id);
}

Result<void, Error> SqliteEntityStore::UpdateTopicRow(const Topic& topic) {
    auto prepared = Statement::Prepare(
        db_.get(), "UPDATE topics SET name = ?, description = ?, updated_at = ? WHERE id = ?",
        "UpdateTopicRow");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, topic.name).BindOpt(2, topic.description)
        .Bind(3, OrNow(topic.updated_at)).Bind(4, topic.id);
    return RunRowUpdate(db_.get(), stmt, "UpdateTopicRow", "topic", topic.id);
}

Result<void, Error> SqliteEntityStore::UpdateCategoryRow(const Category& category) {
    auto prepared = Statement::Prepare(
        db_.get(),
        "UPDATE categories SET name = ?, description = ?, color = ?, updated_at = ? "
        "WHERE id = ?",
        "UpdateCategoryRow");
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, category.name)
        .BindOpt(2, category.description).BindOpt(3, category.color)
        .Bind(4, OrNow(category.updated_at)).Bind(5, category.id);
    return RunRowUpdate(db_.get(), stmt, "UpdateCategoryRow", "category", category.id);
}

Result<void, Error> SqliteEntityStore::DeleteEntity(EntityKind kind, std::string_view id) {
    const auto& t = TableFor(kind);
    auto prepared = Statement::Prepare(
        db_.get(), std::string("DELETE FROM ") + t.table + " WHERE id = ?",
        std::string("Delete ") + EntityKindName(kind));
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, id);
    auto ran = stmt.Run();
    if (ran.IsErr()) return ran;
    if (sqlite3_changes(db_.get()) == 0) {
        return Result<void, Error>::Err(Error::NotFound(
            std::string("Delete ") + EntityKindName(kind), EntityKindName(kind),
            std::string(id)));
    }
    LogDebug("store", std::string("Deleted ") + EntityKindName(kind) + " " + std::string(id));
    return Result<void, Error>::Ok();
}

Result<void, Error> SqliteEntityStore::InsertLink(Relation relation,
                                                  std::string_view source_id,
                                                  std::string_view target_id) {
    const auto& spec = Spec(relation);
    const std::string operation = std::string("InsertLink ") + spec.name;

    if (spec.storage == LinkStorage::Junction) {
        auto prepared = Statement::Prepare(
            db_.get(),
            std::string("INSERT INTO ") + spec.table + " (" + spec.source_column + ", " +
                spec.target_column + ") VALUES (?, ?)",
            operation);
        if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
        auto stmt = std::move(prepared).Value();
        stmt.Bind(1, source_id).Bind(2, target_id);
        return stmt.Run();
    }

    auto prepared = Statement::Prepare(
        db_.get(),
        std::string("UPDATE ") + spec.table + " SET " + spec.target_column +
            " = ?, updated_at = ? WHERE " + spec.source_column + " = ?",
        operation);
    if (prepared.IsErr()) return Result<void, Error>::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, target_id).Bind(2, CurrentTimestamp()).Bind(3, source_id);
    auto ran = stmt.Run();
    if (ran.IsErr()) return ran;
    if (sqlite3_changes(db_.get()) == 0) {
        return Result<void, Error>::Err(Error::NotFound(
            operation, EntityKindName(spec.source), std::string(source_id)));
    }
    return Result<void, Error>::Ok();
}

Result<int64_t, Error> SqliteEntityStore::DeleteLinks(Relation relation, LinkSide side,
                                                      std::string_view id) {
    using R = Result<int64_t, Error>;
    const auto& spec = Spec(relation);
    const std::string operation = std::string("DeleteLinks ") + spec.name;

    std::string sql;
    if (spec.storage == LinkStorage::Junction) {
        sql = std::string("DELETE FROM ") + spec.table + " WHERE " +
              ColumnAt(spec, side) + " = ?";
    } else if (IsNullableReference(spec)) {
        sql = std::string("UPDATE ") + spec.table + " SET " + spec.target_column +
              " = NULL WHERE " + ColumnAt(spec, side) + " = ?";
    } else {
        return R::Err(Error::Validation(
            operation, std::string("required reference ") + spec.target_column +
                           " cannot be cleared"));
    }

    auto prepared = Statement::Prepare(db_.get(), sql, operation);
    if (prepared.IsErr()) return R::Err(std::move(prepared).Error());
    auto stmt = std::move(prepared).Value();
    stmt.Bind(1, id);
    auto ran = stmt.Run();
    if (ran.IsErr()) return R::Err(std::move(ran).Error());
    return R::Ok(static_cast<int64_t>(sqlite3_changes(db_.get())));
}

// ---------------------------------------------------------------------------
// Transactions
// ---------------------------------------------------------------------------
Result<void, Error> SqliteEntityStore::Begin() {
    if (InTransaction()) {
        Error err;
        err.operation = "Begin";
        err.message = "A transaction is already open; nested transactions are not allowed";
        err.category = ErrorCategory::Internal;
        return Result<void, Error>::Err(std::move(err));
    }
    LogDebug("store", "BEGIN");
    return sqlite::Exec(db_.get(), "BEGIN IMMEDIATE", "Begin");
}

Result<void, Error> SqliteEntityStore::Commit() {
    LogDebug("store", "COMMIT");
    return sqlite::Exec(db_.get(), "COMMIT", "Commit");
}

Result<void, Error> SqliteEntityStore::Rollback() {
    LogDebug("store", "ROLLBACK");
    return sqlite::Exec(db_.get(), "ROLLBACK", "Rollback");
}

bool SqliteEntityStore::InTransaction() const {
    return sqlite3_get_autocommit(db_.get()) == 0;
}

Result<void, Error> SqliteEntityStore::Savepoint(std::string_view name) {
    if (!IsValidSavepointName(name)) {
        return Result<void, Error>::Err(
            Error::Validation("Savepoint", "invalid savepoint name '" + std::string(name) + "'"));
    }
    return sqlite::Exec(db_.get(), "SAVEPOINT " + std::string(name), "Savepoint");
}

Result<void, Error> SqliteEntityStore::ReleaseSavepoint(std::string_view name) {
    if (!IsValidSavepointName(name)) {
        return Result<void, Error>::Err(
            Error::Validation("ReleaseSavepoint",
                              "invalid savepoint name '" + std::string(name) + "'"));
    }
    return sqlite::Exec(db_.get(), "RELEASE SAVEPOINT " + std::string(name),
                        "ReleaseSavepoint");
}

Result<void, Error> SqliteEntityStore::RollbackToSavepoint(std::string_view name) {
    if (!IsValidSavepointName(name)) {
        return Result<void, Error>::Err(
            Error::Validation("RollbackToSavepoint",
                              "invalid savepoint name '" + std::string(name) + "'"));
    }
    return sqlite::Exec(db_.get(), "ROLLBACK TO SAVEPOINT " + std::string(name),
                        "RollbackToSavepoint");
}

} // namespace homelib
