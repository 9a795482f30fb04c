#include <homelib/store/schema.hpp>

#include <homelib/core/log.hpp>
#include <homelib/core/types.hpp>

#include "sqlite_util.hpp"

namespace homelib {

namespace {

const char* const kInitialSchema = R"SQL(
CREATE TABLE authors (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL,
    bio         TEXT,
    created_at  TEXT NOT NULL,
    updated_at  TEXT NOT NULL
);

CREATE TABLE publishers (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL,
    location    TEXT,
    website     TEXT,
    created_at  TEXT NOT NULL,
    updated_at  TEXT NOT NULL
);

CREATE TABLE series (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL,
    description TEXT,
    created_at  TEXT NOT NULL,
    updated_at  TEXT NOT NULL
);

CREATE TABLE genres (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL UNIQUE,
    description TEXT,
    created_at  TEXT NOT NULL,
    updated_at  TEXT NOT NULL
);

CREATE TABLE topics (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL UNIQUE,
    description TEXT,
    created_at  TEXT NOT NULL,
    updated_at  TEXT NOT NULL
);

CREATE TABLE categories (
    id          TEXT PRIMARY KEY,
    name        TEXT NOT NULL UNIQUE,
    description TEXT,
    color       TEXT,
    created_at  TEXT NOT NULL,
    updated_at  TEXT NOT NULL
);

CREATE TABLE books (
    id               TEXT PRIMARY KEY,
    title            TEXT NOT NULL,
    isbn             TEXT,
    publication_year INTEGER,
    pages            INTEGER,
    description      TEXT,
    cover_image      TEXT,
    reading_status   TEXT NOT NULL DEFAULT 'unread'
                     CHECK (reading_status IN ('unread', 'reading', 'completed')),
    notes            TEXT,
    rating           INTEGER CHECK (rating IS NULL OR (rating >= 0 AND rating <= 5)),
    publisher_id     TEXT NOT NULL REFERENCES publishers(id),
    series_id        TEXT REFERENCES series(id) ON DELETE SET NULL,
    series_order     INTEGER,
    category_id      TEXT NOT NULL REFERENCES categories(id),
    created_at       TEXT NOT NULL,
    updated_at       TEXT NOT NULL
);

CREATE TABLE book_authors (
    book_id   TEXT NOT NULL REFERENCES books(id) ON DELETE CASCADE,
    author_id TEXT NOT NULL REFERENCES authors(id) ON DELETE CASCADE,
    PRIMARY KEY (book_id, author_id)
);

CREATE TABLE book_genres (
    book_id  TEXT NOT NULL REFERENCES books(id) ON DELETE CASCADE,
    genre_id TEXT NOT NULL REFERENCES genres(id) ON DELETE CASCADE,
    PRIMARY KEY (book_id, genre_id)
);

CREATE TABLE book_topics (
    book_id  TEXT NOT NULL REFERENCES books(id) ON DELETE CASCADE,
    topic_id TEXT NOT NULL REFERENCES topics(id) ON DELETE CASCADE,
    PRIMARY KEY (book_id, topic_id)
);

CREATE TABLE series_authors (
    series_id TEXT NOT NULL REFERENCES series(id) ON DELETE CASCADE,
    author_id TEXT NOT NULL REFERENCES authors(id) ON DELETE CASCADE,
    PRIMARY KEY (series_id, author_id)
);

CREATE INDEX idx_books_publisher ON books(publisher_id);
CREATE INDEX idx_books_series ON books(series_id);
CREATE INDEX idx_books_category ON books(category_id);
CREATE INDEX idx_book_authors_author ON book_authors(author_id);
CREATE INDEX idx_book_genres_genre ON book_genres(genre_id);
CREATE INDEX idx_book_topics_topic ON book_topics(topic_id);
CREATE INDEX idx_series_authors_author ON series_authors(author_id);
)SQL";

// Timestamps of seed rows are filled in with the migration time.
const char* const kSeedData = R"SQL(
INSERT OR IGNORE INTO categories (id, name, description, color, created_at, updated_at)
VALUES ('00000000-0000-4000-8000-000000000001', 'General',
        'Default category for uncategorized books', '#3b82f6', :now, :now);

INSERT OR IGNORE INTO genres (id, name, description, created_at, updated_at) VALUES
    ('00000000-0000-4000-8000-000000000010', 'Fiction', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000011', 'Non-Fiction', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000012', 'Mystery', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000013', 'Science Fiction', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000014', 'Fantasy', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000015', 'Romance', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000016', 'Thriller', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000017', 'Horror', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000018', 'Biography', NULL, :now, :now),
    ('00000000-0000-4000-8000-000000000019', 'History', NULL, :now, :now);
)SQL";

// sqlite3_exec cannot bind parameters; substitute the quoted timestamp.
std::string WithTimestamp(std::string sql) {
    const std::string placeholder = ":now";
    const std::string quoted = "'" + CurrentTimestamp() + "'";
    for (auto pos = sql.find(placeholder); pos != std::string::npos;
         pos = sql.find(placeholder, pos + quoted.size())) {
        sql.replace(pos, placeholder.size(), quoted);
    }
    return sql;
}

Result<int, Error> CurrentVersion(sqlite3* db) {
    auto stmt = sqlite::Statement::Prepare(
        db, "SELECT COALESCE(MAX(version), 0) FROM schema_migrations", "Schema");
    if (stmt.IsErr()) return Result<int, Error>::Err(std::move(stmt).Error());
    auto s = std::move(stmt).Value();
    auto row = s.Step();
    if (row.IsErr()) return Result<int, Error>::Err(std::move(row).Error());
    return Result<int, Error>::Ok(row.Value() ? static_cast<int>(s.Int(0)) : 0);
}

} // anonymous namespace

const std::vector<Migration>& SchemaMigrations() {
    static const std::vector<Migration> migrations = {
        {1, "001_initial_schema", kInitialSchema},
        {2, "002_seed_default_data", kSeedData},
    };
    return migrations;
}

int LatestSchemaVersion() {
    return SchemaMigrations().back().version;
}

namespace sqlite {

Result<int, Error> ApplyMigrations(sqlite3* db) {
    auto created = Exec(db,
        "CREATE TABLE IF NOT EXISTS schema_migrations ("
        " version INTEGER PRIMARY KEY,"
        " name TEXT NOT NULL,"
        " applied_at TEXT NOT NULL)",
        "Schema");
    if (created.IsErr()) return Result<int, Error>::Err(std::move(created).Error());

    auto current = CurrentVersion(db);
    if (current.IsErr()) return current;
    int version = current.Value();

    for (const auto& m : SchemaMigrations()) {
        if (m.version <= version) continue;

        LogInfo("schema", "Applying migration " + m.name);
        auto begun = Exec(db, "BEGIN IMMEDIATE", "Schema");
        if (begun.IsErr()) return Result<int, Error>::Err(std::move(begun).Error());

        auto applied = Exec(db, WithTimestamp(m.sql), "Schema " + m.name);
        if (applied.IsOk()) {
            auto record = Statement::Prepare(
                db, "INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?)",
                "Schema " + m.name);
            if (record.IsErr()) {
                applied = Result<void, Error>::Err(std::move(record).Error());
            } else {
                auto stmt = std::move(record).Value();
                stmt.BindInt(1, static_cast<int64_t>(m.version))
                    .Bind(2, m.name)
                    .Bind(3, CurrentTimestamp());
                applied = stmt.Run();
            }
        }
        if (applied.IsErr()) {
            LogError("schema", "Migration " + m.name + " failed: " +
                                   applied.Error().ToString());
            auto rolled_back = Exec(db, "ROLLBACK", "Schema");
            if (rolled_back.IsErr()) {
                LogError("schema", rolled_back.Error().ToString());
            }
            return Result<int, Error>::Err(std::move(applied).Error());
        }

        auto committed = Exec(db, "COMMIT", "Schema");
        if (committed.IsErr()) return Result<int, Error>::Err(std::move(committed).Error());
        version = m.version;
    }
    return Result<int, Error>::Ok(version);
}

} // namespace sqlite
} // namespace homelib
