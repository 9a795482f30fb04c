#pragma once

// Internal helpers shared by the SQLite store and its schema migrations.
// Not part of the public include tree.

#include <homelib/core/result.hpp>

#include <sqlite3.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace homelib {
namespace sqlite {

// Storage error carrying sqlite3_errmsg() as detail.
Error MakeError(sqlite3* db, const std::string& operation, int rc);

// Run one or more statements without results.
Result<void, Error> Exec(sqlite3* db, const std::string& sql,
                         const std::string& operation);

// ---------------------------------------------------------------------------
// Statement — RAII wrapper around sqlite3_stmt.
//
// Bind failures are remembered and reported by the next Step(), so call
// sites can bind a row in one go and check a single Result.
// ---------------------------------------------------------------------------
class Statement {
public:
    static Result<Statement, Error> Prepare(sqlite3* db, const std::string& sql,
                                            const std::string& operation);

    ~Statement();
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based, as in sqlite3_bind_*.
    Statement& Bind(int index, std::string_view value);
    Statement& BindOpt(int index, const std::optional<std::string>& value);
    Statement& BindInt(int index, int64_t value);
    Statement& BindOptInt(int index, const std::optional<int>& value);

    // true while a row is available, false once the statement is done.
    [[nodiscard]] Result<bool, Error> Step();

    // Step to completion, for statements that return no rows.
    [[nodiscard]] Result<void, Error> Run();

    // Columns are 0-based.
    [[nodiscard]] std::string Text(int column) const;
    [[nodiscard]] std::optional<std::string> OptText(int column) const;
    [[nodiscard]] int64_t Int(int column) const;
    [[nodiscard]] std::optional<int> OptInt(int column) const;

private:
    Statement(sqlite3* db, sqlite3_stmt* stmt, std::string operation)
        : db_(db), stmt_(stmt), operation_(std::move(operation)) {}

    void NoteBind(int rc);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* stmt_ = nullptr;
    std::string operation_;
    int bind_rc_ = SQLITE_OK;
};

// Apply pending schema migrations. Returns the resulting schema version.
Result<int, Error> ApplyMigrations(sqlite3* db);

} // namespace sqlite
} // namespace homelib
