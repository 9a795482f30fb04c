#include "sqlite_util.hpp"

#include <utility>

namespace homelib {
namespace sqlite {

Error MakeError(sqlite3* db, const std::string& operation, int rc) {
    std::string message = std::string("SQLite error: ") + sqlite3_errstr(rc);
    std::optional<std::string> detail;
    if (db != nullptr) {
        detail = sqlite3_errmsg(db);
    }
    return Error::Storage(operation, message, std::move(detail));
}

Result<void, Error> Exec(sqlite3* db, const std::string& sql,
                         const std::string& operation) {
    char* errmsg = nullptr;
    const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string detail = errmsg != nullptr ? errmsg : sqlite3_errmsg(db);
        sqlite3_free(errmsg);
        return Result<void, Error>::Err(Error::Storage(
            operation, std::string("SQLite error: ") + sqlite3_errstr(rc), detail));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Statement
// ---------------------------------------------------------------------------
Result<Statement, Error> Statement::Prepare(sqlite3* db, const std::string& sql,
                                            const std::string& operation) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        return Result<Statement, Error>::Err(MakeError(db, operation, rc));
    }
    return Result<Statement, Error>::Ok(Statement(db, stmt, operation));
}

Statement::~Statement() {
    if (stmt_ != nullptr) {
        sqlite3_finalize(stmt_);
    }
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_),
      operation_(std::move(other.operation_)), bind_rc_(other.bind_rc_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
        db_ = other.db_;
        stmt_ = other.stmt_;
        operation_ = std::move(other.operation_);
        bind_rc_ = other.bind_rc_;
        other.stmt_ = nullptr;
    }
    return *this;
}

void Statement::NoteBind(int rc) {
    if (rc != SQLITE_OK && bind_rc_ == SQLITE_OK) {
        bind_rc_ = rc;
    }
}

Statement& Statement::Bind(int index, std::string_view value) {
    NoteBind(sqlite3_bind_text(stmt_, index, value.data(),
                               static_cast<int>(value.size()), SQLITE_TRANSIENT));
    return *this;
}

Statement& Statement::BindOpt(int index, const std::optional<std::string>& value) {
    if (!value.has_value()) {
        NoteBind(sqlite3_bind_null(stmt_, index));
        return *this;
    }
    return Bind(index, std::string_view(*value));
}

Statement& Statement::BindInt(int index, int64_t value) {
    NoteBind(sqlite3_bind_int64(stmt_, index, value));
    return *this;
}

Statement& Statement::BindOptInt(int index, const std::optional<int>& value) {
    if (!value.has_value()) {
        NoteBind(sqlite3_bind_null(stmt_, index));
        return *this;
    }
    return BindInt(index, static_cast<int64_t>(*value));
}

Result<bool, Error> Statement::Step() {
    if (bind_rc_ != SQLITE_OK) {
        return Result<bool, Error>::Err(MakeError(db_, operation_, bind_rc_));
    }
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return Result<bool, Error>::Ok(true);
    if (rc == SQLITE_DONE) return Result<bool, Error>::Ok(false);
    return Result<bool, Error>::Err(MakeError(db_, operation_, rc));
}

Result<void, Error> Statement::Run() {
    while (true) {
        auto step = Step();
        if (step.IsErr()) return Result<void, Error>::Err(std::move(step).Error());
        if (!step.Value()) break;
    }
    return Result<void, Error>::Ok();
}

std::string Statement::Text(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (text == nullptr) {
        return {};
    }
    return reinterpret_cast<const char*>(text);
}

std::optional<std::string> Statement::OptText(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return Text(column);
}

int64_t Statement::Int(int column) const {
    return sqlite3_column_int64(stmt_, column);
}

std::optional<int> Statement::OptInt(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int(stmt_, column);
}

} // namespace sqlite
} // namespace homelib
