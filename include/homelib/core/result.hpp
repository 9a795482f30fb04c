#pragma once

#include <cassert>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <cstddef>
#include <utility>
#include <variant>
#include <vector>

#include <homelib/core/violation.hpp>

#include <nlohmann/json_fwd.hpp>

namespace homelib {

// ---------------------------------------------------------------------------
// Result<T, E>
//
// Every store and engine call returns one of these instead of throwing.
// Accessing the wrong side is a programming error and asserts in debug builds.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result Err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk());
        return *std::get_if<0>(&state_);
    }
    [[nodiscard]] T Value() && {
        assert(IsOk());
        return std::move(*std::get_if<0>(&state_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return *std::get_if<1>(&state_);
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::move(*std::get_if<1>(&state_));
    }

private:
    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    std::variant<T, E> state_;
};

// Commands with nothing to return (link writes, deletes without a report).
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(); }
    static Result Err(E error) {
        Result r;
        r.error_ = std::move(error);
        return r;
    }

    [[nodiscard]] bool IsOk() const noexcept { return !error_; }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr());
        return *error_;
    }
    [[nodiscard]] E Error() && {
        assert(IsErr());
        return std::move(*error_);
    }

private:
    Result() = default;

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — drives exit codes and the "category" field of JSON output.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    NotFound,
    BlockedByInvariant,
    Validation,
    Storage,
    Parse,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error for catalogue operations.
//
// Blocking errors carry the violations that caused them, so callers can
// render which entities are at risk and under which rule.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string entity;                 // "author:1234", may be empty
    std::string message;
    std::optional<std::string> detail;  // underlying store message
    std::optional<std::string> hint;
    ErrorCategory category = ErrorCategory::Internal;
    std::vector<Violation> violations;
    std::optional<int64_t> linked_count;

    static Error NotFound(const std::string& operation,
                          const std::string& kind,
                          const std::string& id);

    static Error Blocked(const std::string& operation,
                         const std::string& entity,
                         const std::string& message,
                         std::vector<Violation> violations,
                         std::optional<int64_t> linked_count = std::nullopt);

    static Error Validation(const std::string& operation,
                            const std::string& message);

    static Error Storage(const std::string& operation,
                         const std::string& message,
                         std::optional<std::string> detail = std::nullopt);

    static Error Parse(const std::string& operation,
                       const std::string& message);

    static Error Config(const std::string& message);

    [[nodiscard]] bool IsBlocked() const noexcept {
        return category == ErrorCategory::BlockedByInvariant;
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::NotFound:           return 2;
            case ErrorCategory::BlockedByInvariant: return 3;
            case ErrorCategory::Validation:         return 4;
            case ErrorCategory::Storage:            return 5;
            case ErrorCategory::Parse:              return 6;
            case ErrorCategory::Config:             return 7;
            case ErrorCategory::Internal:           return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const;

    // One line: "DeleteAuthor [author:42]: Cannot delete author ... (store: ...)"
    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] nlohmann::json ToJsonValue() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               entity == other.entity &&
               message == other.message &&
               detail == other.detail &&
               hint == other.hint &&
               category == other.category &&
               violations == other.violations &&
               linked_count == other.linked_count;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace homelib
