#pragma once

#include <homelib/core/result.hpp>

#include <string>
#include <string_view>

namespace homelib {

// ---------------------------------------------------------------------------
// EntityId — validated external identifier of a catalogue record.
//
// Rules:
//   - Non-empty, at most 64 characters
//   - No whitespace or control characters
// Generated ids are RFC 4122 version-4 UUIDs, but imported ids are kept
// verbatim as long as they satisfy the rules above.
// ---------------------------------------------------------------------------
class EntityId {
public:
    static Result<EntityId, std::string> Create(std::string_view id);

    // Fresh random version-4 UUID.
    static EntityId Generate();

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const EntityId& other) const { return value_ == other.value_; }
    bool operator!=(const EntityId& other) const { return value_ != other.value_; }

    EntityId(const EntityId&) = default;
    EntityId& operator=(const EntityId&) = default;
    EntityId(EntityId&&) noexcept = default;
    EntityId& operator=(EntityId&&) noexcept = default;

private:
    explicit EntityId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ReadingStatus — where the owner is with a book.
// ---------------------------------------------------------------------------
enum class ReadingStatus {
    Unread,
    Reading,
    Completed,
};

[[nodiscard]] const char* ReadingStatusName(ReadingStatus status);

// "unread" | "reading" | "completed"
[[nodiscard]] Result<ReadingStatus, std::string> ParseReadingStatus(std::string_view text);

// ---------------------------------------------------------------------------
// Rating — 0..5 stars.
// ---------------------------------------------------------------------------
constexpr int kMinRating = 0;
constexpr int kMaxRating = 5;

// Current UTC time as "YYYY-MM-DDTHH:MM:SS.mmmZ".
[[nodiscard]] std::string CurrentTimestamp();

} // namespace homelib
