#pragma once

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace homelib {

// ---------------------------------------------------------------------------
// ViolationRule — the integrity rule a finding or a blocked operation refers
// to. Tags are stable and appear in machine-readable output.
// ---------------------------------------------------------------------------
enum class ViolationRule {
    OrphanAuthor,
    OrphanPublisher,
    OrphanSeries,
    SeriesWithoutAuthors,
    BookWithoutPublisher,
    BookWithoutCategory,
    SoleSeriesAuthor,
    HasLinkedBooks,
};

// "orphan-author", "series-without-authors", ...
[[nodiscard]] const char* RuleTag(ViolationRule rule);

[[nodiscard]] std::optional<ViolationRule> ParseRuleTag(std::string_view tag);

// ---------------------------------------------------------------------------
// Violation — one concrete finding: which entity, which rule, and a message
// suitable for showing to a user.
// ---------------------------------------------------------------------------
struct Violation {
    ViolationRule rule = ViolationRule::OrphanAuthor;
    std::string entity_kind;  // "author", "series", ...
    std::string entity_id;
    std::string entity_name;
    std::string message;

    bool operator==(const Violation& other) const {
        return rule == other.rule && entity_kind == other.entity_kind &&
               entity_id == other.entity_id &&
               entity_name == other.entity_name && message == other.message;
    }
    bool operator!=(const Violation& other) const { return !(*this == other); }
};

// {"type", "entityKind", "entityId", "entityName", "message"}
[[nodiscard]] nlohmann::json ViolationToJson(const Violation& violation);

} // namespace homelib
