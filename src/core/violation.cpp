#include <homelib/core/violation.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <utility>

namespace homelib {

namespace {

constexpr std::array<std::pair<ViolationRule, const char*>, 8> kRuleTags = {{
    {ViolationRule::OrphanAuthor, "orphan-author"},
    {ViolationRule::OrphanPublisher, "orphan-publisher"},
    {ViolationRule::OrphanSeries, "orphan-series"},
    {ViolationRule::SeriesWithoutAuthors, "series-without-authors"},
    {ViolationRule::BookWithoutPublisher, "book-without-publisher"},
    {ViolationRule::BookWithoutCategory, "book-without-category"},
    {ViolationRule::SoleSeriesAuthor, "sole-series-author"},
    {ViolationRule::HasLinkedBooks, "has-linked-books"},
}};

} // anonymous namespace

const char* RuleTag(ViolationRule rule) {
    for (const auto& [r, tag] : kRuleTags) {
        if (r == rule) return tag;
    }
    return "unknown";
}

std::optional<ViolationRule> ParseRuleTag(std::string_view tag) {
    for (const auto& [r, t] : kRuleTags) {
        if (tag == t) return r;
    }
    return std::nullopt;
}

nlohmann::json ViolationToJson(const Violation& violation) {
    return nlohmann::json{{"type", RuleTag(violation.rule)},
                          {"entityKind", violation.entity_kind},
                          {"entityId", violation.entity_id},
                          {"entityName", violation.entity_name},
                          {"message", violation.message}};
}

} // namespace homelib
