#pragma once

#include <homelib/core/violation.hpp>
#include <homelib/model/entities.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace homelib {

// ---------------------------------------------------------------------------
// Relationship catalog — static declaration of every link between entity
// kinds, its cardinality on both ends, how it is stored and what happens to
// it when one of its endpoints is removed.
//
// The store builds its link SQL from these declarations, the impact analyzer
// counts through them and the lifecycle enforcer removes entities by walking
// them. No state, no failure modes.
// ---------------------------------------------------------------------------

enum class Relation {
    BookPublisher,
    BookCategory,
    BookSeries,
    BookAuthor,
    BookGenre,
    BookTopic,
    SeriesAuthor,
};

enum class Cardinality {
    OptionalMany,
    OptionalOne,
    RequiredExactlyOne,
    RequiredMinOne,
};

enum class LinkStorage {
    ForeignKey,  // column on the source table
    Junction,    // separate two-column table
};

// Which end of a relation an entity sits on.
enum class LinkSide {
    Source,
    Target,
};

enum class OnRemoval {
    DeleteLinks,     // link rows go with the entity
    ClearReference,  // nullable foreign key is set to NULL
    Restrict,        // the entity may not go while referenced
};

struct RelationSpec {
    Relation relation;
    const char* name;
    EntityKind source;
    EntityKind target;
    Cardinality source_requires;  // targets each source must have
    Cardinality target_requires;  // sources each target must have
    LinkStorage storage;
    const char* table;
    const char* source_column;  // for ForeignKey: the source table's key
    const char* target_column;  // for ForeignKey: the referencing column
    OnRemoval on_target_removal;
};

struct EntityTable {
    EntityKind kind;
    const char* table;
    const char* name_column;
};

// A minimum-cardinality rule: entities of `kind` on `side` of `relation`
// must satisfy the cardinality declared there.
struct MinimumRule {
    ViolationRule rule;
    EntityKind kind;
    Relation relation;
    LinkSide side;
    const char* missing;      // "books", "authors", "publisher", ...
    const char* requirement;  // "each author must have at least 1 book"
};

[[nodiscard]] const std::vector<RelationSpec>& AllRelations();
// Total over the enums: the catalog declares every relation and kind.
[[nodiscard]] const RelationSpec& Spec(Relation relation);
[[nodiscard]] const EntityTable& TableFor(EntityKind kind);

[[nodiscard]] inline LinkSide Opposite(LinkSide side) {
    return side == LinkSide::Source ? LinkSide::Target : LinkSide::Source;
}
[[nodiscard]] EntityKind KindAt(const RelationSpec& spec, LinkSide side);
[[nodiscard]] const char* ColumnAt(const RelationSpec& spec, LinkSide side);
[[nodiscard]] Cardinality RequirementAt(const RelationSpec& spec, LinkSide side);

[[nodiscard]] bool IsNullableReference(const RelationSpec& spec);

// True when `linked_count` satisfies the cardinality.
[[nodiscard]] bool MinimumSatisfied(Cardinality cardinality, int64_t linked_count);

// True when an entity of `kind` with `linked_count` links through
// `relation` satisfies its minimum. Kinds not on the relation are
// trivially satisfied.
[[nodiscard]] bool MinimumSatisfied(EntityKind kind, Relation relation,
                                    int64_t linked_count);

// Orphan rules (required-min-one). Their violators are swept by cleanup.
[[nodiscard]] const std::vector<MinimumRule>& OrphanRules();

// Required-exactly-one foreign keys of books. Reported, never swept.
[[nodiscard]] const std::vector<MinimumRule>& ReferenceRules();

// The minimum rule behind `rule`, or nullptr for rules that are not
// cardinality minimums (sole series author, linked books).
[[nodiscard]] const MinimumRule* FindRule(ViolationRule rule);

// Every (relation, side) on which `kind` participates.
[[nodiscard]] std::vector<std::pair<Relation, LinkSide>> RelationsTouching(EntityKind kind);

// `Author "Jane" has no books (violates: each author must have at least 1 book)`
[[nodiscard]] std::string DescribeViolation(const MinimumRule& rule,
                                            const std::string& entity_name);

[[nodiscard]] Violation MakeViolation(const MinimumRule& rule, const EntityRef& ref);

} // namespace homelib
