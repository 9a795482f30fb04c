#include <homelib/catalog/relationship_catalog.hpp>

#include <cstddef>

namespace homelib {

namespace {

// kRelations and kTables list one entry per enum value, in enum order.
const std::vector<RelationSpec> kRelations = {
    {Relation::BookPublisher, "book-publisher",
     EntityKind::Book, EntityKind::Publisher,
     Cardinality::RequiredExactlyOne, Cardinality::RequiredMinOne,
     LinkStorage::ForeignKey, "books", "id", "publisher_id", OnRemoval::Restrict},
    {Relation::BookCategory, "book-category",
     EntityKind::Book, EntityKind::Category,
     Cardinality::RequiredExactlyOne, Cardinality::OptionalMany,
     LinkStorage::ForeignKey, "books", "id", "category_id", OnRemoval::Restrict},
    {Relation::BookSeries, "book-series",
     EntityKind::Book, EntityKind::Series,
     Cardinality::OptionalOne, Cardinality::RequiredMinOne,
     LinkStorage::ForeignKey, "books", "id", "series_id", OnRemoval::ClearReference},
    {Relation::BookAuthor, "book-author",
     EntityKind::Book, EntityKind::Author,
     Cardinality::OptionalMany, Cardinality::RequiredMinOne,
     LinkStorage::Junction, "book_authors", "book_id", "author_id", OnRemoval::DeleteLinks},
    {Relation::BookGenre, "book-genre",
     EntityKind::Book, EntityKind::Genre,
     Cardinality::OptionalMany, Cardinality::OptionalMany,
     LinkStorage::Junction, "book_genres", "book_id", "genre_id", OnRemoval::DeleteLinks},
    {Relation::BookTopic, "book-topic",
     EntityKind::Book, EntityKind::Topic,
     Cardinality::OptionalMany, Cardinality::OptionalMany,
     LinkStorage::Junction, "book_topics", "book_id", "topic_id", OnRemoval::DeleteLinks},
    {Relation::SeriesAuthor, "series-author",
     EntityKind::Series, EntityKind::Author,
     Cardinality::RequiredMinOne, Cardinality::OptionalMany,
     LinkStorage::Junction, "series_authors", "series_id", "author_id", OnRemoval::DeleteLinks},
};

const std::vector<EntityTable> kTables = {
    {EntityKind::Book, "books", "title"},
    {EntityKind::Author, "authors", "name"},
    {EntityKind::Publisher, "publishers", "name"},
    {EntityKind::Series, "series", "name"},
    {EntityKind::Genre, "genres", "name"},
    {EntityKind::Topic, "topics", "name"},
    {EntityKind::Category, "categories", "name"},
};

const std::vector<MinimumRule> kOrphanRules = {
    {ViolationRule::OrphanAuthor, EntityKind::Author,
     Relation::BookAuthor, LinkSide::Target,
     "books", "each author must have at least 1 book"},
    {ViolationRule::OrphanPublisher, EntityKind::Publisher,
     Relation::BookPublisher, LinkSide::Target,
     "books", "each publisher must have at least 1 book"},
    {ViolationRule::OrphanSeries, EntityKind::Series,
     Relation::BookSeries, LinkSide::Target,
     "books", "each series must have at least 1 book"},
    {ViolationRule::SeriesWithoutAuthors, EntityKind::Series,
     Relation::SeriesAuthor, LinkSide::Source,
     "authors", "each series must have at least 1 author"},
};

const std::vector<MinimumRule> kReferenceRules = {
    {ViolationRule::BookWithoutPublisher, EntityKind::Book,
     Relation::BookPublisher, LinkSide::Source,
     "publisher", "each book must have exactly 1 publisher"},
    {ViolationRule::BookWithoutCategory, EntityKind::Book,
     Relation::BookCategory, LinkSide::Source,
     "category", "each book must have exactly 1 category"},
};

} // anonymous namespace

const std::vector<RelationSpec>& AllRelations() {
    return kRelations;
}

const RelationSpec& Spec(Relation relation) {
    return kRelations[static_cast<std::size_t>(relation)];
}

const EntityTable& TableFor(EntityKind kind) {
    return kTables[static_cast<std::size_t>(kind)];
}

EntityKind KindAt(const RelationSpec& spec, LinkSide side) {
    return side == LinkSide::Source ? spec.source : spec.target;
}

const char* ColumnAt(const RelationSpec& spec, LinkSide side) {
    return side == LinkSide::Source ? spec.source_column : spec.target_column;
}

Cardinality RequirementAt(const RelationSpec& spec, LinkSide side) {
    return side == LinkSide::Source ? spec.source_requires : spec.target_requires;
}

bool IsNullableReference(const RelationSpec& spec) {
    return spec.storage == LinkStorage::ForeignKey &&
           spec.on_target_removal == OnRemoval::ClearReference;
}

bool MinimumSatisfied(Cardinality cardinality, int64_t linked_count) {
    switch (cardinality) {
        case Cardinality::OptionalMany:       return true;
        case Cardinality::OptionalOne:        return linked_count <= 1;
        case Cardinality::RequiredExactlyOne: return linked_count == 1;
        case Cardinality::RequiredMinOne:     return linked_count >= 1;
    }
    return true;
}

bool MinimumSatisfied(EntityKind kind, Relation relation, int64_t linked_count) {
    const auto& spec = Spec(relation);
    if (spec.target == kind &&
        !MinimumSatisfied(spec.target_requires, linked_count)) {
        return false;
    }
    if (spec.source == kind &&
        !MinimumSatisfied(spec.source_requires, linked_count)) {
        return false;
    }
    return true;
}

const std::vector<MinimumRule>& OrphanRules() {
    return kOrphanRules;
}

const std::vector<MinimumRule>& ReferenceRules() {
    return kReferenceRules;
}

const MinimumRule* FindRule(ViolationRule rule) {
    for (const auto* list : {&kOrphanRules, &kReferenceRules}) {
        for (const auto& r : *list) {
            if (r.rule == rule) return &r;
        }
    }
    return nullptr;
}

std::vector<std::pair<Relation, LinkSide>> RelationsTouching(EntityKind kind) {
    std::vector<std::pair<Relation, LinkSide>> out;
    for (const auto& spec : kRelations) {
        if (spec.source == kind) out.emplace_back(spec.relation, LinkSide::Source);
        if (spec.target == kind) out.emplace_back(spec.relation, LinkSide::Target);
    }
    return out;
}

std::string DescribeViolation(const MinimumRule& rule,
                              const std::string& entity_name) {
    return std::string(EntityKindLabel(rule.kind)) + " \"" + entity_name +
           "\" has no " + rule.missing + " (violates: " + rule.requirement + ")";
}

Violation MakeViolation(const MinimumRule& rule, const EntityRef& ref) {
    return Violation{rule.rule, EntityKindName(ref.kind), ref.id, ref.name,
                     DescribeViolation(rule, ref.name)};
}

} // namespace homelib
