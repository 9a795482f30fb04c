#pragma once

#include <homelib/core/result.hpp>
#include <homelib/core/violation.hpp>
#include <homelib/model/entities.hpp>
#include <homelib/store/i_entity_store.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace homelib {

// ---------------------------------------------------------------------------
// ImpactReport — what a book deletion or update would orphan.
//
// Counts reflect the persisted state with the book still present, so an
// entity is at risk when its count is exactly 1 (the book itself).
// `stranded_series` lists series that survive but whose every author is
// in `orphaned_authors`; it does not contribute to HasImpact().
// ---------------------------------------------------------------------------
struct ImpactReport {
    std::string book_id;
    std::vector<EntityRef> orphaned_authors;
    std::optional<EntityRef> orphaned_publisher;
    std::optional<EntityRef> orphaned_series;
    std::vector<EntityRef> stranded_series;

    [[nodiscard]] bool HasImpact() const {
        return !orphaned_authors.empty() || orphaned_publisher.has_value() ||
               orphaned_series.has_value();
    }

    // One violation per at-risk entity, orphans first, stranded series last.
    [[nodiscard]] std::vector<Violation> ToViolations() const;

    // "1 author(s) would have no books: Jane; Publisher \"P\" would have no books"
    [[nodiscard]] std::string Summary() const;
};

// ---------------------------------------------------------------------------
// AuthorDeleteImpact — series for which the author is the only author.
// ---------------------------------------------------------------------------
struct AuthorDeleteImpact {
    EntityRef author;
    std::vector<EntityRef> series_with_no_authors;

    [[nodiscard]] bool HasImpact() const { return !series_with_no_authors.empty(); }

    [[nodiscard]] std::vector<Violation> ToViolations() const;
};

// ---------------------------------------------------------------------------
// IntegrityReport — result of a full-graph scan.
// ---------------------------------------------------------------------------
struct IntegrityReport {
    bool is_valid = true;
    std::vector<Violation> violations;
    std::map<std::string, int64_t> summary;  // rule tag -> count, all tags present
};

// Orphans grouped by kind, as swept by cleanup. A series missing books and
// authors appears once.
struct OrphanSet {
    std::vector<EntityRef> authors;
    std::vector<EntityRef> publishers;
    std::vector<EntityRef> series;

    [[nodiscard]] bool Empty() const {
        return authors.empty() && publishers.empty() && series.empty();
    }
};

// ---------------------------------------------------------------------------
// Read-only analysis. Every function runs inside the caller's transaction
// when one is open and never writes. A missing subject is NotFound; a link
// count that contradicts the store's uniqueness guarantees is Internal.
// ---------------------------------------------------------------------------

[[nodiscard]] Result<ImpactReport, Error> CheckDeleteImpact(
    IEntityStore& store, std::string_view book_id);

// Only links that change are evaluated: an unchanged publisher or series
// is never at risk, and only authors dropped from the book are counted.
[[nodiscard]] Result<ImpactReport, Error> CheckUpdateImpact(
    IEntityStore& store, std::string_view book_id, const BookInput& proposed);

[[nodiscard]] Result<AuthorDeleteImpact, Error> CheckAuthorDeleteImpact(
    IEntityStore& store, std::string_view author_id);

[[nodiscard]] Result<IntegrityReport, Error> IntegrityCheck(IEntityStore& store);

[[nodiscard]] Result<OrphanSet, Error> FindOrphans(IEntityStore& store);

} // namespace homelib
