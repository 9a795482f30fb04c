#pragma once

#include <homelib/core/result.hpp>
#include <homelib/engine/bulk_merge.hpp>
#include <homelib/engine/impact_analyzer.hpp>
#include <homelib/engine/library_stats.hpp>
#include <homelib/engine/lifecycle_enforcer.hpp>
#include <homelib/model/entities.hpp>

#include <nlohmann/json.hpp>

#include <optional>

namespace homelib {

// ---------------------------------------------------------------------------
// JSON mapping of records and engine results. Field names are camelCase;
// absent optionals are written as null.
// ---------------------------------------------------------------------------

// An integer JSON value as int; nullopt when it does not fit in 32 bits.
// `value` must be an integer number.
[[nodiscard]] std::optional<int> JsonIntValue(const nlohmann::json& value);

[[nodiscard]] nlohmann::json EntityRefToJson(const EntityRef& ref);

[[nodiscard]] nlohmann::json BookToJson(const Book& book);
[[nodiscard]] nlohmann::json BookRecordToJson(const BookRecord& record);
[[nodiscard]] nlohmann::json AuthorToJson(const Author& author);
[[nodiscard]] nlohmann::json PublisherToJson(const Publisher& publisher);
[[nodiscard]] nlohmann::json SeriesToJson(const Series& series);
[[nodiscard]] nlohmann::json SeriesRecordToJson(const SeriesRecord& record);
[[nodiscard]] nlohmann::json GenreToJson(const Genre& genre);
[[nodiscard]] nlohmann::json TopicToJson(const Topic& topic);
[[nodiscard]] nlohmann::json CategoryToJson(const Category& category);

[[nodiscard]] nlohmann::json ImpactReportToJson(const ImpactReport& report);
[[nodiscard]] nlohmann::json AuthorDeleteImpactToJson(const AuthorDeleteImpact& impact);
[[nodiscard]] nlohmann::json IntegrityReportToJson(const IntegrityReport& report);
[[nodiscard]] nlohmann::json DeletionResultToJson(const DeletionResult& result);
[[nodiscard]] nlohmann::json UpdateResultToJson(const UpdateResult& result);
[[nodiscard]] nlohmann::json CleanupResultToJson(const CleanupResult& result);
[[nodiscard]] nlohmann::json ImportResultToJson(const ImportResult& result);
[[nodiscard]] nlohmann::json LibraryStatsToJson(const LibraryStats& stats);

// {kind, id, name} plus bookCount where counted and authors for series.
[[nodiscard]] nlohmann::json EntitySummaryToJson(const EntitySummary& summary);

// ---------------------------------------------------------------------------
// BookInputFromJson — overlay the fields present in `j` onto `base`.
//
// Keys: title, isbn, publicationYear, pages, description, coverImage,
// readingStatus, notes, rating, publisherId, seriesId, seriesOrder,
// categoryId, authorIds, genreIds, topicIds. null clears an optional
// field. A wrongly-typed field is a Validation error.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<BookInput, Error> BookInputFromJson(const nlohmann::json& j,
                                                         BookInput base = {});

} // namespace homelib
