#include <homelib/io/json_mapping.hpp>

#include <homelib/core/violation.hpp>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace homelib {

namespace {

using nlohmann::json;

json OptJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

json OptJson(const std::optional<int>& value) {
    return value ? json(*value) : json(nullptr);
}

json RefArray(const std::vector<EntityRef>& refs) {
    auto arr = json::array();
    for (const auto& r : refs) arr.push_back(EntityRefToJson(r));
    return arr;
}

json OptRef(const std::optional<EntityRef>& ref) {
    return ref ? EntityRefToJson(*ref) : json(nullptr);
}

json CountsToJson(const ImportCounts& counts) {
    return json{{"categories", counts.categories}, {"authors", counts.authors},
                {"publishers", counts.publishers}, {"genres", counts.genres},
                {"topics", counts.topics},         {"series", counts.series},
                {"books", counts.books}};
}

Error FieldError(const std::string& key, const char* expected) {
    return Error::Validation("BookInputFromJson",
                             "Field '" + key + "' must be " + expected);
}

Result<void, Error> ReadString(const json& j, const std::string& key, std::string& out) {
    if (!j.contains(key)) return Result<void, Error>::Ok();
    if (!j[key].is_string()) return Result<void, Error>::Err(FieldError(key, "a string"));
    out = j[key].get<std::string>();
    return Result<void, Error>::Ok();
}

Result<void, Error> ReadOptString(const json& j, const std::string& key,
                                  std::optional<std::string>& out) {
    if (!j.contains(key)) return Result<void, Error>::Ok();
    if (j[key].is_null()) {
        out.reset();
        return Result<void, Error>::Ok();
    }
    if (!j[key].is_string()) {
        return Result<void, Error>::Err(FieldError(key, "a string or null"));
    }
    auto value = j[key].get<std::string>();
    if (value.empty()) {
        out.reset();
    } else {
        out = std::move(value);
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ReadOptInt(const json& j, const std::string& key, std::optional<int>& out) {
    if (!j.contains(key)) return Result<void, Error>::Ok();
    if (j[key].is_null()) {
        out.reset();
        return Result<void, Error>::Ok();
    }
    if (!j[key].is_number_integer()) {
        return Result<void, Error>::Err(FieldError(key, "an integer or null"));
    }
    auto value = JsonIntValue(j[key]);
    if (!value) {
        return Result<void, Error>::Err(FieldError(key, "an integer within 32-bit range"));
    }
    out = *value;
    return Result<void, Error>::Ok();
}

Result<void, Error> ReadIds(const json& j, const std::string& key,
                            std::vector<std::string>& out) {
    if (!j.contains(key)) return Result<void, Error>::Ok();
    if (!j[key].is_array()) {
        return Result<void, Error>::Err(FieldError(key, "an array of ids"));
    }
    std::vector<std::string> ids;
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            return Result<void, Error>::Err(FieldError(key, "an array of ids"));
        }
        ids.push_back(item.get<std::string>());
    }
    out = std::move(ids);
    return Result<void, Error>::Ok();
}

} // anonymous namespace

std::optional<int> JsonIntValue(const json& value) {
    constexpr auto kMax = std::numeric_limits<int>::max();
    constexpr auto kMin = std::numeric_limits<int>::min();
    if (value.is_number_unsigned()) {
        const auto v = value.get<uint64_t>();
        if (v > static_cast<uint64_t>(kMax)) return std::nullopt;
        return static_cast<int>(v);
    }
    const auto v = value.get<int64_t>();
    if (v < kMin || v > kMax) return std::nullopt;
    return static_cast<int>(v);
}

// ---------------------------------------------------------------------------
// Records
// ---------------------------------------------------------------------------
json EntityRefToJson(const EntityRef& ref) {
    return json{{"kind", EntityKindName(ref.kind)}, {"id", ref.id}, {"name", ref.name}};
}

json BookToJson(const Book& book) {
    return json{{"id", book.id},
                {"title", book.title},
                {"isbn", OptJson(book.isbn)},
                {"publicationYear", OptJson(book.publication_year)},
                {"pages", OptJson(book.pages)},
                {"description", OptJson(book.description)},
                {"coverImage", OptJson(book.cover_image)},
                {"readingStatus", ReadingStatusName(book.reading_status)},
                {"notes", OptJson(book.notes)},
                {"rating", OptJson(book.rating)},
                {"publisherId", book.publisher_id},
                {"seriesId", OptJson(book.series_id)},
                {"seriesOrder", OptJson(book.series_order)},
                {"categoryId", book.category_id},
                {"createdAt", book.created_at},
                {"updatedAt", book.updated_at}};
}

json BookRecordToJson(const BookRecord& record) {
    auto j = BookToJson(record.book);
    j["authorIds"] = record.author_ids;
    j["genreIds"] = record.genre_ids;
    j["topicIds"] = record.topic_ids;
    return j;
}

json AuthorToJson(const Author& author) {
    return json{{"id", author.id},
                {"name", author.name},
                {"bio", OptJson(author.bio)},
                {"createdAt", author.created_at},
                {"updatedAt", author.updated_at}};
}

json PublisherToJson(const Publisher& publisher) {
    return json{{"id", publisher.id},
                {"name", publisher.name},
                {"location", OptJson(publisher.location)},
                {"website", OptJson(publisher.website)},
                {"createdAt", publisher.created_at},
                {"updatedAt", publisher.updated_at}};
}

json SeriesToJson(const Series& series) {
    return json{{"id", series.id},
                {"name", series.name},
                {"description", OptJson(series.description)},
                {"createdAt", series.created_at},
                {"updatedAt", series.updated_at}};
}

json SeriesRecordToJson(const SeriesRecord& record) {
    auto j = SeriesToJson(record.series);
    j["authorIds"] = record.author_ids;
    return j;
}

json GenreToJson(const Genre& genre) {
    return json{{"id", genre.id},
                {"name", genre.name},
                {"description", OptJson(genre.description)},
                {"createdAt", genre.created_at},
                {"updatedAt", genre.updated_at}};
}

json TopicToJson(const Topic& topic) {
    return json{{"id", topic.id},
                {"name", topic.name},
                {"description", OptJson(topic.description)},
                {"createdAt", topic.created_at},
                {"updatedAt", topic.updated_at}};
}

json CategoryToJson(const Category& category) {
    return json{{"id", category.id},
                {"name", category.name},
                {"description", OptJson(category.description)},
                {"color", OptJson(category.color)},
                {"createdAt", category.created_at},
                {"updatedAt", category.updated_at}};
}

// ---------------------------------------------------------------------------
// Engine results
// ---------------------------------------------------------------------------
json ImpactReportToJson(const ImpactReport& report) {
    return json{{"bookId", report.book_id},
                {"orphanedAuthors", RefArray(report.orphaned_authors)},
                {"orphanedPublisher", OptRef(report.orphaned_publisher)},
                {"orphanedSeries", OptRef(report.orphaned_series)},
                {"strandedSeries", RefArray(report.stranded_series)},
                {"hasImpact", report.HasImpact()}};
}

json AuthorDeleteImpactToJson(const AuthorDeleteImpact& impact) {
    return json{{"authorId", impact.author.id},
                {"seriesWithNoAuthors", RefArray(impact.series_with_no_authors)},
                {"hasImpact", impact.HasImpact()}};
}

json IntegrityReportToJson(const IntegrityReport& report) {
    auto violations = json::array();
    for (const auto& v : report.violations) violations.push_back(ViolationToJson(v));
    return json{{"isValid", report.is_valid},
                {"violations", std::move(violations)},
                {"summaryCounts", report.summary}};
}

json DeletionResultToJson(const DeletionResult& result) {
    return json{{"state", OperationStateName(result.state)},
                {"deletedEntities", result.Labels()},
                {"deleted", RefArray(result.deleted)}};
}

json UpdateResultToJson(const UpdateResult& result) {
    return json{{"state", OperationStateName(result.state)},
                {"book", BookRecordToJson(result.record)},
                {"deleted", RefArray(result.deleted)}};
}

json CleanupResultToJson(const CleanupResult& result) {
    return json{{"deletedAuthors", RefArray(result.deleted_authors)},
                {"deletedPublishers", RefArray(result.deleted_publishers)},
                {"deletedSeries", RefArray(result.deleted_series)},
                {"passes", result.passes}};
}

json ImportResultToJson(const ImportResult& result) {
    return json{{"success", result.success},
                {"imported", CountsToJson(result.imported)},
                {"skipped", CountsToJson(result.skipped)},
                {"errors", result.errors},
                {"cleanup", CleanupResultToJson(result.cleanup)}};
}

json LibraryStatsToJson(const LibraryStats& stats) {
    return json{{"totals",
                 {{"books", stats.books},
                  {"authors", stats.authors},
                  {"publishers", stats.publishers},
                  {"series", stats.series},
                  {"genres", stats.genres},
                  {"topics", stats.topics},
                  {"categories", stats.categories}}},
                {"readingStatus",
                 {{"unread", stats.unread},
                  {"reading", stats.reading},
                  {"completed", stats.completed}}}};
}

json EntitySummaryToJson(const EntitySummary& summary) {
    auto j = EntityRefToJson(summary.ref);
    if (summary.book_count) j["bookCount"] = *summary.book_count;
    if (summary.ref.kind == EntityKind::Series) j["authors"] = RefArray(summary.authors);
    return j;
}

// ---------------------------------------------------------------------------
// BookInputFromJson
// ---------------------------------------------------------------------------
Result<BookInput, Error> BookInputFromJson(const json& j, BookInput base) {
    using R = Result<BookInput, Error>;
    if (!j.is_object()) {
        return R::Err(Error::Validation("BookInputFromJson", "Book input must be a JSON object"));
    }

    const Result<void, Error> steps[] = {
        ReadString(j, "title", base.title),
        ReadOptString(j, "isbn", base.isbn),
        ReadOptInt(j, "publicationYear", base.publication_year),
        ReadOptInt(j, "pages", base.pages),
        ReadOptString(j, "description", base.description),
        ReadOptString(j, "coverImage", base.cover_image),
        ReadOptString(j, "notes", base.notes),
        ReadOptInt(j, "rating", base.rating),
        ReadString(j, "publisherId", base.publisher_id),
        ReadOptString(j, "seriesId", base.series_id),
        ReadOptInt(j, "seriesOrder", base.series_order),
        ReadString(j, "categoryId", base.category_id),
        ReadIds(j, "authorIds", base.author_ids),
        ReadIds(j, "genreIds", base.genre_ids),
        ReadIds(j, "topicIds", base.topic_ids),
    };
    for (const auto& step : steps) {
        if (step.IsErr()) return R::Err(step.Error());
    }

    if (j.contains("readingStatus")) {
        if (!j["readingStatus"].is_string()) {
            return R::Err(FieldError("readingStatus", "a string"));
        }
        auto status = ParseReadingStatus(j["readingStatus"].get<std::string>());
        if (status.IsErr()) {
            return R::Err(Error::Validation("BookInputFromJson", status.Error()));
        }
        base.reading_status = status.Value();
    }
    return R::Ok(std::move(base));
}

} // namespace homelib
