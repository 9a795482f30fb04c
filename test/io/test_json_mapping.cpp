#include <catch2/catch_test_macros.hpp>

#include <homelib/io/json_mapping.hpp>

#include "../mocks/library_fixture.hpp"

using namespace homelib;
using homelib::testing::LibraryFixture;
using nlohmann::json;

// ===========================================================================
// Records
// ===========================================================================

TEST_CASE("BookToJson: camelCase keys and null optionals", "[io][json]") {
    Book book;
    book.id = "b1";
    book.title = "Dune";
    book.pages = 412;
    book.reading_status = ReadingStatus::Reading;
    book.publisher_id = "p1";
    book.category_id = "c1";

    auto j = BookToJson(book);
    CHECK(j["title"] == "Dune");
    CHECK(j["pages"] == 412);
    CHECK(j["readingStatus"] == "reading");
    CHECK(j["publisherId"] == "p1");
    CHECK(j["isbn"].is_null());
    CHECK(j["seriesId"].is_null());
    CHECK(j.contains("createdAt"));
}

TEST_CASE("BookRecordToJson: link id lists", "[io][json]") {
    BookRecord record;
    record.book.id = "b1";
    record.author_ids = {"a1", "a2"};

    auto j = BookRecordToJson(record);
    CHECK(j["authorIds"] == json::array({"a1", "a2"}));
    CHECK(j["genreIds"].empty());
}

TEST_CASE("CategoryToJson / SeriesRecordToJson", "[io][json]") {
    auto category = CategoryToJson(
        Category{"c1", "Reference", std::nullopt, std::string("#112233"), "t0", "t1"});
    CHECK(category["color"] == "#112233");
    CHECK(category["description"].is_null());

    auto series = SeriesRecordToJson(
        SeriesRecord{Series{"s1", "Saga", std::nullopt, "t0", "t0"}, {"a1"}});
    CHECK(series["name"] == "Saga");
    CHECK(series["authorIds"] == json::array({"a1"}));
}

// ===========================================================================
// Engine results
// ===========================================================================

TEST_CASE("DeletionResultToJson: labels and refs", "[io][json]") {
    DeletionResult result;
    result.state = OperationState::CommittedWithCascade;
    result.deleted = {EntityRef{EntityKind::Book, "b1", "Dune"},
                      EntityRef{EntityKind::Author, "a1", "Frank Herbert"}};

    auto j = DeletionResultToJson(result);
    CHECK(j["state"] == "CommittedWithCascade");
    CHECK(j["deletedEntities"] == json::array({"Book: Dune", "Author: Frank Herbert"}));
    CHECK(j["deleted"][1]["kind"] == "author");
}

TEST_CASE("IntegrityReportToJson: violations and summary", "[io][json]") {
    LibraryFixture lib;
    lib.AddAuthor("a1", "Lonely");

    auto report = IntegrityCheck(lib.Store());
    REQUIRE(report.IsOk());
    auto j = IntegrityReportToJson(report.Value());
    CHECK(j["isValid"] == false);
    REQUIRE(j["violations"].size() == 1);
    CHECK(j["violations"][0]["type"] == "orphan-author");
    CHECK(j["violations"][0]["entityName"] == "Lonely");
    CHECK(j["summaryCounts"]["orphan-author"] == 1);
}

TEST_CASE("ImportResultToJson / LibraryStatsToJson", "[io][json]") {
    ImportResult result;
    result.success = true;
    result.imported.books = 3;
    result.skipped.genres = 10;

    auto j = ImportResultToJson(result);
    CHECK(j["success"] == true);
    CHECK(j["imported"]["books"] == 3);
    CHECK(j["skipped"]["genres"] == 10);
    CHECK(j["cleanup"]["passes"] == 0);

    LibraryStats stats;
    stats.books = 2;
    stats.completed = 2;
    auto s = LibraryStatsToJson(stats);
    CHECK(s["totals"]["books"] == 2);
    CHECK(s["readingStatus"]["completed"] == 2);
}

TEST_CASE("ImpactReportToJson", "[io][json]") {
    ImpactReport report;
    report.book_id = "b1";
    report.orphaned_publisher = EntityRef{EntityKind::Publisher, "p1", "Ace"};

    auto j = ImpactReportToJson(report);
    CHECK(j["hasImpact"] == true);
    CHECK(j["orphanedPublisher"]["name"] == "Ace");
    CHECK(j["orphanedSeries"].is_null());
    CHECK(j["orphanedAuthors"].empty());
}

// ===========================================================================
// BookInputFromJson
// ===========================================================================

TEST_CASE("BookInputFromJson: full input", "[io][json]") {
    auto j = json::parse(R"({
        "title": "Dune", "isbn": "978-0441013593", "publicationYear": 1965,
        "pages": 412, "readingStatus": "completed", "rating": 5,
        "publisherId": "p1", "seriesId": "s1", "seriesOrder": 1, "categoryId": "c1",
        "authorIds": ["a1"], "genreIds": ["g1", "g2"], "topicIds": []
    })");

    auto r = BookInputFromJson(j);
    REQUIRE(r.IsOk());
    const auto& input = r.Value();
    CHECK(input.title == "Dune");
    CHECK(input.publication_year == std::optional<int>(1965));
    CHECK(input.reading_status == ReadingStatus::Completed);
    CHECK(input.series_id == std::optional<std::string>("s1"));
    CHECK(input.genre_ids.size() == 2);
    CHECK(input.topic_ids.empty());
}

TEST_CASE("BookInputFromJson: overlays onto a base", "[io][json]") {
    BookInput base = LibraryFixture::Input("Dune", "p1", {"a1"});
    base.rating = 4;
    base.notes = "Reread in winter";
    base.series_id = "s1";

    auto r = BookInputFromJson(json{{"pages", 300}, {"rating", nullptr}, {"notes", ""}}, base);
    REQUIRE(r.IsOk());
    const auto& input = r.Value();
    CHECK(input.title == "Dune");
    CHECK(input.author_ids == std::vector<std::string>{"a1"});
    CHECK(input.pages == std::optional<int>(300));
    CHECK_FALSE(input.rating.has_value());
    CHECK_FALSE(input.notes.has_value());
    CHECK(input.series_id == std::optional<std::string>("s1"));
}

TEST_CASE("BookInputFromJson: wrong types are Validation errors", "[io][json]") {
    SECTION("not an object") {
        auto r = BookInputFromJson(json::array());
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Book input must be a JSON object");
    }
    SECTION("string pages") {
        auto r = BookInputFromJson(json{{"pages", "412"}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Validation);
        CHECK(r.Error().message == "Field 'pages' must be an integer or null");
    }
    SECTION("numeric title") {
        auto r = BookInputFromJson(json{{"title", 7}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Field 'title' must be a string");
    }
    SECTION("author ids not strings") {
        auto r = BookInputFromJson(json{{"authorIds", json::array({1, 2})}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Field 'authorIds' must be an array of ids");
    }
    SECTION("integer beyond 32 bits") {
        auto r = BookInputFromJson(json{{"pages", 4294967299LL}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Validation);
        CHECK(r.Error().message == "Field 'pages' must be an integer within 32-bit range");
    }
    SECTION("negative integer beyond 32 bits") {
        auto r = BookInputFromJson(json{{"publicationYear", -4294967299LL}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().message ==
              "Field 'publicationYear' must be an integer within 32-bit range");
    }
    SECTION("unknown reading status") {
        auto r = BookInputFromJson(json{{"readingStatus", "abandoned"}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Validation);
        CHECK(r.Error().message.find("abandoned") != std::string::npos);
    }
}

TEST_CASE("JsonIntValue: range of int", "[io][json]") {
    CHECK(JsonIntValue(json(2147483647)) == std::optional<int>(2147483647));
    CHECK(JsonIntValue(json(-2147483647LL - 1)) == std::optional<int>(-2147483647 - 1));
    CHECK_FALSE(JsonIntValue(json(2147483648LL)).has_value());
    CHECK_FALSE(JsonIntValue(json(4294967299ULL)).has_value());
    CHECK_FALSE(JsonIntValue(json(18446744073709551615ULL)).has_value());
}

TEST_CASE("EntitySummaryToJson: counts and series authors", "[io][json]") {
    EntitySummary series{EntityRef{EntityKind::Series, "s1", "Saga"}, 3,
                         {EntityRef{EntityKind::Author, "a1", "Jane"}}};
    auto j = EntitySummaryToJson(series);
    CHECK(j["kind"] == "series");
    CHECK(j["bookCount"] == 3);
    REQUIRE(j["authors"].size() == 1);
    CHECK(j["authors"][0]["name"] == "Jane");

    EntitySummary book{EntityRef{EntityKind::Book, "b1", "Dune"}, std::nullopt, {}};
    auto b = EntitySummaryToJson(book);
    CHECK_FALSE(b.contains("bookCount"));
    CHECK_FALSE(b.contains("authors"));
}
