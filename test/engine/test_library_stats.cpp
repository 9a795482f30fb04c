#include <catch2/catch_test_macros.hpp>

#include <homelib/engine/library_stats.hpp>

#include "../mocks/library_fixture.hpp"

using namespace homelib;
using homelib::testing::LibraryFixture;

TEST_CASE("ComputeLibraryStats: fresh library holds only seeds", "[engine][stats]") {
    LibraryFixture lib;
    auto r = ComputeLibraryStats(lib.Store());
    REQUIRE(r.IsOk());
    CHECK(r.Value().books == 0);
    CHECK(r.Value().genres == 10);
    CHECK(r.Value().categories == 1);
    CHECK(r.Value().unread == 0);
}

TEST_CASE("ComputeLibraryStats: totals and reading status", "[engine][stats]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddAuthor("a1", "Jane");
    lib.AddSeries("s1", "Saga", {"a1"});
    lib.AddBook("b1", "One", "p1", {"a1"}, std::string("s1"), ReadingStatus::Completed);
    lib.AddBook("b2", "Two", "p1", {"a1"}, std::string("s1"), ReadingStatus::Reading);
    lib.AddBook("b3", "Three", "p1", {"a1"});

    auto r = ComputeLibraryStats(lib.Store());
    REQUIRE(r.IsOk());
    const auto& stats = r.Value();
    CHECK(stats.books == 3);
    CHECK(stats.authors == 1);
    CHECK(stats.publishers == 1);
    CHECK(stats.series == 1);
    CHECK(stats.topics == 0);
    CHECK(stats.unread == 1);
    CHECK(stats.reading == 1);
    CHECK(stats.completed == 1);
    CHECK(stats.unread + stats.reading + stats.completed == stats.books);
}

TEST_CASE("ListEntities: names, book counts and series authors", "[engine][stats]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddAuthor("a1", "Zoe");
    lib.AddAuthor("a2", "Adam");
    lib.AddSeries("s1", "Saga", {"a1", "a2"});
    lib.AddBook("b1", "One", "p1", {"a1"}, std::string("s1"));
    lib.AddBook("b2", "Two", "p1", {"a1", "a2"});

    auto authors = ListEntities(lib.Store(), EntityKind::Author);
    REQUIRE(authors.IsOk());
    REQUIRE(authors.Value().size() == 2);
    CHECK(authors.Value()[0].ref.name == "Adam");
    CHECK(authors.Value()[0].book_count == std::optional<int64_t>(1));
    CHECK(authors.Value()[1].ref.name == "Zoe");
    CHECK(authors.Value()[1].book_count == std::optional<int64_t>(2));
    CHECK(authors.Value()[1].authors.empty());

    auto series = ListEntities(lib.Store(), EntityKind::Series);
    REQUIRE(series.IsOk());
    REQUIRE(series.Value().size() == 1);
    CHECK(series.Value()[0].book_count == std::optional<int64_t>(1));
    CHECK(series.Value()[0].authors.size() == 2);

    auto publishers = ListEntities(lib.Store(), EntityKind::Publisher);
    REQUIRE(publishers.IsOk());
    CHECK(publishers.Value()[0].book_count == std::optional<int64_t>(2));

    auto books = ListEntities(lib.Store(), EntityKind::Book);
    REQUIRE(books.IsOk());
    REQUIRE(books.Value().size() == 2);
    CHECK(books.Value()[0].ref.name == "One");
    CHECK_FALSE(books.Value()[0].book_count.has_value());
}

TEST_CASE("ListEntities: seeded genres start without books", "[engine][stats]") {
    LibraryFixture lib;
    auto genres = ListEntities(lib.Store(), EntityKind::Genre);
    REQUIRE(genres.IsOk());
    CHECK(genres.Value().size() == 10);
    for (const auto& row : genres.Value()) {
        CHECK(row.book_count == std::optional<int64_t>(0));
    }
}
