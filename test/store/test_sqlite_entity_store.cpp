#include <catch2/catch_test_macros.hpp>

#include <homelib/store/schema.hpp>
#include <homelib/store/sqlite_entity_store.hpp>

#include "../mocks/library_fixture.hpp"

#include <cstdio>
#include <filesystem>
#include <string>

using namespace homelib;
using homelib::testing::LibraryFixture;

namespace {

std::string TempDbPath(const std::string& name) {
    auto path = (std::filesystem::temp_directory_path() / name).string();
    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
    return path;
}

} // anonymous namespace

// ===========================================================================
// Open / migrations
// ===========================================================================

TEST_CASE("SqliteEntityStore: in-memory store is migrated and seeded", "[store]") {
    LibraryFixture lib;
    CHECK(lib.Store().SchemaVersion() == LatestSchemaVersion());
    CHECK(lib.Count(EntityKind::Category) == 1);
    CHECK(lib.Count(EntityKind::Genre) == 10);
    CHECK(lib.Count(EntityKind::Book) == 0);

    auto general = lib.Store().FindCategory(kDefaultCategoryId);
    REQUIRE(general.IsOk());
    REQUIRE(general.Value().has_value());
    CHECK(general.Value()->name == kDefaultCategoryName);
}

TEST_CASE("SqliteEntityStore: reopening a file keeps data and schema", "[store][file]") {
    auto path = TempDbPath("homelib_test_reopen.db");
    {
        auto opened = SqliteEntityStore::Open(path);
        REQUIRE(opened.IsOk());
        auto store = std::move(opened).Value();
        REQUIRE(store->InsertAuthor(Author{"a1", "Jane", std::nullopt, "", ""}).IsOk());
    }
    {
        auto opened = SqliteEntityStore::Open(path);
        REQUIRE(opened.IsOk());
        auto store = std::move(opened).Value();
        CHECK(store->SchemaVersion() == LatestSchemaVersion());
        auto count = store->CountAll(EntityKind::Category);
        REQUIRE(count.IsOk());
        CHECK(count.Value() == 1);
        auto author = store->FindAuthor("a1");
        REQUIRE(author.IsOk());
        REQUIRE(author.Value().has_value());
        CHECK(author.Value()->name == "Jane");
        // Empty timestamps are filled in on insert.
        CHECK_FALSE(author.Value()->created_at.empty());
        CHECK(author.Value()->updated_at == author.Value()->created_at);
    }
    std::remove(path.c_str());
}

TEST_CASE("SqliteEntityStore: unopenable path is a storage error", "[store][file]") {
    auto opened = SqliteEntityStore::Open("/nonexistent-dir/homelib/library.db");
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Storage);
    CHECK(opened.Error().operation == "Open");
}

// ===========================================================================
// Lookups
// ===========================================================================

TEST_CASE("SqliteEntityStore: book round trip keeps every field", "[store]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");

    Book book;
    book.id = "b1";
    book.title = "Dune";
    book.isbn = "978-0441013593";
    book.publication_year = 1965;
    book.pages = 412;
    book.reading_status = ReadingStatus::Completed;
    book.rating = 5;
    book.publisher_id = "p1";
    book.category_id = kDefaultCategoryId;
    book.created_at = LibraryFixture::kTimestamp;
    book.updated_at = LibraryFixture::kTimestamp;
    REQUIRE(lib.Store().InsertBook(book).IsOk());

    auto found = lib.Store().FindBook("b1");
    REQUIRE(found.IsOk());
    REQUIRE(found.Value().has_value());
    const auto& b = *found.Value();
    CHECK(b.title == "Dune");
    CHECK(b.isbn == std::optional<std::string>("978-0441013593"));
    CHECK(b.publication_year == std::optional<int>(1965));
    CHECK(b.reading_status == ReadingStatus::Completed);
    CHECK(b.rating == std::optional<int>(5));
    CHECK_FALSE(b.series_id.has_value());
    CHECK(b.created_at == LibraryFixture::kTimestamp);
}

TEST_CASE("SqliteEntityStore: missing ids are empty, not errors", "[store]") {
    LibraryFixture lib;
    auto book = lib.Store().FindBook("nope");
    REQUIRE(book.IsOk());
    CHECK_FALSE(book.Value().has_value());

    auto ref = lib.Store().FindRef(EntityKind::Series, "nope");
    REQUIRE(ref.IsOk());
    CHECK_FALSE(ref.Value().has_value());
}

TEST_CASE("SqliteEntityStore: ListIds orders by display name", "[store]") {
    LibraryFixture lib;
    lib.AddAuthor("a2", "Zelazny");
    lib.AddAuthor("a1", "Asimov");
    lib.AddAuthor("a3", "Herbert");

    auto ids = lib.Store().ListIds(EntityKind::Author);
    REQUIRE(ids.IsOk());
    CHECK(ids.Value() == std::vector<std::string>{"a1", "a3", "a2"});
}

TEST_CASE("SqliteEntityStore: CountBooksWithStatus", "[store]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddBook("b1", "One", "p1", {}, std::nullopt, ReadingStatus::Reading);
    lib.AddBook("b2", "Two", "p1", {}, std::nullopt, ReadingStatus::Reading);
    lib.AddBook("b3", "Three", "p1", {});

    CHECK(lib.Store().CountBooksWithStatus(ReadingStatus::Reading).Value() == 2);
    CHECK(lib.Store().CountBooksWithStatus(ReadingStatus::Unread).Value() == 1);
    CHECK(lib.Store().CountBooksWithStatus(ReadingStatus::Completed).Value() == 0);
}

// ===========================================================================
// Links
// ===========================================================================

TEST_CASE("SqliteEntityStore: link counts from both sides", "[store][links]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddAuthor("a1", "Jane");
    lib.AddAuthor("a2", "John");
    lib.AddBook("b1", "One", "p1", {"a1", "a2"});
    lib.AddBook("b2", "Two", "p1", {"a1"});

    auto& s = lib.Store();
    CHECK(s.CountLinks(Relation::BookAuthor, LinkSide::Target, "a1").Value() == 2);
    CHECK(s.CountLinks(Relation::BookAuthor, LinkSide::Source, "b1").Value() == 2);
    CHECK(s.CountLinks(Relation::BookPublisher, LinkSide::Target, "p1").Value() == 2);
    CHECK(s.CountLinks(Relation::BookPublisher, LinkSide::Source, "b1").Value() == 1);

    auto authors = s.ListLinkedIds(Relation::BookAuthor, LinkSide::Source, "b1");
    REQUIRE(authors.IsOk());
    CHECK(authors.Value() == std::vector<std::string>{"a1", "a2"});

    auto publisher = s.ListLinkedIds(Relation::BookPublisher, LinkSide::Source, "b2");
    REQUIRE(publisher.IsOk());
    CHECK(publisher.Value() == std::vector<std::string>{"p1"});
}

TEST_CASE("SqliteEntityStore: nullable series reference", "[store][links]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddAuthor("a1", "Jane");
    lib.AddSeries("s1", "Saga", {"a1"});
    lib.AddBook("b1", "One", "p1", {"a1"});

    auto& s = lib.Store();
    CHECK(s.CountLinks(Relation::BookSeries, LinkSide::Source, "b1").Value() == 0);
    REQUIRE(s.InsertLink(Relation::BookSeries, "b1", "s1").IsOk());
    CHECK(s.CountLinks(Relation::BookSeries, LinkSide::Target, "s1").Value() == 1);

    auto cleared = s.DeleteLinks(Relation::BookSeries, LinkSide::Target, "s1");
    REQUIRE(cleared.IsOk());
    CHECK(cleared.Value() == 1);
    CHECK_FALSE(s.FindBook("b1").Value()->series_id.has_value());
}

TEST_CASE("SqliteEntityStore: required references cannot be cleared", "[store][links]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddBook("b1", "One", "p1", {});

    auto r = lib.Store().DeleteLinks(Relation::BookPublisher, LinkSide::Target, "p1");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Validation);
}

TEST_CASE("SqliteEntityStore: ListUnlinked finds orphans", "[store][links]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddPublisher("p2", "Unused Press");
    lib.AddAuthor("a1", "Jane");
    lib.AddAuthor("a2", "Lonely");
    lib.AddSeries("s1", "Authorless", {});
    lib.AddBook("b1", "One", "p1", {"a1"}, std::string("s1"));

    auto& s = lib.Store();
    auto authors = s.ListUnlinked(Relation::BookAuthor, LinkSide::Target);
    REQUIRE(authors.IsOk());
    REQUIRE(authors.Value().size() == 1);
    CHECK(authors.Value()[0] == EntityRef{EntityKind::Author, "a2", "Lonely"});

    auto publishers = s.ListUnlinked(Relation::BookPublisher, LinkSide::Target);
    REQUIRE(publishers.Value().size() == 1);
    CHECK(publishers.Value()[0].id == "p2");

    auto without_authors = s.ListUnlinked(Relation::SeriesAuthor, LinkSide::Source);
    REQUIRE(without_authors.Value().size() == 1);
    CHECK(without_authors.Value()[0].id == "s1");

    CHECK(s.ListUnlinked(Relation::BookSeries, LinkSide::Target).Value().empty());
}

TEST_CASE("SqliteEntityStore: dangling references are empty under foreign keys", "[store][links]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddBook("b1", "One", "p1", {});

    auto dangling = lib.Store().ListDanglingReferences(Relation::BookPublisher);
    REQUIRE(dangling.IsOk());
    CHECK(dangling.Value().empty());

    auto junction = lib.Store().ListDanglingReferences(Relation::BookAuthor);
    REQUIRE(junction.IsErr());
    CHECK(junction.Error().category == ErrorCategory::Validation);
}

// ===========================================================================
// Writes
// ===========================================================================

TEST_CASE("SqliteEntityStore: duplicate id is a storage error", "[store][writes]") {
    LibraryFixture lib;
    lib.AddAuthor("a1", "Jane");
    auto r = lib.Store().InsertAuthor(Author{"a1", "Other", std::nullopt, "", ""});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Storage);
    REQUIRE(r.Error().detail.has_value());
    CHECK(r.Error().detail->find("UNIQUE") != std::string::npos);
}

TEST_CASE("SqliteEntityStore: foreign keys are enforced", "[store][writes]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddBook("b1", "One", "p1", {});

    SECTION("unknown publisher") {
        Book book;
        book.id = "b2";
        book.title = "Two";
        book.publisher_id = "missing";
        book.category_id = kDefaultCategoryId;
        CHECK(lib.Store().InsertBook(book).IsErr());
    }
    SECTION("publisher in use") {
        auto r = lib.Store().DeleteEntity(EntityKind::Publisher, "p1");
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Storage);
        CHECK(lib.Exists(EntityKind::Publisher, "p1"));
    }
}

TEST_CASE("SqliteEntityStore: delete cascades junction rows", "[store][writes]") {
    LibraryFixture lib;
    lib.AddPublisher("p1", "Ace");
    lib.AddAuthor("a1", "Jane");
    lib.AddBook("b1", "One", "p1", {"a1"});

    REQUIRE(lib.Store().DeleteEntity(EntityKind::Book, "b1").IsOk());
    CHECK(lib.Store().CountLinks(Relation::BookAuthor, LinkSide::Target, "a1").Value() == 0);

    auto again = lib.Store().DeleteEntity(EntityKind::Book, "b1");
    REQUIRE(again.IsErr());
    CHECK(again.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("SqliteEntityStore: UpdateBookRow of a missing book is NotFound", "[store][writes]") {
    LibraryFixture lib;
    Book book;
    book.id = "ghost";
    book.title = "Ghost";
    book.publisher_id = "p1";
    book.category_id = kDefaultCategoryId;
    auto r = lib.Store().UpdateBookRow(book);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::NotFound);
}

TEST_CASE("SqliteEntityStore: record updates keep created_at", "[store][writes]") {
    LibraryFixture lib;
    lib.AddAuthor("a1", "Jane");
    lib.AddSeries("s1", "Saga", {"a1"});
    lib.AddCategory("c2", "Reference");

    Author author{"a1", "Jane Doe", std::string("Bio"), "", "2025-02-02T00:00:00.000Z"};
    REQUIRE(lib.Store().UpdateAuthorRow(author).IsOk());
    auto stored = lib.Store().FindAuthor("a1").Value();
    REQUIRE(stored.has_value());
    CHECK(stored->name == "Jane Doe");
    CHECK(stored->bio == std::optional<std::string>("Bio"));
    CHECK(stored->created_at == LibraryFixture::kTimestamp);
    CHECK(stored->updated_at == "2025-02-02T00:00:00.000Z");

    REQUIRE(lib.Store().UpdateSeriesRow(Series{"s1", "Epic", std::nullopt, "", ""}).IsOk());
    CHECK(lib.Store().FindSeries("s1").Value()->name == "Epic");
    CHECK(lib.Store().CountLinks(Relation::SeriesAuthor, LinkSide::Source, "s1").Value() == 1);

    REQUIRE(lib.Store()
                .UpdateCategoryRow(Category{"c2", "Ref", std::nullopt, std::string("#fff"), "", ""})
                .IsOk());
    CHECK(lib.Store().FindCategory("c2").Value()->color == std::optional<std::string>("#fff"));
}

TEST_CASE("SqliteEntityStore: record updates of missing ids are NotFound", "[store][writes]") {
    LibraryFixture lib;
    auto publisher = lib.Store().UpdatePublisherRow(
        Publisher{"ghost", "Ghost", std::nullopt, std::nullopt, "", ""});
    REQUIRE(publisher.IsErr());
    CHECK(publisher.Error().category == ErrorCategory::NotFound);
    CHECK(publisher.Error().operation == "UpdatePublisherRow");

    CHECK(lib.Store().UpdateGenreRow(Genre{"ghost", "G", std::nullopt, "", ""}).IsErr());
    CHECK(lib.Store().UpdateTopicRow(Topic{"ghost", "T", std::nullopt, "", ""}).IsErr());
}

// ===========================================================================
// Transactions
// ===========================================================================

TEST_CASE("SqliteEntityStore: rollback discards writes", "[store][tx]") {
    LibraryFixture lib;
    auto& s = lib.Store();
    REQUIRE(s.Begin().IsOk());
    CHECK(s.InTransaction());
    lib.AddAuthor("a1", "Jane");
    REQUIRE(s.Rollback().IsOk());
    CHECK_FALSE(s.InTransaction());
    CHECK_FALSE(lib.Exists(EntityKind::Author, "a1"));
}

TEST_CASE("SqliteEntityStore: nested Begin is refused", "[store][tx]") {
    LibraryFixture lib;
    auto& s = lib.Store();
    REQUIRE(s.Begin().IsOk());
    auto nested = s.Begin();
    REQUIRE(nested.IsErr());
    CHECK(nested.Error().category == ErrorCategory::Internal);
    REQUIRE(s.Rollback().IsOk());
}

TEST_CASE("SqliteEntityStore: savepoints undo part of a transaction", "[store][tx]") {
    LibraryFixture lib;
    auto& s = lib.Store();
    REQUIRE(s.Begin().IsOk());
    lib.AddAuthor("a1", "Kept");
    REQUIRE(s.Savepoint("record_1").IsOk());
    lib.AddAuthor("a2", "Undone");
    REQUIRE(s.RollbackToSavepoint("record_1").IsOk());
    REQUIRE(s.ReleaseSavepoint("record_1").IsOk());
    REQUIRE(s.Commit().IsOk());

    CHECK(lib.Exists(EntityKind::Author, "a1"));
    CHECK_FALSE(lib.Exists(EntityKind::Author, "a2"));

    auto bad = s.Savepoint("x; DROP TABLE books");
    REQUIRE(bad.IsErr());
    CHECK(bad.Error().category == ErrorCategory::Validation);
}
