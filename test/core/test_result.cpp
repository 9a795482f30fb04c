#include <catch2/catch_test_macros.hpp>

#include <homelib/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace homelib;

// ===========================================================================
// Basic Ok / Err
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
}

TEST_CASE("Result: move-only value can be moved out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(7));
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 7);
}

// ===========================================================================
// Same-typed sides / Result<void>
// ===========================================================================

TEST_CASE("Result: value and error of the same type stay distinct", "[result]") {
    auto ok = Result<std::string, std::string>::Ok("dune");
    auto err = Result<std::string, std::string>::Err("missing");
    CHECK(ok.IsOk());
    CHECK(ok.Value() == "dune");
    CHECK(err.IsErr());
    CHECK(err.Error() == "missing");
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(Error::Validation("Op", "bad"));
    REQUIRE(err.IsErr());
    CHECK(err.Error().category == ErrorCategory::Validation);
}

// ===========================================================================
// Error factories
// ===========================================================================

TEST_CASE("Error::NotFound names kind and id", "[result][error]") {
    auto e = Error::NotFound("DeleteAuthor", "author", "a1");
    CHECK(e.category == ErrorCategory::NotFound);
    CHECK(e.entity == "author:a1");
    CHECK(e.message == "author 'a1' does not exist");
    CHECK(e.ExitCode() == 2);
}

TEST_CASE("Error::Blocked carries violations and linked count", "[result][error]") {
    Violation v{ViolationRule::HasLinkedBooks, "author", "a1", "Jane", "linked"};
    auto e = Error::Blocked("DeleteAuthor", "author:a1", "Cannot delete author", {v}, 3);
    CHECK(e.IsBlocked());
    CHECK(e.ExitCode() == 3);
    REQUIRE(e.violations.size() == 1);
    CHECK(e.violations[0] == v);
    REQUIRE(e.linked_count.has_value());
    CHECK(*e.linked_count == 3);
}

TEST_CASE("Error: exit codes per category", "[result][error]") {
    CHECK(Error::Validation("Op", "m").ExitCode() == 4);
    CHECK(Error::Storage("Op", "m").ExitCode() == 5);
    CHECK(Error::Parse("Op", "m").ExitCode() == 6);
    CHECK(Error::Config("m").ExitCode() == 7);

    Error internal;
    CHECK(internal.ExitCode() == 99);
    CHECK(internal.CategoryName() == "internal");
}

TEST_CASE("Error::Config uses the config loader as operation", "[result][error]") {
    auto e = Error::Config("Missing required field: database");
    CHECK(e.operation == "ConfigLoader");
    CHECK(e.CategoryName() == "config");
}

// ===========================================================================
// ToString / ToJson
// ===========================================================================

TEST_CASE("Error::ToString: operation, entity, message and store detail", "[result][error]") {
    auto e = Error::Storage("InsertBook", "Failed to insert book", "UNIQUE constraint failed");
    e.entity = "book:b1";
    CHECK(e.ToString() ==
          "InsertBook [book:b1]: Failed to insert book (store: UNIQUE constraint failed)");
}

TEST_CASE("Error::ToString: without entity or detail", "[result][error]") {
    auto e = Error::Validation("CreateBook", "Title is required");
    CHECK(e.ToString() == "CreateBook: Title is required");
}

TEST_CASE("Error::ToJson: full error object", "[result][error]") {
    Violation v{ViolationRule::OrphanAuthor, "author", "a1", "Jane", "Author \"Jane\" would have no books"};
    auto e = Error::Blocked("DeleteBook", "book:b1", "Cannot delete book", {v});
    e.hint = "Enable cascade";

    auto j = nlohmann::json::parse(e.ToJson());
    REQUIRE(j.contains("error"));
    const auto& body = j["error"];
    CHECK(body["category"] == "blocked_by_invariant");
    CHECK(body["operation"] == "DeleteBook");
    CHECK(body["entity"] == "book:b1");
    CHECK(body["message"] == "Cannot delete book");
    CHECK(body["hint"] == "Enable cascade");
    CHECK(body["exit_code"] == 3);
    REQUIRE(body["violations"].size() == 1);
    CHECK(body["violations"][0]["type"] == "orphan-author");
    CHECK(body["violations"][0]["entityId"] == "a1");
    CHECK_FALSE(body.contains("detail"));
}

TEST_CASE("Error::ToJson: linked count and detail", "[result][error]") {
    auto e = Error::Storage("Commit", "Failed to commit", "database is locked");
    e.linked_count = 0;
    auto body = e.ToJsonValue()["error"];
    CHECK(body["detail"] == "database is locked");
    CHECK(body["linkedCount"] == 0);
    CHECK_FALSE(body.contains("entity"));
}

// ===========================================================================
// Violation tags
// ===========================================================================

TEST_CASE("RuleTag and ParseRuleTag are inverse", "[result][violation]") {
    for (auto rule : {ViolationRule::OrphanAuthor, ViolationRule::OrphanPublisher,
                      ViolationRule::OrphanSeries, ViolationRule::SeriesWithoutAuthors,
                      ViolationRule::BookWithoutPublisher, ViolationRule::BookWithoutCategory,
                      ViolationRule::SoleSeriesAuthor, ViolationRule::HasLinkedBooks}) {
        auto parsed = ParseRuleTag(RuleTag(rule));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == rule);
    }
    CHECK_FALSE(ParseRuleTag("no-such-rule").has_value());
}

TEST_CASE("ViolationToJson uses camelCase keys", "[result][violation]") {
    Violation v{ViolationRule::SeriesWithoutAuthors, "series", "s1", "Dune", "no authors"};
    auto j = ViolationToJson(v);
    CHECK(j["type"] == "series-without-authors");
    CHECK(j["entityKind"] == "series");
    CHECK(j["entityId"] == "s1");
    CHECK(j["entityName"] == "Dune");
    CHECK(j["message"] == "no authors");
}
