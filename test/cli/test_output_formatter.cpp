#include <catch2/catch_test_macros.hpp>

#include <homelib/cli/output_formatter.hpp>

#include <sstream>
#include <string>

using namespace homelib;

namespace {

Error BlockedAuthorDelete() {
    Violation v{ViolationRule::HasLinkedBooks, "author", "a1", "Jane",
                "Author \"Jane\" is linked to 2 book(s)"};
    auto err = Error::Blocked("DeleteAuthor", "author:a1",
                              "Cannot delete author: they have 2 book(s).", {v}, 2);
    err.hint = "Remove the author from all books first";
    return err;
}

} // anonymous namespace

// ===========================================================================
// PrintTable
// ===========================================================================

TEST_CASE("OutputFormatter: plain table pads columns", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintTable({"Kind", "Count"}, {{"Publishers", "3"}, {"Books", "12"}});
    CHECK(out.str() ==
          "Kind        Count\n"
          "----------  -----\n"
          "Publishers  3    \n"
          "Books       12   \n");
}

TEST_CASE("OutputFormatter: table with no rows", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, false, out, err);
    fmt.PrintTable({"Rule", "Violations"}, {});
    CHECK(out.str() == "Rule  Violations\n----  ----------\n");
}

TEST_CASE("OutputFormatter: table in JSON mode", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintTable({"Kind", "Count"}, {{"Books", "12"}});
    CHECK(out.str() == "[{\"Count\":\"12\",\"Kind\":\"Books\"}]\n");

    out.str("");
    fmt.PrintTable({"Kind"}, {});
    CHECK(out.str() == "[]\n");
}

TEST_CASE("OutputFormatter: color table is drawn", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, true, out, err);
    fmt.PrintTable({"Kind", "Count"}, {{"Books", "12"}});
    CHECK(out.str().find("Books") != std::string::npos);
    CHECK(out.str().find("12") != std::string::npos);
}

// ===========================================================================
// PrintDetail
// ===========================================================================

TEST_CASE("OutputFormatter: detail card", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintDetail("Dune", {{"", {{"Id", "b1"}, {"Status", "reading"}}},
                             {"Links", {{"Authors", "Frank Herbert"}, {"Genres", "SF"}}},
                             {"Empty", {}}});
    CHECK(out.str() ==
          "Dune\n"
          "  Id:     b1\n"
          "  Status: reading\n"
          "\n"
          "  Links\n"
          "    Authors: Frank Herbert\n"
          "    Genres:  SF\n");
}

TEST_CASE("OutputFormatter: detail card in color", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, true, out, err);
    fmt.PrintDetail("Dune", {{"", {{"Id", "b1"}}}});
    CHECK(out.str().find("\033[1mDune\033[0m") == 0);
    CHECK(out.str().find("\033[90mId:\033[0m b1") != std::string::npos);
}

// ===========================================================================
// Violations, success, warning
// ===========================================================================

TEST_CASE("OutputFormatter: violations", "[cli][formatter]") {
    Violation v{ViolationRule::OrphanAuthor, "author", "a1", "Jane",
                "Author \"Jane\" has no books"};

    std::ostringstream out, err;
    OutputFormatter plain(false, false, out, err);
    plain.PrintViolations({v});
    CHECK(out.str() == "  - [orphan-author] Author \"Jane\" has no books\n");

    std::ostringstream json_out;
    OutputFormatter json(true, false, json_out, err);
    json.PrintViolations({v});
    auto arr = nlohmann::json::parse(json_out.str());
    REQUIRE(arr.size() == 1);
    CHECK(arr[0]["type"] == "orphan-author");
    CHECK(arr[0]["entityId"] == "a1");
}

TEST_CASE("OutputFormatter: success and warning", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter plain(false, false, out, err);
    plain.PrintSuccess("Deleted Book: Dune");
    plain.PrintWarning("Author has no books yet");
    CHECK(out.str() == "Deleted Book: Dune\n");
    CHECK(err.str() == "Warning: Author has no books yet\n");

    std::ostringstream json_out, json_err;
    OutputFormatter json(true, false, json_out, json_err);
    json.PrintSuccess("Exported");
    json.PrintWarning("ignored in JSON mode");
    CHECK(json_out.str() == "{\"message\":\"Exported\",\"success\":true}\n");
    CHECK(json_err.str().empty());

    std::ostringstream color_out, color_err;
    OutputFormatter color(false, true, color_out, color_err);
    color.PrintSuccess("Done");
    CHECK(color_out.str() == "\033[1;32mOK\033[0m Done\n");
}

TEST_CASE("OutputFormatter: JSON mode disables color", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(true, true, out, err);
    CHECK(fmt.IsJsonMode());
    CHECK_FALSE(fmt.IsColorMode());
}

// ===========================================================================
// PrintError
// ===========================================================================

TEST_CASE("OutputFormatter: blocked error in plain text", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, false, out, err);
    fmt.PrintError(BlockedAuthorDelete());
    CHECK(err.str() ==
          "Error: DeleteAuthor [author:a1]\n"
          "  Cannot delete author: they have 2 book(s).\n"
          "  Linked books: 2\n"
          "  has-linked-books  Author \"Jane\" is linked to 2 book(s)\n"
          "  Hint: Remove the author from all books first\n");
    CHECK(out.str().empty());
}

TEST_CASE("OutputFormatter: storage error shows the store detail", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, false, out, err);
    fmt.PrintError(Error::Storage("InsertBook", "Failed to insert book", "UNIQUE constraint failed"));
    CHECK(err.str() ==
          "Error: InsertBook\n"
          "  Failed to insert book\n"
          "  Store: UNIQUE constraint failed\n");
}

TEST_CASE("OutputFormatter: JSON error", "[cli][formatter]") {
    std::ostringstream out, err;
    OutputFormatter fmt(true, false, out, err);
    fmt.PrintError(BlockedAuthorDelete());

    auto j = nlohmann::json::parse(err.str());
    CHECK(j["error"]["category"] == "blocked_by_invariant");
    CHECK(j["error"]["linkedCount"] == 2);
    CHECK(j["error"]["hint"] == "Remove the author from all books first");
    CHECK(j["error"]["violations"][0]["type"] == "has-linked-books");
}
