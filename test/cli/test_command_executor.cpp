#include <catch2/catch_test_macros.hpp>

#include <homelib/cli/command_executor.hpp>

#include "../mocks/library_fixture.hpp"

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace homelib;
using homelib::testing::LibraryFixture;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));   // .../test/cli
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));    // .../test
    return test_root + "/testdata/" + filename;
}

// ---------------------------------------------------------------------------
// CliHarness — every command registered against an in-memory library, with
// captured stdout and stderr.
// ---------------------------------------------------------------------------
class CliHarness {
public:
    CliHarness() {
        ctx_.open_store = [this]() {
            ++opens_;
            if (fail_open_) {
                return Result<IEntityStore*, Error>::Err(
                    Error::Storage("Open", "Cannot open library database", "unable to open"));
            }
            return Result<IEntityStore*, Error>::Ok(&lib_.Store());
        };
        ctx_.out = &out_;
        ctx_.err = &err_;
        RegisterAllCommands(router_, ctx_);
    }

    int Run(std::vector<const char*> args) {
        out_.str("");
        err_.str("");
        args.insert(args.begin(), "homelib");
        return router_.Dispatch(static_cast<int>(args.size()), args.data(), out_, err_);
    }

    LibraryFixture& Lib() { return lib_; }
    CommandContext& Context() { return ctx_; }
    const CommandRouter& Router() const { return router_; }
    std::string Out() const { return out_.str(); }
    std::string Err() const { return err_.str(); }
    nlohmann::json OutJson() const { return nlohmann::json::parse(out_.str()); }
    nlohmann::json ErrJson() const { return nlohmann::json::parse(err_.str()); }
    int Opens() const { return opens_; }
    void FailOpen() { fail_open_ = true; }

    // Jane's only book "Only", published by Ace.
    void SeedSingleBook() {
        lib_.AddPublisher("p1", "Ace");
        lib_.AddAuthor("a1", "Jane");
        lib_.AddBook("b1", "Only", "p1", {"a1"});
    }

private:
    LibraryFixture lib_;
    CommandContext ctx_;
    CommandRouter router_;
    std::ostringstream out_;
    std::ostringstream err_;
    int opens_ = 0;
    bool fail_open_ = false;
};

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// ===========================================================================
// book delete
// ===========================================================================

TEST_CASE("book delete: blocked without cascade", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"book", "delete", "b1"}) == 3);
    CHECK(Contains(cli.Err(), "Error: DeleteBook [book:b1]"));
    CHECK(Contains(cli.Err(), "orphan-author  Author \"Jane\" would have no books"));
    CHECK(Contains(cli.Err(), "Hint: Enable cascade"));
    CHECK(cli.Out().empty());
    CHECK(cli.Lib().Exists(EntityKind::Book, "b1"));
}

TEST_CASE("book delete: cascade lists every removed record", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"book", "delete", "b1", "--cascade"}) == 0);
    CHECK(cli.Out() == "Deleted Book: Only\nDeleted Author: Jane\nDeleted Publisher: Ace\n");
    CHECK(cli.Lib().Count(EntityKind::Author) == 0);
}

TEST_CASE("book delete: JSON error document", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"--json", "book", "delete", "b1"}) == 3);
    auto j = cli.ErrJson();
    CHECK(j["error"]["category"] == "blocked_by_invariant");
    CHECK(j["error"]["exit_code"] == 3);
    CHECK(j["error"]["violations"].size() == 2);
    CHECK(j["error"]["violations"][0]["type"] == "orphan-author");
}

TEST_CASE("book delete: cascade default from the config", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();
    cli.Context().cascade_default = true;

    SECTION("applies without the flag") {
        CHECK(cli.Run({"--json", "book", "delete", "b1"}) == 0);
        CHECK(cli.OutJson()["state"] == "CommittedWithCascade");
    }
    SECTION("--cascade=false turns it off") {
        CHECK(cli.Run({"book", "delete", "b1", "--cascade=false"}) == 3);
    }
}

TEST_CASE("book delete: missing id and unknown id", "[cli][executor]") {
    CliHarness cli;
    CHECK(cli.Run({"book", "delete"}) == 4);
    CHECK(Contains(cli.Err(), "Missing book id"));
    CHECK(cli.Opens() == 0);

    CHECK(cli.Run({"book", "delete", "ghost"}) == 2);
    CHECK(Contains(cli.Err(), "book 'ghost' does not exist"));
}

// ===========================================================================
// book create / update / show / impact
// ===========================================================================

TEST_CASE("book create: flags and default category", "[cli][executor]") {
    CliHarness cli;
    cli.Lib().AddPublisher("p1", "Ace");
    cli.Lib().AddAuthor("a1", "Jane");

    CHECK(cli.Run({"--json", "book", "create", "--title=Dune", "--publisher", "p1",
                   "--authors=a1", "--rating=5", "--status=completed", "--id=b-dune"}) == 0);
    auto j = cli.OutJson();
    CHECK(j["id"] == "b-dune");
    CHECK(j["categoryId"] == kDefaultCategoryId);
    CHECK(j["rating"] == 5);
    CHECK(j["readingStatus"] == "completed");
    CHECK(j["authorIds"] == nlohmann::json::array({"a1"}));
}

TEST_CASE("book create: input errors", "[cli][executor]") {
    CliHarness cli;
    cli.Lib().AddPublisher("p1", "Ace");

    CHECK(cli.Run({"book", "create", "--publisher=p1"}) == 4);
    CHECK(Contains(cli.Err(), "Title is required"));

    CHECK(cli.Run({"book", "create", "--title=Dune", "--publisher=p1", "--rating=lots"}) == 4);
    CHECK(Contains(cli.Err(), "--rating must be an integer, got 'lots'"));

    CHECK(cli.Run({"book", "create", "--title=Dune", "--publisher=p1", "--status=shelved"}) == 4);

    CHECK(cli.Run({"book", "create", "--title=Dune", "--publisher=p9"}) == 2);
    CHECK(cli.Lib().Count(EntityKind::Book) == 0);
}

TEST_CASE("book update: unspecified fields keep their value", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"--json", "book", "update", "b1", "--status=reading", "--pages=320"}) == 0);
    auto j = cli.OutJson();
    CHECK(j["state"] == "CommittedPlain");
    CHECK(j["book"]["title"] == "Only");
    CHECK(j["book"]["readingStatus"] == "reading");
    CHECK(j["book"]["pages"] == 320);
    CHECK(j["book"]["authorIds"] == nlohmann::json::array({"a1"}));
}

TEST_CASE("book update: replacing the only author", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();
    cli.Lib().AddAuthor("a2", "John");

    CHECK(cli.Run({"book", "update", "b1", "--authors=a2"}) == 3);
    CHECK(Contains(cli.Err(), "Cannot update book"));

    CHECK(cli.Run({"book", "update", "b1", "--authors=a2", "--cascade"}) == 0);
    CHECK(Contains(cli.Out(), "Updated book \"Only\""));
    CHECK(Contains(cli.Out(), "Removed orphaned Author: Jane"));
}

TEST_CASE("book show: record card", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"book", "show", "b1"}) == 0);
    const auto out = cli.Out();
    CHECK(out.find("Only\n") == 0);
    CHECK(Contains(out, "  Id:        b1\n"));
    CHECK(Contains(out, "  Publisher: Ace\n"));
    CHECK(Contains(out, "  Category:  General\n"));
    CHECK(Contains(out, "\n  Links\n"));
    CHECK(Contains(out, "    Authors: Jane\n"));
}

TEST_CASE("book impact: delete and update previews", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();
    cli.Lib().AddPublisher("p2", "Tor");
    cli.Lib().AddBook("b2", "Tor book", "p2", {"a1"});

    SECTION("delete preview") {
        CHECK(cli.Run({"--json", "book", "impact", "b1"}) == 0);
        auto j = cli.OutJson();
        CHECK(j["hasImpact"] == true);
        CHECK(j["orphanedPublisher"]["id"] == "p1");
        CHECK(j["orphanedAuthors"].empty());
    }
    SECTION("update preview") {
        CHECK(cli.Run({"book", "impact", "b2", "--publisher=p1"}) == 0);
        CHECK(Contains(cli.Err(), "Warning: Publisher \"Tor\" would have no books"));
        CHECK(Contains(cli.Out(), "[orphan-publisher]"));
    }
    SECTION("nothing at risk") {
        cli.Lib().AddBook("b3", "Ace again", "p1", {"a1"});
        CHECK(cli.Run({"book", "impact", "b1"}) == 0);
        CHECK(Contains(cli.Out(), "No impact"));
    }
    // Previews never write.
    CHECK(cli.Lib().Count(EntityKind::Publisher) == 2);
}

// ===========================================================================
// Other record kinds
// ===========================================================================

TEST_CASE("author create and delete", "[cli][executor]") {
    CliHarness cli;

    CHECK(cli.Run({"author", "create", "--name", "Jane", "--id", "a1"}) == 0);
    CHECK(cli.Out() == "Created author \"Jane\" (a1)\n");
    CHECK(Contains(cli.Err(), "Author has no books yet"));

    CHECK(cli.Run({"author", "create"}) == 4);
    CHECK(Contains(cli.Err(), "Missing --name"));

    cli.Lib().AddPublisher("p1", "Ace");
    cli.Lib().AddBook("b1", "One", "p1", {"a1"});
    CHECK(cli.Run({"author", "delete", "a1"}) == 3);
    CHECK(Contains(cli.Err(), "Linked books: 1"));
}

TEST_CASE("author impact", "[cli][executor]") {
    CliHarness cli;
    cli.Lib().AddAuthor("a1", "Jane");
    cli.Lib().AddSeries("s1", "Saga", {"a1"});

    CHECK(cli.Run({"author", "impact", "a1"}) == 0);
    CHECK(Contains(cli.Err(), "would leave series without authors: Saga"));
    CHECK(Contains(cli.Out(), "[sole-series-author]"));
}

TEST_CASE("series, category, genre and topic commands", "[cli][executor]") {
    CliHarness cli;
    cli.Lib().AddAuthor("a1", "Jane");

    CHECK(cli.Run({"series", "create", "--name=Saga"}) == 4);
    CHECK(Contains(cli.Err(), "A series requires at least one author"));
    CHECK(cli.Run({"--json", "series", "create", "--name=Saga", "--authors=a1"}) == 0);
    CHECK(cli.OutJson()["authorIds"] == nlohmann::json::array({"a1"}));

    CHECK(cli.Run({"category", "delete", kDefaultCategoryId}) == 4);
    CHECK(cli.Run({"category", "create", "--name=Comics", "--color=#ff8800", "--id=c2"}) == 0);
    CHECK(cli.Run({"category", "delete", "c2"}) == 0);
    CHECK(cli.Out() == "Deleted Category: Comics\n");

    CHECK(cli.Run({"genre", "create", "--name=Solarpunk", "--id=g1"}) == 0);
    CHECK(cli.Run({"genre", "delete", "g1"}) == 0);
    CHECK(cli.Run({"topic", "create", "--name=Tides"}) == 0);
    CHECK(cli.Lib().Count(EntityKind::Topic) == 1);
}

TEST_CASE("author update keeps unspecified fields", "[cli][executor]") {
    CliHarness cli;
    cli.Lib().AddAuthor("a1", "Jane");

    CHECK(cli.Run({"author", "update", "a1", "--bio=Writes things"}) == 0);
    CHECK(cli.Out() == "Updated author \"Jane\"\n");

    CHECK(cli.Run({"--json", "author", "update", "a1", "--name=Janet"}) == 0);
    auto j = cli.OutJson();
    CHECK(j["name"] == "Janet");
    CHECK(j["bio"] == "Writes things");

    CHECK(cli.Run({"author", "update"}) == 4);
    CHECK(Contains(cli.Err(), "Missing author id"));
    CHECK(cli.Run({"author", "update", "nope", "--name=X"}) == 2);
}

TEST_CASE("series update replaces the author set", "[cli][executor]") {
    CliHarness cli;
    cli.Lib().AddAuthor("a1", "Jane");
    cli.Lib().AddAuthor("a2", "Omar");
    cli.Lib().AddSeries("s1", "Saga", {"a1"});

    CHECK(cli.Run({"--json", "series", "update", "s1", "--authors=a2,a1"}) == 0);
    CHECK(cli.OutJson()["authorIds"].size() == 2);

    CHECK(cli.Run({"--json", "series", "update", "s1", "--name=Epic"}) == 0);
    auto j = cli.OutJson();
    CHECK(j["name"] == "Epic");
    CHECK(j["authorIds"].size() == 2);

    CHECK(cli.Run({"series", "update", "s1", "--authors="}) == 4);
    CHECK(Contains(cli.Err(), "A series requires at least one author"));
    CHECK(cli.Lib().Exists(EntityKind::Series, "s1"));
}

TEST_CASE("genre, topic, publisher and category update", "[cli][executor]") {
    CliHarness cli;
    cli.Lib().AddPublisher("p1", "Ace");
    cli.Lib().AddTopic("t1", "Tides");
    cli.Lib().AddCategory("c2", "Comics");

    CHECK(cli.Run({"publisher", "update", "p1", "--location=Leeds"}) == 0);
    CHECK(cli.Out() == "Updated publisher \"Ace\"\n");
    CHECK(cli.Run({"--json", "topic", "update", "t1", "--name=Currents"}) == 0);
    CHECK(cli.OutJson()["name"] == "Currents");
    CHECK(cli.Run({"--json", "category", "update", "c2", "--color=#00ff00"}) == 0);
    CHECK(cli.OutJson()["color"] == "#00ff00");
    CHECK(cli.Run({"genre", "update", "missing", "--name=X"}) == 2);
}

TEST_CASE("book progress", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"book", "progress", "b1", "--status", "reading"}) == 0);
    CHECK(cli.Out() == "Marked \"Only\" as reading\n");

    CHECK(cli.Run({"--json", "book", "progress", "b1", "--status=completed", "--notes=Loved it"}) == 0);
    auto j = cli.OutJson();
    CHECK(j["readingStatus"] == "completed");
    CHECK(j["notes"] == "Loved it");
    CHECK(j["authorIds"] == nlohmann::json::array({"a1"}));

    CHECK(cli.Run({"book", "progress", "b1"}) == 4);
    CHECK(cli.Run({"book", "progress", "b1", "--status=skimmed"}) == 4);
    CHECK(cli.Run({"book", "progress", "b9", "--status=reading"}) == 2);
}

TEST_CASE("list commands report book counts", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();
    cli.Lib().AddSeries("s1", "Saga", {"a1"});

    CHECK(cli.Run({"--json", "author", "list"}) == 0);
    auto authors = cli.OutJson();
    REQUIRE(authors.size() == 1);
    CHECK(authors[0]["id"] == "a1");
    CHECK(authors[0]["bookCount"] == 1);

    CHECK(cli.Run({"--json", "series", "list"}) == 0);
    auto series = cli.OutJson();
    REQUIRE(series.size() == 1);
    CHECK(series[0]["bookCount"] == 0);
    CHECK(series[0]["authors"][0]["name"] == "Jane");

    CHECK(cli.Run({"series", "list"}) == 0);
    CHECK(Contains(cli.Out(), "Authors"));
    CHECK(Contains(cli.Out(), "Saga"));

    CHECK(cli.Run({"topic", "list"}) == 0);
    CHECK(Contains(cli.Out(), "No topic records"));
}

// ===========================================================================
// library / maintenance
// ===========================================================================

TEST_CASE("library stats", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"--json", "library", "stats"}) == 0);
    auto j = cli.OutJson();
    CHECK(j["totals"]["books"] == 1);
    CHECK(j["totals"]["genres"] == 10);
    CHECK(j["readingStatus"]["unread"] == 1);

    CHECK(cli.Run({"library", "stats"}) == 0);
    CHECK(Contains(cli.Out(), "Kind        Count"));
    CHECK(Contains(cli.Out(), "Books       1"));
}

TEST_CASE("library export to stdout", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"library", "export"}) == 0);
    auto doc = cli.OutJson();
    CHECK(doc["version"] == "1.0.0");
    CHECK(doc["books"][0]["title"] == "Only");
}

TEST_CASE("library import", "[cli][executor]") {
    CliHarness cli;
    const auto path = TestDataPath("library_export.json");

    SECTION("human output") {
        // The sample holds one malformed book, so the import is not clean.
        CHECK(cli.Run({"library", "import", path.c_str()}) == 1);
        CHECK(Contains(cli.Out(), "Kind        Imported  Skipped"));
        CHECK(Contains(cli.Err(), "Warning: Failed to import book \"Broken Record\""));
        CHECK(cli.Lib().Exists(EntityKind::Book, "b-dune"));
    }
    SECTION("JSON output") {
        CHECK(cli.Run({"--json", "library", "import", path.c_str()}) == 1);
        auto j = cli.OutJson();
        CHECK(j["success"] == false);
        CHECK(j["imported"]["books"] == 1);
    }
    SECTION("missing version") {
        auto bad = TestDataPath("export_missing_version.json");
        CHECK(cli.Run({"library", "import", bad.c_str()}) == 6);
        CHECK(cli.Opens() == 0);
    }
    SECTION("missing path") {
        CHECK(cli.Run({"library", "import"}) == 4);
    }
}

TEST_CASE("maintenance check and cleanup", "[cli][executor]") {
    CliHarness cli;
    cli.SeedSingleBook();

    CHECK(cli.Run({"maintenance", "check"}) == 0);
    CHECK(cli.Out() == "Library is consistent\n");

    cli.Lib().AddAuthor("a9", "Lonely");
    CHECK(cli.Run({"maintenance", "check"}) == 1);
    CHECK(Contains(cli.Out(), "orphan-author  1"));
    CHECK(Contains(cli.Out(), "[orphan-author] Author \"Lonely\" has no books"));

    CHECK(cli.Run({"--json", "maintenance", "check"}) == 1);
    CHECK(cli.OutJson()["isValid"] == false);

    CHECK(cli.Run({"maintenance", "cleanup"}) == 0);
    CHECK(Contains(cli.Out(), "Removed 1 orphaned record(s) in 1 pass(es)"));
    CHECK(cli.Run({"maintenance", "cleanup"}) == 0);
    CHECK(cli.Out() == "No orphaned records\n");
}

// ===========================================================================
// Store and help
// ===========================================================================

TEST_CASE("store open failure is a Storage error", "[cli][executor]") {
    CliHarness cli;
    cli.FailOpen();
    CHECK(cli.Run({"library", "stats"}) == 5);
    CHECK(Contains(cli.Err(), "Cannot open library database"));
    CHECK(Contains(cli.Err(), "Store: unable to open"));
}

TEST_CASE("help never opens the store", "[cli][executor]") {
    CliHarness cli;
    CHECK(cli.Run({"book", "delete", "--help"}) == 0);
    CHECK(Contains(cli.Out(), "--cascade"));
    CHECK(cli.Run({"maintenance"}) == 0);
    CHECK(Contains(cli.Out(), "Integrity check and orphan cleanup"));
    CHECK(cli.Opens() == 0);
}

TEST_CASE("every registered command carries a description", "[cli][executor]") {
    CliHarness cli;
    const auto groups = cli.Router().Groups();
    CHECK(groups.size() == 9);
    for (const auto& group : groups) {
        CHECK_FALSE(cli.Router().GroupDescription(group).empty());
        for (const auto& cmd : cli.Router().CommandsForGroup(group)) {
            INFO(group << " " << cmd.action);
            CHECK_FALSE(cmd.description.empty());
        }
    }
}

TEST_CASE("PrintTopLevelHelp", "[cli][executor]") {
    CliHarness cli;
    std::ostringstream plain;
    PrintTopLevelHelp(cli.Router(), plain, false);
    const auto text = plain.str();
    CHECK(text.find("homelib - home library catalogue") == 0);
    CHECK(Contains(text, "BOOK - Show, create, update and delete books"));
    CHECK(Contains(text, "  maintenance cleanup"));
    CHECK(Contains(text, "mcp serve"));
    CHECK(Contains(text, "3  Blocked by invariant"));
    CHECK_FALSE(Contains(text, "\033["));

    std::ostringstream color;
    PrintTopLevelHelp(cli.Router(), color, true);
    CHECK(Contains(color.str(), "\033["));
}
