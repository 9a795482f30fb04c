#include <catch2/catch_test_macros.hpp>

#include <homelib/store/transaction_guard.hpp>

#include "../mocks/failing_entity_store.hpp"
#include "../mocks/library_fixture.hpp"

#include <utility>

using namespace homelib;
using homelib::testing::FailingEntityStore;
using homelib::testing::LibraryFixture;

TEST_CASE("TransactionGuard: commit keeps writes", "[store][tx]") {
    LibraryFixture lib;
    {
        auto guard = TransactionGuard::Begin(lib.Store());
        REQUIRE(guard.IsOk());
        auto tx = std::move(guard).Value();
        CHECK(tx.Owns());
        lib.AddAuthor("a1", "Jane");
        REQUIRE(tx.Commit().IsOk());
    }
    CHECK_FALSE(lib.Store().InTransaction());
    CHECK(lib.Exists(EntityKind::Author, "a1"));
}

TEST_CASE("TransactionGuard: destruction without commit rolls back", "[store][tx]") {
    LibraryFixture lib;
    {
        auto tx = TransactionGuard::Begin(lib.Store()).Value();
        lib.AddAuthor("a1", "Jane");
    }
    CHECK_FALSE(lib.Store().InTransaction());
    CHECK_FALSE(lib.Exists(EntityKind::Author, "a1"));
}

TEST_CASE("TransactionGuard: explicit rollback", "[store][tx]") {
    LibraryFixture lib;
    auto tx = TransactionGuard::Begin(lib.Store()).Value();
    lib.AddAuthor("a1", "Jane");
    REQUIRE(tx.Rollback().IsOk());
    CHECK_FALSE(lib.Exists(EntityKind::Author, "a1"));
    // A finished guard commits nothing.
    CHECK(tx.Commit().IsOk());
}

TEST_CASE("TransactionGuard: inner guard joins the outer transaction", "[store][tx]") {
    LibraryFixture lib;
    auto outer = TransactionGuard::Begin(lib.Store()).Value();
    {
        auto inner = TransactionGuard::Begin(lib.Store()).Value();
        CHECK_FALSE(inner.Owns());
        lib.AddAuthor("a1", "Jane");
        REQUIRE(inner.Commit().IsOk());
        // A joined commit does not end the transaction.
        CHECK(lib.Store().InTransaction());
    }
    CHECK(lib.Store().InTransaction());
    REQUIRE(outer.Rollback().IsOk());
    CHECK_FALSE(lib.Exists(EntityKind::Author, "a1"));
}

TEST_CASE("TransactionGuard: moved-from guard does nothing", "[store][tx]") {
    LibraryFixture lib;
    auto first = TransactionGuard::Begin(lib.Store()).Value();
    auto second = std::move(first);
    lib.AddAuthor("a1", "Jane");
    REQUIRE(first.Commit().IsOk());
    CHECK(lib.Store().InTransaction());
    REQUIRE(second.Commit().IsOk());
    CHECK(lib.Exists(EntityKind::Author, "a1"));
}

TEST_CASE("TransactionGuard: failed commit is rolled back on destruction", "[store][tx]") {
    LibraryFixture lib;
    FailingEntityStore failing(lib.Store());
    failing.FailOnCommit();
    {
        auto tx = TransactionGuard::Begin(failing).Value();
        lib.AddAuthor("a1", "Jane");
        auto committed = tx.Commit();
        REQUIRE(committed.IsErr());
        CHECK(committed.Error().category == ErrorCategory::Storage);
    }
    CHECK_FALSE(lib.Store().InTransaction());
    CHECK_FALSE(lib.Exists(EntityKind::Author, "a1"));
}
