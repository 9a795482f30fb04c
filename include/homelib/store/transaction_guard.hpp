#pragma once

#include <homelib/core/result.hpp>
#include <homelib/store/i_entity_store.hpp>

namespace homelib {

// ---------------------------------------------------------------------------
// TransactionGuard — RAII wrapper for a store transaction.
//
// Begin() opens a transaction, or joins the one already open on the store.
// A joining guard never commits or rolls back: the owner of the outer
// transaction decides. An owning guard that is destroyed without Commit()
// rolls back, so every early return leaves the store untouched.
// ---------------------------------------------------------------------------
class TransactionGuard {
public:
    [[nodiscard]] static Result<TransactionGuard, Error> Begin(IEntityStore& store);

    ~TransactionGuard();

    // Non-copyable, movable.
    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;
    TransactionGuard(TransactionGuard&& other) noexcept;
    TransactionGuard& operator=(TransactionGuard&& other) noexcept;

    // Commits when owning; a no-op success when joined.
    [[nodiscard]] Result<void, Error> Commit();

    // Explicit rollback when owning; a no-op success when joined.
    [[nodiscard]] Result<void, Error> Rollback();

    [[nodiscard]] bool Owns() const noexcept { return owns_; }

private:
    TransactionGuard(IEntityStore& store, bool owns);

    void RollbackQuietly() noexcept;

    IEntityStore* store_;
    bool owns_;
    bool finished_ = false;
};

} // namespace homelib
