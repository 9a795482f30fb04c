#include <homelib/store/transaction_guard.hpp>

#include <homelib/core/log.hpp>

namespace homelib {

TransactionGuard::TransactionGuard(IEntityStore& store, bool owns)
    : store_(&store), owns_(owns) {}

Result<TransactionGuard, Error> TransactionGuard::Begin(IEntityStore& store) {
    if (store.InTransaction()) {
        return Result<TransactionGuard, Error>::Ok(TransactionGuard(store, false));
    }
    auto begun = store.Begin();
    if (begun.IsErr()) {
        return Result<TransactionGuard, Error>::Err(std::move(begun).Error());
    }
    return Result<TransactionGuard, Error>::Ok(TransactionGuard(store, true));
}

Result<void, Error> TransactionGuard::Commit() {
    if (!owns_ || finished_ || store_ == nullptr) {
        return Result<void, Error>::Ok();
    }
    auto committed = store_->Commit();
    if (committed.IsErr()) {
        // A failed COMMIT leaves the transaction open; the destructor rolls it back.
        return committed;
    }
    finished_ = true;
    return Result<void, Error>::Ok();
}

Result<void, Error> TransactionGuard::Rollback() {
    if (!owns_ || finished_ || store_ == nullptr) {
        return Result<void, Error>::Ok();
    }
    finished_ = true;
    return store_->Rollback();
}

void TransactionGuard::RollbackQuietly() noexcept {
    if (!owns_ || finished_ || store_ == nullptr) {
        return;
    }
    finished_ = true;
    if (!store_->InTransaction()) {
        return;
    }
    LogWarn("store", "Transaction not committed; rolling back");
    auto rolled_back = store_->Rollback();
    if (rolled_back.IsErr()) {
        LogError("store", "Rollback failed: " + rolled_back.Error().ToString());
    }
}

TransactionGuard::~TransactionGuard() {
    RollbackQuietly();
}

TransactionGuard::TransactionGuard(TransactionGuard&& other) noexcept
    : store_(other.store_), owns_(other.owns_), finished_(other.finished_) {
    other.store_ = nullptr;
    other.finished_ = true;
}

TransactionGuard& TransactionGuard::operator=(TransactionGuard&& other) noexcept {
    if (this != &other) {
        RollbackQuietly();
        store_ = other.store_;
        owns_ = other.owns_;
        finished_ = other.finished_;
        other.store_ = nullptr;
        other.finished_ = true;
    }
    return *this;
}

} // namespace homelib
