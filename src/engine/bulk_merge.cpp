#include <homelib/engine/bulk_merge.hpp>

#include <homelib/catalog/relationship_catalog.hpp>
#include <homelib/core/log.hpp>
#include <homelib/store/transaction_guard.hpp>

namespace homelib {

namespace {

constexpr const char* kRecordSavepoint = "import_record";

std::string Describe(const Error& error) {
    std::string out = error.message;
    if (error.detail) out += " (" + *error.detail + ")";
    return out;
}

// Writes one record under a savepoint. Per-record failures are rolled back
// to the savepoint and reported in `errors`; only failures of the store
// itself (lookup, savepoint handling) are returned.
template <typename Insert>
Result<void, Error> MergeRecord(IEntityStore& store, EntityKind kind, const std::string& id,
                                const std::string& name, int& imported, int& skipped,
                                std::vector<std::string>& errors, Insert insert) {
    const std::string failure =
        "Failed to import " + std::string(EntityKindName(kind)) + " \"" + name + "\": ";
    if (id.empty()) {
        errors.push_back(failure + "missing id");
        return Result<void, Error>::Ok();
    }

    auto existing = store.FindRef(kind, id);
    if (existing.IsErr()) return Result<void, Error>::Err(std::move(existing).Error());
    if (existing.Value()) {
        ++skipped;
        return Result<void, Error>::Ok();
    }

    auto savepoint = store.Savepoint(kRecordSavepoint);
    if (savepoint.IsErr()) return savepoint;

    auto written = insert();
    if (written.IsErr()) {
        auto undone = store.RollbackToSavepoint(kRecordSavepoint);
        if (undone.IsErr()) return undone;
        errors.push_back(failure + Describe(written.Error()));
        LogWarn("import", errors.back());
    } else {
        ++imported;
    }
    return store.ReleaseSavepoint(kRecordSavepoint);
}

const std::string& RecordId(const Category& r) { return r.id; }
const std::string& RecordId(const Author& r) { return r.id; }
const std::string& RecordId(const Publisher& r) { return r.id; }
const std::string& RecordId(const Genre& r) { return r.id; }
const std::string& RecordId(const Topic& r) { return r.id; }
const std::string& RecordId(const SeriesRecord& r) { return r.series.id; }
const std::string& RecordId(const BookRecord& r) { return r.book.id; }

const std::string& RecordName(const Category& r) { return r.name; }
const std::string& RecordName(const Author& r) { return r.name; }
const std::string& RecordName(const Publisher& r) { return r.name; }
const std::string& RecordName(const Genre& r) { return r.name; }
const std::string& RecordName(const Topic& r) { return r.name; }
const std::string& RecordName(const SeriesRecord& r) { return r.series.name; }
const std::string& RecordName(const BookRecord& r) { return r.book.title; }

template <typename Record, typename Insert>
Result<void, Error> MergeGroup(IEntityStore& store, EntityKind kind,
                               const std::vector<Record>& records, int& imported, int& skipped,
                               std::vector<std::string>& errors, Insert insert) {
    for (const auto& record : records) {
        auto merged = MergeRecord(store, kind, RecordId(record), RecordName(record), imported,
                                  skipped, errors, [&] { return insert(record); });
        if (merged.IsErr()) return merged;
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> InsertSeriesRecord(IEntityStore& store, const SeriesRecord& record) {
    for (const auto& author_id : record.author_ids) {
        auto author = store.FindRef(EntityKind::Author, author_id);
        if (author.IsErr()) return Result<void, Error>::Err(std::move(author).Error());
        if (!author.Value()) {
            return Result<void, Error>::Err(Error::NotFound("ImportBatch", "author", author_id));
        }
    }
    auto inserted = store.InsertSeries(record.series);
    if (inserted.IsErr()) return inserted;
    for (const auto& author_id : record.author_ids) {
        auto linked = store.InsertLink(Relation::SeriesAuthor, record.series.id, author_id);
        if (linked.IsErr()) return linked;
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> InsertBookRecord(IEntityStore& store, const BookRecord& record) {
    auto valid = ValidateBookInput(store, ToBookInput(record), "ImportBatch");
    if (valid.IsErr()) return valid;

    auto inserted = store.InsertBook(record.book);
    if (inserted.IsErr()) return inserted;

    const std::pair<Relation, const std::vector<std::string>*> links[] = {
        {Relation::BookAuthor, &record.author_ids},
        {Relation::BookGenre, &record.genre_ids},
        {Relation::BookTopic, &record.topic_ids},
    };
    for (const auto& [relation, ids] : links) {
        for (const auto& target : *ids) {
            auto linked = store.InsertLink(relation, record.book.id, target);
            if (linked.IsErr()) return linked;
        }
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

Result<ImportResult, Error> ImportBatch(IEntityStore& store, const LibraryBatch& batch) {
    using R = Result<ImportResult, Error>;

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    ImportResult result;
    auto& in = result.imported;
    auto& skip = result.skipped;
    auto& errors = result.errors;
    errors = batch.rejected;

    const auto fail = [](Result<void, Error> merged) {
        return R::Err(std::move(merged).Error());
    };

    auto categories = MergeGroup(store, EntityKind::Category, batch.categories, in.categories,
                                 skip.categories, errors,
                                 [&](const Category& c) { return store.InsertCategory(c); });
    if (categories.IsErr()) return fail(std::move(categories));

    auto authors = MergeGroup(store, EntityKind::Author, batch.authors, in.authors,
                              skip.authors, errors,
                              [&](const Author& a) { return store.InsertAuthor(a); });
    if (authors.IsErr()) return fail(std::move(authors));

    auto publishers = MergeGroup(store, EntityKind::Publisher, batch.publishers, in.publishers,
                                 skip.publishers, errors,
                                 [&](const Publisher& p) { return store.InsertPublisher(p); });
    if (publishers.IsErr()) return fail(std::move(publishers));

    auto genres = MergeGroup(store, EntityKind::Genre, batch.genres, in.genres, skip.genres,
                             errors, [&](const Genre& g) { return store.InsertGenre(g); });
    if (genres.IsErr()) return fail(std::move(genres));

    auto topics = MergeGroup(store, EntityKind::Topic, batch.topics, in.topics, skip.topics,
                             errors, [&](const Topic& t) { return store.InsertTopic(t); });
    if (topics.IsErr()) return fail(std::move(topics));

    std::vector<SeriesRecord> authored_series;
    for (const auto& s : batch.series) {
        if (s.author_ids.empty()) {
            errors.push_back("Skipped series \"" + s.series.name +
                             "\": a series needs at least one author");
            LogWarn("import", errors.back());
            continue;
        }
        authored_series.push_back(s);
    }
    auto series = MergeGroup(store, EntityKind::Series, authored_series, in.series, skip.series,
                             errors,
                             [&](const SeriesRecord& s) { return InsertSeriesRecord(store, s); });
    if (series.IsErr()) return fail(std::move(series));

    auto books = MergeGroup(store, EntityKind::Book, batch.books, in.books, skip.books, errors,
                            [&](const BookRecord& b) { return InsertBookRecord(store, b); });
    if (books.IsErr()) return fail(std::move(books));

    auto cleanup = CleanupOrphans(store);
    if (cleanup.IsErr()) return R::Err(std::move(cleanup).Error());
    result.cleanup = std::move(cleanup).Value();

    const std::pair<const char*, const std::vector<EntityRef>*> removed[] = {
        {"author", &result.cleanup.deleted_authors},
        {"publisher", &result.cleanup.deleted_publishers},
        {"series", &result.cleanup.deleted_series},
    };
    for (const auto& [kind, refs] : removed) {
        for (const auto& ref : *refs) {
            errors.push_back(std::string("Cleaned up orphan ") + kind + " \"" + ref.name +
                             "\" left without links after import");
        }
    }

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    result.success = errors.empty();
    LogInfo("import", "Imported " + std::to_string(in.Total()) + " record(s), skipped " +
                          std::to_string(skip.Total()) + ", " + std::to_string(errors.size()) +
                          " error(s)");
    return R::Ok(std::move(result));
}

} // namespace homelib
