#include <homelib/engine/lifecycle_enforcer.hpp>

#include <homelib/catalog/relationship_catalog.hpp>
#include <homelib/core/log.hpp>
#include <homelib/core/types.hpp>
#include <homelib/store/schema.hpp>
#include <homelib/store/transaction_guard.hpp>

#include <algorithm>
#include <cctype>
#include <set>

namespace homelib {

namespace {

std::string Subject(EntityKind kind, std::string_view id) {
    return std::string(EntityKindName(kind)) + ":" + std::string(id);
}

void LogTransition(const std::string& operation, const std::string& subject,
                   OperationState state) {
    LogDebug("lifecycle", operation + " " + subject + " -> " + OperationStateName(state));
}

bool IsBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

std::string JoinNames(const std::vector<EntityRef>& refs) {
    std::string out;
    for (const auto& r : refs) {
        if (!out.empty()) out += ", ";
        out += r.name;
    }
    return out;
}

Violation HasLinkedBooks(const EntityRef& ref, int64_t count) {
    return Violation{ViolationRule::HasLinkedBooks, EntityKindName(ref.kind), ref.id, ref.name,
                     std::string(EntityKindLabel(ref.kind)) + " \"" + ref.name +
                         "\" is linked to " + std::to_string(count) + " book(s)"};
}

Result<EntityRef, Error> RequireRef(IEntityStore& store, EntityKind kind, std::string_view id,
                                    const std::string& operation) {
    auto ref = store.FindRef(kind, id);
    if (ref.IsErr()) return Result<EntityRef, Error>::Err(std::move(ref).Error());
    if (!ref.Value()) {
        return Result<EntityRef, Error>::Err(
            Error::NotFound(operation, EntityKindName(kind), std::string(id)));
    }
    return Result<EntityRef, Error>::Ok(*ref.Value());
}

Result<void, Error> RequireDistinctIds(const std::vector<std::string>& ids, EntityKind kind,
                                       const std::string& operation) {
    std::set<std::string> seen;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) {
            return Result<void, Error>::Err(Error::Validation(
                operation, std::string("Duplicate ") + EntityKindName(kind) + " id '" + id + "'"));
        }
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> RequireAll(IEntityStore& store, const std::vector<std::string>& ids,
                               EntityKind kind, const std::string& operation) {
    auto distinct = RequireDistinctIds(ids, kind, operation);
    if (distinct.IsErr()) return distinct;
    for (const auto& id : ids) {
        auto ref = RequireRef(store, kind, id, operation);
        if (ref.IsErr()) return Result<void, Error>::Err(std::move(ref).Error());
    }
    return Result<void, Error>::Ok();
}

// Resolves the identity of a record about to be created: generates an id
// when none is given, otherwise checks the supplied one is well-formed
// and free.
Result<void, Error> PrepareIdentity(IEntityStore& store, EntityKind kind, std::string& id,
                                    const std::string& name, const std::string& operation) {
    if (IsBlank(name)) {
        return Result<void, Error>::Err(Error::Validation(
            operation, std::string(EntityKindLabel(kind)) +
                           (kind == EntityKind::Book ? " title is required" : " name is required")));
    }
    if (id.empty()) {
        id = EntityId::Generate().Value();
        return Result<void, Error>::Ok();
    }
    auto valid = EntityId::Create(id);
    if (valid.IsErr()) {
        return Result<void, Error>::Err(Error::Validation(operation, valid.Error()));
    }
    auto existing = store.FindRef(kind, id);
    if (existing.IsErr()) return Result<void, Error>::Err(std::move(existing).Error());
    if (existing.Value()) {
        return Result<void, Error>::Err(Error::Validation(
            operation, std::string(EntityKindLabel(kind)) + " '" + id + "' already exists"));
    }
    return Result<void, Error>::Ok();
}

void Stamp(std::string& created_at, std::string& updated_at) {
    if (created_at.empty()) created_at = CurrentTimestamp();
    if (updated_at.empty()) updated_at = created_at;
}

// Update of a standalone record: it must exist and keeps its identity and
// creation time; the name may not be blank.
template <typename T>
Result<T, Error> UpdateRecord(IEntityStore& store, EntityKind kind, std::string_view id,
                              T record,
                              Result<std::optional<T>, Error> (IEntityStore::*find)(std::string_view),
                              Result<void, Error> (IEntityStore::*write)(const T&),
                              const std::string& operation) {
    using R = Result<T, Error>;
    if (IsBlank(record.name)) {
        return R::Err(Error::Validation(
            operation, std::string(EntityKindLabel(kind)) + " name is required"));
    }
    auto found = (store.*find)(id);
    if (found.IsErr()) return R::Err(std::move(found).Error());
    if (!found.Value()) {
        return R::Err(Error::NotFound(operation, EntityKindName(kind), std::string(id)));
    }
    record.id = found.Value()->id;
    record.created_at = found.Value()->created_at;
    record.updated_at = CurrentTimestamp();

    auto written = (store.*write)(record);
    if (written.IsErr()) return R::Err(std::move(written).Error());
    LogDebug("lifecycle", std::string("Updated ") + EntityKindName(kind) + " " + record.id);
    return R::Ok(std::move(record));
}

// ---------------------------------------------------------------------------
// RemoveEntity — deletes a record and its links, walking the catalog.
//
// Junction rows go with the record; nullable references to it are cleared;
// a restricting reference that is still in use blocks the removal. A
// foreign key held by the record itself disappears with its row.
// ---------------------------------------------------------------------------
Result<void, Error> RemoveEntity(IEntityStore& store, const EntityRef& ref,
                                 const std::string& operation) {
    for (const auto& [relation, side] : RelationsTouching(ref.kind)) {
        const auto& spec = Spec(relation);
        if (spec.storage == LinkStorage::ForeignKey && side == LinkSide::Source) {
            continue;
        }
        if (spec.storage == LinkStorage::ForeignKey &&
            spec.on_target_removal == OnRemoval::Restrict) {
            auto count = store.CountLinks(relation, side, ref.id);
            if (count.IsErr()) return Result<void, Error>::Err(std::move(count).Error());
            if (count.Value() > 0) {
                return Result<void, Error>::Err(Error::Blocked(
                    operation, Subject(ref.kind, ref.id),
                    std::string("Cannot remove ") + EntityKindName(ref.kind) + " \"" + ref.name +
                        "\": it is still referenced by " + std::to_string(count.Value()) +
                        " book(s)",
                    {HasLinkedBooks(ref, count.Value())}, count.Value()));
            }
            continue;
        }
        auto removed = store.DeleteLinks(relation, side, ref.id);
        if (removed.IsErr()) return Result<void, Error>::Err(std::move(removed).Error());
    }
    return store.DeleteEntity(ref.kind, ref.id);
}

Result<void, Error> InsertBookLinks(IEntityStore& store, const std::string& book_id,
                                    const BookInput& input) {
    const std::pair<Relation, const std::vector<std::string>*> links[] = {
        {Relation::BookAuthor, &input.author_ids},
        {Relation::BookGenre, &input.genre_ids},
        {Relation::BookTopic, &input.topic_ids},
    };
    for (const auto& [relation, ids] : links) {
        for (const auto& target : *ids) {
            auto inserted = store.InsertLink(relation, book_id, target);
            if (inserted.IsErr()) return inserted;
        }
    }
    return Result<void, Error>::Ok();
}

// Full replace: every membership row of the book is deleted and the new
// set inserted.
Result<void, Error> ReplaceBookLinks(IEntityStore& store, const std::string& book_id,
                                     const BookInput& input) {
    for (auto relation : {Relation::BookAuthor, Relation::BookGenre, Relation::BookTopic}) {
        auto removed = store.DeleteLinks(relation, LinkSide::Source, book_id);
        if (removed.IsErr()) return Result<void, Error>::Err(std::move(removed).Error());
    }
    return InsertBookLinks(store, book_id, input);
}

// The error that stops a book deletion or update, if any.
std::optional<Error> BlockOnImpact(const ImpactReport& impact, bool cascade_orphans,
                                   const std::string& operation, const std::string& verb) {
    const std::string subject = Subject(EntityKind::Book, impact.book_id);
    if (impact.HasImpact() && !cascade_orphans) {
        auto err = Error::Blocked(operation, subject,
                                  "Cannot " + verb + " book: " + impact.Summary() +
                                      ". Please reassign or delete these entities first.",
                                  impact.ToViolations());
        err.hint = "Enable cascade to delete the orphaned entities together with the book";
        return err;
    }
    if (cascade_orphans && !impact.stranded_series.empty()) {
        std::vector<Violation> stranded;
        for (auto& v : impact.ToViolations()) {
            if (v.rule == ViolationRule::SeriesWithoutAuthors) stranded.push_back(std::move(v));
        }
        return Error::Blocked(operation, subject,
                              "Cannot " + verb + " book with cascade: series would be left "
                              "without authors: " + JoinNames(impact.stranded_series) +
                                  ". Add another author to these series first.",
                              std::move(stranded));
    }
    return std::nullopt;
}

Result<void, Error> RemoveImpacted(IEntityStore& store, const ImpactReport& impact,
                                   const std::string& operation,
                                   std::vector<EntityRef>& deleted) {
    std::vector<EntityRef> doomed = impact.orphaned_authors;
    if (impact.orphaned_publisher) doomed.push_back(*impact.orphaned_publisher);
    if (impact.orphaned_series) doomed.push_back(*impact.orphaned_series);

    for (const auto& ref : doomed) {
        auto removed = RemoveEntity(store, ref, operation);
        if (removed.IsErr()) return removed;
        deleted.push_back(ref);
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Single-entity deletes
// ---------------------------------------------------------------------------
struct BookLinkPolicy {
    Relation books;
    const char* has;     // "they have" / "it has"
    const char* remedy;
};

std::optional<BookLinkPolicy> PolicyFor(EntityKind kind) {
    switch (kind) {
        case EntityKind::Author:
            return BookLinkPolicy{Relation::BookAuthor, "they have",
                                  "Remove the author from all books first."};
        case EntityKind::Publisher:
            return BookLinkPolicy{Relation::BookPublisher, "they have",
                                  "Reassign books to another publisher first."};
        case EntityKind::Series:
            return BookLinkPolicy{Relation::BookSeries, "it has",
                                  "Remove books from the series first."};
        case EntityKind::Category:
            return BookLinkPolicy{Relation::BookCategory, "it has",
                                  "Reassign books to another category first."};
        default:
            return std::nullopt;
    }
}

Result<DeletionResult, Error> DeleteSingle(IEntityStore& store, EntityKind kind,
                                           std::string_view id, const std::string& operation) {
    using R = Result<DeletionResult, Error>;
    const std::string subject = Subject(kind, id);
    LogTransition(operation, subject, OperationState::Requested);

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    auto found = RequireRef(store, kind, id, operation);
    if (found.IsErr()) return R::Err(std::move(found).Error());
    const EntityRef ref = found.Value();

    if (kind == EntityKind::Category && ref.id == kDefaultCategoryId) {
        return R::Err(Error::Validation(operation, "The default category cannot be deleted"));
    }

    std::vector<Violation> violations;
    std::string message;
    std::optional<int64_t> linked_count;

    if (auto policy = PolicyFor(kind)) {
        auto count = store.CountLinks(policy->books, LinkSide::Target, ref.id);
        if (count.IsErr()) return R::Err(std::move(count).Error());
        linked_count = count.Value();
        if (count.Value() > 0) {
            violations.push_back(HasLinkedBooks(ref, count.Value()));
            message = std::string("Cannot delete ") + EntityKindName(kind) + ": " + policy->has +
                      " " + std::to_string(count.Value()) + " book(s). " + policy->remedy;
        }
    }

    if (kind == EntityKind::Author) {
        auto impact = CheckAuthorDeleteImpact(store, ref.id);
        if (impact.IsErr()) return R::Err(std::move(impact).Error());
        if (impact.Value().HasImpact()) {
            for (auto& v : impact.Value().ToViolations()) violations.push_back(std::move(v));
            const auto names = JoinNames(impact.Value().series_with_no_authors);
            if (message.empty()) {
                message = "Cannot delete author: they are the only author of series: " + names +
                          ". Add another author to these series first.";
            } else {
                message += " They are also the only author of series: " + names + ".";
            }
        }
    }
    LogTransition(operation, subject, OperationState::ImpactChecked);

    if (!violations.empty()) {
        LogTransition(operation, subject, OperationState::Blocked);
        LogInfo("lifecycle", operation + " blocked: " + message);
        return R::Err(Error::Blocked(operation, subject, message, std::move(violations),
                                     linked_count));
    }

    auto removed = RemoveEntity(store, ref, operation);
    if (removed.IsErr()) return R::Err(std::move(removed).Error());

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    DeletionResult result;
    result.state = OperationState::CommittedPlain;
    result.deleted.push_back(ref);
    LogTransition(operation, subject, result.state);
    LogInfo("lifecycle", "Deleted " + std::string(EntityKindName(kind)) + " \"" + ref.name + "\"");
    return R::Ok(std::move(result));
}

} // anonymous namespace

const char* OperationStateName(OperationState state) {
    switch (state) {
        case OperationState::Requested:            return "Requested";
        case OperationState::ImpactChecked:        return "ImpactChecked";
        case OperationState::Blocked:              return "Blocked";
        case OperationState::CommittedPlain:       return "CommittedPlain";
        case OperationState::CommittedWithCascade: return "CommittedWithCascade";
    }
    return "Unknown";
}

std::vector<std::string> DeletionResult::Labels() const {
    std::vector<std::string> out;
    out.reserve(deleted.size());
    for (const auto& ref : deleted) {
        out.push_back(std::string(EntityKindLabel(ref.kind)) + ": " + ref.name);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Validation and reads
// ---------------------------------------------------------------------------
Result<void, Error> ValidateBookInput(IEntityStore& store, const BookInput& input,
                                      const std::string& operation) {
    if (IsBlank(input.title)) {
        return Result<void, Error>::Err(Error::Validation(operation, "Title is required"));
    }
    if (input.publisher_id.empty()) {
        return Result<void, Error>::Err(Error::Validation(operation, "Publisher is required"));
    }
    if (input.category_id.empty()) {
        return Result<void, Error>::Err(Error::Validation(operation, "Category is required"));
    }
    if (input.rating && (*input.rating < kMinRating || *input.rating > kMaxRating)) {
        return Result<void, Error>::Err(Error::Validation(
            operation, "Rating must be between " + std::to_string(kMinRating) + " and " +
                           std::to_string(kMaxRating) + "; got " + std::to_string(*input.rating)));
    }
    if (input.pages && *input.pages <= 0) {
        return Result<void, Error>::Err(Error::Validation(operation, "Pages must be positive"));
    }

    auto publisher = RequireRef(store, EntityKind::Publisher, input.publisher_id, operation);
    if (publisher.IsErr()) return Result<void, Error>::Err(std::move(publisher).Error());
    auto category = RequireRef(store, EntityKind::Category, input.category_id, operation);
    if (category.IsErr()) return Result<void, Error>::Err(std::move(category).Error());
    if (input.series_id) {
        auto series = RequireRef(store, EntityKind::Series, *input.series_id, operation);
        if (series.IsErr()) return Result<void, Error>::Err(std::move(series).Error());
    }

    auto authors = RequireAll(store, input.author_ids, EntityKind::Author, operation);
    if (authors.IsErr()) return authors;
    auto genres = RequireAll(store, input.genre_ids, EntityKind::Genre, operation);
    if (genres.IsErr()) return genres;
    return RequireAll(store, input.topic_ids, EntityKind::Topic, operation);
}

Result<BookRecord, Error> GetBook(IEntityStore& store, std::string_view book_id) {
    using R = Result<BookRecord, Error>;

    auto found = store.FindBook(book_id);
    if (found.IsErr()) return R::Err(std::move(found).Error());
    if (!found.Value()) return R::Err(Error::NotFound("GetBook", "book", std::string(book_id)));

    BookRecord record;
    record.book = *found.Value();

    const std::pair<Relation, std::vector<std::string>*> links[] = {
        {Relation::BookAuthor, &record.author_ids},
        {Relation::BookGenre, &record.genre_ids},
        {Relation::BookTopic, &record.topic_ids},
    };
    for (const auto& [relation, ids] : links) {
        auto linked = store.ListLinkedIds(relation, LinkSide::Source, record.book.id);
        if (linked.IsErr()) return R::Err(std::move(linked).Error());
        *ids = std::move(linked).Value();
    }
    return R::Ok(std::move(record));
}

// ---------------------------------------------------------------------------
// Books
// ---------------------------------------------------------------------------
Result<DeletionResult, Error> DeleteBook(IEntityStore& store, std::string_view book_id,
                                         bool cascade_orphans) {
    using R = Result<DeletionResult, Error>;
    const std::string op = "DeleteBook";
    const std::string subject = Subject(EntityKind::Book, book_id);
    LogTransition(op, subject, OperationState::Requested);

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    auto impact = CheckDeleteImpact(store, book_id);
    if (impact.IsErr()) return R::Err(std::move(impact).Error());
    const auto& report = impact.Value();
    LogTransition(op, subject, OperationState::ImpactChecked);

    if (auto blocked = BlockOnImpact(report, cascade_orphans, op, "delete")) {
        LogTransition(op, subject, OperationState::Blocked);
        LogInfo("lifecycle", op + " blocked: " + blocked->message);
        return R::Err(std::move(*blocked));
    }

    auto book = RequireRef(store, EntityKind::Book, book_id, op);
    if (book.IsErr()) return R::Err(std::move(book).Error());

    DeletionResult result;
    auto removed = RemoveEntity(store, book.Value(), op);
    if (removed.IsErr()) return R::Err(std::move(removed).Error());
    result.deleted.push_back(book.Value());

    if (cascade_orphans) {
        auto cascaded = RemoveImpacted(store, report, op, result.deleted);
        if (cascaded.IsErr()) return R::Err(std::move(cascaded).Error());
    }

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    result.state = result.deleted.size() > 1 ? OperationState::CommittedWithCascade
                                             : OperationState::CommittedPlain;
    LogTransition(op, subject, result.state);
    if (result.state == OperationState::CommittedWithCascade) {
        LogInfo("lifecycle", "Deleted book \"" + book.Value().name + "\" and " +
                                 std::to_string(result.deleted.size() - 1) + " orphaned record(s)");
    }
    return R::Ok(std::move(result));
}

Result<UpdateResult, Error> UpdateBook(IEntityStore& store, std::string_view book_id,
                                       const BookInput& input, bool cascade_orphans) {
    using R = Result<UpdateResult, Error>;
    const std::string op = "UpdateBook";
    const std::string subject = Subject(EntityKind::Book, book_id);
    LogTransition(op, subject, OperationState::Requested);

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    auto found = store.FindBook(book_id);
    if (found.IsErr()) return R::Err(std::move(found).Error());
    if (!found.Value()) return R::Err(Error::NotFound(op, "book", std::string(book_id)));
    Book book = *found.Value();

    auto valid = ValidateBookInput(store, input, op);
    if (valid.IsErr()) return R::Err(std::move(valid).Error());

    auto impact = CheckUpdateImpact(store, book_id, input);
    if (impact.IsErr()) return R::Err(std::move(impact).Error());
    const auto& report = impact.Value();
    LogTransition(op, subject, OperationState::ImpactChecked);

    if (auto blocked = BlockOnImpact(report, cascade_orphans, op, "update")) {
        LogTransition(op, subject, OperationState::Blocked);
        LogInfo("lifecycle", op + " blocked: " + blocked->message);
        return R::Err(std::move(*blocked));
    }

    ApplyBookInput(input, book);
    book.updated_at = CurrentTimestamp();
    auto updated = store.UpdateBookRow(book);
    if (updated.IsErr()) return R::Err(std::move(updated).Error());

    auto links = ReplaceBookLinks(store, book.id, input);
    if (links.IsErr()) return R::Err(std::move(links).Error());

    UpdateResult result;
    if (cascade_orphans) {
        auto cascaded = RemoveImpacted(store, report, op, result.deleted);
        if (cascaded.IsErr()) return R::Err(std::move(cascaded).Error());
    }

    auto record = GetBook(store, book.id);
    if (record.IsErr()) return R::Err(std::move(record).Error());
    result.record = std::move(record).Value();

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    result.state = result.deleted.empty() ? OperationState::CommittedPlain
                                          : OperationState::CommittedWithCascade;
    LogTransition(op, subject, result.state);
    if (result.state == OperationState::CommittedWithCascade) {
        LogInfo("lifecycle", "Updated book \"" + book.title + "\" and removed " +
                                 std::to_string(result.deleted.size()) + " orphaned record(s)");
    }
    return R::Ok(std::move(result));
}

Result<BookRecord, Error> CreateBook(IEntityStore& store, const BookInput& input,
                                     const std::optional<std::string>& id) {
    using R = Result<BookRecord, Error>;
    const std::string op = "CreateBook";

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    auto valid = ValidateBookInput(store, input, op);
    if (valid.IsErr()) return R::Err(std::move(valid).Error());

    Book book;
    book.id = id.value_or("");
    auto identity = PrepareIdentity(store, EntityKind::Book, book.id, input.title, op);
    if (identity.IsErr()) return R::Err(std::move(identity).Error());
    ApplyBookInput(input, book);
    Stamp(book.created_at, book.updated_at);

    auto inserted = store.InsertBook(book);
    if (inserted.IsErr()) return R::Err(std::move(inserted).Error());
    auto links = InsertBookLinks(store, book.id, input);
    if (links.IsErr()) return R::Err(std::move(links).Error());

    auto record = GetBook(store, book.id);
    if (record.IsErr()) return R::Err(std::move(record).Error());

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    LogInfo("lifecycle", "Created book \"" + book.title + "\" (" + book.id + ")");
    return record;
}

// ---------------------------------------------------------------------------
// Standalone records
// ---------------------------------------------------------------------------
Result<Author, Error> CreateAuthor(IEntityStore& store, Author author) {
    auto identity = PrepareIdentity(store, EntityKind::Author, author.id, author.name,
                                    "CreateAuthor");
    if (identity.IsErr()) return Result<Author, Error>::Err(std::move(identity).Error());
    Stamp(author.created_at, author.updated_at);

    auto inserted = store.InsertAuthor(author);
    if (inserted.IsErr()) return Result<Author, Error>::Err(std::move(inserted).Error());
    LogDebug("lifecycle", "Created author " + author.id + " without books");
    return Result<Author, Error>::Ok(std::move(author));
}

Result<Publisher, Error> CreatePublisher(IEntityStore& store, Publisher publisher) {
    auto identity = PrepareIdentity(store, EntityKind::Publisher, publisher.id, publisher.name,
                                    "CreatePublisher");
    if (identity.IsErr()) return Result<Publisher, Error>::Err(std::move(identity).Error());
    Stamp(publisher.created_at, publisher.updated_at);

    auto inserted = store.InsertPublisher(publisher);
    if (inserted.IsErr()) return Result<Publisher, Error>::Err(std::move(inserted).Error());
    LogDebug("lifecycle", "Created publisher " + publisher.id + " without books");
    return Result<Publisher, Error>::Ok(std::move(publisher));
}

Result<SeriesRecord, Error> CreateSeries(IEntityStore& store, Series series,
                                         const std::vector<std::string>& author_ids) {
    using R = Result<SeriesRecord, Error>;
    const std::string op = "CreateSeries";

    if (author_ids.empty()) {
        return R::Err(Error::Validation(op, "A series requires at least one author"));
    }

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    auto authors = RequireAll(store, author_ids, EntityKind::Author, op);
    if (authors.IsErr()) return R::Err(std::move(authors).Error());

    auto identity = PrepareIdentity(store, EntityKind::Series, series.id, series.name, op);
    if (identity.IsErr()) return R::Err(std::move(identity).Error());
    Stamp(series.created_at, series.updated_at);

    auto inserted = store.InsertSeries(series);
    if (inserted.IsErr()) return R::Err(std::move(inserted).Error());
    for (const auto& author_id : author_ids) {
        auto linked = store.InsertLink(Relation::SeriesAuthor, series.id, author_id);
        if (linked.IsErr()) return R::Err(std::move(linked).Error());
    }

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    LogDebug("lifecycle", "Created series " + series.id + " with " +
                              std::to_string(author_ids.size()) + " author(s)");
    return R::Ok(SeriesRecord{std::move(series), author_ids});
}

Result<Genre, Error> CreateGenre(IEntityStore& store, Genre genre) {
    auto identity = PrepareIdentity(store, EntityKind::Genre, genre.id, genre.name, "CreateGenre");
    if (identity.IsErr()) return Result<Genre, Error>::Err(std::move(identity).Error());
    Stamp(genre.created_at, genre.updated_at);

    auto inserted = store.InsertGenre(genre);
    if (inserted.IsErr()) return Result<Genre, Error>::Err(std::move(inserted).Error());
    return Result<Genre, Error>::Ok(std::move(genre));
}

Result<Topic, Error> CreateTopic(IEntityStore& store, Topic topic) {
    auto identity = PrepareIdentity(store, EntityKind::Topic, topic.id, topic.name, "CreateTopic");
    if (identity.IsErr()) return Result<Topic, Error>::Err(std::move(identity).Error());
    Stamp(topic.created_at, topic.updated_at);

    auto inserted = store.InsertTopic(topic);
    if (inserted.IsErr()) return Result<Topic, Error>::Err(std::move(inserted).Error());
    return Result<Topic, Error>::Ok(std::move(topic));
}

Result<Category, Error> CreateCategory(IEntityStore& store, Category category) {
    auto identity = PrepareIdentity(store, EntityKind::Category, category.id, category.name,
                                    "CreateCategory");
    if (identity.IsErr()) return Result<Category, Error>::Err(std::move(identity).Error());
    Stamp(category.created_at, category.updated_at);

    auto inserted = store.InsertCategory(category);
    if (inserted.IsErr()) return Result<Category, Error>::Err(std::move(inserted).Error());
    return Result<Category, Error>::Ok(std::move(category));
}

// ---------------------------------------------------------------------------
// Standalone record updates
// ---------------------------------------------------------------------------
Result<Author, Error> UpdateAuthor(IEntityStore& store, std::string_view id, Author author) {
    return UpdateRecord(store, EntityKind::Author, id, std::move(author),
                        &IEntityStore::FindAuthor, &IEntityStore::UpdateAuthorRow,
                        "UpdateAuthor");
}

Result<Publisher, Error> UpdatePublisher(IEntityStore& store, std::string_view id,
                                         Publisher publisher) {
    return UpdateRecord(store, EntityKind::Publisher, id, std::move(publisher),
                        &IEntityStore::FindPublisher, &IEntityStore::UpdatePublisherRow,
                        "UpdatePublisher");
}

Result<Genre, Error> UpdateGenre(IEntityStore& store, std::string_view id, Genre genre) {
    return UpdateRecord(store, EntityKind::Genre, id, std::move(genre),
                        &IEntityStore::FindGenre, &IEntityStore::UpdateGenreRow, "UpdateGenre");
}

Result<Topic, Error> UpdateTopic(IEntityStore& store, std::string_view id, Topic topic) {
    return UpdateRecord(store, EntityKind::Topic, id, std::move(topic),
                        &IEntityStore::FindTopic, &IEntityStore::UpdateTopicRow, "UpdateTopic");
}

Result<Category, Error> UpdateCategory(IEntityStore& store, std::string_view id,
                                       Category category) {
    return UpdateRecord(store, EntityKind::Category, id, std::move(category),
                        &IEntityStore::FindCategory, &IEntityStore::UpdateCategoryRow,
                        "UpdateCategory");
}

Result<SeriesRecord, Error> UpdateSeries(IEntityStore& store, std::string_view id,
                                         Series series,
                                         const std::vector<std::string>& author_ids) {
    using R = Result<SeriesRecord, Error>;
    const std::string op = "UpdateSeries";

    if (author_ids.empty()) {
        return R::Err(Error::Validation(op, "A series requires at least one author"));
    }

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    auto authors = RequireAll(store, author_ids, EntityKind::Author, op);
    if (authors.IsErr()) return R::Err(std::move(authors).Error());

    auto updated = UpdateRecord(store, EntityKind::Series, id, std::move(series),
                                &IEntityStore::FindSeries, &IEntityStore::UpdateSeriesRow, op);
    if (updated.IsErr()) return R::Err(std::move(updated).Error());
    Series stored = std::move(updated).Value();

    // Full replace of the author set.
    auto removed = store.DeleteLinks(Relation::SeriesAuthor, LinkSide::Source, stored.id);
    if (removed.IsErr()) return R::Err(std::move(removed).Error());
    for (const auto& author_id : author_ids) {
        auto linked = store.InsertLink(Relation::SeriesAuthor, stored.id, author_id);
        if (linked.IsErr()) return R::Err(std::move(linked).Error());
    }

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    LogInfo("lifecycle", "Updated series \"" + stored.name + "\" (" +
                             std::to_string(author_ids.size()) + " author(s))");
    return R::Ok(SeriesRecord{std::move(stored), author_ids});
}

Result<BookRecord, Error> UpdateReadingProgress(IEntityStore& store, std::string_view book_id,
                                                ReadingStatus status,
                                                const std::optional<std::string>& notes) {
    using R = Result<BookRecord, Error>;
    const std::string op = "UpdateReadingProgress";

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    auto found = store.FindBook(book_id);
    if (found.IsErr()) return R::Err(std::move(found).Error());
    if (!found.Value()) return R::Err(Error::NotFound(op, "book", std::string(book_id)));
    Book book = *found.Value();

    book.reading_status = status;
    if (notes) {
        book.notes = notes->empty() ? std::nullopt : notes;
    }
    book.updated_at = CurrentTimestamp();
    auto updated = store.UpdateBookRow(book);
    if (updated.IsErr()) return R::Err(std::move(updated).Error());

    auto record = GetBook(store, book.id);
    if (record.IsErr()) return R::Err(std::move(record).Error());

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    LogDebug("lifecycle", "Book " + book.id + " is now " + ReadingStatusName(status));
    return record;
}

// ---------------------------------------------------------------------------
// Single-entity deletes
// ---------------------------------------------------------------------------
Result<DeletionResult, Error> DeleteAuthor(IEntityStore& store, std::string_view id) {
    return DeleteSingle(store, EntityKind::Author, id, "DeleteAuthor");
}

Result<DeletionResult, Error> DeletePublisher(IEntityStore& store, std::string_view id) {
    return DeleteSingle(store, EntityKind::Publisher, id, "DeletePublisher");
}

Result<DeletionResult, Error> DeleteSeries(IEntityStore& store, std::string_view id) {
    return DeleteSingle(store, EntityKind::Series, id, "DeleteSeries");
}

Result<DeletionResult, Error> DeleteCategory(IEntityStore& store, std::string_view id) {
    return DeleteSingle(store, EntityKind::Category, id, "DeleteCategory");
}

Result<DeletionResult, Error> DeleteGenre(IEntityStore& store, std::string_view id) {
    return DeleteSingle(store, EntityKind::Genre, id, "DeleteGenre");
}

Result<DeletionResult, Error> DeleteTopic(IEntityStore& store, std::string_view id) {
    return DeleteSingle(store, EntityKind::Topic, id, "DeleteTopic");
}

// ---------------------------------------------------------------------------
// CleanupOrphans
// ---------------------------------------------------------------------------
Result<CleanupResult, Error> CleanupOrphans(IEntityStore& store) {
    using R = Result<CleanupResult, Error>;
    const std::string op = "CleanupOrphans";

    auto guard = TransactionGuard::Begin(store);
    if (guard.IsErr()) return R::Err(std::move(guard).Error());
    auto tx = std::move(guard).Value();

    CleanupResult result;
    while (true) {
        auto orphans = FindOrphans(store);
        if (orphans.IsErr()) return R::Err(std::move(orphans).Error());
        const auto& found = orphans.Value();
        if (found.Empty()) break;

        ++result.passes;
        const std::pair<const std::vector<EntityRef>*, std::vector<EntityRef>*> groups[] = {
            {&found.authors, &result.deleted_authors},
            {&found.publishers, &result.deleted_publishers},
            {&found.series, &result.deleted_series},
        };
        for (const auto& [refs, deleted] : groups) {
            for (const auto& ref : *refs) {
                auto removed = RemoveEntity(store, ref, op);
                if (removed.IsErr()) return R::Err(std::move(removed).Error());
                deleted->push_back(ref);
            }
        }
        LogDebug("lifecycle", "cleanup pass " + std::to_string(result.passes) + " removed " +
                                  std::to_string(found.authors.size() + found.publishers.size() +
                                                 found.series.size()) +
                                  " record(s)");
    }

    auto committed = tx.Commit();
    if (committed.IsErr()) return R::Err(std::move(committed).Error());

    if (result.Total() > 0) {
        LogInfo("lifecycle", "Removed " + std::to_string(result.deleted_authors.size()) +
                                 " author(s), " + std::to_string(result.deleted_publishers.size()) +
                                 " publisher(s), " + std::to_string(result.deleted_series.size()) +
                                 " series in " + std::to_string(result.passes) + " pass(es)");
    }
    return R::Ok(std::move(result));
}

} // namespace homelib
