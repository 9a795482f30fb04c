#include <homelib/engine/library_stats.hpp>

namespace homelib {

namespace {

// The relation through which books link a record of `kind`.
std::optional<Relation> BookRelationOf(EntityKind kind) {
    switch (kind) {
        case EntityKind::Author:    return Relation::BookAuthor;
        case EntityKind::Publisher: return Relation::BookPublisher;
        case EntityKind::Series:    return Relation::BookSeries;
        case EntityKind::Genre:     return Relation::BookGenre;
        case EntityKind::Topic:     return Relation::BookTopic;
        case EntityKind::Category:  return Relation::BookCategory;
        case EntityKind::Book:      return std::nullopt;
    }
    return std::nullopt;
}

Result<std::vector<EntityRef>, Error> ResolveRefs(IEntityStore& store, EntityKind kind,
                                                  const std::vector<std::string>& ids) {
    using R = Result<std::vector<EntityRef>, Error>;
    std::vector<EntityRef> refs;
    refs.reserve(ids.size());
    for (const auto& id : ids) {
        auto ref = store.FindRef(kind, id);
        if (ref.IsErr()) return R::Err(std::move(ref).Error());
        if (ref.Value()) refs.push_back(*ref.Value());
    }
    return R::Ok(std::move(refs));
}

} // anonymous namespace

Result<LibraryStats, Error> ComputeLibraryStats(IEntityStore& store) {
    using R = Result<LibraryStats, Error>;

    LibraryStats stats;
    const std::pair<EntityKind, int64_t*> totals[] = {
        {EntityKind::Book, &stats.books},
        {EntityKind::Author, &stats.authors},
        {EntityKind::Publisher, &stats.publishers},
        {EntityKind::Series, &stats.series},
        {EntityKind::Genre, &stats.genres},
        {EntityKind::Topic, &stats.topics},
        {EntityKind::Category, &stats.categories},
    };
    for (const auto& [kind, out] : totals) {
        auto count = store.CountAll(kind);
        if (count.IsErr()) return R::Err(std::move(count).Error());
        *out = count.Value();
    }

    const std::pair<ReadingStatus, int64_t*> statuses[] = {
        {ReadingStatus::Unread, &stats.unread},
        {ReadingStatus::Reading, &stats.reading},
        {ReadingStatus::Completed, &stats.completed},
    };
    for (const auto& [status, out] : statuses) {
        auto count = store.CountBooksWithStatus(status);
        if (count.IsErr()) return R::Err(std::move(count).Error());
        *out = count.Value();
    }

    return R::Ok(stats);
}

Result<std::vector<EntitySummary>, Error> ListEntities(IEntityStore& store, EntityKind kind) {
    using R = Result<std::vector<EntitySummary>, Error>;

    auto ids = store.ListIds(kind);
    if (ids.IsErr()) return R::Err(std::move(ids).Error());
    auto refs = ResolveRefs(store, kind, ids.Value());
    if (refs.IsErr()) return R::Err(std::move(refs).Error());

    const auto books = BookRelationOf(kind);
    std::vector<EntitySummary> rows;
    rows.reserve(refs.Value().size());
    for (const auto& ref : refs.Value()) {
        EntitySummary row;
        row.ref = ref;
        if (books) {
            auto count = store.CountLinks(*books, LinkSide::Target, ref.id);
            if (count.IsErr()) return R::Err(std::move(count).Error());
            row.book_count = count.Value();
        }
        if (kind == EntityKind::Series) {
            auto author_ids = store.ListLinkedIds(Relation::SeriesAuthor, LinkSide::Source, ref.id);
            if (author_ids.IsErr()) return R::Err(std::move(author_ids).Error());
            auto authors = ResolveRefs(store, EntityKind::Author, author_ids.Value());
            if (authors.IsErr()) return R::Err(std::move(authors).Error());
            row.authors = std::move(authors).Value();
        }
        rows.push_back(std::move(row));
    }
    return R::Ok(std::move(rows));
}

} // namespace homelib
