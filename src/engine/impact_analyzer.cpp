#include <homelib/engine/impact_analyzer.hpp>

#include <homelib/catalog/relationship_catalog.hpp>
#include <homelib/core/log.hpp>

#include <algorithm>
#include <set>

namespace homelib {

namespace {

Error InternalError(const std::string& operation, const std::string& message) {
    Error err;
    err.operation = operation;
    err.message = message;
    err.category = ErrorCategory::Internal;
    return err;
}

std::string WouldLose(const MinimumRule& rule, const std::string& name) {
    return std::string(EntityKindLabel(rule.kind)) + " \"" + name + "\" would have no " +
           rule.missing + " (violates: " + rule.requirement + ")";
}

Violation AtRisk(ViolationRule rule_id, const EntityRef& ref) {
    const auto* rule = FindRule(rule_id);
    std::string message = rule ? WouldLose(*rule, ref.name)
                               : std::string(EntityKindLabel(ref.kind)) + " \"" + ref.name +
                                     "\" would be left without required links";
    return Violation{rule_id, EntityKindName(ref.kind), ref.id, ref.name, std::move(message)};
}

// Composite keys make a repeated link impossible; seeing one means the
// counts below cannot be trusted.
Result<void, Error> RequireDistinct(const std::vector<std::string>& ids,
                                    const std::string& operation,
                                    const char* relation_name) {
    std::set<std::string> seen;
    for (const auto& id : ids) {
        if (!seen.insert(id).second) {
            return Result<void, Error>::Err(InternalError(
                operation, std::string("duplicate ") + relation_name + " link to '" + id + "'"));
        }
    }
    return Result<void, Error>::Ok();
}

// The entity at `side` of `relation` when `id` has exactly one link there.
// Callers only ask about entities they have just seen linked, so the
// current count includes the link being removed: exactly 1 means it is
// the last one.
Result<std::optional<EntityRef>, Error> SoleLink(IEntityStore& store, Relation relation,
                                                 LinkSide side, const std::string& id,
                                                 const std::string& operation) {
    using R = Result<std::optional<EntityRef>, Error>;
    const auto& spec = Spec(relation);

    auto count = store.CountLinks(relation, side, id);
    if (count.IsErr()) return R::Err(std::move(count).Error());
    if (count.Value() < 1) {
        return R::Err(InternalError(
            operation, std::string(spec.name) + " count for " +
                           EntityKindName(KindAt(spec, side)) + " '" + id + "' is " +
                           std::to_string(count.Value()) + " although a link exists"));
    }
    if (count.Value() != 1) {
        return R::Ok(std::nullopt);
    }
    return store.FindRef(KindAt(spec, side), id);
}

Result<void, Error> CollectSoleAuthors(IEntityStore& store,
                                       const std::vector<std::string>& author_ids,
                                       const std::string& operation,
                                       std::vector<EntityRef>& out) {
    for (const auto& author_id : author_ids) {
        auto sole = SoleLink(store, Relation::BookAuthor, LinkSide::Target, author_id, operation);
        if (sole.IsErr()) return Result<void, Error>::Err(std::move(sole).Error());
        if (sole.Value().has_value()) {
            out.push_back(*sole.Value());
        }
    }
    return Result<void, Error>::Ok();
}

// Series that keep existing but whose every author is about to go.
Result<std::vector<EntityRef>, Error> FindStrandedSeries(
    IEntityStore& store, const std::vector<EntityRef>& leaving_authors,
    const std::optional<EntityRef>& leaving_series) {
    using R = Result<std::vector<EntityRef>, Error>;

    std::set<std::string> leaving;
    for (const auto& a : leaving_authors) leaving.insert(a.id);

    std::set<std::string> visited;
    if (leaving_series) visited.insert(leaving_series->id);

    std::vector<EntityRef> stranded;
    for (const auto& author : leaving_authors) {
        auto series_ids = store.ListLinkedIds(Relation::SeriesAuthor, LinkSide::Target, author.id);
        if (series_ids.IsErr()) return R::Err(std::move(series_ids).Error());

        for (const auto& series_id : series_ids.Value()) {
            if (!visited.insert(series_id).second) continue;

            auto authors = store.ListLinkedIds(Relation::SeriesAuthor, LinkSide::Source, series_id);
            if (authors.IsErr()) return R::Err(std::move(authors).Error());
            const auto& ids = authors.Value();
            const bool all_leaving = std::all_of(ids.begin(), ids.end(), [&](const std::string& id) {
                return leaving.count(id) > 0;
            });
            if (!all_leaving) continue;

            auto ref = store.FindRef(EntityKind::Series, series_id);
            if (ref.IsErr()) return R::Err(std::move(ref).Error());
            if (ref.Value()) stranded.push_back(*ref.Value());
        }
    }
    return R::Ok(std::move(stranded));
}

void LogReport(const ImpactReport& report, const char* what) {
    if (!GlobalLogger().Enabled(LogLevel::Debug)) return;
    LogDebug("impact", std::string(what) + " " + report.book_id + ": " +
                           std::to_string(report.orphaned_authors.size()) + " author(s), publisher " +
                           (report.orphaned_publisher ? "yes" : "no") + ", series " +
                           (report.orphaned_series ? "yes" : "no") + ", stranded " +
                           std::to_string(report.stranded_series.size()));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------
std::vector<Violation> ImpactReport::ToViolations() const {
    std::vector<Violation> out;
    for (const auto& a : orphaned_authors) {
        out.push_back(AtRisk(ViolationRule::OrphanAuthor, a));
    }
    if (orphaned_publisher) {
        out.push_back(AtRisk(ViolationRule::OrphanPublisher, *orphaned_publisher));
    }
    if (orphaned_series) {
        out.push_back(AtRisk(ViolationRule::OrphanSeries, *orphaned_series));
    }
    for (const auto& s : stranded_series) {
        out.push_back(AtRisk(ViolationRule::SeriesWithoutAuthors, s));
    }
    return out;
}

std::string ImpactReport::Summary() const {
    std::vector<std::string> problems;
    if (!orphaned_authors.empty()) {
        std::string names;
        for (const auto& a : orphaned_authors) {
            if (!names.empty()) names += ", ";
            names += a.name;
        }
        problems.push_back(std::to_string(orphaned_authors.size()) +
                           " author(s) would have no books: " + names);
    }
    if (orphaned_publisher) {
        problems.push_back("Publisher \"" + orphaned_publisher->name + "\" would have no books");
    }
    if (orphaned_series) {
        problems.push_back("Series \"" + orphaned_series->name + "\" would have no books");
    }

    std::string out;
    for (const auto& p : problems) {
        if (!out.empty()) out += "; ";
        out += p;
    }
    return out;
}

std::vector<Violation> AuthorDeleteImpact::ToViolations() const {
    std::vector<Violation> out;
    for (const auto& s : series_with_no_authors) {
        out.push_back(Violation{ViolationRule::SoleSeriesAuthor, EntityKindName(s.kind), s.id,
                                s.name,
                                "Author \"" + author.name + "\" is the only author of series \"" +
                                    s.name + "\""});
    }
    return out;
}

// ---------------------------------------------------------------------------
// CheckDeleteImpact
// ---------------------------------------------------------------------------
Result<ImpactReport, Error> CheckDeleteImpact(IEntityStore& store, std::string_view book_id) {
    using R = Result<ImpactReport, Error>;
    const std::string op = "CheckDeleteImpact";

    auto found = store.FindBook(book_id);
    if (found.IsErr()) return R::Err(std::move(found).Error());
    if (!found.Value()) return R::Err(Error::NotFound(op, "book", std::string(book_id)));
    const Book book = *found.Value();

    ImpactReport report;
    report.book_id = book.id;

    auto author_ids = store.ListLinkedIds(Relation::BookAuthor, LinkSide::Source, book.id);
    if (author_ids.IsErr()) return R::Err(std::move(author_ids).Error());
    auto distinct = RequireDistinct(author_ids.Value(), op, "book-author");
    if (distinct.IsErr()) return R::Err(std::move(distinct).Error());

    auto authors = CollectSoleAuthors(store, author_ids.Value(), op, report.orphaned_authors);
    if (authors.IsErr()) return R::Err(std::move(authors).Error());

    auto publisher = SoleLink(store, Relation::BookPublisher, LinkSide::Target,
                              book.publisher_id, op);
    if (publisher.IsErr()) return R::Err(std::move(publisher).Error());
    report.orphaned_publisher = publisher.Value();

    if (book.series_id) {
        auto series = SoleLink(store, Relation::BookSeries, LinkSide::Target, *book.series_id, op);
        if (series.IsErr()) return R::Err(std::move(series).Error());
        report.orphaned_series = series.Value();
    }

    auto stranded = FindStrandedSeries(store, report.orphaned_authors, report.orphaned_series);
    if (stranded.IsErr()) return R::Err(std::move(stranded).Error());
    report.stranded_series = std::move(stranded).Value();

    LogReport(report, "delete impact");
    return R::Ok(std::move(report));
}

// ---------------------------------------------------------------------------
// CheckUpdateImpact
// ---------------------------------------------------------------------------
Result<ImpactReport, Error> CheckUpdateImpact(IEntityStore& store, std::string_view book_id,
                                              const BookInput& proposed) {
    using R = Result<ImpactReport, Error>;
    const std::string op = "CheckUpdateImpact";

    auto found = store.FindBook(book_id);
    if (found.IsErr()) return R::Err(std::move(found).Error());
    if (!found.Value()) return R::Err(Error::NotFound(op, "book", std::string(book_id)));
    const Book book = *found.Value();

    ImpactReport report;
    report.book_id = book.id;

    auto current = store.ListLinkedIds(Relation::BookAuthor, LinkSide::Source, book.id);
    if (current.IsErr()) return R::Err(std::move(current).Error());
    auto distinct = RequireDistinct(current.Value(), op, "book-author");
    if (distinct.IsErr()) return R::Err(std::move(distinct).Error());

    const std::set<std::string> kept(proposed.author_ids.begin(), proposed.author_ids.end());
    std::vector<std::string> removed;
    for (const auto& id : current.Value()) {
        if (kept.count(id) == 0) removed.push_back(id);
    }

    auto authors = CollectSoleAuthors(store, removed, op, report.orphaned_authors);
    if (authors.IsErr()) return R::Err(std::move(authors).Error());

    if (book.publisher_id != proposed.publisher_id) {
        auto publisher = SoleLink(store, Relation::BookPublisher, LinkSide::Target,
                                  book.publisher_id, op);
        if (publisher.IsErr()) return R::Err(std::move(publisher).Error());
        report.orphaned_publisher = publisher.Value();
    }

    if (book.series_id && book.series_id != proposed.series_id) {
        auto series = SoleLink(store, Relation::BookSeries, LinkSide::Target, *book.series_id, op);
        if (series.IsErr()) return R::Err(std::move(series).Error());
        report.orphaned_series = series.Value();
    }

    auto stranded = FindStrandedSeries(store, report.orphaned_authors, report.orphaned_series);
    if (stranded.IsErr()) return R::Err(std::move(stranded).Error());
    report.stranded_series = std::move(stranded).Value();

    LogReport(report, "update impact");
    return R::Ok(std::move(report));
}

// ---------------------------------------------------------------------------
// CheckAuthorDeleteImpact
// ---------------------------------------------------------------------------
Result<AuthorDeleteImpact, Error> CheckAuthorDeleteImpact(IEntityStore& store,
                                                          std::string_view author_id) {
    using R = Result<AuthorDeleteImpact, Error>;
    const std::string op = "CheckAuthorDeleteImpact";

    auto author = store.FindRef(EntityKind::Author, author_id);
    if (author.IsErr()) return R::Err(std::move(author).Error());
    if (!author.Value()) return R::Err(Error::NotFound(op, "author", std::string(author_id)));

    AuthorDeleteImpact impact;
    impact.author = *author.Value();

    auto series_ids = store.ListLinkedIds(Relation::SeriesAuthor, LinkSide::Target,
                                          impact.author.id);
    if (series_ids.IsErr()) return R::Err(std::move(series_ids).Error());
    auto distinct = RequireDistinct(series_ids.Value(), op, "series-author");
    if (distinct.IsErr()) return R::Err(std::move(distinct).Error());

    for (const auto& series_id : series_ids.Value()) {
        auto sole = SoleLink(store, Relation::SeriesAuthor, LinkSide::Source, series_id, op);
        if (sole.IsErr()) return R::Err(std::move(sole).Error());
        if (sole.Value()) impact.series_with_no_authors.push_back(*sole.Value());
    }

    LogDebug("impact", "author delete impact " + impact.author.id + ": sole author of " +
                           std::to_string(impact.series_with_no_authors.size()) + " series");
    return R::Ok(std::move(impact));
}

// ---------------------------------------------------------------------------
// IntegrityCheck / FindOrphans
// ---------------------------------------------------------------------------
Result<IntegrityReport, Error> IntegrityCheck(IEntityStore& store) {
    using R = Result<IntegrityReport, Error>;

    IntegrityReport report;
    for (const auto* rules : {&OrphanRules(), &ReferenceRules()}) {
        for (const auto& rule : *rules) {
            report.summary[RuleTag(rule.rule)] = 0;
        }
    }

    for (const auto& rule : OrphanRules()) {
        auto unlinked = store.ListUnlinked(rule.relation, rule.side);
        if (unlinked.IsErr()) return R::Err(std::move(unlinked).Error());
        for (const auto& ref : unlinked.Value()) {
            report.violations.push_back(MakeViolation(rule, ref));
            ++report.summary[RuleTag(rule.rule)];
        }
    }

    for (const auto& rule : ReferenceRules()) {
        auto dangling = store.ListDanglingReferences(rule.relation);
        if (dangling.IsErr()) return R::Err(std::move(dangling).Error());
        for (const auto& ref : dangling.Value()) {
            report.violations.push_back(MakeViolation(rule, ref));
            ++report.summary[RuleTag(rule.rule)];
        }
    }

    report.is_valid = report.violations.empty();
    LogDebug("impact", "integrity check: " + std::to_string(report.violations.size()) +
                           " violation(s)");
    return R::Ok(std::move(report));
}

Result<OrphanSet, Error> FindOrphans(IEntityStore& store) {
    using R = Result<OrphanSet, Error>;

    OrphanSet orphans;
    std::set<std::string> seen_series;
    for (const auto& rule : OrphanRules()) {
        auto unlinked = store.ListUnlinked(rule.relation, rule.side);
        if (unlinked.IsErr()) return R::Err(std::move(unlinked).Error());

        for (auto& ref : std::move(unlinked).Value()) {
            switch (ref.kind) {
                case EntityKind::Author:
                    orphans.authors.push_back(std::move(ref));
                    break;
                case EntityKind::Publisher:
                    orphans.publishers.push_back(std::move(ref));
                    break;
                case EntityKind::Series:
                    if (seen_series.insert(ref.id).second) {
                        orphans.series.push_back(std::move(ref));
                    }
                    break;
                default:
                    return R::Err(InternalError(
                        "FindOrphans",
                        std::string("orphan rule targets ") + EntityKindName(ref.kind)));
            }
        }
    }
    return R::Ok(std::move(orphans));
}

} // namespace homelib
