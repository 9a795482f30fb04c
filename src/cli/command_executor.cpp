#include <homelib/cli/command_executor.hpp>
#include <homelib/cli/output_formatter.hpp>
#include <homelib/core/ansi.hpp>
#include <homelib/core/log.hpp>

#include <homelib/engine/bulk_merge.hpp>
#include <homelib/engine/impact_analyzer.hpp>
#include <homelib/engine/library_stats.hpp>
#include <homelib/engine/lifecycle_enforcer.hpp>
#include <homelib/io/json_mapping.hpp>
#include <homelib/io/library_codec.hpp>
#include <homelib/store/schema.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <map>
#include <sstream>
#include <string>

namespace homelib {

namespace {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

std::string GetFlag(const CommandArgs& args, const std::string& key,
                    const std::string& default_val = "") {
    auto it = args.flags.find(key);
    return (it != args.flags.end()) ? it->second : default_val;
}

bool HasFlag(const CommandArgs& args, const std::string& key) {
    return args.flags.count(key) > 0;
}

bool JsonMode(const CommandContext& ctx, const CommandArgs& args) {
    return GetFlag(args, "json") == "true" || ctx.json_default;
}

bool ColorMode(const CommandContext& ctx, const CommandArgs& args) {
    if (JsonMode(ctx, args)) return false;
    if (GetFlag(args, "no-color") == "true") return false;
    if (GetFlag(args, "color") == "true") return true;
    return ctx.color_default;
}

bool Cascade(const CommandContext& ctx, const CommandArgs& args) {
    if (HasFlag(args, "cascade")) return GetFlag(args, "cascade") != "false";
    return ctx.cascade_default;
}

OutputFormatter MakeFormatter(const CommandContext& ctx, const CommandArgs& args) {
    return OutputFormatter(JsonMode(ctx, args), ColorMode(ctx, args), *ctx.out, *ctx.err);
}

int Fail(const OutputFormatter& fmt, const Error& error) {
    fmt.PrintError(error);
    return error.ExitCode();
}

std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

Result<int, Error> ParseIntFlag(const CommandArgs& args, const std::string& key) {
    auto text = GetFlag(args, key);
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return Result<int, Error>::Err(
            Error::Validation("ParseFlags", "--" + key + " must be an integer, got '" + text + "'"));
    }
    return Result<int, Error>::Ok(value);
}

std::optional<std::string> OptFlag(const CommandArgs& args, const std::string& key) {
    auto value = GetFlag(args, key);
    if (value.empty()) return std::nullopt;
    return value;
}

Result<nlohmann::json, Error> ReadJsonFile(const std::string& path, const std::string& operation) {
    std::ifstream in(path);
    if (!in) {
        return Result<nlohmann::json, Error>::Err(
            Error::Storage(operation, "Cannot open file: " + path));
    }
    try {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::parse(in));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(
            Error::Parse(operation, "Invalid JSON in " + path + ": " + e.what()));
    }
}

const char* const kBookInputFlags[] = {
    "file", "title", "isbn", "year", "pages", "description", "cover", "status",
    "notes", "rating", "publisher", "series", "series-order", "category",
    "authors", "genres", "topics",
};

bool HasBookInputFlags(const CommandArgs& args) {
    return std::any_of(std::begin(kBookInputFlags), std::end(kBookInputFlags),
                       [&](const char* key) { return HasFlag(args, key); });
}

// Overlay --file JSON and then individual flags onto `base`.
Result<BookInput, Error> BookInputFromArgs(const CommandArgs& args, BookInput base) {
    using R = Result<BookInput, Error>;

    if (HasFlag(args, "file")) {
        auto doc = ReadJsonFile(GetFlag(args, "file"), "ReadBookInput");
        if (doc.IsErr()) return R::Err(doc.Error());
        auto overlaid = BookInputFromJson(doc.Value(), std::move(base));
        if (overlaid.IsErr()) return overlaid;
        base = std::move(overlaid).Value();
    }

    if (HasFlag(args, "title")) base.title = GetFlag(args, "title");
    if (HasFlag(args, "isbn")) base.isbn = OptFlag(args, "isbn");
    if (HasFlag(args, "description")) base.description = OptFlag(args, "description");
    if (HasFlag(args, "cover")) base.cover_image = OptFlag(args, "cover");
    if (HasFlag(args, "notes")) base.notes = OptFlag(args, "notes");
    if (HasFlag(args, "publisher")) base.publisher_id = GetFlag(args, "publisher");
    if (HasFlag(args, "category")) base.category_id = GetFlag(args, "category");
    if (HasFlag(args, "series")) base.series_id = OptFlag(args, "series");
    if (HasFlag(args, "authors")) base.author_ids = SplitList(GetFlag(args, "authors"));
    if (HasFlag(args, "genres")) base.genre_ids = SplitList(GetFlag(args, "genres"));
    if (HasFlag(args, "topics")) base.topic_ids = SplitList(GetFlag(args, "topics"));

    const std::pair<const char*, std::optional<int>*> int_flags[] = {
        {"year", &base.publication_year},
        {"pages", &base.pages},
        {"rating", &base.rating},
        {"series-order", &base.series_order},
    };
    for (const auto& [key, target] : int_flags) {
        if (!HasFlag(args, key)) continue;
        auto value = ParseIntFlag(args, key);
        if (value.IsErr()) return R::Err(value.Error());
        *target = value.Value();
    }

    if (HasFlag(args, "status")) {
        auto status = ParseReadingStatus(GetFlag(args, "status"));
        if (status.IsErr()) {
            return R::Err(Error::Validation("ParseFlags", status.Error()));
        }
        base.reading_status = status.Value();
    }
    return R::Ok(std::move(base));
}

std::string RefNames(const std::vector<EntityRef>& refs) {
    std::string out;
    for (const auto& r : refs) {
        if (!out.empty()) out += ", ";
        out += r.name;
    }
    return out;
}

std::string NameOrId(IEntityStore& store, EntityKind kind, const std::string& id) {
    auto ref = store.FindRef(kind, id);
    if (ref.IsOk() && ref.Value().has_value()) return ref.Value()->name;
    return id;
}

std::string NamesOf(IEntityStore& store, EntityKind kind, const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += NameOrId(store, kind, id);
    }
    return out;
}

void PrintBookRecord(const OutputFormatter& fmt, IEntityStore& store, const BookRecord& record) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(BookRecordToJson(record));
        return;
    }
    const auto& b = record.book;
    DetailSection fields;
    fields.entries = {
        {"Id", b.id},
        {"Status", ReadingStatusName(b.reading_status)},
        {"Publisher", NameOrId(store, EntityKind::Publisher, b.publisher_id)},
        {"Category", NameOrId(store, EntityKind::Category, b.category_id)},
    };
    if (b.isbn) fields.entries.emplace_back("ISBN", *b.isbn);
    if (b.publication_year) fields.entries.emplace_back("Year", std::to_string(*b.publication_year));
    if (b.pages) fields.entries.emplace_back("Pages", std::to_string(*b.pages));
    if (b.rating) fields.entries.emplace_back("Rating", std::to_string(*b.rating) + "/5");
    if (b.series_id) {
        auto series = NameOrId(store, EntityKind::Series, *b.series_id);
        if (b.series_order) series += " #" + std::to_string(*b.series_order);
        fields.entries.emplace_back("Series", series);
    }

    DetailSection links{"Links", {}};
    links.entries.emplace_back("Authors", NamesOf(store, EntityKind::Author, record.author_ids));
    if (!record.genre_ids.empty()) {
        links.entries.emplace_back("Genres", NamesOf(store, EntityKind::Genre, record.genre_ids));
    }
    if (!record.topic_ids.empty()) {
        links.entries.emplace_back("Topics", NamesOf(store, EntityKind::Topic, record.topic_ids));
    }
    fmt.PrintDetail(b.title, {fields, links});
}

void PrintDeletion(const OutputFormatter& fmt, const DeletionResult& result) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(DeletionResultToJson(result));
        return;
    }
    for (const auto& label : result.Labels()) {
        fmt.PrintSuccess("Deleted " + label);
    }
}

void PrintImpact(const OutputFormatter& fmt, const ImpactReport& report) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(ImpactReportToJson(report));
        return;
    }
    if (!report.HasImpact() && report.stranded_series.empty()) {
        fmt.PrintSuccess("No impact: no other record would be left without links");
        return;
    }
    if (report.HasImpact()) {
        fmt.PrintWarning(report.Summary());
    }
    fmt.PrintViolations(report.ToViolations());
}

// ---------------------------------------------------------------------------
// book show
// ---------------------------------------------------------------------------
int HandleBookShow(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, Error::Validation("BookShow", "Missing book id. Usage: homelib book show <id>"));
    }
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto record = GetBook(*store.Value(), args.positional[0]);
    if (record.IsErr()) return Fail(fmt, record.Error());
    PrintBookRecord(fmt, *store.Value(), record.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// book create
// ---------------------------------------------------------------------------
int HandleBookCreate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);

    BookInput defaults;
    defaults.category_id = kDefaultCategoryId;
    auto input = BookInputFromArgs(args, std::move(defaults));
    if (input.IsErr()) return Fail(fmt, input.Error());

    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto record = CreateBook(*store.Value(), input.Value(), OptFlag(args, "id"));
    if (record.IsErr()) return Fail(fmt, record.Error());

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(BookRecordToJson(record.Value()));
    } else {
        fmt.PrintSuccess("Created book \"" + record.Value().book.title + "\" (" +
                         record.Value().book.id + ")");
    }
    return 0;
}

// ---------------------------------------------------------------------------
// book update
// ---------------------------------------------------------------------------
int HandleBookUpdate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, Error::Validation("BookUpdate", "Missing book id. Usage: homelib book update <id> [flags]"));
    }
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());
    const auto& id = args.positional[0];

    auto current = GetBook(*store.Value(), id);
    if (current.IsErr()) return Fail(fmt, current.Error());

    auto input = BookInputFromArgs(args, ToBookInput(current.Value()));
    if (input.IsErr()) return Fail(fmt, input.Error());

    auto result = UpdateBook(*store.Value(), id, input.Value(), Cascade(ctx, args));
    if (result.IsErr()) return Fail(fmt, result.Error());

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(UpdateResultToJson(result.Value()));
        return 0;
    }
    fmt.PrintSuccess("Updated book \"" + result.Value().record.book.title + "\"");
    for (const auto& ref : result.Value().deleted) {
        fmt.PrintSuccess(std::string("Removed orphaned ") + EntityKindLabel(ref.kind) +
                         ": " + ref.name);
    }
    return 0;
}

// ---------------------------------------------------------------------------
// book delete
// ---------------------------------------------------------------------------
int HandleBookDelete(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, Error::Validation("BookDelete", "Missing book id. Usage: homelib book delete <id> [--cascade]"));
    }
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto result = DeleteBook(*store.Value(), args.positional[0], Cascade(ctx, args));
    if (result.IsErr()) return Fail(fmt, result.Error());
    PrintDeletion(fmt, result.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// book impact
// ---------------------------------------------------------------------------
int HandleBookImpact(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, Error::Validation("BookImpact", "Missing book id. Usage: homelib book impact <id> [--file <json>]"));
    }
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());
    const auto& id = args.positional[0];

    if (!HasBookInputFlags(args)) {
        auto report = CheckDeleteImpact(*store.Value(), id);
        if (report.IsErr()) return Fail(fmt, report.Error());
        PrintImpact(fmt, report.Value());
        return 0;
    }

    auto current = GetBook(*store.Value(), id);
    if (current.IsErr()) return Fail(fmt, current.Error());
    auto input = BookInputFromArgs(args, ToBookInput(current.Value()));
    if (input.IsErr()) return Fail(fmt, input.Error());

    auto report = CheckUpdateImpact(*store.Value(), id, input.Value());
    if (report.IsErr()) return Fail(fmt, report.Error());
    PrintImpact(fmt, report.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// author / publisher / series / category / genre / topic delete
// ---------------------------------------------------------------------------
using DeleteFn = Result<DeletionResult, Error> (*)(IEntityStore&, std::string_view);

int RunDelete(CommandContext& ctx, const CommandArgs& args, const std::string& kind,
              DeleteFn fn) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, Error::Validation("Delete", "Missing " + kind + " id. Usage: homelib " +
                                                         kind + " delete <id>"));
    }
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto result = fn(*store.Value(), args.positional[0]);
    if (result.IsErr()) return Fail(fmt, result.Error());
    PrintDeletion(fmt, result.Value());
    return 0;
}

// ---------------------------------------------------------------------------
// author impact
// ---------------------------------------------------------------------------
int HandleAuthorImpact(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty()) {
        return Fail(fmt, Error::Validation("AuthorImpact", "Missing author id. Usage: homelib author impact <id>"));
    }
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto impact = CheckAuthorDeleteImpact(*store.Value(), args.positional[0]);
    if (impact.IsErr()) return Fail(fmt, impact.Error());

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(AuthorDeleteImpactToJson(impact.Value()));
    } else if (!impact.Value().HasImpact()) {
        fmt.PrintSuccess("No series depends on " + impact.Value().author.name + " alone");
    } else {
        fmt.PrintWarning("Deleting " + impact.Value().author.name +
                         " would leave series without authors: " +
                         RefNames(impact.Value().series_with_no_authors));
        fmt.PrintViolations(impact.Value().ToViolations());
    }
    return 0;
}

// ---------------------------------------------------------------------------
// Creation of standalone records
// ---------------------------------------------------------------------------
bool RequireName(const OutputFormatter& fmt, const CommandArgs& args,
                 const std::string& kind, int& exit_code) {
    if (!GetFlag(args, "name").empty()) return true;
    exit_code = Fail(fmt, Error::Validation("Create", "Missing --name. Usage: homelib " + kind +
                                                          " create --name <name>"));
    return false;
}

void PrintCreated(const OutputFormatter& fmt, const std::string& kind,
                  const std::string& name, const std::string& id,
                  const nlohmann::json& json) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(json);
    } else {
        fmt.PrintSuccess("Created " + kind + " \"" + name + "\" (" + id + ")");
    }
}

int HandleAuthorCreate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireName(fmt, args, "author", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    Author author;
    author.id = GetFlag(args, "id");
    author.name = GetFlag(args, "name");
    author.bio = OptFlag(args, "bio");
    auto created = CreateAuthor(*store.Value(), std::move(author));
    if (created.IsErr()) return Fail(fmt, created.Error());
    const auto& a = created.Value();
    PrintCreated(fmt, "author", a.name, a.id, AuthorToJson(a));
    fmt.PrintWarning("Author has no books yet; link a book before the next cleanup");
    return 0;
}

int HandlePublisherCreate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireName(fmt, args, "publisher", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    Publisher publisher;
    publisher.id = GetFlag(args, "id");
    publisher.name = GetFlag(args, "name");
    publisher.location = OptFlag(args, "location");
    publisher.website = OptFlag(args, "website");
    auto created = CreatePublisher(*store.Value(), std::move(publisher));
    if (created.IsErr()) return Fail(fmt, created.Error());
    const auto& p = created.Value();
    PrintCreated(fmt, "publisher", p.name, p.id, PublisherToJson(p));
    fmt.PrintWarning("Publisher has no books yet; link a book before the next cleanup");
    return 0;
}

int HandleSeriesCreate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireName(fmt, args, "series", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    Series series;
    series.id = GetFlag(args, "id");
    series.name = GetFlag(args, "name");
    series.description = OptFlag(args, "description");
    auto created = CreateSeries(*store.Value(), std::move(series),
                                SplitList(GetFlag(args, "authors")));
    if (created.IsErr()) return Fail(fmt, created.Error());
    const auto& s = created.Value().series;
    PrintCreated(fmt, "series", s.name, s.id, SeriesRecordToJson(created.Value()));
    return 0;
}

int HandleCategoryCreate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireName(fmt, args, "category", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    Category category;
    category.id = GetFlag(args, "id");
    category.name = GetFlag(args, "name");
    category.description = OptFlag(args, "description");
    category.color = OptFlag(args, "color");
    auto created = CreateCategory(*store.Value(), std::move(category));
    if (created.IsErr()) return Fail(fmt, created.Error());
    const auto& c = created.Value();
    PrintCreated(fmt, "category", c.name, c.id, CategoryToJson(c));
    return 0;
}

int HandleGenreCreate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireName(fmt, args, "genre", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    Genre genre;
    genre.id = GetFlag(args, "id");
    genre.name = GetFlag(args, "name");
    genre.description = OptFlag(args, "description");
    auto created = CreateGenre(*store.Value(), std::move(genre));
    if (created.IsErr()) return Fail(fmt, created.Error());
    const auto& g = created.Value();
    PrintCreated(fmt, "genre", g.name, g.id, GenreToJson(g));
    return 0;
}

int HandleTopicCreate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireName(fmt, args, "topic", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    Topic topic;
    topic.id = GetFlag(args, "id");
    topic.name = GetFlag(args, "name");
    topic.description = OptFlag(args, "description");
    auto created = CreateTopic(*store.Value(), std::move(topic));
    if (created.IsErr()) return Fail(fmt, created.Error());
    const auto& t = created.Value();
    PrintCreated(fmt, "topic", t.name, t.id, TopicToJson(t));
    return 0;
}

// ---------------------------------------------------------------------------
// Updates of standalone records. Flags not given keep their value; an empty
// optional flag clears it.
// ---------------------------------------------------------------------------
bool RequireUpdateId(const OutputFormatter& fmt, const CommandArgs& args,
                     const std::string& kind, int& exit_code) {
    if (!args.positional.empty()) return true;
    exit_code = Fail(fmt, Error::Validation("Update", "Missing " + kind + " id. Usage: homelib " +
                                                          kind + " update <id> [flags]"));
    return false;
}

template <typename T>
Result<T, Error> LoadCurrent(IEntityStore& store, EntityKind kind, const std::string& id,
                             Result<std::optional<T>, Error> (IEntityStore::*find)(std::string_view),
                             const std::string& operation) {
    auto found = (store.*find)(id);
    if (found.IsErr()) return Result<T, Error>::Err(std::move(found).Error());
    if (!found.Value()) {
        return Result<T, Error>::Err(Error::NotFound(operation, EntityKindName(kind), id));
    }
    return Result<T, Error>::Ok(*found.Value());
}

void PrintUpdated(const OutputFormatter& fmt, const std::string& kind, const std::string& name,
                  const nlohmann::json& json) {
    if (fmt.IsJsonMode()) {
        fmt.PrintJson(json);
    } else {
        fmt.PrintSuccess("Updated " + kind + " \"" + name + "\"");
    }
}

void OverlayText(const CommandArgs& args, const char* key, std::string& out) {
    if (HasFlag(args, key)) out = GetFlag(args, key);
}

void OverlayText(const CommandArgs& args, const char* key, std::optional<std::string>& out) {
    if (HasFlag(args, key)) out = OptFlag(args, key);
}

int HandleAuthorUpdate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireUpdateId(fmt, args, "author", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());
    const auto& id = args.positional[0];

    auto current = LoadCurrent(*store.Value(), EntityKind::Author, id,
                               &IEntityStore::FindAuthor, "UpdateAuthor");
    if (current.IsErr()) return Fail(fmt, current.Error());
    Author author = std::move(current).Value();
    OverlayText(args, "name", author.name);
    OverlayText(args, "bio", author.bio);

    auto updated = UpdateAuthor(*store.Value(), id, std::move(author));
    if (updated.IsErr()) return Fail(fmt, updated.Error());
    PrintUpdated(fmt, "author", updated.Value().name, AuthorToJson(updated.Value()));
    return 0;
}

int HandlePublisherUpdate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireUpdateId(fmt, args, "publisher", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());
    const auto& id = args.positional[0];

    auto current = LoadCurrent(*store.Value(), EntityKind::Publisher, id,
                               &IEntityStore::FindPublisher, "UpdatePublisher");
    if (current.IsErr()) return Fail(fmt, current.Error());
    Publisher publisher = std::move(current).Value();
    OverlayText(args, "name", publisher.name);
    OverlayText(args, "location", publisher.location);
    OverlayText(args, "website", publisher.website);

    auto updated = UpdatePublisher(*store.Value(), id, std::move(publisher));
    if (updated.IsErr()) return Fail(fmt, updated.Error());
    PrintUpdated(fmt, "publisher", updated.Value().name, PublisherToJson(updated.Value()));
    return 0;
}

int HandleSeriesUpdate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireUpdateId(fmt, args, "series", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());
    const auto& id = args.positional[0];

    auto current = LoadCurrent(*store.Value(), EntityKind::Series, id,
                               &IEntityStore::FindSeries, "UpdateSeries");
    if (current.IsErr()) return Fail(fmt, current.Error());
    Series series = std::move(current).Value();
    OverlayText(args, "name", series.name);
    OverlayText(args, "description", series.description);

    std::vector<std::string> author_ids;
    if (HasFlag(args, "authors")) {
        author_ids = SplitList(GetFlag(args, "authors"));
    } else {
        auto linked = store.Value()->ListLinkedIds(Relation::SeriesAuthor, LinkSide::Source, id);
        if (linked.IsErr()) return Fail(fmt, linked.Error());
        author_ids = std::move(linked).Value();
    }

    auto updated = UpdateSeries(*store.Value(), id, std::move(series), author_ids);
    if (updated.IsErr()) return Fail(fmt, updated.Error());
    PrintUpdated(fmt, "series", updated.Value().series.name,
                 SeriesRecordToJson(updated.Value()));
    return 0;
}

int HandleCategoryUpdate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireUpdateId(fmt, args, "category", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());
    const auto& id = args.positional[0];

    auto current = LoadCurrent(*store.Value(), EntityKind::Category, id,
                               &IEntityStore::FindCategory, "UpdateCategory");
    if (current.IsErr()) return Fail(fmt, current.Error());
    Category category = std::move(current).Value();
    OverlayText(args, "name", category.name);
    OverlayText(args, "description", category.description);
    OverlayText(args, "color", category.color);

    auto updated = UpdateCategory(*store.Value(), id, std::move(category));
    if (updated.IsErr()) return Fail(fmt, updated.Error());
    PrintUpdated(fmt, "category", updated.Value().name, CategoryToJson(updated.Value()));
    return 0;
}

int HandleGenreUpdate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireUpdateId(fmt, args, "genre", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());
    const auto& id = args.positional[0];

    auto current = LoadCurrent(*store.Value(), EntityKind::Genre, id,
                               &IEntityStore::FindGenre, "UpdateGenre");
    if (current.IsErr()) return Fail(fmt, current.Error());
    Genre genre = std::move(current).Value();
    OverlayText(args, "name", genre.name);
    OverlayText(args, "description", genre.description);

    auto updated = UpdateGenre(*store.Value(), id, std::move(genre));
    if (updated.IsErr()) return Fail(fmt, updated.Error());
    PrintUpdated(fmt, "genre", updated.Value().name, GenreToJson(updated.Value()));
    return 0;
}

int HandleTopicUpdate(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    int code = 0;
    if (!RequireUpdateId(fmt, args, "topic", code)) return code;
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());
    const auto& id = args.positional[0];

    auto current = LoadCurrent(*store.Value(), EntityKind::Topic, id,
                               &IEntityStore::FindTopic, "UpdateTopic");
    if (current.IsErr()) return Fail(fmt, current.Error());
    Topic topic = std::move(current).Value();
    OverlayText(args, "name", topic.name);
    OverlayText(args, "description", topic.description);

    auto updated = UpdateTopic(*store.Value(), id, std::move(topic));
    if (updated.IsErr()) return Fail(fmt, updated.Error());
    PrintUpdated(fmt, "topic", updated.Value().name, TopicToJson(updated.Value()));
    return 0;
}

// ---------------------------------------------------------------------------
// book progress
// ---------------------------------------------------------------------------
int HandleBookProgress(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    if (args.positional.empty() || !HasFlag(args, "status")) {
        return Fail(fmt, Error::Validation("BookProgress", "Usage: homelib book progress <id> --status <status> [--notes <text>]"));
    }
    auto status = ParseReadingStatus(GetFlag(args, "status"));
    if (status.IsErr()) return Fail(fmt, Error::Validation("BookProgress", status.Error()));

    std::optional<std::string> notes;
    if (HasFlag(args, "notes")) notes = GetFlag(args, "notes");

    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto record = UpdateReadingProgress(*store.Value(), args.positional[0], status.Value(), notes);
    if (record.IsErr()) return Fail(fmt, record.Error());

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(BookRecordToJson(record.Value()));
    } else {
        fmt.PrintSuccess("Marked \"" + record.Value().book.title + "\" as " +
                         ReadingStatusName(status.Value()));
    }
    return 0;
}

// ---------------------------------------------------------------------------
// <kind> list
// ---------------------------------------------------------------------------
int RunList(CommandContext& ctx, const CommandArgs& args, EntityKind kind) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto rows = ListEntities(*store.Value(), kind);
    if (rows.IsErr()) return Fail(fmt, rows.Error());

    if (fmt.IsJsonMode()) {
        auto arr = nlohmann::json::array();
        for (const auto& row : rows.Value()) arr.push_back(EntitySummaryToJson(row));
        fmt.PrintJson(arr);
        return 0;
    }
    if (rows.Value().empty()) {
        fmt.PrintSuccess(std::string("No ") + EntityKindName(kind) + " records");
        return 0;
    }

    std::vector<std::string> headers = {"Name", "Id"};
    if (kind != EntityKind::Book) headers.emplace_back("Books");
    if (kind == EntityKind::Series) headers.emplace_back("Authors");

    std::vector<std::vector<std::string>> table;
    for (const auto& row : rows.Value()) {
        std::vector<std::string> cells = {row.ref.name, row.ref.id};
        if (row.book_count) cells.push_back(std::to_string(*row.book_count));
        if (kind == EntityKind::Series) cells.push_back(RefNames(row.authors));
        table.push_back(std::move(cells));
    }
    fmt.PrintTable(headers, table);
    return 0;
}

// ---------------------------------------------------------------------------
// library stats
// ---------------------------------------------------------------------------
int HandleLibraryStats(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto stats = ComputeLibraryStats(*store.Value());
    if (stats.IsErr()) return Fail(fmt, stats.Error());
    const auto& s = stats.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(LibraryStatsToJson(s));
        return 0;
    }
    fmt.PrintTable({"Kind", "Count"},
                   {{"Books", std::to_string(s.books)},
                    {"Authors", std::to_string(s.authors)},
                    {"Publishers", std::to_string(s.publishers)},
                    {"Series", std::to_string(s.series)},
                    {"Genres", std::to_string(s.genres)},
                    {"Topics", std::to_string(s.topics)},
                    {"Categories", std::to_string(s.categories)}});
    fmt.PrintTable({"Reading status", "Books"},
                   {{"unread", std::to_string(s.unread)},
                    {"reading", std::to_string(s.reading)},
                    {"completed", std::to_string(s.completed)}});
    return 0;
}

// ---------------------------------------------------------------------------
// library export
// ---------------------------------------------------------------------------
int HandleLibraryExport(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    std::string path = GetFlag(args, "file");
    if (path.empty() && !args.positional.empty()) path = args.positional[0];

    if (path.empty()) {
        auto doc = ExportLibrary(*store.Value());
        if (doc.IsErr()) return Fail(fmt, doc.Error());
        *ctx.out << doc.Value().dump(2) << "\n";
        return 0;
    }

    auto written = WriteLibraryFile(*store.Value(), path);
    if (written.IsErr()) return Fail(fmt, written.Error());
    fmt.PrintSuccess("Exported library to " + path);
    return 0;
}

// ---------------------------------------------------------------------------
// library import
// ---------------------------------------------------------------------------
int HandleLibraryImport(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    std::string path = GetFlag(args, "file");
    if (path.empty() && !args.positional.empty()) path = args.positional[0];
    if (path.empty()) {
        return Fail(fmt, Error::Validation("LibraryImport", "Missing file. Usage: homelib library import <path>"));
    }

    auto batch = ReadLibraryFile(path);
    if (batch.IsErr()) return Fail(fmt, batch.Error());

    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto result = ImportBatch(*store.Value(), batch.Value());
    if (result.IsErr()) return Fail(fmt, result.Error());
    const auto& r = result.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(ImportResultToJson(r));
        return r.success ? 0 : 1;
    }

    const auto row = [](const char* kind, int imported, int skipped) {
        return std::vector<std::string>{kind, std::to_string(imported), std::to_string(skipped)};
    };
    fmt.PrintTable({"Kind", "Imported", "Skipped"},
                   {row("Categories", r.imported.categories, r.skipped.categories),
                    row("Authors", r.imported.authors, r.skipped.authors),
                    row("Publishers", r.imported.publishers, r.skipped.publishers),
                    row("Genres", r.imported.genres, r.skipped.genres),
                    row("Topics", r.imported.topics, r.skipped.topics),
                    row("Series", r.imported.series, r.skipped.series),
                    row("Books", r.imported.books, r.skipped.books)});
    for (const auto& message : r.errors) {
        fmt.PrintWarning(message);
    }
    if (r.success) {
        fmt.PrintSuccess("Imported " + std::to_string(r.imported.Total()) + " record(s)");
    }
    return r.success ? 0 : 1;
}

// ---------------------------------------------------------------------------
// maintenance check
// ---------------------------------------------------------------------------
int HandleMaintenanceCheck(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto report = IntegrityCheck(*store.Value());
    if (report.IsErr()) return Fail(fmt, report.Error());
    const auto& r = report.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(IntegrityReportToJson(r));
        return r.is_valid ? 0 : 1;
    }
    if (r.is_valid) {
        fmt.PrintSuccess("Library is consistent");
        return 0;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto& [tag, count] : r.summary) {
        if (count > 0) rows.push_back({tag, std::to_string(count)});
    }
    fmt.PrintTable({"Rule", "Violations"}, rows);
    fmt.PrintViolations(r.violations);
    return 1;
}

// ---------------------------------------------------------------------------
// maintenance cleanup
// ---------------------------------------------------------------------------
int HandleMaintenanceCleanup(CommandContext& ctx, const CommandArgs& args) {
    auto fmt = MakeFormatter(ctx, args);
    auto store = ctx.open_store();
    if (store.IsErr()) return Fail(fmt, store.Error());

    auto result = CleanupOrphans(*store.Value());
    if (result.IsErr()) return Fail(fmt, result.Error());
    const auto& r = result.Value();

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(CleanupResultToJson(r));
        return 0;
    }
    if (r.Total() == 0) {
        fmt.PrintSuccess("No orphaned records");
        return 0;
    }
    std::vector<std::vector<std::string>> rows;
    for (const auto* group : {&r.deleted_authors, &r.deleted_publishers, &r.deleted_series}) {
        for (const auto& ref : *group) {
            rows.push_back({EntityKindLabel(ref.kind), ref.name, ref.id});
        }
    }
    fmt.PrintTable({"Kind", "Name", "Id"}, rows);
    fmt.PrintSuccess("Removed " + std::to_string(r.Total()) + " orphaned record(s) in " +
                     std::to_string(r.passes) + " pass(es)");
    return 0;
}

// ---------------------------------------------------------------------------
// Top-level help formatting
// ---------------------------------------------------------------------------
struct Ansi {
    std::ostream& out;
    bool color;

    Ansi& Bold(const std::string& s) {
        if (color) out << ansi::kBold;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Dim(const std::string& s) {
        if (color) out << ansi::kDim;
        out << s;
        if (color) out << ansi::kReset;
        return *this;
    }

    Ansi& Normal(const std::string& s) {
        out << s;
        return *this;
    }

    Ansi& Nl() {
        out << "\n";
        return *this;
    }
};

} // anonymous namespace

void PrintTopLevelHelp(const CommandRouter& router, std::ostream& out, bool color) {
    Ansi a{out, color};

    a.Bold("homelib").Normal(" - home library catalogue").Nl().Nl();
    a.Dim("  Keeps books, authors, publishers and series consistent: no record is left").Nl();
    a.Dim("  without the links it needs. All commands accept --json.").Nl();

    out << "\n";
    a.Bold("USAGE").Nl();
    out << "  homelib [global-flags] <group> <action> [args] [flags]\n";

    const std::vector<std::string> group_order = {
        "book", "author", "publisher", "series", "category",
        "genre", "topic", "library", "maintenance"};

    constexpr size_t kLeft = 34;
    for (const auto& group : group_order) {
        if (!router.HasGroup(group)) continue;
        out << "\n";
        std::string label = group;
        std::transform(label.begin(), label.end(), label.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        a.Bold(label);
        auto desc = router.GroupDescription(group);
        if (!desc.empty()) a.Dim(" - " + desc);
        a.Nl();

        for (const auto& cmd : router.CommandsForGroup(group)) {
            std::string left = "  " + group + " " + cmd.action;
            size_t pad = left.size() < kLeft ? kLeft - left.size() : 2;
            out << left << std::string(pad, ' ') << cmd.description << "\n";
        }
    }

    out << "\n";
    a.Bold("SERVER").Nl();
    out << "  mcp serve                         JSON-RPC tool server over stdin/stdout\n";

    out << "\n";
    a.Bold("GLOBAL FLAGS").Nl();
    struct GlobalFlag {
        const char* flag;
        const char* desc;
    };
    const GlobalFlag global_flags[] = {
        {"--db <path>",           "Library database (default: library.db, env HOMELIB_DB)"},
        {"-c, --config <path>",   "YAML config file (default: homelib.yaml if present)"},
        {"--busy-timeout <ms>",   "SQLite busy timeout"},
        {"--json",                "JSON output"},
        {"--color / --no-color",  "Force or disable colored output"},
        {"--log-json",            "Log as JSON lines"},
        {"--log-file <path>",     "Also append JSON log lines to a file"},
        {"-q, --quiet",           "Errors only"},
        {"-v / -vv",              "Info / debug logging"},
        {"--version",             "Print version"},
    };
    for (const auto& gf : global_flags) {
        std::string left = std::string("  ") + gf.flag;
        size_t pad = left.size() < kLeft ? kLeft - left.size() : 2;
        out << left << std::string(pad, ' ') << gf.desc << "\n";
    }

    out << "\n";
    a.Bold("EXIT CODES").Nl();
    out << "  0  Success          2  Not found          3  Blocked by invariant\n";
    out << "  4  Invalid input    5  Storage error      6  Parse error\n";
    out << "  7  Config error     1  Check failed       99 Internal error\n";

    out << "\n";
    a.Dim("  Use \"homelib <group> --help\" for the actions of a group.").Nl();
}

// ---------------------------------------------------------------------------
// RegisterAllCommands
// ---------------------------------------------------------------------------
void RegisterAllCommands(CommandRouter& router, CommandContext& ctx) {
    auto bind = [&ctx](int (*handler)(CommandContext&, const CommandArgs&)) {
        return [&ctx, handler](const CommandArgs& args) { return handler(ctx, args); };
    };
    auto bind_delete = [&ctx](const std::string& kind, DeleteFn fn) {
        return [&ctx, kind, fn](const CommandArgs& args) { return RunDelete(ctx, args, kind, fn); };
    };
    auto bind_list = [&ctx](EntityKind kind) {
        return [&ctx, kind](const CommandArgs& args) { return RunList(ctx, args, kind); };
    };

    const std::vector<FlagHelp> book_input_flags = {
        {"file", "<path>", "JSON object with camelCase book fields", false},
        {"title", "<text>", "Title", false},
        {"publisher", "<id>", "Publisher id", false},
        {"category", "<id>", "Category id (default: General)", false},
        {"authors", "<id,id>", "Author ids, replaces the current list", false},
        {"genres", "<id,id>", "Genre ids", false},
        {"topics", "<id,id>", "Topic ids", false},
        {"series", "<id>", "Series id (empty clears)", false},
        {"series-order", "<n>", "Position in the series", false},
        {"status", "<status>", "unread, reading or completed", false},
        {"rating", "<0-5>", "Rating", false},
        {"year", "<n>", "Publication year", false},
        {"pages", "<n>", "Page count", false},
        {"isbn", "<isbn>", "ISBN", false},
    };

    // -----------------------------------------------------------------------
    // Groups
    // -----------------------------------------------------------------------
    router.DescribeGroup("book", "Show, create, update and delete books", {
        "$ homelib book show 3f6c...",
        "$ homelib book impact 3f6c...",
        "$ homelib book delete 3f6c... --cascade",
        "$ homelib book update 3f6c... --authors=a1,a2 --status=reading",
    });
    router.DescribeGroup("author", "List, create, update, inspect and delete authors");
    router.DescribeGroup("publisher", "List, create, update and delete publishers");
    router.DescribeGroup("series", "List, create, update and delete series", {
        "$ homelib series update s1 --authors=a1,a2",
    });
    router.DescribeGroup("category", "List, create, update and delete categories");
    router.DescribeGroup("genre", "List, create, update and delete genres");
    router.DescribeGroup("topic", "List, create, update and delete topics");
    router.DescribeGroup("library", "Statistics, export and import", {
        "$ homelib library export backup.json",
        "$ homelib --json library import backup.json",
    });
    router.DescribeGroup("maintenance", "Integrity check and orphan cleanup");

    // -----------------------------------------------------------------------
    // book
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "homelib book show <id>";
        help.args_description = "<id>    Book id";
        router.Register("book", "show", "Show a book with its links",
                        bind(HandleBookShow), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib book create --title <text> --publisher <id> --authors <ids> [flags]";
        help.flags = book_input_flags;
        help.flags.push_back({"id", "<id>", "Use this id instead of a generated one", false});
        help.examples = {
            "homelib book create --title=Dune --publisher=P1 --authors=A1",
            "homelib book create --file=book.json",
        };
        router.Register("book", "create", "Create a book",
                        bind(HandleBookCreate), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib book update <id> [flags] [--cascade]";
        help.args_description = "<id>    Book id";
        help.long_description =
            "Fields not given keep their current value. Dropping the last book of an\n"
            "author, publisher or series is blocked unless --cascade is given.";
        help.flags = book_input_flags;
        help.flags.push_back({"cascade", "", "Delete records the update leaves without books", false});
        router.Register("book", "update", "Update a book",
                        bind(HandleBookUpdate), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib book delete <id> [--cascade]";
        help.args_description = "<id>    Book id";
        help.long_description =
            "Blocked when the book is the last one of an author, its publisher or its\n"
            "series. --cascade deletes those records in the same transaction.";
        help.flags = {{"cascade", "", "Delete records left without books", false}};
        help.examples = {
            "homelib book delete 3f6c...",
            "homelib --json book delete 3f6c... --cascade",
        };
        router.Register("book", "delete", "Delete a book",
                        bind(HandleBookDelete), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib book impact <id> [update flags]";
        help.args_description = "<id>    Book id";
        help.long_description =
            "Without update flags, previews deleting the book. With --file or any\n"
            "field flag, previews that update. Nothing is written.";
        help.flags = book_input_flags;
        router.Register("book", "impact", "Preview what a delete or update would orphan",
                        bind(HandleBookImpact), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib book progress <id> --status <status> [--notes <text>]";
        help.args_description = "<id>    Book id";
        help.flags = {{"status", "<status>", "unread, reading or completed", true},
                      {"notes", "<text>", "Reading notes (empty clears, absent keeps)", false}};
        router.Register("book", "progress", "Set the reading status of a book",
                        bind(HandleBookProgress), std::move(help));
    }
    router.Register("book", "list", "List books by title", bind_list(EntityKind::Book));

    // -----------------------------------------------------------------------
    // author
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "homelib author create --name <name> [--bio <text>]";
        help.flags = {{"name", "<name>", "Author name", true},
                      {"bio", "<text>", "Biography", false},
                      {"id", "<id>", "Use this id", false}};
        router.Register("author", "create", "Create an author",
                        bind(HandleAuthorCreate), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib author update <id> [--name <name>] [--bio <text>]";
        help.flags = {{"name", "<name>", "Author name", false},
                      {"bio", "<text>", "Biography (empty clears)", false}};
        router.Register("author", "update", "Rename an author or edit the biography",
                        bind(HandleAuthorUpdate), std::move(help));
    }
    router.Register("author", "list", "List authors with their book counts",
                    bind_list(EntityKind::Author));
    {
        CommandHelp help;
        help.usage = "homelib author delete <id>";
        help.long_description =
            "Blocked while books link the author, or while the author is the only\n"
            "author of a series.";
        router.Register("author", "delete", "Delete an author",
                        bind_delete("author", DeleteAuthor), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib author impact <id>";
        router.Register("author", "impact", "List series that depend on this author alone",
                        bind(HandleAuthorImpact), std::move(help));
    }

    // -----------------------------------------------------------------------
    // publisher, series, category, genre, topic
    // -----------------------------------------------------------------------
    {
        CommandHelp help;
        help.usage = "homelib publisher create --name <name> [--location <text>] [--website <url>]";
        help.flags = {{"name", "<name>", "Publisher name", true},
                      {"location", "<text>", "Location", false},
                      {"website", "<url>", "Website", false},
                      {"id", "<id>", "Use this id", false}};
        router.Register("publisher", "create", "Create a publisher",
                        bind(HandlePublisherCreate), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib publisher update <id> [--name <name>] [--location <text>] [--website <url>]";
        help.flags = {{"name", "<name>", "Publisher name", false},
                      {"location", "<text>", "Location (empty clears)", false},
                      {"website", "<url>", "Website (empty clears)", false}};
        router.Register("publisher", "update", "Update a publisher",
                        bind(HandlePublisherUpdate), std::move(help));
    }
    router.Register("publisher", "list", "List publishers with their book counts",
                    bind_list(EntityKind::Publisher));
    router.Register("publisher", "delete", "Delete a publisher without books",
                    bind_delete("publisher", DeletePublisher));
    {
        CommandHelp help;
        help.usage = "homelib series create --name <name> --authors <id,id>";
        help.flags = {{"name", "<name>", "Series name", true},
                      {"authors", "<id,id>", "Author ids", true},
                      {"description", "<text>", "Description", false},
                      {"id", "<id>", "Use this id", false}};
        router.Register("series", "create", "Create a series",
                        bind(HandleSeriesCreate), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib series update <id> [--name <name>] [--authors <id,id>]";
        help.long_description =
            "--authors replaces the whole author set. A series keeps at least one\n"
            "author; an empty set is rejected.";
        help.flags = {{"name", "<name>", "Series name", false},
                      {"authors", "<id,id>", "Author ids, replaces the current set", false},
                      {"description", "<text>", "Description (empty clears)", false}};
        router.Register("series", "update", "Rename a series or replace its authors",
                        bind(HandleSeriesUpdate), std::move(help));
    }
    router.Register("series", "list", "List series with book counts and authors",
                    bind_list(EntityKind::Series));
    router.Register("series", "delete", "Delete a series without books",
                    bind_delete("series", DeleteSeries));
    {
        CommandHelp help;
        help.usage = "homelib category create --name <name> [--color <hex>]";
        help.flags = {{"name", "<name>", "Category name", true},
                      {"description", "<text>", "Description", false},
                      {"color", "<hex>", "Display color", false},
                      {"id", "<id>", "Use this id", false}};
        router.Register("category", "create", "Create a category",
                        bind(HandleCategoryCreate), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib category update <id> [--name <name>] [--color <hex>]";
        help.flags = {{"name", "<name>", "Category name", false},
                      {"description", "<text>", "Description (empty clears)", false},
                      {"color", "<hex>", "Display color (empty clears)", false}};
        router.Register("category", "update", "Update a category",
                        bind(HandleCategoryUpdate), std::move(help));
    }
    router.Register("category", "list", "List categories with their book counts",
                    bind_list(EntityKind::Category));
    router.Register("category", "delete", "Delete a category without books",
                    bind_delete("category", DeleteCategory));
    router.Register("genre", "create", "Create a genre", bind(HandleGenreCreate));
    router.Register("genre", "update", "Rename a genre (--name, --description)",
                    bind(HandleGenreUpdate));
    router.Register("genre", "list", "List genres with their book counts",
                    bind_list(EntityKind::Genre));
    router.Register("genre", "delete", "Delete a genre and its book links",
                    bind_delete("genre", DeleteGenre));
    router.Register("topic", "create", "Create a topic", bind(HandleTopicCreate));
    router.Register("topic", "update", "Rename a topic (--name, --description)",
                    bind(HandleTopicUpdate));
    router.Register("topic", "list", "List topics with their book counts",
                    bind_list(EntityKind::Topic));
    router.Register("topic", "delete", "Delete a topic and its book links",
                    bind_delete("topic", DeleteTopic));

    // -----------------------------------------------------------------------
    // library
    // -----------------------------------------------------------------------
    router.Register("library", "stats", "Record totals and reading status",
                    bind(HandleLibraryStats));
    {
        CommandHelp help;
        help.usage = "homelib library export [<path>]";
        help.args_description = "<path>    Output file (default: stdout)";
        router.Register("library", "export", "Export the library as JSON",
                        bind(HandleLibraryExport), std::move(help));
    }
    {
        CommandHelp help;
        help.usage = "homelib library import <path>";
        help.args_description = "<path>    Export file to merge";
        help.long_description =
            "Records whose id already exists are skipped. Records that fail are\n"
            "reported and the rest are kept. Orphans are cleaned up afterwards.";
        router.Register("library", "import", "Merge an export file into the library",
                        bind(HandleLibraryImport), std::move(help));
    }

    // -----------------------------------------------------------------------
    // maintenance
    // -----------------------------------------------------------------------
    router.Register("maintenance", "check", "Scan the library for integrity violations",
                    bind(HandleMaintenanceCheck));
    router.Register("maintenance", "cleanup", "Delete authors, publishers and series left without links",
                    bind(HandleMaintenanceCleanup));
}

} // namespace homelib
