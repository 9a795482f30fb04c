#include <homelib/mcp/library_tools.hpp>

#include <homelib/engine/bulk_merge.hpp>
#include <homelib/engine/impact_analyzer.hpp>
#include <homelib/engine/library_stats.hpp>
#include <homelib/engine/lifecycle_enforcer.hpp>
#include <homelib/io/json_mapping.hpp>
#include <homelib/io/library_codec.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace homelib {

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolResult MakeParamError(const std::string& tool, const std::string& msg) {
    return ToolResult::Failure(Error::Validation(tool, msg));
}

template <typename T, typename ToJson>
ToolResult FromResult(const Result<T, Error>& result, ToJson to_json) {
    if (result.IsErr()) return ToolResult::Failure(result.Error());
    return ToolResult::Json(to_json(result.Value()));
}

std::optional<std::string> RequireString(const nlohmann::json& params,
                                         const std::string& tool,
                                         const std::string& key,
                                         ToolResult& out_error) {
    if (!params.contains(key) || !params[key].is_string() ||
        params[key].get<std::string>().empty()) {
        out_error = MakeParamError(tool, "Missing required parameter: " + key);
        return std::nullopt;
    }
    return params[key].get<std::string>();
}

// Overlays params[key] onto `out` when present. A wrong type is a parameter
// error; for optional fields null or "" clears the value.
bool OverlayString(const nlohmann::json& params, const std::string& tool,
                   const std::string& key, std::string& out, ToolResult& out_error) {
    if (!params.contains(key)) return true;
    if (!params[key].is_string()) {
        out_error = MakeParamError(tool, "Parameter " + key + " must be a string");
        return false;
    }
    out = params[key].get<std::string>();
    return true;
}

bool OverlayOptString(const nlohmann::json& params, const std::string& tool,
                      const std::string& key, std::optional<std::string>& out,
                      ToolResult& out_error) {
    if (!params.contains(key)) return true;
    if (params[key].is_null()) {
        out.reset();
        return true;
    }
    std::string value;
    if (!OverlayString(params, tool, key, value, out_error)) return false;
    out = value.empty() ? std::nullopt : std::optional<std::string>(std::move(value));
    return true;
}

bool OptBool(const nlohmann::json& params, const std::string& key, bool default_val) {
    if (params.contains(key) && params[key].is_boolean()) {
        return params[key].get<bool>();
    }
    return default_val;
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}};
}

nlohmann::json StringArrayProp(const std::string& desc) {
    return {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", desc}};
}

nlohmann::json ObjectProp(const std::string& desc) {
    return {{"type", "object"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

nlohmann::json IdSchema(const std::string& desc) {
    return MakeSchema({{"id", StringProp(desc)}}, {"id"});
}

nlohmann::json NoParams() {
    return MakeSchema(nlohmann::json::object(), nlohmann::json::array());
}

const char* const kBookStateHelp =
    "Book fields in camelCase: title, publisherId, categoryId, authorIds, genreIds, "
    "topicIds, seriesId, seriesOrder, readingStatus, rating, isbn, publicationYear, "
    "pages, description, coverImage, notes";

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// delete_book
ToolResult HandleDeleteBook(IEntityStore& store, const nlohmann::json& params) {
    ToolResult err;
    auto id = RequireString(params, "delete_book", "id", err);
    if (!id) return err;
    return FromResult(DeleteBook(store, *id, OptBool(params, "cascadeOrphans", false)),
                      DeletionResultToJson);
}

// update_book. Fields missing from newState keep their current value.
ToolResult HandleUpdateBook(IEntityStore& store, const nlohmann::json& params) {
    ToolResult err;
    auto id = RequireString(params, "update_book", "id", err);
    if (!id) return err;
    if (!params.contains("newState")) {
        return MakeParamError("update_book", "Missing required parameter: newState");
    }

    auto current = GetBook(store, *id);
    if (current.IsErr()) return ToolResult::Failure(current.Error());
    auto input = BookInputFromJson(params["newState"], ToBookInput(current.Value()));
    if (input.IsErr()) return ToolResult::Failure(input.Error());

    return FromResult(UpdateBook(store, *id, input.Value(),
                                 OptBool(params, "cascadeOrphans", false)),
                      UpdateResultToJson);
}

// create_book
ToolResult HandleCreateBook(IEntityStore& store, const nlohmann::json& params) {
    if (!params.contains("book")) {
        return MakeParamError("create_book", "Missing required parameter: book");
    }
    auto input = BookInputFromJson(params["book"]);
    if (input.IsErr()) return ToolResult::Failure(input.Error());

    std::optional<std::string> id;
    if (params.contains("id") && params["id"].is_string()) {
        id = params["id"].get<std::string>();
    }
    return FromResult(CreateBook(store, input.Value(), id), BookRecordToJson);
}

// get_book
ToolResult HandleGetBook(IEntityStore& store, const nlohmann::json& params) {
    ToolResult err;
    auto id = RequireString(params, "get_book", "id", err);
    if (!id) return err;
    return FromResult(GetBook(store, *id), BookRecordToJson);
}

// check_book_delete_impact
ToolResult HandleCheckBookDeleteImpact(IEntityStore& store, const nlohmann::json& params) {
    ToolResult err;
    auto id = RequireString(params, "check_book_delete_impact", "id", err);
    if (!id) return err;
    return FromResult(CheckDeleteImpact(store, *id), ImpactReportToJson);
}

// check_book_update_impact
ToolResult HandleCheckBookUpdateImpact(IEntityStore& store, const nlohmann::json& params) {
    ToolResult err;
    auto id = RequireString(params, "check_book_update_impact", "id", err);
    if (!id) return err;
    if (!params.contains("newState")) {
        return MakeParamError("check_book_update_impact", "Missing required parameter: newState");
    }

    auto current = GetBook(store, *id);
    if (current.IsErr()) return ToolResult::Failure(current.Error());
    auto input = BookInputFromJson(params["newState"], ToBookInput(current.Value()));
    if (input.IsErr()) return ToolResult::Failure(input.Error());

    return FromResult(CheckUpdateImpact(store, *id, input.Value()), ImpactReportToJson);
}

// check_author_delete_impact
ToolResult HandleCheckAuthorDeleteImpact(IEntityStore& store, const nlohmann::json& params) {
    ToolResult err;
    auto id = RequireString(params, "check_author_delete_impact", "id", err);
    if (!id) return err;
    return FromResult(CheckAuthorDeleteImpact(store, *id), AuthorDeleteImpactToJson);
}

// delete_author, delete_publisher, delete_series
using DeleteFn = Result<DeletionResult, Error> (*)(IEntityStore&, std::string_view);

ToolResult HandleSingleDelete(IEntityStore& store, const nlohmann::json& params,
                              const std::string& tool, DeleteFn fn) {
    ToolResult err;
    auto id = RequireString(params, tool, "id", err);
    if (!id) return err;
    return FromResult(fn(store, *id), DeletionResultToJson);
}

// update_author, update_publisher, update_genre, update_topic,
// update_category. Fields missing from params keep their current value.
template <typename T, typename Apply, typename ToJson>
ToolResult HandleRecordUpdate(IEntityStore& store, const nlohmann::json& params,
                              const std::string& tool, EntityKind kind,
                              Result<std::optional<T>, Error> (IEntityStore::*find)(std::string_view),
                              Result<T, Error> (*update)(IEntityStore&, std::string_view, T),
                              Apply apply, ToJson to_json) {
    ToolResult err;
    auto id = RequireString(params, tool, "id", err);
    if (!id) return err;

    auto found = (store.*find)(*id);
    if (found.IsErr()) return ToolResult::Failure(found.Error());
    if (!found.Value()) {
        return ToolResult::Failure(Error::NotFound(tool, EntityKindName(kind), *id));
    }
    T record = *found.Value();
    if (!apply(record, err)) return err;
    return FromResult(update(store, *id, std::move(record)), to_json);
}

// update_series. authorIds, when given, replaces the whole author set.
ToolResult HandleUpdateSeries(IEntityStore& store, const nlohmann::json& params) {
    const std::string tool = "update_series";
    ToolResult err;
    auto id = RequireString(params, tool, "id", err);
    if (!id) return err;

    auto found = store.FindSeries(*id);
    if (found.IsErr()) return ToolResult::Failure(found.Error());
    if (!found.Value()) return ToolResult::Failure(Error::NotFound(tool, "series", *id));
    Series series = *found.Value();
    if (!OverlayString(params, tool, "name", series.name, err) ||
        !OverlayOptString(params, tool, "description", series.description, err)) {
        return err;
    }

    std::vector<std::string> author_ids;
    if (params.contains("authorIds")) {
        const auto& ids = params["authorIds"];
        if (!ids.is_array()) return MakeParamError(tool, "Parameter authorIds must be an array");
        for (const auto& item : ids) {
            if (!item.is_string()) {
                return MakeParamError(tool, "Parameter authorIds must hold id strings");
            }
            author_ids.push_back(item.get<std::string>());
        }
    } else {
        auto linked = store.ListLinkedIds(Relation::SeriesAuthor, LinkSide::Source, *id);
        if (linked.IsErr()) return ToolResult::Failure(linked.Error());
        author_ids = std::move(linked).Value();
    }
    return FromResult(UpdateSeries(store, *id, std::move(series), author_ids),
                      SeriesRecordToJson);
}

// update_reading_progress
ToolResult HandleUpdateReadingProgress(IEntityStore& store, const nlohmann::json& params) {
    const std::string tool = "update_reading_progress";
    ToolResult err;
    auto id = RequireString(params, tool, "id", err);
    if (!id) return err;
    auto status_text = RequireString(params, tool, "readingStatus", err);
    if (!status_text) return err;
    auto status = ParseReadingStatus(*status_text);
    if (status.IsErr()) return MakeParamError(tool, status.Error());

    std::optional<std::string> notes;
    if (params.contains("notes")) {
        if (params["notes"].is_null()) {
            notes = std::string();
        } else if (params["notes"].is_string()) {
            notes = params["notes"].get<std::string>();
        } else {
            return MakeParamError(tool, "Parameter notes must be a string or null");
        }
    }
    return FromResult(UpdateReadingProgress(store, *id, status.Value(), notes), BookRecordToJson);
}

// list_entities
ToolResult HandleListEntities(IEntityStore& store, const nlohmann::json& params) {
    ToolResult err;
    auto kind_text = RequireString(params, "list_entities", "kind", err);
    if (!kind_text) return err;
    auto kind = ParseEntityKind(*kind_text);
    if (kind.IsErr()) return MakeParamError("list_entities", kind.Error());

    auto rows = ListEntities(store, kind.Value());
    if (rows.IsErr()) return ToolResult::Failure(rows.Error());
    auto items = nlohmann::json::array();
    for (const auto& row : rows.Value()) items.push_back(EntitySummaryToJson(row));
    return ToolResult::Json({{"kind", EntityKindName(kind.Value())}, {"items", std::move(items)}});
}

// import_batch
ToolResult HandleImportBatch(IEntityStore& store, const nlohmann::json& params) {
    if (!params.contains("records") || !params["records"].is_object()) {
        return MakeParamError("import_batch", "Missing required parameter: records");
    }
    auto batch = DecodeLibraryExport(params["records"]);
    if (batch.IsErr()) return ToolResult::Failure(batch.Error());
    return FromResult(ImportBatch(store, batch.Value()), ImportResultToJson);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterLibraryTools
// ---------------------------------------------------------------------------
void RegisterLibraryTools(ToolRegistry& registry, IEntityStore& store) {
    registry.Register(
        "delete_book",
        "Delete a book. Blocked when it would leave an author, its publisher or its "
        "series without books, unless cascadeOrphans is true.",
        MakeSchema({{"id", StringProp("Book id")},
                    {"cascadeOrphans", BoolProp("Also delete records left without books")}},
                   {"id"}),
        [&store](const nlohmann::json& p) { return HandleDeleteBook(store, p); });

    registry.Register(
        "update_book",
        "Update a book. Link lists in newState replace the current ones.",
        MakeSchema({{"id", StringProp("Book id")},
                    {"newState", ObjectProp(kBookStateHelp)},
                    {"cascadeOrphans", BoolProp("Also delete records left without books")}},
                   {"id", "newState"}),
        [&store](const nlohmann::json& p) { return HandleUpdateBook(store, p); });

    registry.Register(
        "create_book",
        "Create a book with its author, genre and topic links.",
        MakeSchema({{"book", ObjectProp(kBookStateHelp)},
                    {"id", StringProp("Optional id; generated when absent")}},
                   {"book"}),
        [&store](const nlohmann::json& p) { return HandleCreateBook(store, p); });

    registry.Register(
        "get_book", "Get a book with its link ids.", IdSchema("Book id"),
        [&store](const nlohmann::json& p) { return HandleGetBook(store, p); });

    registry.Register(
        "check_book_delete_impact",
        "Preview which authors, publisher and series deleting a book would orphan.",
        IdSchema("Book id"),
        [&store](const nlohmann::json& p) { return HandleCheckBookDeleteImpact(store, p); });

    registry.Register(
        "check_book_update_impact",
        "Preview which records an update would orphan. Nothing is written.",
        MakeSchema({{"id", StringProp("Book id")},
                    {"newState", ObjectProp(kBookStateHelp)}},
                   {"id", "newState"}),
        [&store](const nlohmann::json& p) { return HandleCheckBookUpdateImpact(store, p); });

    registry.Register(
        "check_author_delete_impact",
        "List series for which the author is the only author.",
        IdSchema("Author id"),
        [&store](const nlohmann::json& p) { return HandleCheckAuthorDeleteImpact(store, p); });

    registry.Register(
        "delete_author",
        "Delete an author with no books who is not the sole author of a series.",
        IdSchema("Author id"),
        [&store](const nlohmann::json& p) {
            return HandleSingleDelete(store, p, "delete_author", DeleteAuthor);
        });

    registry.Register(
        "delete_publisher", "Delete a publisher with no books.", IdSchema("Publisher id"),
        [&store](const nlohmann::json& p) {
            return HandleSingleDelete(store, p, "delete_publisher", DeletePublisher);
        });

    registry.Register(
        "delete_series", "Delete a series with no books.", IdSchema("Series id"),
        [&store](const nlohmann::json& p) {
            return HandleSingleDelete(store, p, "delete_series", DeleteSeries);
        });

    registry.Register(
        "update_author", "Rename an author or edit the biography.",
        MakeSchema({{"id", StringProp("Author id")},
                    {"name", StringProp("New name")},
                    {"bio", StringProp("Biography; null or empty clears")}},
                   {"id"}),
        [&store](const nlohmann::json& p) {
            return HandleRecordUpdate(
                store, p, "update_author", EntityKind::Author, &IEntityStore::FindAuthor,
                UpdateAuthor,
                [&p](Author& a, ToolResult& e) {
                    return OverlayString(p, "update_author", "name", a.name, e) &&
                           OverlayOptString(p, "update_author", "bio", a.bio, e);
                },
                AuthorToJson);
        });

    registry.Register(
        "update_publisher", "Rename a publisher or edit its location and website.",
        MakeSchema({{"id", StringProp("Publisher id")},
                    {"name", StringProp("New name")},
                    {"location", StringProp("Location; null or empty clears")},
                    {"website", StringProp("Website; null or empty clears")}},
                   {"id"}),
        [&store](const nlohmann::json& p) {
            return HandleRecordUpdate(
                store, p, "update_publisher", EntityKind::Publisher,
                &IEntityStore::FindPublisher, UpdatePublisher,
                [&p](Publisher& r, ToolResult& e) {
                    return OverlayString(p, "update_publisher", "name", r.name, e) &&
                           OverlayOptString(p, "update_publisher", "location", r.location, e) &&
                           OverlayOptString(p, "update_publisher", "website", r.website, e);
                },
                PublisherToJson);
        });

    registry.Register(
        "update_series",
        "Rename a series or replace its authors. authorIds replaces the whole set "
        "and may not be empty.",
        MakeSchema({{"id", StringProp("Series id")},
                    {"name", StringProp("New name")},
                    {"description", StringProp("Description; null or empty clears")},
                    {"authorIds", StringArrayProp("Author ids")}},
                   {"id"}),
        [&store](const nlohmann::json& p) { return HandleUpdateSeries(store, p); });

    registry.Register(
        "update_genre", "Rename a genre or edit its description.",
        MakeSchema({{"id", StringProp("Genre id")},
                    {"name", StringProp("New name")},
                    {"description", StringProp("Description; null or empty clears")}},
                   {"id"}),
        [&store](const nlohmann::json& p) {
            return HandleRecordUpdate(
                store, p, "update_genre", EntityKind::Genre, &IEntityStore::FindGenre,
                UpdateGenre,
                [&p](Genre& g, ToolResult& e) {
                    return OverlayString(p, "update_genre", "name", g.name, e) &&
                           OverlayOptString(p, "update_genre", "description", g.description, e);
                },
                GenreToJson);
        });

    registry.Register(
        "update_topic", "Rename a topic or edit its description.",
        MakeSchema({{"id", StringProp("Topic id")},
                    {"name", StringProp("New name")},
                    {"description", StringProp("Description; null or empty clears")}},
                   {"id"}),
        [&store](const nlohmann::json& p) {
            return HandleRecordUpdate(
                store, p, "update_topic", EntityKind::Topic, &IEntityStore::FindTopic,
                UpdateTopic,
                [&p](Topic& t, ToolResult& e) {
                    return OverlayString(p, "update_topic", "name", t.name, e) &&
                           OverlayOptString(p, "update_topic", "description", t.description, e);
                },
                TopicToJson);
        });

    registry.Register(
        "update_category", "Rename a category or edit its description and color.",
        MakeSchema({{"id", StringProp("Category id")},
                    {"name", StringProp("New name")},
                    {"description", StringProp("Description; null or empty clears")},
                    {"color", StringProp("Display color; null or empty clears")}},
                   {"id"}),
        [&store](const nlohmann::json& p) {
            return HandleRecordUpdate(
                store, p, "update_category", EntityKind::Category, &IEntityStore::FindCategory,
                UpdateCategory,
                [&p](Category& c, ToolResult& e) {
                    return OverlayString(p, "update_category", "name", c.name, e) &&
                           OverlayOptString(p, "update_category", "description", c.description, e) &&
                           OverlayOptString(p, "update_category", "color", c.color, e);
                },
                CategoryToJson);
        });

    registry.Register(
        "update_reading_progress",
        "Set a book's reading status. notes replaces the current notes when given; "
        "null clears them.",
        MakeSchema({{"id", StringProp("Book id")},
                    {"readingStatus", StringProp("unread, reading or completed")},
                    {"notes", StringProp("Reading notes")}},
                   {"id", "readingStatus"}),
        [&store](const nlohmann::json& p) { return HandleUpdateReadingProgress(store, p); });

    registry.Register(
        "list_entities",
        "List the records of one kind ordered by name, with book counts and, for "
        "series, their authors.",
        MakeSchema({{"kind", StringProp("book, author, publisher, series, genre, topic "
                                        "or category")}},
                   {"kind"}),
        [&store](const nlohmann::json& p) { return HandleListEntities(store, p); });

    registry.Register(
        "integrity_check", "Scan the whole library for integrity violations.", NoParams(),
        [&store](const nlohmann::json&) {
            return FromResult(IntegrityCheck(store), IntegrityReportToJson);
        });

    registry.Register(
        "cleanup_orphans",
        "Delete authors, publishers and series without books, and series without authors.",
        NoParams(),
        [&store](const nlohmann::json&) {
            return FromResult(CleanupOrphans(store), CleanupResultToJson);
        });

    registry.Register(
        "import_batch",
        "Merge an export document (version, categories, authors, publishers, genres, "
        "topics, series, books). Existing ids are skipped.",
        MakeSchema({{"records", ObjectProp("Library export document")}}, {"records"}),
        [&store](const nlohmann::json& p) { return HandleImportBatch(store, p); });

    registry.Register(
        "export_library", "Export the whole library as one JSON document.", NoParams(),
        [&store](const nlohmann::json&) {
            auto doc = ExportLibrary(store);
            if (doc.IsErr()) return ToolResult::Failure(doc.Error());
            return ToolResult::Json(doc.Value());
        });

    registry.Register(
        "library_stats", "Record totals per kind and reading-status breakdown.", NoParams(),
        [&store](const nlohmann::json&) {
            return FromResult(ComputeLibraryStats(store), LibraryStatsToJson);
        });
}

} // namespace homelib
