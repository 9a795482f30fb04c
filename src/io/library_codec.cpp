#include <homelib/io/library_codec.hpp>

#include <homelib/core/log.hpp>
#include <homelib/core/types.hpp>
#include <homelib/io/json_mapping.hpp>

#include <fstream>
#include <sstream>
#include <tuple>

namespace homelib {

namespace {

using nlohmann::json;

// ---------------------------------------------------------------------------
// RecordReader — typed access to one exported record. The first problem
// is remembered; later reads return empty values.
// ---------------------------------------------------------------------------
class RecordReader {
public:
    explicit RecordReader(const json& j) : j_(j) {}

    std::string Text(const char* key) {
        if (!j_.contains(key) || j_[key].is_null()) return {};
        if (!j_[key].is_string()) {
            Fail(std::string("field '") + key + "' must be a string");
            return {};
        }
        return j_[key].get<std::string>();
    }

    std::optional<std::string> OptText(const char* key) {
        auto value = Text(key);
        if (value.empty()) return std::nullopt;
        return value;
    }

    std::optional<int> OptInt(const char* key) {
        if (!j_.contains(key) || j_[key].is_null()) return std::nullopt;
        if (!j_[key].is_number_integer()) {
            Fail(std::string("field '") + key + "' must be an integer");
            return std::nullopt;
        }
        auto value = JsonIntValue(j_[key]);
        if (!value) Fail(std::string("field '") + key + "' is out of range");
        return value;
    }

    // Accepts [{"id": ..., "name": ...}] as exported, or plain id strings.
    std::vector<std::string> Ids(const char* key) {
        std::vector<std::string> ids;
        if (!j_.contains(key) || j_[key].is_null()) return ids;
        if (!j_[key].is_array()) {
            Fail(std::string("field '") + key + "' must be an array");
            return ids;
        }
        for (const auto& item : j_[key]) {
            if (item.is_string()) {
                ids.push_back(item.get<std::string>());
            } else if (item.is_object() && item.contains("id") && item["id"].is_string()) {
                ids.push_back(item["id"].get<std::string>());
            } else {
                Fail(std::string("field '") + key + "' has an entry without an id");
                return {};
            }
        }
        return ids;
    }

    ReadingStatus Status(const char* key) {
        auto text = Text(key);
        if (text.empty()) return ReadingStatus::Unread;
        auto status = ParseReadingStatus(text);
        if (status.IsErr()) {
            Fail(status.Error());
            return ReadingStatus::Unread;
        }
        return status.Value();
    }

    [[nodiscard]] bool Ok() const { return problem_.empty(); }
    [[nodiscard]] const std::string& Problem() const { return problem_; }

private:
    void Fail(std::string problem) {
        if (problem_.empty()) problem_ = std::move(problem);
    }

    const json& j_;
    std::string problem_;
};

std::string LabelOf(const json& j, const char* key) {
    if (j.is_object() && j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "?";
}

template <typename T>
using Decoded = Result<T, std::string>;

Decoded<Category> DecodeCategory(const json& j) {
    RecordReader r(j);
    Category c{r.Text("id"), r.Text("name"), r.OptText("description"), r.OptText("color"),
               r.Text("createdAt"), r.Text("updatedAt")};
    if (!r.Ok()) return Decoded<Category>::Err(r.Problem());
    return Decoded<Category>::Ok(std::move(c));
}

Decoded<Author> DecodeAuthor(const json& j) {
    RecordReader r(j);
    Author a{r.Text("id"), r.Text("name"), r.OptText("bio"), r.Text("createdAt"),
             r.Text("updatedAt")};
    if (!r.Ok()) return Decoded<Author>::Err(r.Problem());
    return Decoded<Author>::Ok(std::move(a));
}

Decoded<Publisher> DecodePublisher(const json& j) {
    RecordReader r(j);
    Publisher p{r.Text("id"), r.Text("name"), r.OptText("location"), r.OptText("website"),
                r.Text("createdAt"), r.Text("updatedAt")};
    if (!r.Ok()) return Decoded<Publisher>::Err(r.Problem());
    return Decoded<Publisher>::Ok(std::move(p));
}

Decoded<Genre> DecodeGenre(const json& j) {
    RecordReader r(j);
    Genre g{r.Text("id"), r.Text("name"), r.OptText("description"), r.Text("createdAt"),
            r.Text("updatedAt")};
    if (!r.Ok()) return Decoded<Genre>::Err(r.Problem());
    return Decoded<Genre>::Ok(std::move(g));
}

Decoded<Topic> DecodeTopic(const json& j) {
    RecordReader r(j);
    Topic t{r.Text("id"), r.Text("name"), r.OptText("description"), r.Text("createdAt"),
            r.Text("updatedAt")};
    if (!r.Ok()) return Decoded<Topic>::Err(r.Problem());
    return Decoded<Topic>::Ok(std::move(t));
}

Decoded<SeriesRecord> DecodeSeries(const json& j) {
    RecordReader r(j);
    SeriesRecord s;
    s.series = Series{r.Text("id"), r.Text("name"), r.OptText("description"),
                      r.Text("createdAt"), r.Text("updatedAt")};
    s.author_ids = r.Ids("authors");
    if (!r.Ok()) return Decoded<SeriesRecord>::Err(r.Problem());
    return Decoded<SeriesRecord>::Ok(std::move(s));
}

Decoded<BookRecord> DecodeBook(const json& j) {
    RecordReader r(j);
    BookRecord rec;
    Book& b = rec.book;
    b.id = r.Text("id");
    b.title = r.Text("title");
    b.isbn = r.OptText("isbn");
    b.publication_year = r.OptInt("publicationYear");
    b.pages = r.OptInt("pages");
    b.description = r.OptText("description");
    b.cover_image = r.OptText("coverImage");
    b.reading_status = r.Status("readingStatus");
    b.notes = r.OptText("notes");
    b.rating = r.OptInt("rating");
    b.publisher_id = r.Text("publisherId");
    b.series_id = r.OptText("seriesId");
    b.series_order = r.OptInt("seriesOrder");
    b.category_id = r.Text("categoryId");
    b.created_at = r.Text("createdAt");
    b.updated_at = r.Text("updatedAt");
    rec.author_ids = r.Ids("authors");
    rec.genre_ids = r.Ids("genres");
    rec.topic_ids = r.Ids("topics");
    if (!r.Ok()) return Decoded<BookRecord>::Err(r.Problem());
    return Decoded<BookRecord>::Ok(std::move(rec));
}

template <typename T, typename Decoder>
void DecodeGroup(const json& doc, const char* key, const char* kind, const char* label_key,
                 Decoder decode, std::vector<T>& out, std::vector<std::string>& rejected) {
    if (!doc.contains(key) || doc[key].is_null()) return;
    if (!doc[key].is_array()) {
        rejected.push_back(std::string("Ignored '") + key + "': expected an array");
        return;
    }
    for (const auto& item : doc[key]) {
        if (!item.is_object()) {
            rejected.push_back(std::string("Failed to import ") + kind + ": not an object");
            continue;
        }
        auto decoded = decode(item);
        if (decoded.IsErr()) {
            rejected.push_back(std::string("Failed to import ") + kind + " \"" +
                               LabelOf(item, label_key) + "\": " + decoded.Error());
            continue;
        }
        out.push_back(std::move(decoded).Value());
    }
}

// ---------------------------------------------------------------------------
// Export helpers
// ---------------------------------------------------------------------------
Result<json, Error> LinkedRefs(IEntityStore& store, Relation relation, LinkSide side,
                               const std::string& id, EntityKind kind) {
    auto ids = store.ListLinkedIds(relation, side, id);
    if (ids.IsErr()) return Result<json, Error>::Err(std::move(ids).Error());
    auto arr = json::array();
    for (const auto& linked : ids.Value()) {
        auto ref = store.FindRef(kind, linked);
        if (ref.IsErr()) return Result<json, Error>::Err(std::move(ref).Error());
        if (ref.Value()) {
            arr.push_back(json{{"id", ref.Value()->id}, {"name", ref.Value()->name}});
        }
    }
    return Result<json, Error>::Ok(std::move(arr));
}

template <typename T, typename Find, typename ToJson>
Result<json, Error> ExportKind(IEntityStore& store, EntityKind kind, Find find, ToJson to_json) {
    auto ids = store.ListIds(kind);
    if (ids.IsErr()) return Result<json, Error>::Err(std::move(ids).Error());
    auto arr = json::array();
    for (const auto& id : ids.Value()) {
        Result<std::optional<T>, Error> found = find(id);
        if (found.IsErr()) return Result<json, Error>::Err(std::move(found).Error());
        if (found.Value()) arr.push_back(to_json(*found.Value()));
    }
    return Result<json, Error>::Ok(std::move(arr));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ParseLibraryExport
// ---------------------------------------------------------------------------
Result<LibraryBatch, Error> ParseLibraryExport(std::string_view text) {
    using R = Result<LibraryBatch, Error>;

    json doc;
    try {
        doc = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        return R::Err(Error::Parse("ParseLibraryExport",
                                   std::string("Failed to parse import file: ") + e.what()));
    }
    return DecodeLibraryExport(doc);
}

// ---------------------------------------------------------------------------
// DecodeLibraryExport
// ---------------------------------------------------------------------------
Result<LibraryBatch, Error> DecodeLibraryExport(const json& doc) {
    using R = Result<LibraryBatch, Error>;

    if (!doc.is_object() || !doc.contains("version") || doc["version"].is_null()) {
        return R::Err(Error::Parse("DecodeLibraryExport", "Invalid export file: missing version"));
    }

    LibraryBatch batch;
    DecodeGroup(doc, "categories", "category", "name", DecodeCategory, batch.categories,
                batch.rejected);
    DecodeGroup(doc, "authors", "author", "name", DecodeAuthor, batch.authors, batch.rejected);
    DecodeGroup(doc, "publishers", "publisher", "name", DecodePublisher, batch.publishers,
                batch.rejected);
    DecodeGroup(doc, "genres", "genre", "name", DecodeGenre, batch.genres, batch.rejected);
    DecodeGroup(doc, "topics", "topic", "name", DecodeTopic, batch.topics, batch.rejected);
    DecodeGroup(doc, "series", "series", "name", DecodeSeries, batch.series, batch.rejected);
    DecodeGroup(doc, "books", "book", "title", DecodeBook, batch.books, batch.rejected);

    LogDebug("codec", "Parsed export: " + std::to_string(batch.books.size()) + " book(s), " +
                          std::to_string(batch.rejected.size()) + " rejected record(s)");
    return R::Ok(std::move(batch));
}

// ---------------------------------------------------------------------------
// ExportLibrary
// ---------------------------------------------------------------------------
Result<json, Error> ExportLibrary(IEntityStore& store) {
    using R = Result<json, Error>;

    json doc;
    doc["version"] = kExportFormatVersion;
    doc["exportedAt"] = CurrentTimestamp();

    auto categories = ExportKind<Category>(
        store, EntityKind::Category, [&](const std::string& id) { return store.FindCategory(id); },
        CategoryToJson);
    if (categories.IsErr()) return categories;
    doc["categories"] = std::move(categories).Value();

    auto authors = ExportKind<Author>(
        store, EntityKind::Author, [&](const std::string& id) { return store.FindAuthor(id); },
        AuthorToJson);
    if (authors.IsErr()) return authors;
    doc["authors"] = std::move(authors).Value();

    auto publishers = ExportKind<Publisher>(
        store, EntityKind::Publisher,
        [&](const std::string& id) { return store.FindPublisher(id); }, PublisherToJson);
    if (publishers.IsErr()) return publishers;
    doc["publishers"] = std::move(publishers).Value();

    auto genres = ExportKind<Genre>(
        store, EntityKind::Genre, [&](const std::string& id) { return store.FindGenre(id); },
        GenreToJson);
    if (genres.IsErr()) return genres;
    doc["genres"] = std::move(genres).Value();

    auto topics = ExportKind<Topic>(
        store, EntityKind::Topic, [&](const std::string& id) { return store.FindTopic(id); },
        TopicToJson);
    if (topics.IsErr()) return topics;
    doc["topics"] = std::move(topics).Value();

    auto series_ids = store.ListIds(EntityKind::Series);
    if (series_ids.IsErr()) return R::Err(std::move(series_ids).Error());
    auto series = json::array();
    for (const auto& id : series_ids.Value()) {
        auto found = store.FindSeries(id);
        if (found.IsErr()) return R::Err(std::move(found).Error());
        if (!found.Value()) continue;
        auto j = SeriesToJson(*found.Value());
        auto linked = LinkedRefs(store, Relation::SeriesAuthor, LinkSide::Source, id,
                                 EntityKind::Author);
        if (linked.IsErr()) return linked;
        j["authors"] = std::move(linked).Value();
        series.push_back(std::move(j));
    }
    doc["series"] = std::move(series);

    auto book_ids = store.ListIds(EntityKind::Book);
    if (book_ids.IsErr()) return R::Err(std::move(book_ids).Error());
    auto books = json::array();
    for (const auto& id : book_ids.Value()) {
        auto found = store.FindBook(id);
        if (found.IsErr()) return R::Err(std::move(found).Error());
        if (!found.Value()) continue;
        auto j = BookToJson(*found.Value());

        const std::tuple<const char*, Relation, EntityKind> links[] = {
            {"authors", Relation::BookAuthor, EntityKind::Author},
            {"genres", Relation::BookGenre, EntityKind::Genre},
            {"topics", Relation::BookTopic, EntityKind::Topic},
        };
        for (const auto& [key, relation, kind] : links) {
            auto linked = LinkedRefs(store, relation, LinkSide::Source, id, kind);
            if (linked.IsErr()) return linked;
            j[key] = std::move(linked).Value();
        }
        books.push_back(std::move(j));
    }
    doc["books"] = std::move(books);

    LogDebug("codec", "Exported " + std::to_string(doc["books"].size()) + " book(s)");
    return R::Ok(std::move(doc));
}

// ---------------------------------------------------------------------------
// Files
// ---------------------------------------------------------------------------
Result<LibraryBatch, Error> ReadLibraryFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<LibraryBatch, Error>::Err(
            Error::Storage("ReadLibraryFile", "Cannot open import file: " + path));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return ParseLibraryExport(buffer.str());
}

Result<void, Error> WriteLibraryFile(IEntityStore& store, const std::string& path) {
    auto doc = ExportLibrary(store);
    if (doc.IsErr()) return Result<void, Error>::Err(std::move(doc).Error());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void, Error>::Err(
            Error::Storage("WriteLibraryFile", "Cannot open export file: " + path));
    }
    out << doc.Value().dump(2) << "\n";
    if (!out) {
        return Result<void, Error>::Err(
            Error::Storage("WriteLibraryFile", "Failed writing export file: " + path));
    }
    LogInfo("codec", "Exported library to " + path);
    return Result<void, Error>::Ok();
}

} // namespace homelib
