#include <homelib/model/entities.hpp>

#include <array>
#include <utility>

namespace homelib {

namespace {

struct KindNames {
    EntityKind kind;
    const char* name;
    const char* label;
};

constexpr std::array<KindNames, 7> kKindNames = {{
    {EntityKind::Book, "book", "Book"},
    {EntityKind::Author, "author", "Author"},
    {EntityKind::Publisher, "publisher", "Publisher"},
    {EntityKind::Series, "series", "Series"},
    {EntityKind::Genre, "genre", "Genre"},
    {EntityKind::Topic, "topic", "Topic"},
    {EntityKind::Category, "category", "Category"},
}};

} // anonymous namespace

const char* EntityKindName(EntityKind kind) {
    for (const auto& k : kKindNames) {
        if (k.kind == kind) return k.name;
    }
    return "unknown";
}

const char* EntityKindLabel(EntityKind kind) {
    for (const auto& k : kKindNames) {
        if (k.kind == kind) return k.label;
    }
    return "Unknown";
}

Result<EntityKind, std::string> ParseEntityKind(std::string_view text) {
    for (const auto& k : kKindNames) {
        if (text == k.name) return Result<EntityKind, std::string>::Ok(k.kind);
    }
    return Result<EntityKind, std::string>::Err(
        "Unknown entity kind '" + std::string(text) + "'");
}

BookInput ToBookInput(const BookRecord& record) {
    const auto& b = record.book;
    BookInput in;
    in.title = b.title;
    in.isbn = b.isbn;
    in.publication_year = b.publication_year;
    in.pages = b.pages;
    in.description = b.description;
    in.cover_image = b.cover_image;
    in.reading_status = b.reading_status;
    in.notes = b.notes;
    in.rating = b.rating;
    in.publisher_id = b.publisher_id;
    in.series_id = b.series_id;
    in.series_order = b.series_order;
    in.category_id = b.category_id;
    in.author_ids = record.author_ids;
    in.genre_ids = record.genre_ids;
    in.topic_ids = record.topic_ids;
    return in;
}

void ApplyBookInput(const BookInput& input, Book& book) {
    book.title = input.title;
    book.isbn = input.isbn;
    book.publication_year = input.publication_year;
    book.pages = input.pages;
    book.description = input.description;
    book.cover_image = input.cover_image;
    book.reading_status = input.reading_status;
    book.notes = input.notes;
    book.rating = input.rating;
    book.publisher_id = input.publisher_id;
    book.series_id = input.series_id;
    book.series_order = input.series_id ? input.series_order : std::nullopt;
    book.category_id = input.category_id;
}

} // namespace homelib
