#pragma once

#include <homelib/core/result.hpp>
#include <homelib/core/types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace homelib {

// ---------------------------------------------------------------------------
// EntityKind — the seven record kinds of the catalogue.
// ---------------------------------------------------------------------------
enum class EntityKind {
    Book,
    Author,
    Publisher,
    Series,
    Genre,
    Topic,
    Category,
};

// Lower-case singular name: "book", "author", ...
[[nodiscard]] const char* EntityKindName(EntityKind kind);

// Capitalised display name: "Book", "Author", ...
[[nodiscard]] const char* EntityKindLabel(EntityKind kind);

[[nodiscard]] Result<EntityKind, std::string> ParseEntityKind(std::string_view text);

// ---------------------------------------------------------------------------
// EntityRef — identity plus display name, used in reports and results.
// ---------------------------------------------------------------------------
struct EntityRef {
    EntityKind kind = EntityKind::Book;
    std::string id;
    std::string name;

    bool operator==(const EntityRef& other) const {
        return kind == other.kind && id == other.id && name == other.name;
    }
    bool operator!=(const EntityRef& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// Records. Timestamps are ISO-8601 UTC strings and are preserved on import.
// ---------------------------------------------------------------------------
struct Author {
    std::string id;
    std::string name;
    std::optional<std::string> bio;
    std::string created_at;
    std::string updated_at;
};

struct Publisher {
    std::string id;
    std::string name;
    std::optional<std::string> location;
    std::optional<std::string> website;
    std::string created_at;
    std::string updated_at;
};

struct Series {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::string created_at;
    std::string updated_at;
};

struct Genre {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::string created_at;
    std::string updated_at;
};

struct Topic {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::string created_at;
    std::string updated_at;
};

struct Category {
    std::string id;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> color;
    std::string created_at;
    std::string updated_at;
};

struct Book {
    std::string id;
    std::string title;
    std::optional<std::string> isbn;
    std::optional<int> publication_year;
    std::optional<int> pages;
    std::optional<std::string> description;
    std::optional<std::string> cover_image;
    ReadingStatus reading_status = ReadingStatus::Unread;
    std::optional<std::string> notes;
    std::optional<int> rating;
    std::string publisher_id;
    std::optional<std::string> series_id;
    std::optional<int> series_order;
    std::string category_id;
    std::string created_at;
    std::string updated_at;
};

// A book row together with its many-to-many memberships.
struct BookRecord {
    Book book;
    std::vector<std::string> author_ids;
    std::vector<std::string> genre_ids;
    std::vector<std::string> topic_ids;
};

// A series row together with its authors.
struct SeriesRecord {
    Series series;
    std::vector<std::string> author_ids;
};

// ---------------------------------------------------------------------------
// BookInput — desired state of a book for create and update. Link lists are
// complete: on update they replace the existing memberships.
// ---------------------------------------------------------------------------
struct BookInput {
    std::string title;
    std::optional<std::string> isbn;
    std::optional<int> publication_year;
    std::optional<int> pages;
    std::optional<std::string> description;
    std::optional<std::string> cover_image;
    ReadingStatus reading_status = ReadingStatus::Unread;
    std::optional<std::string> notes;
    std::optional<int> rating;
    std::string publisher_id;
    std::optional<std::string> series_id;
    std::optional<int> series_order;
    std::string category_id;
    std::vector<std::string> author_ids;
    std::vector<std::string> genre_ids;
    std::vector<std::string> topic_ids;
};

// Current state of a book expressed as an input, for partial edits.
[[nodiscard]] BookInput ToBookInput(const BookRecord& record);

// Apply the scalar fields of an input to a book row (id and timestamps kept).
void ApplyBookInput(const BookInput& input, Book& book);

} // namespace homelib
