#pragma once

#include <homelib/core/result.hpp>
#include <homelib/engine/bulk_merge.hpp>
#include <homelib/store/i_entity_store.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace homelib {

constexpr const char* kExportFormatVersion = "1.0.0";

// ---------------------------------------------------------------------------
// Library export document
//
//   {
//     "version": "1.0.0",
//     "exportedAt": "2024-05-01T12:00:00.000Z",
//     "categories": [...], "authors": [...], "publishers": [...],
//     "genres": [...], "topics": [...],
//     "series": [{..., "authors": [{"id", "name"}]}],
//     "books":  [{..., "authors": [...], "genres": [...], "topics": [...]}]
//   }
//
// Parsing is all-or-nothing at the document level (malformed JSON or a
// missing version is a Parse error) and lenient per record: a record that
// cannot be decoded is listed in LibraryBatch::rejected.
// ---------------------------------------------------------------------------

[[nodiscard]] Result<LibraryBatch, Error> ParseLibraryExport(std::string_view text);
[[nodiscard]] Result<LibraryBatch, Error> DecodeLibraryExport(const nlohmann::json& doc);

[[nodiscard]] Result<nlohmann::json, Error> ExportLibrary(IEntityStore& store);

// File helpers for the CLI. Read and write failures are Storage errors.
[[nodiscard]] Result<LibraryBatch, Error> ReadLibraryFile(const std::string& path);
[[nodiscard]] Result<void, Error> WriteLibraryFile(IEntityStore& store, const std::string& path);

} // namespace homelib
