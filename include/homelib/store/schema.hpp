#pragma once

#include <string>
#include <vector>

namespace homelib {

// Seeded by migration 002 and never deletable.
constexpr const char* kDefaultCategoryId = "00000000-0000-4000-8000-000000000001";
constexpr const char* kDefaultCategoryName = "General";

// ---------------------------------------------------------------------------
// Migration — one versioned step of the database schema. Applied in order,
// each inside its own transaction, and recorded in schema_migrations.
// ---------------------------------------------------------------------------
struct Migration {
    int version;
    std::string name;
    std::string sql;
};

[[nodiscard]] const std::vector<Migration>& SchemaMigrations();

[[nodiscard]] int LatestSchemaVersion();

} // namespace homelib
