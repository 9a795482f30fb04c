#pragma once

#include <homelib/core/result.hpp>
#include <homelib/core/violation.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace homelib {

// A titled group of key/value lines in PrintDetail. An empty title puts the
// entries at the root of the tree.
struct DetailSection {
    std::string title;
    std::vector<std::pair<std::string, std::string>> entries;
};

// ---------------------------------------------------------------------------
// OutputFormatter — human-readable and JSON output for CLI commands.
//
// When color_mode is true and json_mode is false, tables are rendered with
// FTXUI and messages use ANSI escape codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // In JSON mode, outputs a JSON array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    void PrintDetail(const std::string& title,
                     const std::vector<DetailSection>& sections) const;

    // Bulleted "rule: message" lines, human mode only.
    void PrintViolations(const std::vector<Violation>& violations) const;

    void PrintJson(const nlohmann::json& value) const;

    // Structured error to stderr; blocked errors list their violations.
    void PrintError(const Error& error) const;

    void PrintSuccess(const std::string& message) const;

    void PrintWarning(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace homelib
