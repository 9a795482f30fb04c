#include <homelib/cli/output_formatter.hpp>
#include <homelib/core/ansi.hpp>

#include <algorithm>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace homelib {

namespace {

using namespace homelib::ansi;

std::string Padded(const std::string& text, size_t width) {
    return text.size() >= width ? text : text + std::string(width - text.size(), ' ');
}

// Widest cell per column, headers included.
std::vector<size_t> ColumnWidths(const std::vector<std::string>& headers,
                                 const std::vector<std::vector<std::string>>& rows) {
    std::vector<size_t> widths;
    widths.reserve(headers.size());
    for (const auto& h : headers) widths.push_back(h.size());
    for (const auto& row : rows) {
        for (size_t c = 0; c < widths.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }
    return widths;
}

size_t KeyWidth(const std::vector<std::pair<std::string, std::string>>& entries) {
    size_t width = 0;
    for (const auto& e : entries) width = std::max(width, e.first.size() + 1);
    return width;
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {
    if (json_mode_) {
        auto records = nlohmann::json::array();
        for (const auto& row : rows) {
            auto record = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                record[headers[c]] = row[c];
            }
            records.push_back(std::move(record));
        }
        out_ << records.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> cells{headers};
        cells.insert(cells.end(), rows.begin(), rows.end());
        auto table = ftxui::Table(std::move(cells));
        auto header = table.SelectRow(0);
        header.Decorate(ftxui::bold);
        header.BorderBottom(ftxui::LIGHT);
        table.SelectAll().SeparatorVertical(ftxui::EMPTY);

        auto document = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(document));
        ftxui::Render(screen, document);
        out_ << screen.ToString() << "\n";
        return;
    }

    const auto widths = ColumnWidths(headers, rows);
    auto emit = [&](const std::vector<std::string>& cells, bool underline) {
        for (size_t c = 0; c < widths.size(); ++c) {
            if (c > 0) out_ << "  ";
            if (underline) {
                out_ << std::string(widths[c], '-');
            } else {
                out_ << Padded(c < cells.size() ? cells[c] : std::string(), widths[c]);
            }
        }
        out_ << "\n";
    };
    emit(headers, false);
    emit(headers, true);
    for (const auto& row : rows) emit(row, false);
}

// Record card: the title, untitled sections as aligned "key: value" lines,
// then each titled section under its own indented heading. Empty sections
// are skipped.
void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<DetailSection>& sections) const {
    const char* bold = color_mode_ ? kBold : "";
    const char* dim = color_mode_ ? kDim : "";
    const char* reset = color_mode_ ? kReset : "";

    out_ << bold << title << reset << "\n";
    for (const auto& section : sections) {
        if (section.entries.empty()) continue;
        std::string indent = "  ";
        if (!section.title.empty()) {
            out_ << "\n  " << bold << section.title << reset << "\n";
            indent = "    ";
        }
        const size_t width = KeyWidth(section.entries);
        for (const auto& entry : section.entries) {
            out_ << indent << dim << Padded(entry.first + ":", width) << reset << ' '
                 << entry.second << "\n";
        }
    }
}

void OutputFormatter::PrintViolations(const std::vector<Violation>& violations) const {
    if (json_mode_) {
        auto arr = nlohmann::json::array();
        for (const auto& v : violations) arr.push_back(ViolationToJson(v));
        out_ << arr.dump() << "\n";
        return;
    }
    for (const auto& v : violations) {
        if (color_mode_) {
            out_ << "  " << kYellow << RuleTag(v.rule) << kReset << "  " << v.message << "\n";
        } else {
            out_ << "  - [" << RuleTag(v.rule) << "] " << v.message << "\n";
        }
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& value) const {
    out_ << value.dump(2) << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    const char* red = color_mode_ ? kRed : "";
    const char* bold = color_mode_ ? kBold : "";
    const char* dim = color_mode_ ? kDim : "";
    const char* yellow = color_mode_ ? kYellow : "";
    const char* reset = color_mode_ ? kReset : "";

    err_ << red << "Error: " << reset << bold << error.operation << reset;
    if (!error.entity.empty()) {
        err_ << dim << " [" << error.entity << "]" << reset;
    }
    err_ << "\n  " << error.message << "\n";
    if (error.detail.has_value() && !error.detail->empty()) {
        err_ << "  " << dim << "Store: " << reset << *error.detail << "\n";
    }
    if (error.linked_count.has_value()) {
        err_ << "  " << dim << "Linked books: " << reset << *error.linked_count << "\n";
    }
    for (const auto& v : error.violations) {
        err_ << "  " << yellow << RuleTag(v.rule) << reset << "  " << v.message << "\n";
    }
    if (error.hint.has_value() && !error.hint->empty()) {
        err_ << "  " << yellow << "Hint: " << reset << *error.hint << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump() << "\n";
        return;
    }
    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }
    out_ << message << "\n";
}

void OutputFormatter::PrintWarning(const std::string& message) const {
    if (json_mode_) return;
    if (color_mode_) {
        err_ << kYellow << "Warning: " << kReset << message << "\n";
        return;
    }
    err_ << "Warning: " << message << "\n";
}

} // namespace homelib
