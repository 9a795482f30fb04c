#include <homelib/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace homelib {

Error Error::NotFound(const std::string& operation,
                      const std::string& kind,
                      const std::string& id) {
    Error e;
    e.operation = operation;
    e.entity = kind + ":" + id;
    e.message = kind + " '" + id + "' does not exist";
    e.category = ErrorCategory::NotFound;
    return e;
}

Error Error::Blocked(const std::string& operation,
                     const std::string& entity,
                     const std::string& message,
                     std::vector<Violation> violations,
                     std::optional<int64_t> linked_count) {
    Error e;
    e.operation = operation;
    e.entity = entity;
    e.message = message;
    e.category = ErrorCategory::BlockedByInvariant;
    e.violations = std::move(violations);
    e.linked_count = linked_count;
    return e;
}

Error Error::Validation(const std::string& operation,
                        const std::string& message) {
    Error e;
    e.operation = operation;
    e.message = message;
    e.category = ErrorCategory::Validation;
    return e;
}

Error Error::Storage(const std::string& operation,
                     const std::string& message,
                     std::optional<std::string> detail) {
    Error e;
    e.operation = operation;
    e.message = message;
    e.detail = std::move(detail);
    e.category = ErrorCategory::Storage;
    return e;
}

Error Error::Parse(const std::string& operation, const std::string& message) {
    Error e;
    e.operation = operation;
    e.message = message;
    e.category = ErrorCategory::Parse;
    return e;
}

Error Error::Config(const std::string& message) {
    Error e;
    e.operation = "ConfigLoader";
    e.message = message;
    e.category = ErrorCategory::Config;
    return e;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::NotFound:           return "not_found";
        case ErrorCategory::BlockedByInvariant: return "blocked_by_invariant";
        case ErrorCategory::Validation:         return "validation";
        case ErrorCategory::Storage:            return "storage";
        case ErrorCategory::Parse:              return "parse";
        case ErrorCategory::Config:             return "config";
        case ErrorCategory::Internal:           return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!entity.empty()) {
        oss << " [" << entity << "]";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " (store: " << *detail << ")";
    }
    return oss.str();
}

nlohmann::json Error::ToJsonValue() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!entity.empty()) {
        body["entity"] = entity;
    }
    body["message"] = message;
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    if (hint.has_value() && !hint->empty()) {
        body["hint"] = *hint;
    }
    if (linked_count.has_value()) {
        body["linkedCount"] = *linked_count;
    }
    if (!violations.empty()) {
        auto arr = nlohmann::json::array();
        for (const auto& v : violations) {
            arr.push_back(ViolationToJson(v));
        }
        body["violations"] = std::move(arr);
    }
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", std::move(body)}};
}

std::string Error::ToJson() const {
    return ToJsonValue().dump();
}

} // namespace homelib
