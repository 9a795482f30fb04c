#include <homelib/core/types.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace homelib {

namespace {

constexpr size_t kMaxIdLength = 64;

bool IsForbiddenIdChar(char c) {
    auto u = static_cast<unsigned char>(c);
    return u < 0x20 || u == 0x7F || c == ' ';
}

std::mt19937_64& RandomEngine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// EntityId
// ---------------------------------------------------------------------------
Result<EntityId, std::string> EntityId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<EntityId, std::string>::Err("Identifier must not be empty");
    }
    if (id.size() > kMaxIdLength) {
        return Result<EntityId, std::string>::Err(
            "Identifier must be at most 64 characters, got " +
            std::to_string(id.size()));
    }
    for (char c : id) {
        if (IsForbiddenIdChar(c)) {
            return Result<EntityId, std::string>::Err(
                "Identifier must not contain whitespace or control characters");
        }
    }
    return Result<EntityId, std::string>::Ok(EntityId(std::string(id)));
}

EntityId EntityId::Generate() {
    std::array<uint8_t, 16> bytes{};
    std::uniform_int_distribution<uint32_t> dist(0, 255);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dist(RandomEngine()));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return EntityId(oss.str());
}

// ---------------------------------------------------------------------------
// ReadingStatus
// ---------------------------------------------------------------------------
const char* ReadingStatusName(ReadingStatus status) {
    switch (status) {
        case ReadingStatus::Unread:    return "unread";
        case ReadingStatus::Reading:   return "reading";
        case ReadingStatus::Completed: return "completed";
    }
    return "unread";
}

Result<ReadingStatus, std::string> ParseReadingStatus(std::string_view text) {
    if (text == "unread") return Result<ReadingStatus, std::string>::Ok(ReadingStatus::Unread);
    if (text == "reading") return Result<ReadingStatus, std::string>::Ok(ReadingStatus::Reading);
    if (text == "completed") {
        return Result<ReadingStatus, std::string>::Ok(ReadingStatus::Completed);
    }
    return Result<ReadingStatus, std::string>::Err(
        "Reading status must be one of unread, reading, completed; got '" +
        std::string(text) + "'");
}

std::string CurrentTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time_t_now = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &time_t_now);
#else
    gmtime_r(&time_t_now, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // namespace homelib
