#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace crossover_sim {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Timestamp and string helpers shared by the data source, the report writers and main.
 */
namespace utils {

/**
 * Convert timestamp to milliseconds since epoch.
 */
inline int64_t ts_to_ms(Timestamp ts) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/**
 * Format timestamp as date string (e.g., "2024-01-15").
 */
inline std::string ts_to_date(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm);
    return std::string(buf);
}

/**
 * Parse ISO 8601 timestamp string to Timestamp.
 * Supports: "2024-01-15T10:30:00Z", "2024-01-15T10:30:00" and "2024-01-15 10:30:00"
 */
inline std::optional<Timestamp> parse_iso_ts(const std::string& s) {
    if (s.size() < 19) return std::nullopt;
    std::string normalized = s;
    if (normalized[10] == ' ') normalized[10] = 'T';
    std::tm tm{};
    std::istringstream ss(normalized);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) return std::nullopt;
    return Timestamp{} + std::chrono::seconds(timegm(&tm));
}

/**
 * Parse date string to Timestamp (midnight UTC).
 */
inline std::optional<Timestamp> parse_date(const std::string& s) {
    if (s.empty()) return std::nullopt;
    std::tm tm{};
    std::istringstream ss(s);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) return std::nullopt;
    return Timestamp{} + std::chrono::seconds(timegm(&tm));
}

/**
 * Parse timestamp from various formats (ISO, date, compact YYYYMMDD date, or numeric epoch).
 * Eight digits are read as YYYYMMDD, longer digit strings as epoch s/ms/us/ns by length.
 */
inline std::optional<Timestamp> parse_ts_any(const std::string& s) {
    if (s.empty()) return std::nullopt;

    bool all_digits = std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c); });

    if (all_digits) {
        if (s.size() == 8) {
            std::tm tm{};
            std::istringstream ss(s);
            ss >> std::get_time(&tm, "%Y%m%d");
            if (ss.fail()) return std::nullopt;
            return Timestamp{} + std::chrono::seconds(timegm(&tm));
        }
        int64_t v = 0;
        try {
            v = std::stoll(s);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
        if (s.size() >= 19) {
            return Timestamp{} + std::chrono::nanoseconds(v);
        } else if (s.size() >= 16) {
            return Timestamp{} + std::chrono::microseconds(v);
        } else if (s.size() >= 13) {
            return Timestamp{} + std::chrono::milliseconds(v);
        }
        return Timestamp{} + std::chrono::seconds(v);
    }

    if (auto ts = parse_iso_ts(s)) return ts;

    return parse_date(s);
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

inline std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n\"");
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(" \t\r\n\"");
    return s.substr(first, last - first + 1);
}

} // namespace utils
} // namespace crossover_sim
