#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>

namespace capscribe {

// ─── Time of Day ────────────────────────────────────────────────────────────
// Caption timestamps are offsets from a fixed placeholder date, so only the
// time-of-day part is meaningful. Stored as milliseconds since midnight.

struct TimeOfDay {
    int64_t ms = 0;

    bool operator==(const TimeOfDay &) const = default;
    auto operator<=>(const TimeOfDay &) const = default;
};

constexpr int64_t MS_PER_SECOND = 1000;
constexpr int64_t MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr int64_t MS_PER_HOUR = 60 * MS_PER_MINUTE;

// Parse "HH:MM:SS.mmm" or the WebVTT short form "MM:SS.mmm".
// Hours may have more than two digits. Returns nullopt on malformed input.
std::optional<TimeOfDay> try_parse_timestamp(const std::string &text);

// Same as try_parse_timestamp, but throws CueParseError.
TimeOfDay parse_timestamp(const std::string &text);

// Render as "HH:MM:SS.mmm".
std::string format_timestamp(TimeOfDay t);

// Signed difference end - start, in seconds.
inline double seconds_between(TimeOfDay start, TimeOfDay end) {
    return static_cast<double>(end.ms - start.ms) /
           static_cast<double>(MS_PER_SECOND);
}

} // namespace capscribe
