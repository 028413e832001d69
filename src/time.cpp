#include "capscribe/time.hpp"

#include "capscribe/error.hpp"

#include <cctype>
#include <cstdio>
#include <vector>

namespace capscribe {

// ─── Parsing ────────────────────────────────────────────────────────────────

namespace {

// Reads a run of ASCII digits starting at pos. Returns the digit count.
size_t read_digits(const std::string &s, size_t pos, int64_t &value) {
    size_t n = 0;
    value = 0;
    while (pos + n < s.size() &&
           std::isdigit(static_cast<unsigned char>(s[pos + n]))) {
        value = value * 10 + (s[pos + n] - '0');
        ++n;
        if (n > 12) // far beyond any real caption length
            return 0;
    }
    return n;
}

} // namespace

std::optional<TimeOfDay> try_parse_timestamp(const std::string &text) {
    // Split on ':' into 2 or 3 fields; the last one is "SS.mmm".
    std::vector<int64_t> fields;
    std::vector<size_t> widths;
    size_t pos = 0;

    while (true) {
        int64_t v = 0;
        size_t n = read_digits(text, pos, v);
        if (n == 0)
            return std::nullopt;
        fields.push_back(v);
        widths.push_back(n);
        pos += n;
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            continue;
        }
        break;
    }

    if (fields.size() < 2 || fields.size() > 3)
        return std::nullopt;
    if (pos >= text.size() || text[pos] != '.')
        return std::nullopt;
    ++pos;

    int64_t millis = 0;
    if (read_digits(text, pos, millis) != 3 || pos + 3 != text.size())
        return std::nullopt;

    int64_t hours = 0;
    if (fields.size() == 3) {
        if (widths[0] < 2)
            return std::nullopt;
        hours = fields[0];
    }
    int64_t minutes = fields[fields.size() - 2];
    int64_t seconds = fields.back();

    // Minutes and seconds are always exactly two digits.
    if (widths[widths.size() - 2] != 2 || widths.back() != 2)
        return std::nullopt;
    if (minutes >= 60 || seconds >= 60)
        return std::nullopt;

    return TimeOfDay{hours * MS_PER_HOUR + minutes * MS_PER_MINUTE +
                     seconds * MS_PER_SECOND + millis};
}

TimeOfDay parse_timestamp(const std::string &text) {
    auto t = try_parse_timestamp(text);
    if (!t) {
        throw CueParseError("Invalid timestamp: '" + text + "'");
    }
    return *t;
}

// ─── Formatting ─────────────────────────────────────────────────────────────

std::string format_timestamp(TimeOfDay t) {
    int64_t ms = t.ms < 0 ? -t.ms : t.ms;
    int64_t hours = ms / MS_PER_HOUR;
    int64_t minutes = (ms % MS_PER_HOUR) / MS_PER_MINUTE;
    int64_t seconds = (ms % MS_PER_MINUTE) / MS_PER_SECOND;
    int64_t millis = ms % MS_PER_SECOND;

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%s%02lld:%02lld:%02lld.%03lld",
                  t.ms < 0 ? "-" : "", static_cast<long long>(hours),
                  static_cast<long long>(minutes),
                  static_cast<long long>(seconds),
                  static_cast<long long>(millis));
    return buf;
}

} // namespace capscribe
