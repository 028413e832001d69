#include "capscribe/normalize.hpp"

namespace capscribe {

// ─── Line Normalizer ────────────────────────────────────────────────────────

static bool is_noise(char c) {
    return c == '\r' || c == '\n' || c == ' ' || c == '\0';
}

std::string normalize_line(const std::string &text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && is_noise(text[b]))
        ++b;
    while (e > b && is_noise(text[e - 1]))
        --e;
    return text.substr(b, e - b);
}

// ─── Duplicate Filter ───────────────────────────────────────────────────────

bool DuplicateFilter::accept(const std::string &line) {
    if (line == last_line_) {
        ++suppressed_;
        return false;
    }
    last_line_ = line;
    return true;
}

} // namespace capscribe
