#pragma once

#include <string>

namespace capscribe {

// ─── Line Normalizer ────────────────────────────────────────────────────────

// Strip leading/trailing '\r', '\n', ' ' and '\0'. Some caption feeds
// terminate every cue payload with a null byte.
std::string normalize_line(const std::string &text);

// ─── Duplicate Filter ───────────────────────────────────────────────────────

// Scrolling two-line caption displays repeat each line in two consecutive
// cues. Only the first occurrence is kept. Comparison is against the
// immediately preceding accepted line only.
class DuplicateFilter {
  public:
    // Returns true if the line is new and should be processed. The initial
    // state is the empty string, so a leading empty line is rejected.
    bool accept(const std::string &line);

    const std::string &last_line() const { return last_line_; }
    size_t suppressed() const { return suppressed_; }

  private:
    std::string last_line_;
    size_t suppressed_ = 0;
};

} // namespace capscribe
