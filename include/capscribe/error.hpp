#pragma once

#include <stdexcept>
#include <string>

namespace capscribe {

// ─── Caption Errors ─────────────────────────────────────────────────────────

// Base class for failures that make a single caption file unusable.
class CaptionError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

// No timestamp-like line was found while repairing the caption header.
class PreprocessError : public CaptionError {
  public:
    using CaptionError::CaptionError;
};

// Malformed cue syntax. line() is 1-based, 0 when not tied to a line.
class CueParseError : public CaptionError {
  public:
    explicit CueParseError(const std::string &what, int line = 0)
        : CaptionError(line > 0
                           ? what + " (line " + std::to_string(line) + ")"
                           : what),
          line_(line) {}

    int line() const { return line_; }

  private:
    int line_;
};

} // namespace capscribe
