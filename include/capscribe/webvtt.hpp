#pragma once

#include <string>
#include <vector>

#include "capscribe/time.hpp"

namespace capscribe {

// ─── Cue ────────────────────────────────────────────────────────────────────

struct Cue {
    TimeOfDay start;
    TimeOfDay end;
    std::string text; // payload lines joined with '\n'
};

// ─── Header Repair ──────────────────────────────────────────────────────────

/// Some broadcasters emit header content that is not valid WebVTT. Drop
/// everything before the first line that starts with a strict
/// "HH:MM:SS.mmm" timestamp and prepend a minimal "WEBVTT\r\n" header.
/// Throws PreprocessError if no such line exists.
std::string repair_header(const std::string &text);

// True if the line starts with "HH:MM:SS.mmm" (exactly two hour digits).
bool has_timestamp_prefix(const std::string &line);

// ─── WebVTT Parsing ─────────────────────────────────────────────────────────

/// Parse WebVTT text into cues, in file order.
///
/// The first line must start with "WEBVTT". The header ends at the first
/// blank line or the first timing line. NOTE, STYLE and REGION blocks are
/// skipped; cue identifiers are allowed. Throws CueParseError on a bad
/// timing line or on text that has no timing line.
std::vector<Cue> parse_webvtt(const std::string &text);

/// Read a caption file, repair its header and parse it.
std::vector<Cue> read_caption_file(const std::string &path);

} // namespace capscribe
