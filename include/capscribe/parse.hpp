#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "capscribe/segmenter.hpp"
#include "capscribe/speaker.hpp"
#include "capscribe/webvtt.hpp"

namespace capscribe {

// ─── Parse Options ──────────────────────────────────────────────────────────

struct ParseOptions {
    bool infer_speakers = true;       // correct speaker typos by edit distance
    bool flush_trailing_block = true; // keep the last speaker's remarks
};

// ─── Parse Result ───────────────────────────────────────────────────────────

struct ParseStats {
    size_t cues = 0;               // cues read from the source
    size_t duplicates = 0;         // cues dropped as repeats
    size_t distance_lookups = 0;   // resolver cache misses
    double unattributed_seconds = 0.0; // before the first speaker marker
    double dropped_seconds = 0.0;      // trailing block, when not flushed
};

struct CaptionParse {
    std::vector<Block> blocks;

    // raw label -> canonical name, only where they differ
    std::vector<std::pair<std::string, std::string>> corrections;

    ParseStats stats;

    // Block speech joined with '\n', in block order.
    std::string transcript() const;

    // Total seconds per speaker.
    std::map<std::string, double> speaker_times() const;

    double total_seconds() const;
};

// ─── High-Level API ─────────────────────────────────────────────────────────

/// Reconstruct speech blocks from an ordered cue sequence. A fresh resolver
/// is built from known for every call, so corrections never leak between
/// files.
CaptionParse parse_captions(const std::vector<Cue> &cues,
                            const KnownSpeakers &known,
                            const ParseOptions &options = {});

/// read_caption_file() followed by parse_captions().
CaptionParse parse_caption_file(const std::string &path,
                                const KnownSpeakers &known,
                                const ParseOptions &options = {});

// ─── Output Formatting ──────────────────────────────────────────────────────

// "Inferred <raw> -> <canonical>" per line.
std::string format_corrections(const CaptionParse &result);

// "<speaker>: <seconds>" per line, speakers sorted, three decimals.
std::string format_speaker_times(const CaptionParse &result);

// One line per block: "[start - end] <seconds>s <speaker>: <speech>".
std::string format_blocks(const CaptionParse &result);

enum class OutputMode { Transcript, SpeakerTimes, Blocks };

// Full report for one file. Speaker times and blocks are preceded by the
// corrections and a blank line.
std::string format_report(const CaptionParse &result, OutputMode mode);

} // namespace capscribe
