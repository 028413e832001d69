#pragma once

#include <optional>
#include <string>
#include <vector>

#include "capscribe/normalize.hpp"
#include "capscribe/speaker.hpp"
#include "capscribe/time.hpp"
#include "capscribe/webvtt.hpp"

namespace capscribe {

// Two-character prefix that opens a new speaker turn.
inline constexpr const char *SPEAKER_MARKER = ">>";

// ─── Speech Block ───────────────────────────────────────────────────────────

struct Block {
    TimeOfDay start;
    TimeOfDay end;
    double duration = 0.0; // sum of per-cue on-screen seconds, not end - start
    std::string speaker;   // canonical name or UNKNOWN_SPEAKER
    std::string speech;    // marker line plus continuation lines
};

bool is_speaker_marker(const std::string &line);

// Raw label of a marker line: text between the marker and the first colon,
// trimmed and lowercased. nullopt when the line has no colon.
std::optional<std::string> extract_speaker_label(const std::string &line);

// ─── Block Segmenter ────────────────────────────────────────────────────────

/// Groups cues into speaker-attributed blocks.
///
/// Each accepted cue adds its on-screen seconds to the active block. A line
/// starting with ">>" closes the active block and opens a new one; any other
/// line is appended to the active block's speech. Lines arriving before the
/// first marker belong to no block and their seconds are counted in
/// unattributed_seconds().
///
///   BlockSegmenter seg(resolver);
///   for (const auto &cue : cues)
///       seg.feed(cue);
///   auto blocks = seg.finish();
///
class BlockSegmenter {
  public:
    explicit BlockSegmenter(SpeakerResolver &resolver);

    // Normalize, de-duplicate and consume one cue.
    void feed(const Cue &cue);

    // End of stream. With flush_trailing set, the active block is appended;
    // otherwise it is dropped. Returns the completed blocks.
    std::vector<Block> finish(bool flush_trailing = true);

    bool active() const { return current_.has_value(); }
    const std::vector<Block> &blocks() const { return blocks_; }

    size_t cues_seen() const { return cues_seen_; }
    size_t duplicates() const { return dedup_.suppressed(); }
    double unattributed_seconds() const { return unattributed_seconds_; }

    // Seconds held by the active block when finish(false) dropped it.
    double dropped_seconds() const { return dropped_seconds_; }

  private:
    SpeakerResolver &resolver_;
    DuplicateFilter dedup_;
    std::optional<Block> current_;
    std::vector<Block> blocks_;
    size_t cues_seen_ = 0;
    double unattributed_seconds_ = 0.0;
    double dropped_seconds_ = 0.0;

    void start_block_(const std::string &line, const Cue &cue);
    void close_block_();
};

// Clipped contribution of one cue: end - start, floored at zero.
double cue_seconds(const Cue &cue);

} // namespace capscribe
