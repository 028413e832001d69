#include "capscribe/segmenter.hpp"

#include "capscribe/log.hpp"

#include <cctype>
#include <string>

namespace capscribe {

// ─── Marker Handling ────────────────────────────────────────────────────────

bool is_speaker_marker(const std::string &line) {
    return line.starts_with(SPEAKER_MARKER);
}

std::optional<std::string> extract_speaker_label(const std::string &line) {
    auto colon = line.find(':');
    if (colon == std::string::npos)
        return std::nullopt;

    // ">>: text" has an empty label
    const size_t prefix = std::string(SPEAKER_MARKER).size();
    std::string label =
        colon > prefix ? line.substr(prefix, colon - prefix) : std::string();

    size_t b = 0;
    size_t e = label.size();
    while (b < e && std::isspace(static_cast<unsigned char>(label[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(label[e - 1])))
        --e;
    return lowercase(label.substr(b, e - b));
}

double cue_seconds(const Cue &cue) {
    double s = seconds_between(cue.start, cue.end);
    return s > 0.0 ? s : 0.0;
}

// ─── Block Segmenter ────────────────────────────────────────────────────────

BlockSegmenter::BlockSegmenter(SpeakerResolver &resolver)
    : resolver_(resolver) {}

void BlockSegmenter::feed(const Cue &cue) {
    ++cues_seen_;

    std::string line = normalize_line(cue.text);
    if (!dedup_.accept(line))
        return;

    if (cue.end < cue.start) {
        log_debug("Cue " + format_timestamp(cue.start) + " --> " +
                  format_timestamp(cue.end) +
                  " ends before it starts; counting 0s");
    }

    if (is_speaker_marker(line)) {
        close_block_();
        start_block_(line, cue);
    } else if (current_) {
        current_->speech += ' ';
        current_->speech += line;
        current_->end = cue.end;
    }

    // Added after a block start too: the marker cue counts toward its block.
    double seconds = cue_seconds(cue);
    if (current_) {
        current_->duration += seconds;
    } else {
        unattributed_seconds_ += seconds;
    }
}

void BlockSegmenter::start_block_(const std::string &line, const Cue &cue) {
    Block block;
    block.start = cue.start;
    block.end = cue.end;
    block.duration = 0.0;
    block.speech = line;

    auto label = extract_speaker_label(line);
    block.speaker = label ? resolver_.resolve(*label) : UNKNOWN_SPEAKER;

    current_ = std::move(block);
}

void BlockSegmenter::close_block_() {
    if (!current_)
        return;
    blocks_.push_back(std::move(*current_));
    current_.reset();
}

std::vector<Block> BlockSegmenter::finish(bool flush_trailing) {
    if (current_) {
        if (flush_trailing) {
            close_block_();
        } else {
            log_debug("Dropping trailing block for '" + current_->speaker +
                      "'");
            dropped_seconds_ += current_->duration;
            current_.reset();
        }
    }
    return std::move(blocks_);
}

} // namespace capscribe
