#include "capscribe/parse.hpp"

#include "capscribe/log.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace capscribe {

// ─── CaptionParse ───────────────────────────────────────────────────────────

std::string CaptionParse::transcript() const {
    std::string out;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0)
            out += '\n';
        out += blocks[i].speech;
    }
    return out;
}

std::map<std::string, double> CaptionParse::speaker_times() const {
    std::map<std::string, double> times;
    for (const auto &b : blocks)
        times[b.speaker] += b.duration;
    return times;
}

double CaptionParse::total_seconds() const {
    double total = 0.0;
    for (const auto &b : blocks)
        total += b.duration;
    return total;
}

// ─── High-Level API ─────────────────────────────────────────────────────────

CaptionParse parse_captions(const std::vector<Cue> &cues,
                            const KnownSpeakers &known,
                            const ParseOptions &options) {
    SpeakerResolver resolver(known, options.infer_speakers);
    BlockSegmenter segmenter(resolver);

    for (const auto &cue : cues)
        segmenter.feed(cue);

    CaptionParse result;
    result.blocks = segmenter.finish(options.flush_trailing_block);
    result.corrections = resolver.corrections();

    result.stats.cues = segmenter.cues_seen();
    result.stats.duplicates = segmenter.duplicates();
    result.stats.distance_lookups = resolver.distance_lookups();
    result.stats.unattributed_seconds = segmenter.unattributed_seconds();
    result.stats.dropped_seconds = segmenter.dropped_seconds();

    log_debug(std::to_string(result.blocks.size()) + " blocks from " +
              std::to_string(result.stats.cues) + " cues (" +
              std::to_string(result.stats.duplicates) + " duplicates, " +
              std::to_string(result.stats.distance_lookups) +
              " speaker lookups)");
    if (result.stats.unattributed_seconds > 0.0) {
        log_debug("Unattributed caption time before first speaker marker: " +
                  std::to_string(result.stats.unattributed_seconds) + "s");
    }
    return result;
}

CaptionParse parse_caption_file(const std::string &path,
                                const KnownSpeakers &known,
                                const ParseOptions &options) {
    return parse_captions(read_caption_file(path), known, options);
}

// ─── Output Formatting ──────────────────────────────────────────────────────

std::string format_corrections(const CaptionParse &result) {
    std::ostringstream out;
    for (const auto &[raw, canonical] : result.corrections)
        out << "Inferred " << raw << " -> " << canonical << "\n";
    return out.str();
}

std::string format_speaker_times(const CaptionParse &result) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    for (const auto &[speaker, seconds] : result.speaker_times())
        out << speaker << ": " << seconds << "\n";
    return out.str();
}

std::string format_blocks(const CaptionParse &result) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(3);
    for (const auto &b : result.blocks) {
        out << "[" << format_timestamp(b.start) << " - "
            << format_timestamp(b.end) << "] " << b.duration << "s "
            << b.speaker << ": " << b.speech << "\n";
    }
    return out.str();
}

std::string format_report(const CaptionParse &result, OutputMode mode) {
    switch (mode) {
    case OutputMode::Transcript:
        return result.transcript() + "\n";
    case OutputMode::SpeakerTimes:
        return format_corrections(result) + "\n" + format_speaker_times(result);
    case OutputMode::Blocks:
        return format_corrections(result) + "\n" + format_blocks(result);
    }
    throw std::invalid_argument("format_report: unknown output mode");
}

} // namespace capscribe
