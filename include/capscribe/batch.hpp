#pragma once

#include <string>

#include "capscribe/parse.hpp"
#include "capscribe/speaker.hpp"

namespace capscribe {

// ─── Batch Transcription ────────────────────────────────────────────────────

struct BatchSummary {
    size_t written = 0;
    size_t skipped = 0; // transcript already present
    size_t failed = 0;  // preprocess or parse error
};

/// Write "<stem>.txt" transcripts into dst_dir for every "*.vtt" file in
/// src_dir, in name order. Existing transcripts are left alone. A file that
/// fails to preprocess or parse is logged and skipped. dst_dir is created if
/// it does not exist.
BatchSummary process_directory(const std::string &src_dir,
                               const std::string &dst_dir,
                               const KnownSpeakers &known,
                               const ParseOptions &options = {});

} // namespace capscribe
