#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "capscribe/log.hpp"
#include "capscribe/parse.hpp"

namespace capscribe {

// Bad command line. The message is shown above the usage text.
class UsageError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct CliOptions {
    bool batch = false;
    OutputMode output = OutputMode::Transcript; // single-file modes
    std::string captions_path;
    std::string src_dir; // --batch
    std::string dst_dir; // --batch
    std::string speaker_list = "known_speakers.txt";
    ParseOptions parse;
    LogLevel log_level = LogLevel::Info;
};

/// Parse the arguments after the program name. Exactly one of
/// --get-transcript, --get-speaker-times, --get-blocks or --batch must be
/// given. Throws UsageError otherwise.
CliOptions parse_cli_args(const std::vector<std::string> &args);

} // namespace capscribe
