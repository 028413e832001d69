#include "capscribe/cli.hpp"

namespace capscribe {

CliOptions parse_cli_args(const std::vector<std::string> &args) {
    CliOptions opts;
    std::vector<std::string> positional;
    int modes = 0;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];
        if (arg == "--get-transcript") {
            opts.output = OutputMode::Transcript;
            ++modes;
        } else if (arg == "--get-speaker-times") {
            opts.output = OutputMode::SpeakerTimes;
            ++modes;
        } else if (arg == "--get-blocks") {
            opts.output = OutputMode::Blocks;
            ++modes;
        } else if (arg == "--batch") {
            opts.batch = true;
            ++modes;
        } else if (arg == "--no-infer-speakers") {
            opts.parse.infer_speakers = false;
        } else if (arg == "--drop-trailing-block") {
            opts.parse.flush_trailing_block = false;
        } else if (arg == "--speaker-list-file") {
            if (i + 1 >= args.size())
                throw UsageError("--speaker-list-file requires a path");
            opts.speaker_list = args[++i];
        } else if (arg == "--verbose") {
            opts.log_level = LogLevel::Debug;
        } else if (arg == "--quiet") {
            opts.log_level = LogLevel::Error;
        } else if (arg.starts_with("--")) {
            throw UsageError("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (modes == 0)
        throw UsageError("A mode is required");
    if (modes > 1)
        throw UsageError("Only one mode may be given");

    if (opts.batch) {
        if (positional.size() != 2)
            throw UsageError("--batch takes <src_dir> <dst_dir>");
        opts.src_dir = positional[0];
        opts.dst_dir = positional[1];
    } else {
        if (positional.size() != 1)
            throw UsageError("Expected one captions file");
        opts.captions_path = positional[0];
    }
    return opts;
}

} // namespace capscribe
