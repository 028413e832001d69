#include "capscribe/capscribe.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace {

void print_usage(const char *prog) {
    std::cerr
        << "Usage: " << prog << " <captions.vtt> <mode> [options]\n"
        << "       " << prog << " --batch <src_dir> <dst_dir> [options]\n"
        << "\nModes (exactly one):\n"
        << "  --get-transcript      Reconstructed text transcript\n"
        << "  --get-speaker-times   Approximate total speaking time per "
           "speaker\n"
        << "  --get-blocks          Raw reconstructed speech blocks\n"
        << "\nOptions:\n"
        << "  --no-infer-speakers       Don't correct speaker-name typos\n"
        << "  --speaker-list-file PATH  Known speakers, lowercase, one per "
           "line\n"
        << "                            (default: known_speakers.txt)\n"
        << "  --drop-trailing-block     Discard the last speaker's block\n"
        << "  --verbose                 Debug logging\n"
        << "  --quiet                   Only log errors\n"
        << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
    using namespace capscribe;

    CliOptions opts;
    try {
        opts = parse_cli_args(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const UsageError &e) {
        std::cerr << e.what() << std::endl;
        print_usage(argv[0]);
        return 1;
    }
    set_log_level(opts.log_level);

    try {
        auto known = KnownSpeakers::load_for(opts.speaker_list,
                                             opts.parse.infer_speakers);

        if (opts.batch) {
            auto summary =
                process_directory(opts.src_dir, opts.dst_dir, known,
                                  opts.parse);
            return summary.failed > 0 ? 2 : 0;
        }

        auto result = parse_caption_file(opts.captions_path, known,
                                         opts.parse);

        std::cout << format_report(result, opts.output);

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
