#include "capscribe/batch.hpp"

#include "capscribe/log.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace fs = std::filesystem;

namespace capscribe {

BatchSummary process_directory(const std::string &src_dir,
                               const std::string &dst_dir,
                               const KnownSpeakers &known,
                               const ParseOptions &options) {
    if (!fs::is_directory(src_dir)) {
        throw std::runtime_error("Not a directory: " + src_dir);
    }
    fs::create_directories(dst_dir);

    std::vector<fs::path> sources;
    for (const auto &entry : fs::directory_iterator(src_dir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".vtt")
            sources.push_back(entry.path());
    }
    std::sort(sources.begin(), sources.end());

    BatchSummary summary;
    for (const auto &src : sources) {
        fs::path dst = fs::path(dst_dir) / src.stem();
        dst += ".txt";

        if (fs::exists(dst)) {
            log_debug("Skipping " + src.filename().string() +
                      ": transcript exists");
            ++summary.skipped;
            continue;
        }

        log_info("Parsing " + src.filename().string());
        CaptionParse result;
        try {
            result = parse_caption_file(src.string(), known, options);
        } catch (const std::exception &e) {
            log_warning("Error parsing " + src.string() + ": " + e.what());
            ++summary.failed;
            continue;
        }

        std::ofstream out(dst, std::ios::binary);
        if (!out) {
            throw std::runtime_error("Cannot write transcript: " +
                                     dst.string());
        }
        out << result.transcript();
        ++summary.written;
    }

    log_info("Batch done: " + std::to_string(summary.written) + " written, " +
             std::to_string(summary.skipped) + " skipped, " +
             std::to_string(summary.failed) + " failed");
    return summary;
}

} // namespace capscribe
