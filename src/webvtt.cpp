#include "capscribe/webvtt.hpp"

#include "capscribe/error.hpp"
#include "capscribe/log.hpp"

#include <cctype>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <stdexcept>

namespace capscribe {

namespace {

const std::string MINIMAL_HEADER = "WEBVTT\r\n";
const std::string TIMING_ARROW = "-->";

// Split on "\r\n", "\n" or "\r".
std::vector<std::string> split_lines(const std::string &text) {
    std::vector<std::string> lines;
    std::string current;
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r' || c == '\n') {
            lines.push_back(std::move(current));
            current.clear();
            if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
        } else {
            current += c;
        }
    }
    if (!current.empty())
        lines.push_back(std::move(current));
    return lines;
}

std::string trim(const std::string &s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

bool is_timing_line(const std::string &line) {
    return line.find(TIMING_ARROW) != std::string::npos;
}

// "NOTE", "STYLE" and "REGION" blocks carry no cues.
bool is_metadata_block(const std::string &line) {
    for (const char *kw : {"NOTE", "STYLE", "REGION"}) {
        std::string k(kw);
        if (line.compare(0, k.size(), k) == 0 &&
            (line.size() == k.size() || line[k.size()] == ' ' ||
             line[k.size()] == '\t'))
            return true;
    }
    return false;
}

// Parse "start --> end [settings]"; line_no is 1-based.
void parse_timing(const std::string &line, int line_no, Cue &cue) {
    auto arrow = line.find(TIMING_ARROW);
    std::string start_str = trim(line.substr(0, arrow));
    std::string rest = trim(line.substr(arrow + TIMING_ARROW.size()));

    // Cue settings follow the end timestamp after whitespace.
    size_t ws = 0;
    while (ws < rest.size() &&
           !std::isspace(static_cast<unsigned char>(rest[ws])))
        ++ws;
    std::string end_str = rest.substr(0, ws);

    auto start = try_parse_timestamp(start_str);
    if (!start) {
        throw CueParseError("Invalid cue start time '" + start_str + "'",
                            line_no);
    }
    auto end = try_parse_timestamp(end_str);
    if (!end) {
        throw CueParseError("Invalid cue end time '" + end_str + "'",
                            line_no);
    }
    cue.start = *start;
    cue.end = *end;
}

} // namespace

// ─── Header Repair ──────────────────────────────────────────────────────────

bool has_timestamp_prefix(const std::string &line) {
    // ^\d\d:\d\d:\d\d\.\d\d\d
    static const char *pattern = "dd:dd:dd.ddd";
    if (line.size() < 12)
        return false;
    for (size_t i = 0; i < 12; ++i) {
        char p = pattern[i];
        char c = line[i];
        if (p == 'd') {
            if (!std::isdigit(static_cast<unsigned char>(c)))
                return false;
        } else if (c != p) {
            return false;
        }
    }
    return true;
}

std::string repair_header(const std::string &text) {
    size_t line_start = 0;
    while (line_start < text.size()) {
        size_t line_end = text.find_first_of("\r\n", line_start);
        std::string line = text.substr(
            line_start, line_end == std::string::npos ? std::string::npos
                                                      : line_end - line_start);
        if (has_timestamp_prefix(line)) {
            return MINIMAL_HEADER + text.substr(line_start);
        }
        if (line_end == std::string::npos)
            break;
        line_start = line_end + 1;
        if (text[line_end] == '\r' && line_start < text.size() &&
            text[line_start] == '\n')
            ++line_start;
    }
    throw PreprocessError("No timestamp-like lines found!");
}

// ─── WebVTT Parsing ─────────────────────────────────────────────────────────

std::vector<Cue> parse_webvtt(const std::string &text) {
    auto lines = split_lines(text);

    // UTF-8 BOM
    if (!lines.empty() && lines[0].size() >= 3 &&
        static_cast<unsigned char>(lines[0][0]) == 0xEF &&
        static_cast<unsigned char>(lines[0][1]) == 0xBB &&
        static_cast<unsigned char>(lines[0][2]) == 0xBF) {
        lines[0].erase(0, 3);
    }

    if (lines.empty() || lines[0].compare(0, 6, "WEBVTT") != 0) {
        throw CueParseError("Missing WEBVTT header", 1);
    }

    const size_t n = lines.size();
    size_t i = 1;
    while (i < n && !lines[i].empty() && !is_timing_line(lines[i]))
        ++i;

    std::vector<Cue> cues;
    while (i < n) {
        const std::string &line = lines[i];

        if (line.empty()) {
            ++i;
            continue;
        }

        if (is_timing_line(line)) {
            Cue cue;
            parse_timing(line, static_cast<int>(i + 1), cue);
            ++i;

            std::string payload;
            bool first = true;
            while (i < n && !lines[i].empty() && !is_timing_line(lines[i])) {
                if (!first)
                    payload += '\n';
                payload += lines[i];
                first = false;
                ++i;
            }
            cue.text = std::move(payload);
            cues.push_back(std::move(cue));
            continue;
        }

        if (is_metadata_block(line)) {
            while (i < n && !lines[i].empty())
                ++i;
            continue;
        }

        // Cue identifier
        if (i + 1 < n && is_timing_line(lines[i + 1])) {
            ++i;
            continue;
        }

        throw CueParseError("Cue text without a timing line",
                            static_cast<int>(i + 1));
    }

    return cues;
}

std::vector<Cue> read_caption_file(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open caption file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    auto cues = parse_webvtt(repair_header(content));
    log_debug("Read " + std::to_string(cues.size()) + " cues from " + path);
    return cues;
}

} // namespace capscribe
