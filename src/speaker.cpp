#include "capscribe/speaker.hpp"

#include "capscribe/log.hpp"

#include <unicode/locid.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace capscribe {

// ─── Edit Distance ──────────────────────────────────────────────────────────

static std::u32string to_code_points(const std::string &text) {
    std::u32string out;
    out.reserve(text.size());
    const auto *s = reinterpret_cast<const uint8_t *>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT_OR_FFFD(s, i, length, c);
        out.push_back(static_cast<char32_t>(c));
    }
    return out;
}

size_t levenshtein_distance(const std::string &utf8_a,
                            const std::string &utf8_b) {
    const std::u32string a = to_code_points(utf8_a);
    const std::u32string b = to_code_points(utf8_b);
    if (a.empty())
        return b.size();
    if (b.empty())
        return a.size();

    // Two rolling rows over b: prev = row i-1, curr = row i
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> curr(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j)
        prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        curr[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            curr[j] = std::min({prev[j] + 1,          // deletion
                                curr[j - 1] + 1,      // insertion
                                prev[j - 1] + cost}); // substitution
        }
        std::swap(prev, curr);
    }
    return prev[b.size()];
}

const std::string &closest_match(const std::string &query,
                                 const std::vector<std::string> &candidates) {
    if (candidates.empty()) {
        throw std::invalid_argument("closest_match: no candidates");
    }

    size_t best = 0;
    size_t best_distance = levenshtein_distance(query, candidates[0]);
    for (size_t i = 1; i < candidates.size() && best_distance > 0; ++i) {
        size_t d = levenshtein_distance(query, candidates[i]);
        if (d < best_distance) {
            best_distance = d;
            best = i;
        }
    }
    return candidates[best];
}

std::string lowercase(const std::string &text) {
    auto u = icu::UnicodeString::fromUTF8(text);
    u.toLower(icu::Locale::getRoot());
    std::string out;
    u.toUTF8String(out);
    return out;
}

// ─── Known Speakers ─────────────────────────────────────────────────────────

KnownSpeakers::KnownSpeakers() : names_{UNKNOWN_SPEAKER} {}

KnownSpeakers::KnownSpeakers(const std::vector<std::string> &names) {
    for (const auto &name : names) {
        if (!name.empty() && name != UNKNOWN_SPEAKER)
            names_.push_back(name);
    }
    names_.push_back(UNKNOWN_SPEAKER);
}

KnownSpeakers KnownSpeakers::parse(const std::string &text) {
    std::vector<std::string> names;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto b = std::find_if_not(line.begin(), line.end(), [](char c) {
            return std::isspace(static_cast<unsigned char>(c));
        });
        auto e = std::find_if_not(line.rbegin(), line.rend(), [](char c) {
                     return std::isspace(static_cast<unsigned char>(c));
                 }).base();
        if (b < e)
            names.emplace_back(b, e);
    }
    return KnownSpeakers(names);
}

KnownSpeakers KnownSpeakers::load(const std::string &path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open speaker list: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto known = parse(ss.str());
    log_debug("Loaded " + std::to_string(known.size() - 1) +
              " known speakers from " + path);
    return known;
}

KnownSpeakers KnownSpeakers::load_for(const std::string &path, bool infer) {
    if (!infer && !std::filesystem::exists(path)) {
        log_debug("No speaker list at " + path + "; labels pass through");
        return KnownSpeakers();
    }
    return load(path);
}

// ─── Speaker Resolver ───────────────────────────────────────────────────────

SpeakerResolver::SpeakerResolver(KnownSpeakers known, bool infer)
    : known_(std::move(known)), infer_(infer) {
    for (const auto &name : known_.names())
        insert_(name, name);
}

void SpeakerResolver::insert_(const std::string &raw,
                              const std::string &canonical) {
    if (index_.count(raw))
        return;
    index_.emplace(raw, entries_.size());
    entries_.emplace_back(raw, canonical);
}

std::string SpeakerResolver::resolve(const std::string &raw_label) {
    if (!infer_)
        return raw_label;

    auto it = index_.find(raw_label);
    if (it != index_.end())
        return entries_[it->second].second;

    const std::string &best = closest_match(raw_label, known_.names());
    ++distance_lookups_;
    insert_(raw_label, best);
    log_debug("Inferred speaker '" + raw_label + "' -> '" + best + "'");
    return best;
}

std::vector<std::pair<std::string, std::string>>
SpeakerResolver::corrections() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto &[raw, canonical] : entries_) {
        if (raw != canonical)
            out.emplace_back(raw, canonical);
    }
    return out;
}

} // namespace capscribe
