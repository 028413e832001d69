#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace capscribe {

// Placeholder speaker for turns whose marker carries no name.
inline constexpr const char *UNKNOWN_SPEAKER = "UNKNOWN";

// ─── Edit Distance ──────────────────────────────────────────────────────────

// Levenshtein distance (unit-cost insertion, deletion, substitution),
// counted in Unicode code points of the UTF-8 input. Ill-formed bytes count
// as U+FFFD each.
size_t levenshtein_distance(const std::string &a, const std::string &b);

// Candidate with the lowest distance to query. Ties go to the earliest
// candidate. candidates must not be empty.
const std::string &closest_match(const std::string &query,
                                 const std::vector<std::string> &candidates);

// Full Unicode lowercase mapping (root locale) of UTF-8 text.
std::string lowercase(const std::string &text);

// ─── Known Speakers ─────────────────────────────────────────────────────────

// Ordered list of canonical lowercase names. The UNKNOWN sentinel is always
// the last entry and is never read from the file.
class KnownSpeakers {
  public:
    KnownSpeakers();
    explicit KnownSpeakers(const std::vector<std::string> &names);

    // One name per line; surrounding whitespace trimmed, blank lines skipped.
    static KnownSpeakers load(const std::string &path);
    static KnownSpeakers parse(const std::string &text);

    // load(), except that without inference a missing file yields the
    // sentinel alone: the list then only seeds the speaker map.
    static KnownSpeakers load_for(const std::string &path, bool infer);

    const std::vector<std::string> &names() const { return names_; }
    size_t size() const { return names_.size(); }

  private:
    std::vector<std::string> names_;
};

// ─── Speaker Resolver ───────────────────────────────────────────────────────

/// Maps raw speaker labels (lowercased, trimmed) to canonical names.
///
/// Hand-entered captions misspell names often. The first time a label is
/// seen it is matched against the known speakers by edit distance and the
/// result is memoized; later lookups of the same label are a hash hit.
/// With inference disabled labels pass through untouched.
///
///   SpeakerResolver r(KnownSpeakers({"smith", "jones"}));
///   r.resolve("smth");   // "smith"
///
class SpeakerResolver {
  public:
    explicit SpeakerResolver(KnownSpeakers known, bool infer = true);

    std::string resolve(const std::string &raw_label);

    bool infer() const { return infer_; }
    const KnownSpeakers &known() const { return known_; }

    // Mapping in first-resolution order (seed entries first).
    const std::vector<std::pair<std::string, std::string>> &
    mapping() const {
        return entries_;
    }

    // Entries whose raw label differs from the canonical name.
    std::vector<std::pair<std::string, std::string>> corrections() const;

    // Number of labels resolved by distance search (cache misses).
    size_t distance_lookups() const { return distance_lookups_; }

  private:
    KnownSpeakers known_;
    bool infer_;
    std::unordered_map<std::string, size_t> index_; // label -> entries_ slot
    std::vector<std::pair<std::string, std::string>> entries_;
    size_t distance_lookups_ = 0;

    void insert_(const std::string &raw, const std::string &canonical);
};

} // namespace capscribe
