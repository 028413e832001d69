#include "capscribe/capscribe.hpp"

#include <benchmark/benchmark.h>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

// ─── Custom CLI flags ───────────────────────────────────────────────────────

static bool flag_markdown = false;

static void parse_custom_flags(int *argc, char **argv) {
    int out = 1;
    for (int i = 1; i < *argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--markdown")
            flag_markdown = true;
        else
            argv[out++] = argv[i];
    }
    *argc = out;
}

// ─── Synthetic captions ─────────────────────────────────────────────────────

static const std::vector<std::string> speaker_names = {
    "mayor harrell", "councilmember mosqueda", "councilmember sawant",
    "councilmember pedersen", "city clerk", "council president juarez"};

// Hand-typed captions: every fifth cue opens a turn, one turn in three
// misspells the name, and each line is shown twice while it scrolls.
static std::vector<capscribe::Cue> make_cues(size_t n) {
    std::vector<capscribe::Cue> cues;
    cues.reserve(n);

    int64_t t = 0;
    size_t turn = 0;
    while (cues.size() < n) {
        size_t i = cues.size() / 2;
        std::string text;
        if (i % 5 == 0) {
            std::string name = speaker_names[turn % speaker_names.size()];
            if (turn % 3 == 1 && name.size() > 4)
                name.erase(name.size() / 2, 1);
            text = ">> " + name + ": item " + std::to_string(i);
            ++turn;
        } else {
            text = "line " + std::to_string(i) + " of the public record";
        }

        for (int rep = 0; rep < 2 && cues.size() < n; ++rep) {
            capscribe::Cue c;
            c.start = capscribe::TimeOfDay{t};
            c.end = capscribe::TimeOfDay{t + 1500};
            c.text = text + "\r\n";
            cues.push_back(std::move(c));
            t += 750;
        }
    }
    return cues;
}

static std::string make_vtt(size_t n) {
    std::string vtt = "WEBVTT\r\nKind: captions\r\nLanguage: en\r\n\r\n";
    for (const auto &c : make_cues(n)) {
        vtt += capscribe::format_timestamp(c.start) + " --> " +
               capscribe::format_timestamp(c.end) + " align:start\r\n";
        vtt += c.text + "\r\n";
    }
    return vtt;
}

// ─── Markdown reporter ──────────────────────────────────────────────────────

class MarkdownReporter : public benchmark::BenchmarkReporter {
  public:
    bool ReportContext(const Context &) override {
        std::cerr << "Running benchmarks..." << std::endl;
        return true;
    }

    void ReportRuns(const std::vector<Run> &reports) override {
        for (const auto &r : reports)
            runs_.push_back(r);
    }

    void Finalize() override {
        if (runs_.empty())
            return;

        std::cout << "| Benchmark | Time (ms) | Items/s |\n";
        std::cout << "|-----------|-----------|---------|\n";

        for (const auto &r : runs_) {
            double time_ms = r.real_accumulated_time /
                             static_cast<double>(r.iterations) * 1000.0;
            double rate = 0.0;
            auto it = r.counters.find("items_per_second");
            if (it != r.counters.end())
                rate = it->second.value;

            std::cout << "| " << r.benchmark_name() << " | " << std::fixed
                      << std::setprecision(3) << time_ms << " | "
                      << std::setprecision(0) << rate << " |\n";
        }
    }

  private:
    std::vector<Run> runs_;
};

// ─── Benchmark registration ─────────────────────────────────────────────────

static const std::vector<int64_t> cue_counts = {1000, 10000, 100000};

static void add_count_args(benchmark::internal::Benchmark *b) {
    for (auto n : cue_counts)
        b->Arg(n);
    b->UseRealTime()->Unit(benchmark::kMillisecond);
}

static void register_benchmarks() {
    const capscribe::KnownSpeakers known(speaker_names);

    // Segmentation over pre-parsed cues, inference on
    add_count_args(benchmark::RegisterBenchmark(
        "segment", [known](benchmark::State &state) {
            auto cues = make_cues(static_cast<size_t>(state.range(0)));
            for (auto _ : state) {
                auto result = capscribe::parse_captions(cues, known);
                benchmark::DoNotOptimize(result.blocks.data());
            }
            state.SetItemsProcessed(state.iterations() * state.range(0));
        }));

    // Same stream with inference off (resolver passthrough)
    add_count_args(benchmark::RegisterBenchmark(
        "segment_no_infer", [known](benchmark::State &state) {
            auto cues = make_cues(static_cast<size_t>(state.range(0)));
            capscribe::ParseOptions opts;
            opts.infer_speakers = false;
            for (auto _ : state) {
                auto result = capscribe::parse_captions(cues, known, opts);
                benchmark::DoNotOptimize(result.blocks.data());
            }
            state.SetItemsProcessed(state.iterations() * state.range(0));
        }));

    // Header repair + WebVTT parse
    add_count_args(benchmark::RegisterBenchmark(
        "parse_webvtt", [](benchmark::State &state) {
            auto vtt = make_vtt(static_cast<size_t>(state.range(0)));
            for (auto _ : state) {
                auto cues =
                    capscribe::parse_webvtt(capscribe::repair_header(vtt));
                benchmark::DoNotOptimize(cues.data());
            }
            state.SetItemsProcessed(state.iterations() * state.range(0));
        }));

    // Cold resolver: every label is a cache miss
    benchmark::RegisterBenchmark(
        "resolve_miss", [known](benchmark::State &state) {
            for (auto _ : state) {
                capscribe::SpeakerResolver resolver(known);
                for (const auto &name : speaker_names) {
                    std::string typo = name;
                    typo[0] = 'x';
                    benchmark::DoNotOptimize(resolver.resolve(typo));
                }
            }
            state.SetItemsProcessed(
                state.iterations() *
                static_cast<int64_t>(speaker_names.size()));
        })
        ->Unit(benchmark::kMicrosecond);
}

// ─── Main ────────────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    parse_custom_flags(&argc, argv);

    capscribe::set_log_level(capscribe::LogLevel::Error);
    benchmark::Initialize(&argc, argv);
    if (benchmark::ReportUnrecognizedArguments(argc, argv))
        return 1;
    register_benchmarks();

    if (flag_markdown) {
        MarkdownReporter reporter;
        benchmark::RunSpecifiedBenchmarks(&reporter);
    } else {
        benchmark::RunSpecifiedBenchmarks();
    }

    benchmark::Shutdown();
    return 0;
}
