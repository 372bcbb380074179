// analyze_snapshot: run the engine over a JSON snapshot
//
// Reads an analysis input snapshot (proposals, symbols, optional graph),
// an optional configuration file and an optional decisions log, and
// writes the analysis result as JSON to stdout. Diagnostics go to stderr.
//
// Build: cmake -B build -DMERGEGUARD_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/analyze_snapshot snapshot.json [config.json] [decisions.jsonl]

#include <mergeguard/mergeguard.hpp>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <exception>
#include <fstream>
#include <string>

namespace mg = mergeguard;
using json = nlohmann::json;

int main(int argc, char** argv) {
    if (argc < 2) {
        std::fprintf(stderr, "usage: %s snapshot.json [config.json] [decisions.jsonl]\n", argv[0]);
        return 2;
    }

    try {
        auto config = argc > 2 ? mg::load_config_file(argv[2]) : mg::Config{};

        auto in = std::ifstream{argv[1]};
        if (!in) {
            std::fprintf(stderr, "cannot open %s\n", argv[1]);
            return 1;
        }
        auto input = mg::load_input(json::parse(in));

        auto log = mg::DecisionLog{};
        auto options = mg::AnalysisOptions{};
        if (argc > 3) {
            auto decisions = std::ifstream{argv[3]};
            if (!decisions) {
                std::fprintf(stderr, "cannot open %s\n", argv[3]);
                return 1;
            }
            log = mg::load_decisions(decisions);
            options.decisions = &log;
        }

        auto result = mg::Engine{config}.analyze(input, options);

        for (const auto& d : result.diagnostics.items()) {
            std::fprintf(stderr, "%s: %s: %s\n",
                         std::string{mg::to_string_view(d.level)}.c_str(), d.code.c_str(), d.message.c_str());
        }
        std::printf("%s\n", json(result).dump(2).c_str());

        auto failed = false;
        for (const auto& r : result.reports) {
            failed = failed || r.status == mg::ReportStatus::fail || r.status == mg::ReportStatus::error;
        }
        return failed ? 3 : 0;
    } catch (const mg::ConfigError& e) {
        std::fprintf(stderr, "configuration error: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
        return 1;
    }
}
