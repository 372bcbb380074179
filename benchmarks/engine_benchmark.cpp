// mergeguard benchmarks: measures throughput of the analysis steps.

#include <mergeguard/mergeguard.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace mergeguard;

// Synthetic repository: `files` modules of 20 functions each. Proposal i
// edits function (i % 20) in files i and i + 1, so neighbours overlap.
static auto make_input(std::size_t proposals, std::size_t files) -> AnalysisInput {
    auto input = AnalysisInput{};
    auto symbols = std::vector<FileSymbols>{};
    for (std::size_t f = 0; f < files; ++f) {
        auto fs = FileSymbols{.path = "pkg/mod" + std::to_string(f) + ".py"};
        for (std::uint32_t k = 0; k < 20; ++k) {
            auto s = Symbol{};
            s.name = "fn" + std::to_string(k);
            s.file = fs.path;
            s.lines = LineRange{k * 10 + 1, k * 10 + 9};
            s.module = "pkg.mod" + std::to_string(f);
            fs.symbols.push_back(std::move(s));
        }
        if (f > 0) fs.imports.push_back(Import{.target = "pkg.mod" + std::to_string(f - 1), .line = 1});
        symbols.push_back(std::move(fs));
    }
    input.graph = DependencyGraph::from_imports(symbols);

    for (std::size_t i = 0; i < proposals; ++i) {
        auto p = ChangeProposal{};
        p.id = i + 1;
        p.source_branch = "feature/" + std::to_string(i);
        p.target_branch = "main";
        const auto line = static_cast<std::uint32_t>((i % 20) * 10 + 3);
        for (auto f : {i % files, (i + 1) % files}) {
            auto hunk = Hunk::from_header(line, 2, line, 2);
            hunk.added_lines = {"x = 1", "y = 2"};
            hunk.removed_lines = {"x = 0", "y = 0"};
            p.files.push_back(FileDiff{.path = symbols[f].path, .previous_path = std::nullopt,
                                       .change = FileChange::modified, .hunks = {hunk}});
            input.symbols[p.id].base.emplace(symbols[f].path, symbols[f]);
            input.symbols[p.id].head.emplace(symbols[f].path, symbols[f]);
        }
        input.proposals.push_back(std::move(p));
    }
    return input;
}

// =============================================================================
// Engine
// =============================================================================

static void bm_analyze(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto input = make_input(n, n / 2 + 1);
    auto config = Config{};
    config.max_open_prs = n;
    auto engine = Engine{config};
    for (auto _ : state) {
        auto result = engine.analyze(input);
        benchmark::DoNotOptimize(result);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n * (n - 1) / 2));
}
BENCHMARK(bm_analyze)->Arg(8)->Arg(30)->Arg(100)->Unit(benchmark::kMillisecond);

static void bm_analyze_serial(benchmark::State& state) {
    auto input = make_input(30, 16);
    auto config = Config{};
    config.worker_count = 1;
    auto engine = Engine{config};
    for (auto _ : state) {
        auto result = engine.analyze(input);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(bm_analyze_serial)->Unit(benchmark::kMillisecond);

// =============================================================================
// Pairwise steps
// =============================================================================

static void bm_compute_overlaps(benchmark::State& state) {
    auto input = make_input(2, 2);
    auto a = ProposalView{input.proposals[0], input.symbols.at(1)};
    auto b = ProposalView{input.proposals[1], input.symbols.at(2)};
    for (auto _ : state) {
        benchmark::DoNotOptimize(compute_overlaps(a, b));
    }
}
BENCHMARK(bm_compute_overlaps);

static void bm_classify(benchmark::State& state) {
    auto input = make_input(2, 2);
    auto a = ProposalView{input.proposals[0], input.symbols.at(1)};
    auto b = ProposalView{input.proposals[1], input.symbols.at(2)};
    auto overlaps = compute_overlaps(a, b);
    for (auto _ : state) {
        benchmark::DoNotOptimize(classify(a, b, overlaps, input.graph));
    }
}
BENCHMARK(bm_classify);

static void bm_reverse_reach(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto input = make_input(1, n);
    for (auto _ : state) {
        benchmark::DoNotOptimize(input.graph.reverse_reach({"pkg/mod0.py"}, 5));
    }
}
BENCHMARK(bm_reverse_reach)->Range(8, 512);

static void bm_token_jaccard(benchmark::State& state) {
    auto a = Symbol{};
    a.name = "parseInvoiceTotal";
    a.source = "return sum(line.amount for line in invoice.lines if not line.void)";
    auto b = a;
    b.name = "parse_invoice_total";
    for (auto _ : state) {
        benchmark::DoNotOptimize(token_jaccard(a, b));
    }
}
BENCHMARK(bm_token_jaccard);
