// basic_usage: demonstrates the core mergeguard API
//
// Builds two open proposals that edit the same function, a third that
// re-adds a recently removed helper, and a guardrail rule, then prints
// each report with its risk breakdown.
//
// Build: cmake -B build -DMERGEGUARD_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/basic_usage

#include <mergeguard/mergeguard.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace mg = mergeguard;

static auto function(std::string name, std::string file, std::uint32_t start, std::uint32_t end,
                     std::string module) -> mg::Symbol {
    auto s = mg::Symbol{};
    s.name = std::move(name);
    s.file = std::move(file);
    s.lines = mg::LineRange{start, end};
    s.module = std::move(module);
    return s;
}

static auto edit(std::string path, std::uint32_t line, std::uint32_t count,
                 std::vector<std::string> added) -> mg::FileDiff {
    auto hunk = mg::Hunk::from_header(line, count, line, static_cast<std::uint32_t>(added.size()));
    hunk.added_lines = std::move(added);
    hunk.removed_lines.assign(count, "");
    return mg::FileDiff{.path = std::move(path), .previous_path = std::nullopt,
                        .change = mg::FileChange::modified, .hunks = {std::move(hunk)}};
}

static auto proposal(mg::ProposalId id, std::string title, std::vector<mg::FileDiff> files) -> mg::ChangeProposal {
    auto p = mg::ChangeProposal{};
    p.id = id;
    p.title = std::move(title);
    p.source_branch = "feature/" + std::to_string(id);
    p.target_branch = "main";
    p.files = std::move(files);
    return p;
}

int main() {
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // -- Configuration: default weights plus one guardrail --------------------
    auto config = mg::Config{};
    auto rule = mg::GuardrailRule{};
    rule.name = "no-debug-output";
    rule.forbidden_content = {"print("};
    rule.message = "use the logger instead of print()";
    config.rules.push_back(rule);
    auto engine = mg::Engine{config};

    // -- Symbols on the target branch ------------------------------------------
    auto orders = mg::FileSymbols{.path = "shop/orders.py"};
    orders.symbols.push_back(function("total", "shop/orders.py", 5, 30, "shop.orders"));
    auto util = mg::FileSymbols{.path = "shop/util.py"};
    util.symbols.push_back(function("round_price", "shop/util.py", 1, 8, "shop.util"));

    auto input = mg::AnalysisInput{};
    input.proposals.push_back(proposal(101, "apply discounts", {edit("shop/orders.py", 12, 3, {"a", "b", "c"})}));
    input.proposals.push_back(proposal(102, "tax rounding", {edit("shop/orders.py", 13, 1, {"print(rate)"})}));

    auto util_head = util;
    util_head.symbols.push_back(function("legacy_round", "shop/util.py", 10, 14, "shop.util"));
    input.proposals.push_back(proposal(103, "restore rounding", {edit("shop/util.py", 9, 1, {"", "def legacy_round(x):", "", "", ""})}));

    for (auto id : {mg::ProposalId{101}, mg::ProposalId{102}}) {
        input.symbols[id].base.emplace(orders.path, orders);
        input.symbols[id].head.emplace(orders.path, orders);
    }
    input.symbols[103].base.emplace(util.path, util);
    input.symbols[103].head.emplace(util.path, util_head);
    input.graph = mg::DependencyGraph::from_imports({orders, util});

    // -- Decisions recorded from earlier merges --------------------------------
    auto log = mg::DecisionLog{};
    auto removal = mg::Decision{};
    removal.kind = mg::DecisionKind::removal;
    removal.entity = "legacy_round";
    removal.module = "shop.util";
    removal.origin = 97;
    removal.description = "replaced by round_price";
    removal.timestamp = now - 2 * 60 * 60 * 1000;
    log.append(removal);

    auto options = mg::AnalysisOptions{};
    options.now = now;
    options.decisions = &log;

    // -- Analyse and print ------------------------------------------------------
    auto result = engine.analyze(input, options);

    for (const auto& report : result.reports) {
        std::printf("#%llu  %-5s  risk %5.1f%s\n",
                    static_cast<unsigned long long>(report.id),
                    std::string{mg::to_string_view(report.status)}.c_str(),
                    report.risk.composite,
                    report.exceeds_threshold ? "  (over threshold)" : "");
        for (auto f : mg::all_risk_factors) {
            const auto& score = report.risk.factor(f);
            std::printf("    %-18s %5.2f x %.2f = %5.1f%s\n",
                        std::string{mg::to_string_view(f)}.c_str(),
                        score.raw, score.weight, score.weighted,
                        score.available ? "" : "  (unavailable)");
        }
        for (const auto& c : report.conflicts) {
            std::printf("  [%s/%s] %s\n",
                        std::string{mg::to_string_view(c.severity)}.c_str(),
                        std::string{mg::to_string_view(c.kind)}.c_str(),
                        c.description.c_str());
        }
    }

    std::printf("\n%zu pair(s) compared, %zu filtered, %zu diagnostic(s)\n",
                result.compared_pairs, result.filtered_pairs, result.diagnostics.items().size());
    return 0;
}
