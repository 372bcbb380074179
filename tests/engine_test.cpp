#include <mergeguard/engine.hpp>
#include <mergeguard/error.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace mergeguard;
namespace mt = mergeguard::test;
using namespace std::chrono_literals;

namespace {

constexpr auto now_ms = std::int64_t{1'760'000'000'000};

void same_on_both_sides(AnalysisInput& input, ProposalId id, const FileSymbols& f) {
    mt::add_base(input.symbols[id], f);
    mt::add_head(input.symbols[id], f);
}

auto process_file() -> FileSymbols {
    return mt::file_symbols("a.py", {mt::function("process", "a.py", 5, 40)});
}

// Proposals that each edit one line of `process`; every pair is behavioral.
auto edits_to_process(std::initializer_list<std::uint32_t> lines) -> AnalysisInput {
    auto input = AnalysisInput{};
    auto id = ProposalId{1};
    for (auto line : lines) {
        input.proposals.push_back(mt::proposal(id, {mt::modified("a.py", {mt::hunk(line, 1, line, 1)})}));
        same_on_both_sides(input, id, process_file());
        ++id;
    }
    return input;
}

class ThrowingDecisions : public DecisionSource {
public:
    auto recent(std::size_t) const -> std::vector<Decision> override {
        throw std::runtime_error{"log file locked"};
    }
};

auto kinds(const ProposalReport& r) -> std::vector<ConflictKind> {
    auto out = std::vector<ConflictKind>{};
    for (const auto& c : r.conflicts) out.push_back(c.kind);
    return out;
}

}  // namespace

// =============================================================================
// End-to-end scenarios
// =============================================================================

TEST(Engine, same_lines_of_one_function) {
    auto input = AnalysisInput{};
    input.proposals.push_back(mt::proposal(1, {mt::modified("a.py", {mt::hunk(10, 11, 10, 11)})}));
    input.proposals.push_back(mt::proposal(2, {mt::modified("a.py", {mt::hunk(10, 11, 10, 11)})}));
    same_on_both_sides(input, 1, process_file());
    same_on_both_sides(input, 2, process_file());

    auto result = Engine{Config{}}.analyze(input);

    ASSERT_EQ(result.reports.size(), 2u);
    EXPECT_EQ(result.compared_pairs, 1u);
    for (auto id : {ProposalId{1}, ProposalId{2}}) {
        const auto* r = result.report_for(id);
        ASSERT_NE(r, nullptr);
        ASSERT_EQ(r->conflicts.size(), 1u);
        EXPECT_EQ(r->conflicts[0].kind, ConflictKind::hard);
        EXPECT_EQ(r->conflicts[0].severity, Severity::critical);
        EXPECT_EQ(r->status, ReportStatus::fail);
        EXPECT_GE(r->risk.composite, 30.0);
        EXPECT_TRUE(r->clean_pairs.empty());
    }
}

TEST(Engine, signature_change_against_edited_call) {
    auto input = AnalysisInput{};
    auto base = mt::file_symbols("a.py", {mt::function("f", "a.py", 1, 5, "app", mt::params({"x"})),
                                          mt::function("main", "a.py", 10, 20)},
                                 {}, {CallSite{.callee = "f", .line = 12}});
    auto changed = base;
    changed.symbols[0].signature = mt::params({"x", "y"});

    input.proposals.push_back(mt::proposal(1, {mt::modified("a.py", {mt::hunk(1, 1, 1, 1)})}));
    mt::add_base(input.symbols[1], base);
    mt::add_head(input.symbols[1], changed);
    input.proposals.push_back(mt::proposal(2, {mt::modified("a.py", {mt::hunk(12, 1, 12, 1, {"    f(1)"})})}));
    same_on_both_sides(input, 2, base);

    auto result = Engine{Config{}}.analyze(input);

    const auto* r = result.report_for(2);
    ASSERT_NE(r, nullptr);
    ASSERT_EQ(r->conflicts.size(), 1u);
    EXPECT_EQ(r->conflicts[0].kind, ConflictKind::interface);
    EXPECT_EQ(r->conflicts[0].severity, Severity::critical);
    EXPECT_EQ(r->conflicts[0].symbol, "f");
    EXPECT_GE(result.diagnostics.count("degraded"), 1u);
}

TEST(Engine, readding_recently_removed_function) {
    auto log = DecisionLog{};
    auto d = Decision{};
    d.kind = DecisionKind::removal;
    d.entity = "g";
    d.module = "util";
    d.origin = 7;
    d.timestamp = now_ms - 5 * 60'000;
    log.append(d);

    auto input = AnalysisInput{};
    auto base = mt::file_symbols("util.py", {mt::function("h", "util.py", 1, 10, "util")});
    auto head = base;
    head.symbols.push_back(mt::function("g", "util.py", 12, 20, "util"));
    input.proposals.push_back(mt::proposal(2, {mt::modified("util.py", {mt::hunk(11, 1, 11, 10)})}));
    mt::add_base(input.symbols[2], base);
    mt::add_head(input.symbols[2], head);

    auto options = AnalysisOptions{};
    options.now = now_ms;
    options.decisions = &log;
    auto result = Engine{Config{}}.analyze(input, options);

    const auto& r = result.reports.at(0);
    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].kind, ConflictKind::regression);
    EXPECT_NE(r.conflicts[0].severity, Severity::info);
    EXPECT_EQ(r.conflicts[0].target, 7u);

    auto config = Config{};
    config.check_regressions = false;
    EXPECT_TRUE(Engine{config}.analyze(input, options).reports.at(0).conflicts.empty());
}

TEST(Engine, forbidden_import_guardrail) {
    auto config = Config{};
    auto rule = GuardrailRule{};
    rule.name = "billing-isolation";
    rule.pattern = "billing/**";
    rule.forbidden_imports = {"auth/**"};
    config.rules.push_back(rule);

    auto input = AnalysisInput{};
    auto base = mt::file_symbols("billing/x.py", {mt::function("charge", "billing/x.py", 2, 20, "billing")});
    auto head = base;
    head.imports.push_back(Import{.target = "auth.session", .line = 1});
    input.proposals.push_back(mt::proposal(3, {mt::modified("billing/x.py", {mt::hunk(1, 1, 1, 2)})}));
    mt::add_base(input.symbols[3], base);
    mt::add_head(input.symbols[3], head);

    auto result = Engine{config}.analyze(input);

    const auto& r = result.reports.at(0);
    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].kind, ConflictKind::guardrail);
    EXPECT_NE(r.conflicts[0].description.find("billing-isolation"), std::string::npos);
    EXPECT_NE(r.conflicts[0].description.find("auth.session"), std::string::npos);
    EXPECT_EQ(r.status, ReportStatus::warn);
}

// =============================================================================
// Orchestration
// =============================================================================

TEST(Engine, disjoint_proposals_are_filtered) {
    auto input = AnalysisInput{};
    input.proposals.push_back(mt::proposal(1, {mt::modified("a.py", {mt::hunk(1, 1, 1, 1)})}));
    input.proposals.push_back(mt::proposal(2, {mt::modified("b.py", {mt::hunk(1, 1, 1, 1)})}));

    auto result = Engine{Config{}}.analyze(input);
    EXPECT_EQ(result.filtered_pairs, 1u);
    EXPECT_EQ(result.compared_pairs, 0u);
    for (const auto& r : result.reports) {
        EXPECT_TRUE(r.conflicts.empty());
        EXPECT_EQ(r.status, ReportStatus::pass);
        EXPECT_EQ(r.clean_pairs.size(), 1u);
    }
    EXPECT_EQ(result.report_for(1)->clean_pairs[0], 2u);
}

TEST(Engine, rename_is_compared_with_edit_of_old_path) {
    auto renamed = mt::modified("b.py", {mt::hunk(10, 2, 10, 2)});
    renamed.previous_path = "a.py";
    renamed.change = FileChange::renamed;

    auto input = AnalysisInput{};
    input.proposals.push_back(mt::proposal(1, {renamed}));
    input.proposals.push_back(mt::proposal(2, {mt::modified("a.py", {mt::hunk(10, 2, 10, 2)})}));
    mt::add_base(input.symbols[1], process_file());
    mt::add_head(input.symbols[1], mt::file_symbols("b.py", {mt::function("process", "b.py", 5, 40)}));
    same_on_both_sides(input, 2, process_file());

    auto result = Engine{Config{}}.analyze(input);
    EXPECT_EQ(result.filtered_pairs, 0u);
    EXPECT_EQ(result.compared_pairs, 1u);
    for (auto id : {ProposalId{1}, ProposalId{2}}) {
        const auto* r = result.report_for(id);
        ASSERT_NE(r, nullptr);
        EXPECT_EQ(kinds(*r), (std::vector<ConflictKind>{ConflictKind::hard}));
        EXPECT_TRUE(r->clean_pairs.empty());
    }
}

TEST(Engine, compared_pair_without_conflicts_is_clean) {
    auto input = AnalysisInput{};
    input.proposals.push_back(mt::proposal(1, {mt::modified("notes.txt", {mt::hunk(1, 1, 1, 1)})}));
    input.proposals.push_back(mt::proposal(2, {mt::modified("notes.txt", {mt::hunk(50, 1, 50, 1)})}));

    auto result = Engine{Config{}}.analyze(input);
    EXPECT_EQ(result.compared_pairs, 1u);
    EXPECT_EQ(result.report_for(2)->clean_pairs, (std::vector<ProposalId>{1}));
    EXPECT_EQ(result.diagnostics.count("coarse_fallback"), 2u);
}

TEST(Engine, conflicts_are_in_report_order) {
    auto config = Config{};
    auto rule = GuardrailRule{};
    rule.name = "no-print";
    rule.forbidden_content = {"print("};
    config.rules.push_back(rule);

    auto input = AnalysisInput{};
    input.proposals.push_back(mt::proposal(1, {mt::modified("a.py", {mt::hunk(10, 2, 10, 2, {"print(x)", "y"})})}));
    input.proposals.push_back(mt::proposal(2, {mt::modified("a.py", {mt::hunk(11, 1, 11, 1)})}));
    same_on_both_sides(input, 1, process_file());
    same_on_both_sides(input, 2, process_file());

    auto result = Engine{config}.analyze(input);
    const auto* r = result.report_for(1);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(kinds(*r), (std::vector<ConflictKind>{ConflictKind::hard, ConflictKind::guardrail}));
    EXPECT_EQ(kinds(*result.report_for(2)), (std::vector<ConflictKind>{ConflictKind::hard}));
}

TEST(Engine, truncates_to_max_open_proposals) {
    auto config = Config{};
    config.max_open_prs = 2;
    auto input = edits_to_process({6, 12, 18});

    auto result = Engine{config}.analyze(input);
    ASSERT_EQ(result.reports.size(), 2u);
    EXPECT_EQ(result.report_for(3), nullptr);
    EXPECT_EQ(result.diagnostics.count("truncated"), 1u);
}

TEST(Engine, ignored_files_do_not_conflict) {
    auto input = AnalysisInput{};
    input.proposals.push_back(mt::proposal(1, {mt::modified("web/yarn.lock", {mt::hunk(1, 5, 1, 5)})}));
    input.proposals.push_back(mt::proposal(2, {mt::modified("web/yarn.lock", {mt::hunk(1, 5, 1, 5)})}));

    auto result = Engine{Config{}}.analyze(input);
    EXPECT_EQ(result.compared_pairs, 0u);
    EXPECT_EQ(result.diagnostics.count("ignored_files"), 2u);
    for (const auto& r : result.reports) EXPECT_TRUE(r.conflicts.empty());
}

TEST(Engine, invalid_diff_is_isolated) {
    auto input = edits_to_process({6, 12});
    input.proposals.push_back(mt::proposal(9, {mt::modified("a.py", {mt::hunk(5, 4, 5, 4), mt::hunk(7, 1, 7, 1)})}));

    auto result = Engine{Config{}}.analyze(input);
    ASSERT_EQ(result.reports.size(), 3u);
    const auto* bad = result.report_for(9);
    ASSERT_NE(bad, nullptr);
    ASSERT_TRUE(bad->error.has_value());
    EXPECT_EQ(bad->error->kind, ErrorKind::invalid_diff);
    EXPECT_EQ(bad->status, ReportStatus::error);
    EXPECT_EQ(result.diagnostics.count("invalid_diff"), 1u);

    const auto* good = result.report_for(1);
    EXPECT_FALSE(good->error.has_value());
    EXPECT_EQ(kinds(*good), (std::vector<ConflictKind>{ConflictKind::behavioral}));
}

TEST(Engine, malformed_symbols_are_reported_as_such) {
    auto input = edits_to_process({6, 12});
    input.proposals.push_back(mt::proposal(9, {mt::modified("a.py", {mt::hunk(20, 1, 20, 1)})}));
    mt::add_base(input.symbols[9], mt::file_symbols("a.py", {mt::function("process", "a.py", 5, 40),
                                                             mt::function("helper", "a.py", 30, 50)}));

    auto result = Engine{Config{}}.analyze(input);
    const auto* bad = result.report_for(9);
    ASSERT_NE(bad, nullptr);
    ASSERT_TRUE(bad->error.has_value());
    EXPECT_EQ(bad->error->kind, ErrorKind::invalid_symbol);
    EXPECT_EQ(result.diagnostics.count("invalid_symbol"), 1u);
    EXPECT_FALSE(result.report_for(2)->error.has_value());
}

TEST(Engine, duplicate_file_is_an_invalid_proposal) {
    auto input = edits_to_process({6});
    input.proposals.push_back(mt::proposal(9, {mt::modified("b.py", {mt::hunk(1, 1, 1, 1)}),
                                               mt::modified("b.py", {mt::hunk(9, 1, 9, 1)})}));

    auto result = Engine{Config{}}.analyze(input);
    const auto* bad = result.report_for(9);
    ASSERT_NE(bad, nullptr);
    ASSERT_TRUE(bad->error.has_value());
    EXPECT_EQ(bad->error->kind, ErrorKind::invalid_proposal);
    EXPECT_EQ(result.diagnostics.count("invalid_proposal"), 1u);
}

TEST(Engine, adjudicator_and_similarity_reach_the_classifier) {
    auto input = edits_to_process({6, 30});
    auto options = AnalysisOptions{};
    options.adjudicator = [](const BehavioralCase&) -> std::optional<Severity> { return Severity::critical; };

    auto result = Engine{Config{}}.analyze(input, options);
    EXPECT_EQ(result.report_for(1)->status, ReportStatus::fail);
}

TEST(Engine, threshold_flags_risky_reports) {
    auto input = edits_to_process({6, 30});
    auto options = AnalysisOptions{};
    options.adjudicator = [](const BehavioralCase&) -> std::optional<Severity> { return Severity::critical; };

    EXPECT_FALSE(Engine{Config{}}.analyze(input, options).reports[0].exceeds_threshold);

    auto config = Config{};
    config.risk_threshold = 25.0;
    EXPECT_TRUE(Engine{config}.analyze(input, options).reports[0].exceeds_threshold);
}

TEST(Engine, failing_decision_source_is_a_diagnostic) {
    auto input = edits_to_process({6});
    auto decisions = ThrowingDecisions{};
    auto options = AnalysisOptions{};
    options.decisions = &decisions;

    auto result = Engine{Config{}}.analyze(input, options);
    EXPECT_EQ(result.diagnostics.count("decisions_unavailable"), 1u);
    EXPECT_EQ(result.reports[0].status, ReportStatus::pass);
}

TEST(Engine, failed_pair_is_recorded_and_run_continues) {
    auto input = edits_to_process({6, 30});
    input.proposals.push_back(mt::proposal(3, {mt::modified("b.py", {mt::hunk(1, 1, 1, 1)})}));
    auto options = AnalysisOptions{};
    options.adjudicator = [](const BehavioralCase&) -> std::optional<Severity> { throw 7; };

    auto result = Engine{Config{}}.analyze(input, options);
    EXPECT_EQ(result.compared_pairs, 0u);
    ASSERT_EQ(result.diagnostics.count("pair_failed"), 1u);
    for (auto id : {ProposalId{1}, ProposalId{2}}) {
        const auto* r = result.report_for(id);
        ASSERT_NE(r, nullptr);
        EXPECT_TRUE(r->partial);
        EXPECT_TRUE(r->conflicts.empty());
        EXPECT_FALSE(r->error.has_value());
    }
    EXPECT_FALSE(result.report_for(3)->partial);
    EXPECT_EQ(result.report_for(3)->status, ReportStatus::pass);
}

TEST(Engine, malformed_decision_fails_the_proposal_check) {
    auto log = DecisionLog{};
    auto d = Decision{};
    d.kind = DecisionKind::migration;
    d.entity = "http client";
    d.origin = 4;
    log.append(d);

    auto input = edits_to_process({6, 30});
    auto options = AnalysisOptions{};
    options.now = now_ms;
    options.decisions = &log;
    auto result = Engine{Config{}}.analyze(input, options);

    ASSERT_EQ(result.reports.size(), 2u);
    for (const auto& r : result.reports) {
        ASSERT_TRUE(r.error.has_value());
        EXPECT_EQ(r.error->kind, ErrorKind::analysis_failed);
        EXPECT_NE(r.error->message.find("#4"), std::string::npos);
        EXPECT_EQ(r.status, ReportStatus::error);
        EXPECT_TRUE(r.conflicts.empty());
    }
    EXPECT_EQ(result.diagnostics.count("proposal_failed"), 2u);
    EXPECT_EQ(result.compared_pairs, 1u);
}

TEST(Engine, results_do_not_depend_on_worker_count) {
    auto input = edits_to_process({6, 12, 18, 24, 30});
    auto serial = Config{};
    serial.worker_count = 1;
    auto parallel = Config{};
    parallel.worker_count = 4;

    auto a = Engine{serial}.analyze(input);
    auto b = Engine{parallel}.analyze(input);
    ASSERT_EQ(a.reports.size(), b.reports.size());
    for (std::size_t i = 0; i < a.reports.size(); ++i) {
        EXPECT_EQ(a.reports[i].conflicts, b.reports[i].conflicts);
        EXPECT_EQ(a.reports[i].risk, b.reports[i].risk);
    }
    EXPECT_EQ(a.compared_pairs, 10u);
}

TEST(Engine, deadline_keeps_completed_pairs) {
    auto config = Config{};
    config.worker_count = 1;
    auto input = edits_to_process({6, 12, 18, 24});
    auto options = AnalysisOptions{};
    options.adjudicator = [](const BehavioralCase&) -> std::optional<Severity> {
        std::this_thread::sleep_for(300ms);
        return std::nullopt;
    };
    options.deadline = std::chrono::steady_clock::now() + 100ms;

    auto result = Engine{config}.analyze(input, options);
    EXPECT_TRUE(result.deadline_hit);
    EXPECT_FALSE(result.skipped_pairs.empty());
    EXPECT_LT(result.compared_pairs, 6u);
    EXPECT_EQ(result.compared_pairs + result.skipped_pairs.size(), 6u);
    EXPECT_TRUE(std::ranges::any_of(result.reports, [](const ProposalReport& r) { return r.partial; }));
    EXPECT_EQ(result.diagnostics.count("deadline"), 1u);
}

TEST(Engine, rejects_invalid_configuration) {
    auto config = Config{};
    config.weights.churn = 0.5;
    EXPECT_THROW(Engine{config}, ConfigError);
}

TEST(Engine, drop_ignored_files_counts_removals) {
    auto p = mt::proposal(1, {mt::modified("a.py", {}), mt::modified("dist/app.min.js", {}),
                              mt::modified("poetry.lock", {})});
    EXPECT_EQ(drop_ignored_files(p, Config{}.ignored_paths), 2u);
    ASSERT_EQ(p.files.size(), 1u);
    EXPECT_EQ(p.files[0].path, "a.py");
}
