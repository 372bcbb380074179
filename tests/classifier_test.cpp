#include <mergeguard/classifier.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <stdexcept>

using namespace mergeguard;
namespace mt = mergeguard::test;

namespace {

// Owns the proposals and symbol data the views point into.
struct Pair {
    ChangeProposal a;
    ChangeProposal b;
    ProposalSymbols sa;
    ProposalSymbols sb;
    DependencyGraph graph;

    auto run(const ClassifierOptions& options = {}) const -> ClassificationResult {
        auto va = ProposalView{a, sa};
        auto vb = ProposalView{b, sb};
        return classify(va, vb, compute_overlaps(va, vb), graph, options);
    }
};

auto process_file() -> FileSymbols {
    return mt::file_symbols("a.py", {mt::function("process", "a.py", 5, 30)});
}

auto same_on_both_sides(ProposalSymbols& s, const FileSymbols& f) {
    mt::add_base(s, f);
    mt::add_head(s, f);
}

auto edits_to_process(Hunk first, Hunk second) -> Pair {
    auto p = Pair{};
    p.a = mt::proposal(1, {mt::modified("a.py", {std::move(first)})});
    p.b = mt::proposal(2, {mt::modified("a.py", {std::move(second)})});
    same_on_both_sides(p.sa, process_file());
    same_on_both_sides(p.sb, process_file());
    return p;
}

// #1 changes f(x) to f(x, y); #2 edits `main`, which calls f at line 12.
auto signature_change(std::uint32_t caller_edit_line) -> Pair {
    auto p = Pair{};
    auto base = mt::file_symbols("a.py", {mt::function("f", "a.py", 1, 5, "app", mt::params({"x"})),
                                          mt::function("main", "a.py", 10, 20)},
                                 {}, {CallSite{.callee = "f", .line = 12}});
    auto changed = base;
    changed.symbols[0].signature = mt::params({"x", "y"});

    p.a = mt::proposal(1, {mt::modified("a.py", {mt::hunk(1, 1, 1, 1)})});
    mt::add_base(p.sa, base);
    mt::add_head(p.sa, changed);

    p.b = mt::proposal(2, {mt::modified("a.py", {mt::hunk(caller_edit_line, 1, caller_edit_line, 1)})});
    same_on_both_sides(p.sb, base);
    return p;
}

auto added_function(std::string name, std::string file, std::string module, std::string source) -> Symbol {
    auto s = mt::function(std::move(name), file, 1, 6, std::move(module), mt::params({"invoice"}));
    s.source = std::move(source);
    return s;
}

// Both proposals add one new file and touch README.md at distinct lines.
auto parallel_additions(Symbol first, Symbol second) -> Pair {
    auto p = Pair{};
    p.a = mt::proposal(1, {mt::added_file(first.file, 6), mt::modified("README.md", {mt::hunk(1, 1, 1, 1)})});
    p.b = mt::proposal(2, {mt::added_file(second.file, 6), mt::modified("README.md", {mt::hunk(40, 1, 40, 1)})});
    mt::add_head(p.sa, mt::file_symbols(first.file, {first}));
    mt::add_head(p.sb, mt::file_symbols(second.file, {second}));
    return p;
}

auto count_kind(const ClassificationResult& r, ConflictKind kind) -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(r.conflicts, [&](const Conflict& c) {
        return c.kind == kind;
    }));
}

}  // namespace

// -- hard ---------------------------------------------------------------------

TEST(Classifier, common_lines_of_one_function_are_hard_critical) {
    auto p = edits_to_process(mt::hunk(10, 11, 10, 11), mt::hunk(10, 11, 10, 11));
    auto r = p.run();

    ASSERT_EQ(r.conflicts.size(), 1u);
    const auto& c = r.conflicts[0];
    EXPECT_EQ(c.kind, ConflictKind::hard);
    EXPECT_EQ(c.severity, Severity::critical);
    EXPECT_EQ(c.symbol, "process");
    EXPECT_EQ(c.file, "a.py");
    EXPECT_EQ(c.source, 1u);
    EXPECT_EQ(c.target, 2u);
    EXPECT_EQ(c.source_lines, (LineRange{10, 20}));
    EXPECT_FALSE(c.description.empty());
    EXPECT_FALSE(c.recommendation.empty());
}

TEST(Classifier, edits_running_past_function_end_are_one_conflict) {
    // process spans 5-30; both hunks cover 27-34.
    auto p = edits_to_process(mt::hunk(27, 8, 27, 8), mt::hunk(27, 8, 27, 8));
    auto r = p.run();

    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].kind, ConflictKind::hard);
    EXPECT_EQ(r.conflicts[0].severity, Severity::critical);
    EXPECT_EQ(r.conflicts[0].symbol, "process");
}

TEST(Classifier, unclaimed_span_beside_symbol_conflict_is_file_level) {
    auto p = edits_to_process(mt::hunk(27, 8, 27, 8), mt::hunk(27, 8, 27, 8));
    p.a.files[0].hunks.push_back(mt::hunk(50, 2, 50, 2));
    p.b.files[0].hunks.push_back(mt::hunk(50, 2, 50, 2));
    auto r = p.run();

    ASSERT_EQ(r.conflicts.size(), 2u);
    EXPECT_EQ(count_kind(r, ConflictKind::hard), 2u);
    auto file_level = std::ranges::find_if(r.conflicts, [](const Conflict& c) { return !c.symbol; });
    ASSERT_NE(file_level, r.conflicts.end());
    EXPECT_EQ(file_level->severity, Severity::warning);
    EXPECT_EQ(file_level->source_lines, (LineRange{50, 51}));
}

TEST(Classifier, pair_order_does_not_matter) {
    auto p = edits_to_process(mt::hunk(10, 4, 10, 4), mt::hunk(12, 1, 12, 1));
    p.a.id = 9;
    p.b.id = 3;

    auto va = ProposalView{p.a, p.sa};
    auto vb = ProposalView{p.b, p.sb};
    auto ab = classify(va, vb, compute_overlaps(va, vb), p.graph);
    auto ba = classify(vb, va, compute_overlaps(vb, va), p.graph);

    EXPECT_EQ(ab.conflicts, ba.conflicts);
    ASSERT_EQ(ab.conflicts.size(), 1u);
    EXPECT_EQ(ab.conflicts[0].source, 3u);
    EXPECT_EQ(ab.conflicts[0].target, 9u);
}

TEST(Classifier, no_overlaps_no_conflicts) {
    auto p = Pair{};
    p.a = mt::proposal(1, {mt::modified("a.py", {mt::hunk(1, 1, 1, 1)})});
    p.b = mt::proposal(2, {mt::modified("b.py", {mt::hunk(1, 1, 1, 1)})});
    auto r = p.run();
    EXPECT_TRUE(r.conflicts.empty());
    EXPECT_TRUE(r.notes.empty());
}

// -- interface ----------------------------------------------------------------

TEST(Classifier, edited_call_to_changed_signature_is_critical) {
    auto p = signature_change(12);
    auto r = p.run();

    ASSERT_EQ(r.conflicts.size(), 1u);
    const auto& c = r.conflicts[0];
    EXPECT_EQ(c.kind, ConflictKind::interface);
    EXPECT_EQ(c.severity, Severity::critical);
    EXPECT_EQ(c.symbol, "f");
    EXPECT_EQ(c.target_lines, (LineRange{12, 12}));
    EXPECT_NE(c.description.find("(x, y)"), std::string::npos);
    // empty graph: scope limited to the defining file
    ASSERT_EQ(r.notes.size(), 1u);
    EXPECT_NE(r.notes[0].find("a.py"), std::string::npos);
}

TEST(Classifier, untouched_call_to_changed_signature_is_warning) {
    auto p = signature_change(15);
    auto r = p.run();

    ASSERT_EQ(count_kind(r, ConflictKind::interface), 1u);
    EXPECT_EQ(r.conflicts[0].severity, Severity::warning);
}

TEST(Classifier, interface_reaches_dependent_files) {
    auto p = Pair{};
    auto util = mt::file_symbols("util.py", {mt::function("f", "util.py", 1, 5, "util", mt::params({"x"}))});
    auto util_changed = util;
    util_changed.symbols[0].signature = mt::params({"x", "y"});
    p.a = mt::proposal(1, {mt::modified("util.py", {mt::hunk(1, 1, 1, 1)}),
                           mt::modified("README.md", {mt::hunk(1, 1, 1, 1)})});
    mt::add_base(p.sa, util);
    mt::add_head(p.sa, util_changed);

    auto app = mt::file_symbols("app.py", {mt::function("main", "app.py", 1, 20)},
                                {Import{.target = "util", .line = 1}}, {CallSite{.callee = "f", .line = 7}});
    p.b = mt::proposal(2, {mt::modified("app.py", {mt::hunk(7, 1, 7, 1)}),
                           mt::modified("README.md", {mt::hunk(40, 1, 40, 1)})});
    same_on_both_sides(p.sb, app);
    p.graph.add_edge("app.py", "util.py");

    auto r = p.run();
    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].kind, ConflictKind::interface);
    EXPECT_EQ(r.conflicts[0].severity, Severity::critical);
    EXPECT_EQ(r.conflicts[0].file, "app.py");
    EXPECT_TRUE(r.notes.empty());
}

TEST(Classifier, hard_takes_precedence_over_interface) {
    auto p = Pair{};
    auto base = mt::file_symbols("a.py", {mt::function("f", "a.py", 1, 5, "app", mt::params({"x"}))},
                                 {}, {CallSite{.callee = "f", .line = 3}});
    auto changed = base;
    changed.symbols[0].signature = mt::params({"x", "y"});

    p.a = mt::proposal(1, {mt::modified("a.py", {mt::hunk(1, 3, 1, 3)})});
    mt::add_base(p.sa, base);
    mt::add_head(p.sa, changed);
    p.b = mt::proposal(2, {mt::modified("a.py", {mt::hunk(3, 1, 3, 1)})});
    same_on_both_sides(p.sb, base);

    auto r = p.run();
    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].kind, ConflictKind::hard);
    EXPECT_EQ(r.conflicts[0].symbol, "f");
}

// -- behavioral ---------------------------------------------------------------

TEST(Classifier, same_function_different_lines_is_behavioral_warning) {
    auto p = edits_to_process(mt::hunk(6, 2, 6, 2), mt::hunk(25, 2, 25, 2));
    auto r = p.run();

    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].kind, ConflictKind::behavioral);
    EXPECT_EQ(r.conflicts[0].severity, Severity::warning);
    EXPECT_FALSE(r.conflicts[0].note.has_value());
}

TEST(Classifier, adjudicator_sets_behavioral_severity) {
    auto p = edits_to_process(mt::hunk(6, 2, 6, 2), mt::hunk(25, 2, 25, 2));
    auto seen = std::vector<std::string>{};
    auto options = ClassifierOptions{};
    options.adjudicator = [&](const BehavioralCase& bc) -> std::optional<Severity> {
        seen.push_back(bc.first_change.symbol.name);
        EXPECT_EQ(bc.first, 1u);
        EXPECT_EQ(bc.second, 2u);
        return Severity::critical;
    };

    auto r = p.run(options);
    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].severity, Severity::critical);
    EXPECT_TRUE(r.conflicts[0].note.has_value());
    EXPECT_EQ(seen, (std::vector<std::string>{"process"}));
}

TEST(Classifier, adjudicator_without_verdict_keeps_warning) {
    auto p = edits_to_process(mt::hunk(6, 2, 6, 2), mt::hunk(25, 2, 25, 2));
    auto options = ClassifierOptions{};
    options.adjudicator = [](const BehavioralCase&) -> std::optional<Severity> { return std::nullopt; };

    auto r = p.run(options);
    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].severity, Severity::warning);
    EXPECT_FALSE(r.conflicts[0].note.has_value());
}

TEST(Classifier, failing_adjudicator_degrades_to_warning) {
    auto p = edits_to_process(mt::hunk(6, 2, 6, 2), mt::hunk(25, 2, 25, 2));
    auto options = ClassifierOptions{};
    options.adjudicator = [](const BehavioralCase&) -> std::optional<Severity> {
        throw std::runtime_error{"model unavailable"};
    };

    auto r = p.run(options);
    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].severity, Severity::warning);
    ASSERT_TRUE(r.conflicts[0].note.has_value());
    EXPECT_NE(r.conflicts[0].note->find("model unavailable"), std::string::npos);
    ASSERT_EQ(r.notes.size(), 1u);
}

// -- duplication --------------------------------------------------------------

TEST(Classifier, near_identical_additions_are_duplication_info) {
    auto p = parallel_additions(
        added_function("parse_invoice_total", "billing/a.py", "billing", "return sum(line.amount for line in invoice)"),
        added_function("parseInvoiceTotal", "billing/b.py", "billing", "return sum(line.amount for line in invoice)"));
    auto r = p.run();

    ASSERT_EQ(r.conflicts.size(), 1u);
    const auto& c = r.conflicts[0];
    EXPECT_EQ(c.kind, ConflictKind::duplication);
    EXPECT_EQ(c.severity, Severity::info);
    EXPECT_EQ(c.file, "billing/a.py");
    EXPECT_NE(c.description.find("billing/b.py"), std::string::npos);
}

TEST(Classifier, additions_to_different_modules_are_not_duplicates) {
    auto p = parallel_additions(
        added_function("parse_invoice_total", "billing/a.py", "billing", "return sum(invoice)"),
        added_function("parse_invoice_total", "shipping/b.py", "shipping", "return sum(invoice)"));
    EXPECT_EQ(count_kind(p.run(), ConflictKind::duplication), 0u);
}

TEST(Classifier, dissimilar_additions_are_not_duplicates) {
    auto p = parallel_additions(
        added_function("parse_invoice_total", "billing/a.py", "billing", "return sum(line.amount for line in invoice)"),
        added_function("send_reminder_email", "billing/b.py", "billing", "mailer.deliver(template, customer)"));
    EXPECT_EQ(count_kind(p.run(), ConflictKind::duplication), 0u);
}

TEST(Classifier, custom_similarity_measure_is_used) {
    auto p = parallel_additions(
        added_function("total", "billing/a.py", "billing", "a"),
        added_function("other", "billing/b.py", "billing", "b"));
    auto options = ClassifierOptions{};
    options.similarity = [](const Symbol&, const Symbol&) { return 0.95; };

    EXPECT_EQ(count_kind(p.run(options), ConflictKind::duplication), 1u);
}

TEST(Classifier, failing_similarity_falls_back_to_tokens) {
    auto p = parallel_additions(
        added_function("parse_invoice_total", "billing/a.py", "billing", "return sum(invoice)"),
        added_function("parse_invoice_total", "billing/b.py", "billing", "return sum(invoice)"));
    auto options = ClassifierOptions{};
    options.similarity = [](const Symbol&, const Symbol&) -> double { throw std::runtime_error{"no embeddings"}; };

    auto r = p.run(options);
    EXPECT_EQ(count_kind(r, ConflictKind::duplication), 1u);
    ASSERT_FALSE(r.notes.empty());
    EXPECT_NE(r.notes[0].find("no embeddings"), std::string::npos);
}

// -- file level ---------------------------------------------------------------

TEST(Classifier, overlap_outside_symbols_is_file_level_warning) {
    auto p = edits_to_process(mt::hunk(1, 3, 1, 3), mt::hunk(2, 1, 2, 1));
    auto r = p.run();

    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].kind, ConflictKind::hard);
    EXPECT_EQ(r.conflicts[0].severity, Severity::warning);
    EXPECT_FALSE(r.conflicts[0].symbol.has_value());
    EXPECT_FALSE(r.conflicts[0].coarse);
    EXPECT_EQ(r.conflicts[0].source_lines, (LineRange{2, 2}));
}

TEST(Classifier, coarse_file_overlap_is_flagged_coarse) {
    auto p = Pair{};
    p.a = mt::proposal(1, {mt::modified("build.zig", {mt::hunk(3, 3, 3, 3)})});
    p.b = mt::proposal(2, {mt::modified("build.zig", {mt::hunk(4, 1, 4, 1)})});

    auto r = p.run();
    ASSERT_EQ(r.conflicts.size(), 1u);
    EXPECT_EQ(r.conflicts[0].kind, ConflictKind::hard);
    EXPECT_EQ(r.conflicts[0].severity, Severity::warning);
    EXPECT_TRUE(r.conflicts[0].coarse);
    EXPECT_TRUE(r.conflicts[0].note.has_value());
}

TEST(Classifier, shared_coarse_file_without_line_overlap_is_clean) {
    auto p = Pair{};
    p.a = mt::proposal(1, {mt::modified("build.zig", {mt::hunk(3, 1, 3, 1)})});
    p.b = mt::proposal(2, {mt::modified("build.zig", {mt::hunk(30, 1, 30, 1)})});
    EXPECT_TRUE(p.run().conflicts.empty());
}

// -- tokens -------------------------------------------------------------------

TEST(Tokens, split_on_case_and_separators) {
    auto s = mt::function("parseHTTPHeader_value", "a.py", 1, 2);
    EXPECT_EQ(normalized_tokens(s), (std::vector<std::string>{"parse", "http", "header", "value"}));
}

TEST(Tokens, jaccard_of_identical_and_disjoint_symbols) {
    auto a = mt::function("parse_invoice", "a.py", 1, 2);
    auto b = mt::function("parseInvoice", "b.py", 1, 2);
    auto c = mt::function("send_email", "c.py", 1, 2);
    EXPECT_DOUBLE_EQ(token_jaccard(a, b), 1.0);
    EXPECT_DOUBLE_EQ(token_jaccard(a, c), 0.0);
}

TEST(Tokens, jaccard_of_partial_overlap) {
    auto a = mt::function("parse_invoice", "a.py", 1, 2);
    auto b = mt::function("parse_order", "b.py", 1, 2);
    EXPECT_DOUBLE_EQ(token_jaccard(a, b), 1.0 / 3.0);
}
