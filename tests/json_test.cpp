// json_test.cpp: Tests for nlohmann/json interoperability and snapshots

#include <mergeguard/json.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace mergeguard;
namespace mt = mergeguard::test;
using json = nlohmann::json;

namespace {

auto snapshot() -> json {
    return json::parse(R"({
      "proposals": [
        {"id": 11, "title": "add pricing", "source_branch": "feature/pricing", "target_branch": "main",
         "head_sha": "9f2c1e0", "author": "carol", "labels": ["billing"],
         "attribution": {"authorship": "ai_suspected", "confidence": 0.6, "markers": ["Co-authored-by: bot"]},
         "files": [
           {"path": "billing/price.py", "change": "modified",
            "hunks": [{"old_start": 10, "old_count": 2, "new_start": 10, "new_count": 3,
                       "added": ["a", "b", "c"], "removed": ["x", "y"]}]}
         ]}
      ],
      "symbols": {
        "11": {
          "base": [{"path": "billing/price.py", "status": "ok",
                    "symbols": [{"name": "price", "kind": "function", "lines": {"start": 5, "end": 20},
                                 "module": "billing",
                                 "signature": {"parameters": [{"name": "item"}], "returns": "Decimal"}}],
                    "imports": [{"target": "billing.tax", "line": 1}],
                    "calls": [{"callee": "tax_for", "line": 12}]}],
          "head": [{"path": "billing/price.py", "status": "ok",
                    "symbols": [{"name": "price", "kind": "function", "lines": {"start": 5, "end": 21},
                                 "module": "billing"}]}]
        }
      }
    })");
}

}  // namespace

// =============================================================================
// Value and diff codecs
// =============================================================================

TEST(Json, line_range_codec) {
    auto j = json(LineRange{3, 9});
    EXPECT_EQ(j, (json{{"start", 3}, {"end", 9}}));
    EXPECT_EQ(j.get<LineRange>(), (LineRange{3, 9}));
}

TEST(Json, proposal_pair_is_an_array) {
    EXPECT_EQ(json(ProposalPair{2, 5}), json::array({2, 5}));
}

TEST(Json, hunk_from_header_numbers) {
    auto h = json{{"old_start", 4}, {"old_count", 0}, {"new_start", 5}, {"new_count", 2},
                  {"added", {"x", "y"}}}.get<Hunk>();
    EXPECT_EQ(h.before, (LineRange{4, 4}));
    EXPECT_EQ(h.after, (LineRange{5, 6}));
    EXPECT_EQ(h.added_lines.size(), 2u);
    EXPECT_TRUE(h.removed_lines.empty());
}

TEST(Json, hunk_counts_default_to_one) {
    auto h = json{{"old_start", 7}, {"new_start", 7}}.get<Hunk>();
    EXPECT_EQ(h.before, (LineRange{7, 7}));
    EXPECT_EQ(h.after, (LineRange{7, 7}));
}

TEST(Json, file_diff_round_trip) {
    auto d = mt::modified("src/new.py", {mt::hunk(1, 2, 1, 3)});
    d.change = FileChange::renamed;
    d.previous_path = "src/old.py";
    EXPECT_EQ(json(d).get<FileDiff>(), d);
}

TEST(Json, unknown_file_change_is_rejected) {
    auto j = json{{"path", "a.py"}, {"change", "copied"}};
    EXPECT_THROW(j.get<FileDiff>(), std::runtime_error);
}

// =============================================================================
// Symbols
// =============================================================================

TEST(Json, symbol_round_trip) {
    auto s = mt::method("get", "Cache", "util.py", 10, 20, "util");
    s.signature.parameters.push_back(Parameter{.name = "key", .type = "str", .has_default = false});
    s.signature.parameters.push_back(Parameter{.name = "default", .type = std::nullopt, .has_default = true});
    s.signature.returns = "Any";
    s.nesting_depth = 2;
    s.complexity = 4;
    s.source = "return self._d.get(key, default)";
    EXPECT_EQ(json(s).get<Symbol>(), s);
}

TEST(Json, symbols_inherit_file_path) {
    auto j = json::parse(R"({"path": "a.py", "symbols": [{"name": "f", "lines": {"start": 1, "end": 2}}]})");
    auto f = j.get<FileSymbols>();
    EXPECT_EQ(f.status, ExtractionStatus::ok);
    ASSERT_EQ(f.symbols.size(), 1u);
    EXPECT_EQ(f.symbols[0].file, "a.py");
    EXPECT_EQ(f.symbols[0].kind, SymbolKind::function);
}

TEST(Json, extraction_status_is_read) {
    auto j = json{{"path", "main.zig"}, {"status", "unsupported_language"}};
    auto f = j.get<FileSymbols>();
    EXPECT_EQ(f.status, ExtractionStatus::unsupported_language);
    EXPECT_FALSE(f.usable());
}

// =============================================================================
// Proposals, decisions and conflicts
// =============================================================================

TEST(Json, proposal_round_trip) {
    auto p = mt::proposal(42, {mt::modified("a.py", {mt::hunk(3, 1, 3, 2)}), mt::added_file("b.py", 5)});
    p.labels = {"ready"};
    p.attribution = AttributionSignals{.authorship = Authorship::ai_confirmed, .confidence = 0.9,
                                       .markers = {"agent-trace"}};
    EXPECT_EQ(json(p).get<ChangeProposal>(), p);
}

TEST(Json, decision_round_trip) {
    auto d = Decision{};
    d.kind = DecisionKind::migration;
    d.entity = "orm";
    d.old_pattern = "session.query(";
    d.new_pattern = "select(";
    d.origin = 17;
    d.timestamp = 1'700'000'000'123;
    EXPECT_EQ(json(d).get<Decision>(), d);
}

TEST(Json, conflict_round_trip) {
    auto c = mt::conflict(ConflictKind::interface, Severity::critical, 3, 8);
    c.symbol = "f";
    c.source_lines = LineRange{1, 2};
    c.target_lines = LineRange{12, 12};
    c.description = "signature changed";
    c.recommendation = "update callers";
    c.note = "no dependency data";
    auto j = json(c);
    EXPECT_EQ(j["kind"], "interface");
    EXPECT_EQ(j["severity"], "critical");
    EXPECT_EQ(j.get<Conflict>(), c);
}

TEST(Json, risk_breakdown_lists_every_factor) {
    auto r = RiskBreakdown{};
    r.conflict_severity = FactorScore{.raw = 1.0, .weight = 0.3, .weighted = 30.0, .available = true};
    r.churn.available = false;
    r.composite = 30.0;
    auto j = json(r);
    EXPECT_DOUBLE_EQ(j["composite"].get<double>(), 30.0);
    ASSERT_EQ(j["factors"].size(), all_risk_factors.size());
    EXPECT_DOUBLE_EQ(j["factors"]["conflict_severity"]["weighted"].get<double>(), 30.0);
    EXPECT_FALSE(j["factors"]["churn"]["available"].get<bool>());
}

TEST(Json, report_with_error) {
    auto r = ProposalReport{};
    r.id = 4;
    r.status = ReportStatus::error;
    r.error = Error{ErrorKind::invalid_proposal, "hunks overlap"};
    auto j = json(r);
    EXPECT_EQ(j["status"], "error");
    EXPECT_EQ(j["error"]["kind"], "invalid_proposal");
    EXPECT_EQ(j["error"]["message"], "hunks overlap");
}

// =============================================================================
// Snapshots
// =============================================================================

TEST(Snapshot, load_input_reads_everything) {
    auto input = load_input(snapshot());

    ASSERT_EQ(input.proposals.size(), 1u);
    const auto& p = input.proposals[0];
    EXPECT_EQ(p.id, 11u);
    EXPECT_EQ(p.head_sha, "9f2c1e0");
    EXPECT_TRUE(p.base_sha.empty());
    EXPECT_EQ(p.attribution.authorship, Authorship::ai_suspected);
    EXPECT_EQ(p.attribution.confidence, 0.6);
    ASSERT_EQ(p.files.size(), 1u);
    EXPECT_EQ(p.files[0].hunks[0].before, (LineRange{10, 11}));

    ASSERT_TRUE(input.symbols.contains(11));
    const auto& s = input.symbols.at(11);
    const auto& base = s.base.at("billing/price.py");
    EXPECT_EQ(base.symbols[0].signature.to_string(), "(item) -> Decimal");
    EXPECT_EQ(base.calls.size(), 1u);
    EXPECT_EQ(s.head.at("billing/price.py").symbols[0].lines, (LineRange{5, 21}));
}

TEST(Snapshot, graph_defaults_to_imports) {
    auto j = snapshot();
    j["symbols"]["11"]["base"].push_back(json::parse(R"({"path": "billing/tax.py"})"));
    auto input = load_input(j);
    EXPECT_TRUE(input.graph.contains("billing/price.py"));
    EXPECT_EQ(input.graph.direct_dependents("billing/tax.py"), (std::set<std::string>{"billing/price.py"}));
}

TEST(Snapshot, explicit_graph_wins) {
    auto j = snapshot();
    j["graph"] = json{{"edges", json::array({json::array({"app.py", "billing/price.py"})})}};
    auto input = load_input(j);
    EXPECT_EQ(input.graph.direct_dependents("billing/price.py"), (std::set<std::string>{"app.py"}));
    EXPECT_FALSE(input.graph.contains("billing/tax.py"));
}

TEST(Snapshot, export_then_load_preserves_input) {
    auto input = load_input(snapshot());
    input.graph.add_edge("app.py", "billing/price.py");
    auto again = load_input(export_input(input));

    EXPECT_EQ(again.proposals, input.proposals);
    EXPECT_EQ(again.symbols, input.symbols);
    EXPECT_EQ(again.graph.edges(), input.graph.edges());
    EXPECT_EQ(again.graph.files(), input.graph.files());
}

TEST(Snapshot, malformed_input_is_rejected) {
    EXPECT_THROW(load_input(json::array()), std::runtime_error);
    EXPECT_THROW(load_input(json{{"symbols", {{"eleven", json::object()}}}}), std::runtime_error);
    EXPECT_THROW(load_input(json{{"graph", {{"edges", json::array({json::array({"only-one"})})}}}}),
                 std::runtime_error);
}
