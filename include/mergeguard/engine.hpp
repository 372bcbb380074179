/// @file engine.hpp
/// @brief Engine orchestrator: runs every analysis step over the open proposals.

#pragma once

#include <mergeguard/classifier.hpp>
#include <mergeguard/config.hpp>
#include <mergeguard/conflict.hpp>
#include <mergeguard/decision.hpp>
#include <mergeguard/dependency_graph.hpp>
#include <mergeguard/diagnostics.hpp>
#include <mergeguard/error.hpp>
#include <mergeguard/proposal.hpp>
#include <mergeguard/risk.hpp>
#include <mergeguard/view.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string_view>
#include <vector>

namespace mergeguard {

/// Everything one analysis run reads.
struct AnalysisInput {
    std::vector<ChangeProposal> proposals;
    std::map<ProposalId, ProposalSymbols> symbols;  ///< Missing entry: file-level analysis only.
    DependencyGraph graph;
};

/// Per-run strategies and limits. Every member is optional.
struct AnalysisOptions {
    std::optional<std::int64_t> now;  ///< Unix milliseconds; nullopt reads the system clock.
    std::optional<std::chrono::steady_clock::time_point> deadline;
    SimilarityMeasure similarity;
    SemanticAdjudicator adjudicator;
    const SignalProvider* signals{nullptr};
    const DecisionSource* decisions{nullptr};
};

/// Summary verdict of a report.
enum class ReportStatus : std::uint8_t {
    pass,   ///< No conflicts.
    warn,   ///< Conflicts, none critical.
    fail,   ///< At least one critical conflict.
    error,  ///< The proposal could not be analysed.
};

/// Convert a ReportStatus to its string representation.
constexpr auto to_string_view(ReportStatus s) noexcept -> std::string_view {
    switch (s) {
        case ReportStatus::pass:  return "pass";
        case ReportStatus::warn:  return "warn";
        case ReportStatus::fail:  return "fail";
        case ReportStatus::error: return "error";
    }
    return "unknown";
}

/// The result of analysing one proposal.
struct ProposalReport {
    ProposalId id{0};
    std::vector<Conflict> conflicts;         ///< Every conflict mentioning this proposal, in report order.
    RiskBreakdown risk;
    std::vector<ProposalId> clean_pairs;     ///< Open proposals compared with this one and found conflict-free.
    std::optional<Error> error;              ///< Set when analysis failed; conflicts are then empty.
    bool partial{false};                     ///< Some comparison involving this proposal missed the deadline.
    bool exceeds_threshold{false};           ///< risk.composite >= Config::risk_threshold.
    ReportStatus status{ReportStatus::pass};
    std::chrono::milliseconds duration{0};   ///< Wall time of the run that produced this report.
};

/// The output of one run: one report per analysed proposal.
struct AnalysisResult {
    std::vector<ProposalReport> reports;   ///< In input order.
    Diagnostics diagnostics;
    std::size_t compared_pairs{0};         ///< Pairs that shared a file and were classified.
    std::size_t filtered_pairs{0};         ///< Pairs skipped by the disjoint-files pre-filter.
    std::vector<ProposalPair> skipped_pairs;  ///< Pairs not classified before the deadline.
    bool deadline_hit{false};
    std::chrono::milliseconds duration{0};

    /// The report of one proposal, or nullptr.
    auto report_for(ProposalId id) const -> const ProposalReport*;
};

/// Runs the overlap engine, classifier, regression detector, guardrail
/// evaluator and risk scorer over a set of open proposals.
///
/// Pairwise comparisons and per-proposal checks are independent tasks on
/// a Taskflow executor; each writes only its own result slot. A failing
/// proposal is reported with an Error and never aborts the run.
class Engine {
public:
    /// @throws ConfigError if the configuration is invalid.
    explicit Engine(Config config);

    auto config() const -> const Config& { return config_; }

    /// Analyse the open proposals in `input`.
    auto analyze(const AnalysisInput& input, const AnalysisOptions& options = {}) const -> AnalysisResult;

private:
    Config config_;
};

/// Drop the FileDiffs of a proposal that match any ignore glob.
/// @return The number of files dropped.
auto drop_ignored_files(ChangeProposal& proposal, const std::vector<std::string>& ignored) -> std::size_t;

}  // namespace mergeguard
