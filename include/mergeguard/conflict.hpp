/// @file conflict.hpp
/// @brief Conflict records: kind, severity, subject and explanation.

#pragma once

#include <mergeguard/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

/// How bad a conflict is. Ordered from most to least severe.
enum class Severity : std::uint8_t {
    critical,  ///< Will break if both proposals merge.
    warning,   ///< Likely to cause issues; needs human review.
    info,      ///< Overlap detected but probably fine.
};

/// Convert a Severity to its string representation.
constexpr auto to_string_view(Severity s) noexcept -> std::string_view {
    switch (s) {
        case Severity::critical: return "critical";
        case Severity::warning:  return "warning";
        case Severity::info:     return "info";
    }
    return "unknown";
}

/// Parse a Severity from its string representation.
auto parse_severity(std::string_view text) -> std::optional<Severity>;

/// Base score of a severity on a 0-100 scale (critical=100, warning=50, info=15).
constexpr auto severity_score(Severity s) noexcept -> double {
    switch (s) {
        case Severity::critical: return 100.0;
        case Severity::warning:  return 50.0;
        case Severity::info:     return 15.0;
    }
    return 0.0;
}

/// The classes of conflict the engine reports.
enum class ConflictKind : std::uint8_t {
    hard,         ///< Both proposals change the same lines.
    interface,    ///< A signature changed under callers touched by the other proposal.
    behavioral,   ///< Both proposals change the same symbol at different lines.
    duplication,  ///< Both proposals add near-identical symbols to one module.
    regression,   ///< A proposal reverses a recent recorded decision.
    guardrail,    ///< A repository policy rule is violated.
};

/// Convert a ConflictKind to its string representation.
constexpr auto to_string_view(ConflictKind k) noexcept -> std::string_view {
    switch (k) {
        case ConflictKind::hard:        return "hard";
        case ConflictKind::interface:   return "interface";
        case ConflictKind::behavioral:  return "behavioral";
        case ConflictKind::duplication: return "duplication";
        case ConflictKind::regression:  return "regression";
        case ConflictKind::guardrail:   return "guardrail";
    }
    return "unknown";
}

/// Parse a ConflictKind from its string representation.
auto parse_conflict_kind(std::string_view text) -> std::optional<ConflictKind>;

/// A detected conflict.
///
/// `source` is the proposal the conflict was found from; `target` is the
/// other open proposal, the merged proposal that recorded a reversed
/// decision (regression), or `source` itself (guardrail).
struct Conflict {
    ConflictKind kind{ConflictKind::hard};
    Severity severity{Severity::warning};
    ProposalId source{0};
    ProposalId target{0};
    std::string file;                      ///< Implicated file ("<repo>" for proposal-wide rules).
    std::optional<std::string> symbol;     ///< Implicated symbol; nullopt for file-level conflicts.
    std::string description;               ///< Human-readable explanation.
    std::string recommendation;            ///< Suggested action.
    std::optional<LineRange> source_lines;
    std::optional<LineRange> target_lines;
    bool coarse{false};                    ///< Found through the coarse (file-level) fallback.
    std::optional<std::string> note;       ///< Degraded-coverage or adjudication remark.

    /// The unordered pair this conflict belongs to.
    auto pair() const -> ProposalPair { return ProposalPair{source, target}; }

    /// True if this conflict mentions the proposal on either side.
    auto involves(ProposalId id) const -> bool { return source == id || target == id; }

    auto operator==(const Conflict&) const -> bool = default;
};

/// Deterministic report order: severity, then proposal ids, then kind,
/// file and symbol.
auto conflict_order(const Conflict& a, const Conflict& b) -> bool;

/// Sort conflicts into report order.
void sort_conflicts(std::vector<Conflict>& conflicts);

}  // namespace mergeguard
