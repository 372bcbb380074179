/// @file risk.hpp
/// @brief Risk scorer: composite 0-100 score with a per-factor breakdown.

#pragma once

#include <mergeguard/config.hpp>
#include <mergeguard/conflict.hpp>
#include <mergeguard/dependency_graph.hpp>
#include <mergeguard/proposal.hpp>
#include <mergeguard/view.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

/// The five factors of the composite risk score.
enum class RiskFactor : std::uint8_t {
    conflict_severity,
    blast_radius,
    pattern_deviation,
    churn,
    attribution,
};

/// Convert a RiskFactor to its string representation.
constexpr auto to_string_view(RiskFactor f) noexcept -> std::string_view {
    switch (f) {
        case RiskFactor::conflict_severity: return "conflict_severity";
        case RiskFactor::blast_radius:      return "blast_radius";
        case RiskFactor::pattern_deviation: return "pattern_deviation";
        case RiskFactor::churn:             return "churn";
        case RiskFactor::attribution:       return "attribution";
    }
    return "unknown";
}

/// One factor of a breakdown.
struct FactorScore {
    double raw{0.0};          ///< Factor value; [0,1] except conflict severity (see conflict_severity_factor()).
    double weight{0.0};       ///< Configured weight.
    double weighted{0.0};     ///< raw * weight * 100: the factor's contribution to the composite.
    bool available{true};     ///< False when the signal was absent or failed (raw is then 0).

    auto operator==(const FactorScore&) const -> bool = default;
};

/// Transparent per-proposal risk score.
struct RiskBreakdown {
    FactorScore conflict_severity;
    FactorScore blast_radius;
    FactorScore pattern_deviation;
    FactorScore churn;
    FactorScore attribution;
    double composite{0.0};    ///< Sum of weighted factors, clamped to [0,100].

    /// The factor with the given name.
    auto factor(RiskFactor f) const -> const FactorScore&;

    auto operator==(const RiskBreakdown&) const -> bool = default;
};

/// Every factor in declaration order.
inline constexpr auto all_risk_factors = std::array{
    RiskFactor::conflict_severity, RiskFactor::blast_radius, RiskFactor::pattern_deviation,
    RiskFactor::churn, RiskFactor::attribution,
};

/// External per-file and per-proposal signals. Both may be absent.
class SignalProvider {
public:
    virtual ~SignalProvider() = default;

    /// Historical revert/hotfix rate of a file in [0,1]; nullopt if unknown.
    virtual auto churn(std::string_view path) const -> std::optional<double> = 0;

    /// Confidence in [0,1] that the proposal is machine-generated; nullopt if unknown.
    virtual auto attribution(const ChangeProposal& proposal) const -> std::optional<double> = 0;
};

/// Average shape of a module's functions on the target branch.
struct ModuleProfile {
    double line_count{0.0};
    double nesting_depth{0.0};
    double parameter_count{0.0};
    std::size_t samples{0};

    /// Fold one symbol into the running average.
    void add(const Symbol& s);
};

/// Diminishing-returns severity accumulation.
///
/// Severities sorted descending contribute `score_i * 0.5^i`; the sum is
/// divided by 100. One critical conflict yields 1.0; further conflicts
/// add less each time, approaching 2.0.
auto conflict_severity_factor(const std::vector<Conflict>& conflicts) -> double;

/// Distinct files reachable over reverse imports from the touched files,
/// divided by `saturation` and capped at 1.
auto blast_radius_factor(const DependencyGraph& graph,
                         const std::set<std::string>& touched,
                         std::size_t max_depth,
                         std::size_t saturation) -> double;

/// Per-module profiles built from the target-branch symbols of touched files.
auto module_profiles(const ProposalView& view) -> std::map<std::string, ModuleProfile>;

/// Mean saturated deviation of the added or edited functions from their
/// module's profile; nullopt when no function has a profile to compare to.
auto pattern_deviation_factor(const ProposalView& view) -> std::optional<double>;

/// Score one proposal.
/// @param conflicts Every conflict in the proposal's report.
/// @param signals Optional external signals (nullptr: churn unavailable,
///   attribution from the proposal's own confidence).
/// @param notes Receives one line per unavailable or failing signal.
auto score_risk(const ProposalView& view,
                const std::vector<Conflict>& conflicts,
                const DependencyGraph& graph,
                const Config& config,
                const SignalProvider* signals = nullptr,
                std::vector<std::string>* notes = nullptr) -> RiskBreakdown;

}  // namespace mergeguard
