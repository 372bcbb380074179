/// @file config.hpp
/// @brief Analysis configuration: risk weights, guardrail rules, limits.

#pragma once

#include <mergeguard/conflict.hpp>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

/// Per-factor weights of the composite risk score. Must sum to 1.0.
struct RiskWeights {
    double conflict_severity{0.30};
    double blast_radius{0.25};
    double pattern_deviation{0.20};
    double churn{0.15};
    double attribution{0.10};

    /// Sum of all five weights.
    auto sum() const -> double {
        return conflict_severity + blast_radius + pattern_deviation + churn + attribution;
    }

    auto operator==(const RiskWeights&) const -> bool = default;
};

/// Condition under which a guardrail rule is active.
enum class RuleActivation : std::uint8_t {
    always,              ///< The rule applies to every proposal.
    automated_authored,  ///< Only to proposals whose attribution says machine-generated.
};

/// Convert a RuleActivation to its string representation.
constexpr auto to_string_view(RuleActivation a) noexcept -> std::string_view {
    switch (a) {
        case RuleActivation::always:             return "always";
        case RuleActivation::automated_authored: return "automated_authored";
    }
    return "unknown";
}

/// Parse a RuleActivation. Accepts `ai_authored` and `automated-authored` as aliases.
auto parse_rule_activation(std::string_view text) -> std::optional<RuleActivation>;

/// A declarative repository policy rule.
struct GuardrailRule {
    std::string name;
    std::optional<std::string> pattern;              ///< File glob scope; nullopt = all files.
    RuleActivation when{RuleActivation::always};
    std::vector<std::string> forbidden_imports;      ///< Globs over imported module paths.
    std::vector<std::string> forbidden_content;      ///< Literal text banned in added lines.
    std::optional<std::size_t> max_files_changed;
    std::optional<std::size_t> max_lines_changed;
    std::optional<std::uint32_t> max_function_lines;
    std::optional<std::uint32_t> max_cyclomatic_complexity;
    Severity severity{Severity::warning};
    std::string message;                             ///< Optional guidance shown with violations.

    /// True if at least one constraint is set.
    auto has_constraint() const -> bool {
        return !forbidden_imports.empty() || !forbidden_content.empty()
            || max_files_changed || max_lines_changed
            || max_function_lines || max_cyclomatic_complexity;
    }

    auto operator==(const GuardrailRule&) const -> bool = default;
};

/// Upper bound on Config::worker_count.
inline constexpr unsigned int max_worker_count{512};

/// The fixed set of options consumed by the engine.
struct Config {
    double risk_threshold{50.0};            ///< Reports at or above this score are flagged.
    bool check_regressions{true};
    std::size_t max_open_prs{30};
    std::size_t decisions_log_depth{50};
    RiskWeights weights;
    std::vector<GuardrailRule> rules;
    std::vector<std::string> ignored_paths{
        "*.lock", "*.min.js", "*.min.css", "package-lock.json",
        "yarn.lock", "pnpm-lock.yaml", "poetry.lock",
    };
    std::size_t blast_radius_depth{5};
    std::size_t blast_radius_saturation{20};  ///< Dependent-file count that maps to factor 1.0.
    double duplication_threshold{0.7};
    std::chrono::milliseconds regression_recency_window{std::chrono::hours{24 * 7}};
    unsigned int worker_count{0};             ///< 0 = hardware concurrency.

    auto operator==(const Config&) const -> bool = default;
};

/// Check every Config invariant.
/// @throws ConfigError on weights that are negative or do not sum to 1.0,
///   an out-of-range threshold, a zero limit, or a malformed rule.
void validate(const Config& config);

/// Check a single rule.
/// @throws ConfigError naming the rule and the problem.
void validate(const GuardrailRule& rule);

/// Parse and validate a configuration from its JSON form.
/// Missing keys keep their defaults.
/// @throws ConfigError on malformed or invalid input.
auto load_config(const nlohmann::json& j) -> Config;

/// Read, parse and validate a JSON configuration file.
/// @throws ConfigError if the file cannot be read or is invalid.
auto load_config_file(const std::filesystem::path& path) -> Config;

}  // namespace mergeguard
