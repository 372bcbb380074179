#include <mergeguard/config.hpp>
#include <mergeguard/error.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>

namespace mergeguard {

auto parse_rule_activation(std::string_view text) -> std::optional<RuleActivation> {
    if (text == "always") return RuleActivation::always;
    if (text == "automated_authored" || text == "automated-authored" || text == "ai_authored") {
        return RuleActivation::automated_authored;
    }
    return std::nullopt;
}

void validate(const GuardrailRule& rule) {
    if (rule.name.empty()) {
        throw ConfigError{"guardrail rule has no name"};
    }
    if (!rule.has_constraint()) {
        throw ConfigError{"guardrail rule '" + rule.name + "' sets no constraint"};
    }
    if (rule.pattern && rule.pattern->empty()) {
        throw ConfigError{"guardrail rule '" + rule.name + "' has an empty file pattern"};
    }
    for (const auto& p : rule.forbidden_imports) {
        if (p.empty()) throw ConfigError{"guardrail rule '" + rule.name + "' has an empty import pattern"};
    }
    for (const auto& p : rule.forbidden_content) {
        if (p.empty()) throw ConfigError{"guardrail rule '" + rule.name + "' has an empty content pattern"};
    }
}

void validate(const Config& config) {
    const auto& w = config.weights;
    for (auto v : {w.conflict_severity, w.blast_radius, w.pattern_deviation, w.churn, w.attribution}) {
        if (!(v >= 0.0) || !std::isfinite(v)) {
            throw ConfigError{"risk weights must be finite and non-negative"};
        }
    }
    if (std::abs(w.sum() - 1.0) > 1e-6) {
        throw ConfigError{"risk weights must sum to 1.0 (got " + std::to_string(w.sum()) + ")"};
    }
    if (!(config.risk_threshold >= 0.0 && config.risk_threshold <= 100.0)) {
        throw ConfigError{"risk_threshold must be within [0, 100]"};
    }
    if (config.max_open_prs == 0) throw ConfigError{"max_open_prs must be positive"};
    if (config.worker_count > max_worker_count) {
        throw ConfigError{"worker_count must not exceed " + std::to_string(max_worker_count)};
    }
    if (config.blast_radius_saturation == 0) throw ConfigError{"blast_radius_saturation must be positive"};
    if (!(config.duplication_threshold > 0.0 && config.duplication_threshold <= 1.0)) {
        throw ConfigError{"duplication_threshold must be within (0, 1]"};
    }
    if (config.regression_recency_window.count() < 0) {
        throw ConfigError{"regression_recency_window must not be negative"};
    }
    for (const auto& p : config.ignored_paths) {
        if (p.empty()) throw ConfigError{"ignored_paths contains an empty pattern"};
    }

    auto names = std::vector<std::string_view>{};
    for (const auto& rule : config.rules) {
        validate(rule);
        for (auto n : names) {
            if (n == rule.name) throw ConfigError{"duplicate guardrail rule name '" + rule.name + "'"};
        }
        names.push_back(rule.name);
    }
}

namespace {

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) out = it->template get<T>();
}

template <typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) out = it->template get<T>();
}

// Counts and sizes must be given as non-negative integers.
template <typename T>
void read_count(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_integer() || (!it->is_number_unsigned() && it->template get<std::int64_t>() < 0)) {
        throw ConfigError{std::string{key} + " must be a non-negative integer"};
    }
    if (it->template get<std::uint64_t>() > std::numeric_limits<T>::max()) {
        throw ConfigError{std::string{key} + " is out of range"};
    }
    out = it->template get<T>();
}

// Limits must be given as non-negative integers.
template <typename T>
void read_limit(const nlohmann::json& j, const char* key, const std::string& rule, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_integer() || it->template get<std::int64_t>() < 0) {
        throw ConfigError{"guardrail rule '" + rule + "': " + key + " must be a non-negative integer"};
    }
    out = it->template get<T>();
}

auto parse_rule(const nlohmann::json& j) -> GuardrailRule {
    if (!j.is_object()) throw ConfigError{"each guardrail rule must be an object"};

    auto rule = GuardrailRule{};
    read_value(j, "name", rule.name);
    read_optional(j, "pattern", rule.pattern);
    if (auto it = j.find("when"); it != j.end() && !it->is_null()) {
        auto text = it->get<std::string>();
        auto when = parse_rule_activation(text);
        if (!when) throw ConfigError{"guardrail rule '" + rule.name + "': unknown condition '" + text + "'"};
        rule.when = *when;
    }
    read_value(j, "cannot_import_from", rule.forbidden_imports);
    read_value(j, "must_not_contain", rule.forbidden_content);
    read_limit(j, "max_files_changed", rule.name, rule.max_files_changed);
    read_limit(j, "max_lines_changed", rule.name, rule.max_lines_changed);
    read_limit(j, "max_function_lines", rule.name, rule.max_function_lines);
    read_limit(j, "max_cyclomatic_complexity", rule.name, rule.max_cyclomatic_complexity);
    if (auto it = j.find("severity"); it != j.end() && !it->is_null()) {
        auto text = it->get<std::string>();
        auto severity = parse_severity(text);
        if (!severity) throw ConfigError{"guardrail rule '" + rule.name + "': unknown severity '" + text + "'"};
        rule.severity = *severity;
    }
    read_value(j, "message", rule.message);
    return rule;
}

}  // anonymous namespace

auto load_config(const nlohmann::json& j) -> Config {
    if (j.is_null()) {
        return Config{};
    }
    if (!j.is_object()) throw ConfigError{"configuration must be a JSON object"};

    auto config = Config{};
    try {
        read_value(j, "risk_threshold", config.risk_threshold);
        read_value(j, "check_regressions", config.check_regressions);
        read_count(j, "max_open_prs", config.max_open_prs);
        read_count(j, "decisions_log_depth", config.decisions_log_depth);
        read_value(j, "ignored_paths", config.ignored_paths);
        read_count(j, "blast_radius_depth", config.blast_radius_depth);
        read_count(j, "blast_radius_saturation", config.blast_radius_saturation);
        read_value(j, "duplication_threshold", config.duplication_threshold);
        read_count(j, "worker_count", config.worker_count);
        if (auto it = j.find("regression_recency_window_hours"); it != j.end() && !it->is_null()) {
            config.regression_recency_window = std::chrono::hours{it->get<std::int64_t>()};
        }
        if (auto it = j.find("weights"); it != j.end() && !it->is_null()) {
            auto& w = config.weights;
            read_value(*it, "conflict_severity", w.conflict_severity);
            read_value(*it, "blast_radius", w.blast_radius);
            read_value(*it, "pattern_deviation", w.pattern_deviation);
            read_value(*it, "churn", w.churn);
            read_value(*it, "attribution", w.attribution);
        }
        if (auto it = j.find("rules"); it != j.end() && !it->is_null()) {
            if (!it->is_array()) throw ConfigError{"rules must be an array"};
            for (const auto& r : *it) config.rules.push_back(parse_rule(r));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError{std::string{"malformed configuration: "} + e.what()};
    }

    validate(config);
    return config;
}

auto load_config_file(const std::filesystem::path& path) -> Config {
    auto in = std::ifstream{path};
    if (!in) throw ConfigError{"cannot open configuration file '" + path.string() + "'"};

    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        throw ConfigError{"configuration file '" + path.string() + "' is not valid JSON"};
    }
    return load_config(j);
}

}  // namespace mergeguard
