#include <mergeguard/risk.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <functional>

namespace mergeguard {

auto RiskBreakdown::factor(RiskFactor f) const -> const FactorScore& {
    switch (f) {
        case RiskFactor::conflict_severity: return conflict_severity;
        case RiskFactor::blast_radius:      return blast_radius;
        case RiskFactor::pattern_deviation: return pattern_deviation;
        case RiskFactor::churn:             return churn;
        case RiskFactor::attribution:       return attribution;
    }
    return conflict_severity;
}

void ModuleProfile::add(const Symbol& s) {
    auto n = static_cast<double>(++samples);
    line_count += (static_cast<double>(s.lines.length()) - line_count) / n;
    nesting_depth += (static_cast<double>(s.nesting_depth) - nesting_depth) / n;
    parameter_count += (static_cast<double>(s.signature.parameters.size()) - parameter_count) / n;
}

auto conflict_severity_factor(const std::vector<Conflict>& conflicts) -> double {
    auto scores = std::vector<double>{};
    scores.reserve(conflicts.size());
    for (const auto& c : conflicts) scores.push_back(severity_score(c.severity));
    std::ranges::sort(scores, std::greater<>{});

    auto total = 0.0;
    auto decay = 1.0;
    for (auto s : scores) {
        total += s * decay;
        decay *= 0.5;
    }
    return total / 100.0;
}

auto blast_radius_factor(const DependencyGraph& graph,
                         const std::set<std::string>& touched,
                         std::size_t max_depth,
                         std::size_t saturation) -> double {
    if (saturation == 0) return 0.0;
    const auto reached = graph.reverse_reach(touched, max_depth).size();
    return std::min(1.0, static_cast<double>(reached) / static_cast<double>(saturation));
}

namespace {

auto is_callable(const Symbol& s) -> bool {
    return s.kind == SymbolKind::function || s.kind == SymbolKind::method;
}

auto relative_deviation(double value, double average) -> double {
    return std::abs(value - average) / std::max(average, 1.0);
}

// Proposal-branch shape of an edited symbol; added symbols already are.
auto head_shape(const ProposalView& view, const ChangedSymbol& cs) -> const Symbol* {
    if (cs.change == SymbolChange::added) return &cs.symbol;
    for (const auto& diff : view.proposal().files) {
        const bool same = diff.path == cs.symbol.file
                       || (diff.previous_path && *diff.previous_path == cs.symbol.file);
        if (!same) continue;
        const auto* head = view.head_file(diff.path);
        if (!head) return nullptr;
        auto it = std::ranges::find_if(head->symbols, [&](const Symbol& s) {
            return s.qualified_name() == cs.symbol.qualified_name();
        });
        return it == head->symbols.end() ? nullptr : &*it;
    }
    return nullptr;
}

void add_note(std::vector<std::string>* notes, std::string text) {
    if (notes) notes->push_back(std::move(text));
}

void set_factor(FactorScore& f, std::optional<double> raw, double weight) {
    f.weight = weight;
    f.available = raw.has_value();
    f.raw = raw.value_or(0.0);
    f.weighted = f.raw * weight * 100.0;
}

}  // anonymous namespace

auto module_profiles(const ProposalView& view) -> std::map<std::string, ModuleProfile> {
    auto profiles = std::map<std::string, ModuleProfile>{};
    for (const auto& diff : view.proposal().files) {
        const auto* base = view.base_file(diff.path);
        if (!base) continue;
        for (const auto& s : base->symbols) {
            if (is_callable(s)) profiles[s.module].add(s);
        }
    }
    return profiles;
}

auto pattern_deviation_factor(const ProposalView& view) -> std::optional<double> {
    const auto profiles = module_profiles(view);

    auto total = 0.0;
    auto count = std::size_t{0};
    for (const auto& cs : view.changed()) {
        if (cs.change == SymbolChange::removed || !is_callable(cs.symbol)) continue;
        auto it = profiles.find(cs.symbol.module);
        if (it == profiles.end()) continue;
        const auto* shape = head_shape(view, cs);
        if (!shape) continue;

        const auto& p = it->second;
        const auto d = (relative_deviation(shape->lines.length(), p.line_count)
                      + relative_deviation(shape->nesting_depth, p.nesting_depth)
                      + relative_deviation(static_cast<double>(shape->signature.parameters.size()),
                                           p.parameter_count)) / 3.0;
        total += 1.0 - std::exp(-d);
        ++count;
    }
    if (count == 0) return std::nullopt;
    return total / static_cast<double>(count);
}

auto score_risk(const ProposalView& view,
                const std::vector<Conflict>& conflicts,
                const DependencyGraph& graph,
                const Config& config,
                const SignalProvider* signals,
                std::vector<std::string>* notes) -> RiskBreakdown {
    auto breakdown = RiskBreakdown{};
    const auto& w = config.weights;
    const auto& touched = view.touched_paths();

    set_factor(breakdown.conflict_severity, conflict_severity_factor(conflicts), w.conflict_severity);

    const bool graph_known = std::ranges::any_of(touched, [&](const std::string& p) { return graph.contains(p); });
    set_factor(breakdown.blast_radius,
               blast_radius_factor(graph, touched, config.blast_radius_depth, config.blast_radius_saturation),
               w.blast_radius);
    if (!graph_known && !touched.empty()) {
        breakdown.blast_radius.available = false;
        add_note(notes, "no dependency data for any file of #" + std::to_string(view.id()));
    }

    set_factor(breakdown.pattern_deviation, pattern_deviation_factor(view), w.pattern_deviation);

    auto churn = std::optional<double>{};
    if (signals) {
        auto sum = 0.0;
        auto known = std::size_t{0};
        for (const auto& path : touched) {
            try {
                if (auto rate = signals->churn(path)) {
                    sum += std::clamp(*rate, 0.0, 1.0);
                    ++known;
                }
            } catch (const std::exception& e) {
                add_note(notes, "churn signal failed for " + path + ": " + e.what());
            }
        }
        if (known > 0) churn = sum / static_cast<double>(known);
    }
    if (!churn) add_note(notes, "churn unavailable for #" + std::to_string(view.id()));
    set_factor(breakdown.churn, churn, w.churn);

    auto attribution = std::optional<double>{};
    if (signals) {
        try {
            attribution = signals->attribution(view.proposal());
        } catch (const std::exception& e) {
            add_note(notes, "attribution signal failed for #" + std::to_string(view.id()) + ": " + e.what());
        }
    }
    if (!attribution) attribution = view.proposal().attribution.confidence;
    if (attribution) attribution = std::clamp(*attribution, 0.0, 1.0);
    set_factor(breakdown.attribution, attribution, w.attribution);

    auto composite = 0.0;
    for (auto f : all_risk_factors) composite += breakdown.factor(f).weighted;
    breakdown.composite = std::clamp(composite, 0.0, 100.0);
    return breakdown;
}

}  // namespace mergeguard
