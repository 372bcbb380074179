#include <mergeguard/guardrails.hpp>

#include "glob.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <string>

namespace mergeguard {

auto rule_active(const GuardrailRule& rule, const ChangeProposal& proposal) -> bool {
    switch (rule.when) {
        case RuleActivation::always:             return true;
        case RuleActivation::automated_authored: return proposal.attribution.automated();
    }
    return false;
}

auto rule_covers(const GuardrailRule& rule, std::string_view path) -> bool {
    return !rule.pattern || detail::glob_match(*rule.pattern, path);
}

namespace {

class RuleEvaluator {
public:
    RuleEvaluator(const ProposalView& view, const GuardrailRule& rule, std::vector<Conflict>& out)
        : view_{view}, rule_{rule}, out_{out} {
        for (const auto& diff : view.proposal().files) {
            if (rule_covers(rule, diff.path)) scoped_.push_back(&diff);
        }
    }

    void run() {
        check_imports();
        check_content();
        check_size();
        check_functions();
    }

private:
    void report(std::string file, std::string constraint,
                std::optional<std::string> symbol = std::nullopt,
                std::optional<LineRange> lines = std::nullopt) {
        auto c = Conflict{};
        c.kind = ConflictKind::guardrail;
        c.severity = rule_.severity;
        c.source = view_.id();
        c.target = view_.id();
        c.description = "rule `" + rule_.name + "` violated in " + file + ": " + constraint;
        c.recommendation = rule_.message.empty()
            ? "change the proposal to satisfy `" + rule_.name + "`"
            : rule_.message;
        c.file = std::move(file);
        c.symbol = std::move(symbol);
        c.source_lines = lines;
        out_.push_back(std::move(c));
    }

    // Only imports the proposal introduces count.
    void check_imports() {
        if (rule_.forbidden_imports.empty()) return;
        for (const auto* diff : scoped_) {
            if (diff->change == FileChange::removed) continue;
            const auto* head = view_.head_file(diff->path);
            if (!head) continue;

            auto existing = std::set<std::string>{};
            if (const auto* base = view_.base_file(diff->path)) {
                for (const auto& imp : base->imports) existing.insert(imp.target);
            }

            for (const auto& imp : head->imports) {
                if (existing.contains(imp.target)) continue;
                const auto as_path = detail::module_to_path(imp.target);
                auto banned = std::ranges::find_if(rule_.forbidden_imports, [&](const std::string& glob) {
                    return detail::glob_match(glob, as_path) || detail::glob_match(glob, imp.target);
                });
                if (banned == rule_.forbidden_imports.end()) continue;

                auto lines = imp.line > 0 ? std::optional{LineRange{imp.line, imp.line}} : std::nullopt;
                report(diff->path, "imports `" + imp.target + "`, which matches forbidden source `"
                                   + *banned + "`", std::nullopt, lines);
            }
        }
    }

    void check_content() {
        for (const auto& needle : rule_.forbidden_content) {
            for (const auto* diff : scoped_) {
                auto hit = std::ranges::find_if(diff->hunks, [&](const Hunk& h) {
                    return std::ranges::any_of(h.added_lines, [&](const std::string& line) {
                        return line.find(needle) != std::string::npos;
                    });
                });
                if (hit == diff->hunks.end()) continue;
                report(diff->path, "adds forbidden content `" + needle + "`", std::nullopt, hit->after);
            }
        }
    }

    void check_size() {
        auto where = std::string{rule_.pattern ? *rule_.pattern : std::string{proposal_wide_file}};
        if (rule_.max_files_changed && scoped_.size() > *rule_.max_files_changed) {
            report(where, "changes " + std::to_string(scoped_.size()) + " files (max_files_changed "
                          + std::to_string(*rule_.max_files_changed) + ")");
        }
        if (rule_.max_lines_changed) {
            auto total = std::size_t{0};
            for (const auto* diff : scoped_) total += diff->changed_line_count();
            if (total > *rule_.max_lines_changed) {
                report(where, "changes " + std::to_string(total) + " lines (max_lines_changed "
                              + std::to_string(*rule_.max_lines_changed) + ")");
            }
        }
    }

    // Limits apply to the proposal-branch version of each function it adds or edits.
    void check_functions() {
        if (!rule_.max_function_lines && !rule_.max_cyclomatic_complexity) return;
        for (const auto* diff : scoped_) {
            const auto* head = view_.head_file(diff->path);
            if (!head) continue;

            auto changed = std::set<std::string>{};
            for (const auto* cs : view_.changed_in(diff->path)) {
                if (cs->change != SymbolChange::removed) changed.insert(cs->symbol.qualified_name());
            }

            for (const auto& s : head->symbols) {
                if (s.kind == SymbolKind::class_) continue;
                const auto name = s.qualified_name();
                if (!changed.contains(name)) continue;

                if (rule_.max_function_lines && s.lines.length() > *rule_.max_function_lines) {
                    report(diff->path, "`" + name + "` spans " + std::to_string(s.lines.length())
                                       + " lines (max_function_lines "
                                       + std::to_string(*rule_.max_function_lines) + ")",
                           name, s.lines);
                }
                if (rule_.max_cyclomatic_complexity && s.complexity > *rule_.max_cyclomatic_complexity) {
                    report(diff->path, "`" + name + "` has cyclomatic complexity "
                                       + std::to_string(s.complexity) + " (max_cyclomatic_complexity "
                                       + std::to_string(*rule_.max_cyclomatic_complexity) + ")",
                           name, s.lines);
                }
            }
        }
    }

    const ProposalView& view_;
    const GuardrailRule& rule_;
    std::vector<Conflict>& out_;
    std::vector<const FileDiff*> scoped_;
};

}  // anonymous namespace

auto evaluate_guardrails(const ProposalView& view, const std::vector<GuardrailRule>& rules)
    -> std::vector<Conflict> {
    auto result = std::vector<Conflict>{};
    for (const auto& rule : rules) {
        if (!rule_active(rule, view.proposal())) continue;
        RuleEvaluator{view, rule, result}.run();
    }
    return result;
}

}  // namespace mergeguard
