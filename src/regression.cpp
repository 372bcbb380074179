#include <mergeguard/regression.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mergeguard {

namespace {

auto severity_for(const Decision& d, std::chrono::milliseconds window, std::int64_t now_ms) -> Severity {
    const auto age = now_ms - d.timestamp;
    return age < window.count() ? Severity::critical : Severity::warning;
}

auto age_text(const Decision& d, std::int64_t now_ms) -> std::string {
    const auto minutes = (now_ms - d.timestamp) / 60'000;
    if (minutes < 60) return std::to_string(minutes < 0 ? 0 : minutes) + " minutes ago";
    if (minutes < 60 * 48) return std::to_string(minutes / 60) + " hours ago";
    return std::to_string(minutes / (60 * 24)) + " days ago";
}

auto same_file(const FileDiff& diff, const std::string& path) -> bool {
    return diff.path == path || (diff.previous_path && *diff.previous_path == path);
}

auto removal_matches(const Decision& d, const Symbol& s) -> bool {
    if (s.name != d.entity && s.qualified_name() != d.entity) return false;
    if (d.module) return s.module == *d.module;
    if (d.file) return s.file == *d.file;
    return false;
}

}  // anonymous namespace

auto detect_regressions(const ProposalView& view,
                        const std::vector<Decision>& decisions,
                        std::chrono::milliseconds recency_window,
                        std::int64_t now_ms) -> std::vector<Conflict> {
    auto result = std::vector<Conflict>{};

    for (const auto& d : decisions) {
        validate(d);
        if (d.kind == DecisionKind::removal) {
            for (const auto& cs : view.changed()) {
                if (cs.change != SymbolChange::added || !removal_matches(d, cs.symbol)) continue;

                auto c = Conflict{};
                c.kind = ConflictKind::regression;
                c.severity = severity_for(d, recency_window, now_ms);
                c.source = view.id();
                c.target = d.origin;
                c.file = cs.symbol.file;
                c.symbol = cs.symbol.qualified_name();
                c.source_lines = cs.symbol.lines;
                c.description = "#" + std::to_string(view.id()) + " re-adds `" + cs.symbol.qualified_name()
                              + "` in `" + cs.symbol.module + "`, removed by #" + std::to_string(d.origin)
                              + " " + age_text(d, now_ms);
                if (!d.description.empty()) c.description += ": " + d.description;
                c.recommendation = "confirm the removal in #" + std::to_string(d.origin)
                                 + " should be reversed, or drop `" + cs.symbol.name + "`";
                result.push_back(std::move(c));
            }
        } else if (d.kind == DecisionKind::migration) {
            for (const auto& diff : view.proposal().files) {
                if (d.file && !same_file(diff, *d.file)) continue;

                auto line_no = std::optional<LineRange>{};
                for (const auto& hunk : diff.hunks) {
                    for (const auto& added : hunk.added_lines) {
                        if (added.find(*d.old_pattern) == std::string::npos) continue;
                        line_no = hunk.after;
                        break;
                    }
                    if (line_no) break;
                }
                if (!line_no) continue;

                auto c = Conflict{};
                c.kind = ConflictKind::regression;
                c.severity = severity_for(d, recency_window, now_ms);
                c.source = view.id();
                c.target = d.origin;
                c.file = diff.path;
                c.source_lines = line_no;
                c.description = "#" + std::to_string(view.id()) + " reintroduces `" + *d.old_pattern
                              + "` in " + diff.path + ", superseded by #" + std::to_string(d.origin)
                              + " " + age_text(d, now_ms);
                if (d.new_pattern) c.description += " in favour of `" + *d.new_pattern + "`";
                c.recommendation = d.new_pattern ? "use `" + *d.new_pattern + "` instead"
                                                 : "follow the migration made in #" + std::to_string(d.origin);
                result.push_back(std::move(c));
            }
        }
    }
    return result;
}

}  // namespace mergeguard
