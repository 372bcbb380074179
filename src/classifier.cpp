#include <mergeguard/classifier.hpp>

#include "tokenize.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <set>
#include <string>
#include <utility>

namespace mergeguard {

auto normalized_tokens(const Symbol& symbol) -> std::vector<std::string> {
    auto tokens = std::vector<std::string>{};
    detail::append_tokens(symbol.name, tokens);
    detail::append_tokens(symbol.signature.to_string(), tokens);
    detail::append_tokens(symbol.source, tokens);
    return tokens;
}

auto token_jaccard(const Symbol& a, const Symbol& b) -> double {
    auto ta = normalized_tokens(a);
    auto tb = normalized_tokens(b);
    auto sa = std::set<std::string>(ta.begin(), ta.end());
    auto sb = std::set<std::string>(tb.begin(), tb.end());
    if (sa.empty() && sb.empty()) return 0.0;

    auto shared = std::size_t{0};
    for (const auto& t : sa) {
        if (sb.contains(t)) ++shared;
    }
    const auto total = sa.size() + sb.size() - shared;
    return static_cast<double>(shared) / static_cast<double>(total);
}

namespace {

using SymbolKey = std::pair<std::string, std::string>;  // (file, qualified name)

auto key_of(const ChangedSymbol& cs) -> SymbolKey {
    return {cs.symbol.file, cs.symbol.qualified_name()};
}

auto modifies(SymbolChange c) -> bool {
    return c == SymbolChange::body_modified || c == SymbolChange::signature_modified;
}

auto edits_existing(SymbolChange c) -> bool {
    return c != SymbolChange::added;
}

class PairClassifier {
public:
    PairClassifier(const ProposalView& first, const ProposalView& second,
                   const DependencyGraph& graph, const ClassifierOptions& options)
        : first_{first}, second_{second}, graph_{graph}, options_{options} {}

    auto run(const std::vector<Overlap>& overlaps) -> ClassificationResult {
        for (const auto& overlap : overlaps) hard_conflicts(overlap);
        interface_conflicts(first_, second_);
        interface_conflicts(second_, first_);
        for (const auto& overlap : overlaps) behavioral_conflicts(overlap);
        duplication_conflicts();
        for (const auto& overlap : overlaps) file_level_conflicts(overlap);
        return std::move(result_);
    }

private:
    auto make(ConflictKind kind, Severity severity, std::string file) const -> Conflict {
        auto c = Conflict{};
        c.kind = kind;
        c.severity = severity;
        c.source = first_.id();
        c.target = second_.id();
        c.file = std::move(file);
        return c;
    }

    // Rule 1: both sides edit an existing symbol on a common line.
    void hard_conflicts(const Overlap& overlap) {
        for (const auto& shared : overlap.shared_symbols) {
            if (!shared.lines_intersect) continue;
            if (!edits_existing(shared.first.change) || !edits_existing(shared.second.change)) continue;
            auto key = key_of(shared.first);
            if (!classified_.insert(key).second) continue;

            auto c = make(ConflictKind::hard, Severity::critical, overlap.path);
            c.symbol = key.second;
            c.source_lines = shared.first.touched;
            c.target_lines = shared.second.touched;
            c.description = "both #" + std::to_string(first_.id()) + " and #"
                          + std::to_string(second_.id()) + " change the same lines of `"
                          + key.second + "` (" + std::string{to_string_view(shared.first.change)}
                          + " vs " + std::string{to_string_view(shared.second.change)} + ")";
            c.recommendation = "merge one first and rebase the other onto it, resolving `"
                             + key.second + "` by hand";
            result_.conflicts.push_back(std::move(c));
        }
    }

    // Rule 2: `changer` alters a signature that `caller` calls in a file it touches.
    void interface_conflicts(const ProposalView& changer, const ProposalView& caller) {
        const auto& caller_touched = caller.touched_paths();
        for (const auto& cs : changer.changed()) {
            if (cs.change != SymbolChange::signature_modified) continue;
            auto key = key_of(cs);
            if (classified_.contains(key)) continue;

            auto scope = std::set<std::string>{cs.symbol.file};
            if (graph_.contains(cs.symbol.file)) {
                scope.merge(graph_.direct_dependents(cs.symbol.file));
            } else {
                result_.notes.push_back("no dependency data for " + cs.symbol.file
                                        + "; interface check for `" + key.second
                                        + "` limited to the defining file");
            }

            auto found = false;
            auto severity = Severity::warning;
            auto hit_file = std::string{};
            auto hit_line = std::uint32_t{0};
            for (const auto& path : scope) {
                if (!caller_touched.contains(path)) continue;
                const auto* diff = caller.proposal().find_file(path);
                if (!diff) continue;

                // Prefer the caller's own branch; fall back to target-branch call sites.
                const FileSymbols* calls_from = caller.head_file(path);
                auto ranges = diff->added_ranges();
                if (!calls_from) {
                    calls_from = caller.base_file(path);
                    ranges = diff->touched_ranges();
                }
                if (!calls_from) continue;

                for (const auto& call : calls_from->calls) {
                    if (call.callee != cs.symbol.name) continue;
                    const bool touched = std::ranges::any_of(ranges, [&](const LineRange& r) {
                        return r.contains(call.line);
                    });
                    if (!found || (touched && severity != Severity::critical)) {
                        hit_file = path;
                        hit_line = call.line;
                    }
                    found = true;
                    if (touched) severity = Severity::critical;
                }
            }
            if (!found) continue;
            classified_.insert(key);

            auto c = make(ConflictKind::interface, severity, hit_file);
            c.symbol = key.second;
            const bool changer_is_first = changer.id() == first_.id();
            auto call_lines = LineRange{hit_line, hit_line};
            c.source_lines = changer_is_first ? cs.touched : call_lines;
            c.target_lines = changer_is_first ? call_lines : cs.touched;
            c.description = "#" + std::to_string(changer.id()) + " changes the signature of `"
                          + key.second + "` to " + cs.new_signature.value_or(cs.symbol.signature).to_string()
                          + "; #" + std::to_string(caller.id()) + " "
                          + (severity == Severity::critical ? "adds or edits a call" : "touches a file that calls it")
                          + " at " + hit_file + ":" + std::to_string(hit_line);
            c.recommendation = "update the call sites in #" + std::to_string(caller.id())
                             + " to the new signature before merging";
            result_.conflicts.push_back(std::move(c));
        }
    }

    // Rule 3: both sides modify one symbol without touching a common line.
    void behavioral_conflicts(const Overlap& overlap) {
        for (const auto& shared : overlap.shared_symbols) {
            if (!modifies(shared.first.change) || !modifies(shared.second.change)) continue;
            if (shared.lines_intersect) continue;
            auto key = key_of(shared.first);
            if (!classified_.insert(key).second) continue;

            auto severity = Severity::warning;
            auto note = std::optional<std::string>{};
            if (options_.adjudicator) {
                auto bcase = BehavioralCase{
                    .first = first_.id(),
                    .second = second_.id(),
                    .file = overlap.path,
                    .first_change = shared.first,
                    .second_change = shared.second,
                };
                try {
                    if (auto verdict = options_.adjudicator(bcase)) {
                        severity = *verdict;
                        note = "severity set by semantic adjudicator";
                    }
                } catch (const std::exception& e) {
                    note = std::string{"semantic adjudicator failed: "} + e.what();
                    result_.notes.push_back(*note + " (" + overlap.path + ", `" + key.second + "`)");
                }
            }

            auto c = make(ConflictKind::behavioral, severity, overlap.path);
            c.symbol = key.second;
            c.source_lines = shared.first.touched;
            c.target_lines = shared.second.touched;
            c.note = std::move(note);
            c.description = "#" + std::to_string(first_.id()) + " and #" + std::to_string(second_.id())
                          + " both modify `" + key.second + "` at different lines";
            c.recommendation = "review the combined behaviour of `" + key.second
                             + "` with both changes applied";
            result_.conflicts.push_back(std::move(c));
        }
    }

    auto similarity(const Symbol& a, const Symbol& b) -> double {
        if (options_.similarity) {
            try {
                return options_.similarity(a, b);
            } catch (const std::exception& e) {
                result_.notes.push_back(std::string{"similarity measure failed, using token overlap: "}
                                        + e.what());
            }
        }
        return token_jaccard(a, b);
    }

    // Rule 4: both sides add near-identical symbols to one module.
    void duplication_conflicts() {
        for (const auto& ours : first_.changed()) {
            if (ours.change != SymbolChange::added) continue;
            for (const auto& theirs : second_.changed()) {
                if (theirs.change != SymbolChange::added) continue;
                if (ours.symbol.module != theirs.symbol.module || ours.symbol.kind != theirs.symbol.kind) continue;

                const auto score = similarity(ours.symbol, theirs.symbol);
                if (score < options_.duplication_threshold) continue;

                auto c = make(ConflictKind::duplication, Severity::info, ours.symbol.file);
                c.symbol = ours.symbol.qualified_name();
                c.source_lines = ours.symbol.lines;
                c.target_lines = theirs.symbol.lines;
                c.description = "#" + std::to_string(first_.id()) + " adds `" + ours.symbol.qualified_name()
                              + "` (" + ours.symbol.file + ") and #" + std::to_string(second_.id())
                              + " adds `" + theirs.symbol.qualified_name() + "` (" + theirs.symbol.file
                              + ") to module `" + ours.symbol.module + "` with similarity "
                              + std::to_string(static_cast<int>(score * 100.0 + 0.5)) + "%";
                c.recommendation = "keep one implementation and reuse it from the other proposal";
                result_.conflicts.push_back(std::move(c));
            }
        }
    }

    // True if a symbol-level conflict in this file already covers some line of the range.
    auto claimed_by_symbol(const std::string& path, const LineRange& range) const -> bool {
        return std::ranges::any_of(result_.conflicts, [&](const Conflict& c) {
            if (!c.symbol || c.file != path) return false;
            return (c.source_lines && c.source_lines->intersects(range))
                || (c.target_lines && c.target_lines->intersects(range));
        });
    }

    // Overlapping lines no symbol accounts for.
    void file_level_conflicts(const Overlap& overlap) {
        if (!overlap.has_line_overlap()) return;
        auto span = std::ranges::find_if(overlap.spans, [&](const OverlapSpan& s) {
            if (overlap.coarse_fallback) return true;
            return !s.symbol && !claimed_by_symbol(overlap.path, s.range);
        });
        if (span == overlap.spans.end()) return;

        auto c = make(ConflictKind::hard, Severity::warning, overlap.path);
        c.source_lines = span->range;
        c.target_lines = span->range;
        c.coarse = overlap.coarse_fallback;
        if (overlap.coarse_fallback) c.note = "no symbol data for this file; compared at line level only";
        c.description = "#" + std::to_string(first_.id()) + " and #" + std::to_string(second_.id())
                      + " both change lines " + std::to_string(span->range.start) + "-"
                      + std::to_string(span->range.end) + " of " + overlap.path;
        c.recommendation = "coordinate the edits to " + overlap.path + " before merging";
        result_.conflicts.push_back(std::move(c));
    }

    const ProposalView& first_;
    const ProposalView& second_;
    const DependencyGraph& graph_;
    const ClassifierOptions& options_;
    std::set<SymbolKey> classified_;
    ClassificationResult result_;
};

}  // anonymous namespace

auto classify(const ProposalView& a,
              const ProposalView& b,
              const std::vector<Overlap>& overlaps,
              const DependencyGraph& graph,
              const ClassifierOptions& options) -> ClassificationResult {
    const auto& first = a.id() <= b.id() ? a : b;
    const auto& second = a.id() <= b.id() ? b : a;
    if (overlaps.empty()) return {};
    return PairClassifier{first, second, graph, options}.run(overlaps);
}

}  // namespace mergeguard
