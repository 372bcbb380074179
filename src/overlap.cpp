#include <mergeguard/overlap.hpp>

#include "symbol_index.hpp"

#include <algorithm>
#include <map>
#include <unordered_map>

namespace mergeguard {

auto intersect_ranges(const std::vector<LineRange>& a, const std::vector<LineRange>& b)
    -> std::vector<LineRange> {
    auto result = std::vector<LineRange>{};
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (auto shared = a[i].intersection(b[j])) result.push_back(*shared);
        if (a[i].end < b[j].end) {
            ++i;
        } else {
            ++j;
        }
    }
    return result;
}

namespace {

// Keyed by target-branch path so a rename meets an edit of the old file.
auto diffs_by_path(const ChangeProposal& p) -> std::unordered_map<std::string_view, const FileDiff*> {
    auto result = std::unordered_map<std::string_view, const FileDiff*>{};
    result.reserve(p.files.size());
    for (const auto& f : p.files) result.emplace(f.base_path(), &f);
    return result;
}

auto sorted_ranges(const FileDiff& diff) -> std::vector<LineRange> {
    auto ranges = diff.touched_ranges();
    std::ranges::sort(ranges);
    return ranges;
}

void collect_shared_symbols(Overlap& overlap,
                            const ProposalView& first,
                            const ProposalView& second,
                            const detail::SymbolIndex& index) {
    auto by_name = std::map<std::string, const ChangedSymbol*>{};
    for (const auto* cs : second.changed_in(overlap.path)) {
        by_name.emplace(cs->symbol.qualified_name(), cs);
    }

    for (const auto* ours : first.changed_in(overlap.path)) {
        auto it = by_name.find(ours->symbol.qualified_name());
        if (it == by_name.end()) continue;
        const auto* theirs = it->second;

        auto shared = SharedSymbol{.first = *ours, .second = *theirs, .lines_intersect = false};
        const bool both_on_base = ours->change != SymbolChange::added
                               && theirs->change != SymbolChange::added;
        if (both_on_base) {
            for (const auto& span : overlap.spans) {
                auto owners = index.innermost_intersecting(span.range);
                auto owned = std::ranges::any_of(owners, [&](const Symbol* s) {
                    return s->qualified_name() == ours->symbol.qualified_name();
                });
                if (owned) {
                    shared.lines_intersect = true;
                    break;
                }
            }
        }
        overlap.shared_symbols.push_back(std::move(shared));
    }
}

}  // anonymous namespace

auto compute_overlaps(const ProposalView& a, const ProposalView& b) -> std::vector<Overlap> {
    const auto& first = a.id() <= b.id() ? a : b;
    const auto& second = a.id() <= b.id() ? b : a;

    const auto first_diffs = diffs_by_path(first.proposal());
    const auto second_diffs = diffs_by_path(second.proposal());
    const auto& smaller = first_diffs.size() <= second_diffs.size() ? first_diffs : second_diffs;
    const auto& larger = first_diffs.size() <= second_diffs.size() ? second_diffs : first_diffs;

    auto shared_paths = std::vector<std::string_view>{};
    for (const auto& [path, _] : smaller) {
        if (larger.contains(path)) shared_paths.push_back(path);
    }
    std::ranges::sort(shared_paths);

    auto result = std::vector<Overlap>{};
    result.reserve(shared_paths.size());
    for (auto path : shared_paths) {
        auto overlap = Overlap{};
        overlap.pair = ProposalPair{first.id(), second.id()};
        overlap.path = std::string{path};
        overlap.first_ranges = sorted_ranges(*first_diffs.at(path));
        overlap.second_ranges = sorted_ranges(*second_diffs.at(path));

        const auto* base = first.base_file(path);
        if (!base) base = second.base_file(path);
        overlap.coarse_fallback = first.is_coarse(path) || second.is_coarse(path) || !base;

        auto index = detail::SymbolIndex{};
        if (!overlap.coarse_fallback) index = detail::SymbolIndex{base->symbols};

        for (const auto& range : intersect_ranges(overlap.first_ranges, overlap.second_ranges)) {
            auto span = OverlapSpan{.range = range, .symbol = std::nullopt};
            if (const auto* owner = index.innermost_enclosing(range)) {
                span.symbol = owner->qualified_name();
            }
            overlap.spans.push_back(std::move(span));
        }

        if (!overlap.coarse_fallback) collect_shared_symbols(overlap, first, second, index);
        result.push_back(std::move(overlap));
    }
    return result;
}

}  // namespace mergeguard
