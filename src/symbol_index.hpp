#pragma once

// Range index over the symbols of one file.
// Internal header: not installed.
//
// Symbols are kept sorted by (start asc, end desc), so an enclosing
// symbol always precedes the symbols it encloses. Lookups binary-search
// on the start line and walk backwards; the first enclosing symbol met
// on the way back is the innermost one.

#include <mergeguard/symbol.hpp>
#include <mergeguard/types.hpp>

#include <algorithm>
#include <cstddef>
#include <vector>

namespace mergeguard::detail {

class SymbolIndex {
public:
    SymbolIndex() = default;

    explicit SymbolIndex(const std::vector<Symbol>& symbols) {
        entries_.reserve(symbols.size());
        for (const auto& s : symbols) entries_.push_back(&s);
        std::ranges::sort(entries_, [](const Symbol* a, const Symbol* b) {
            if (a->lines.start != b->lines.start) return a->lines.start < b->lines.start;
            return a->lines.end > b->lines.end;
        });
    }

    auto empty() const -> bool { return entries_.empty(); }
    auto size() const -> std::size_t { return entries_.size(); }

    // Innermost symbol whose lines enclose the whole range, or nullptr.
    auto innermost_enclosing(const LineRange& range) const -> const Symbol* {
        auto it = std::ranges::upper_bound(entries_, range.start, {},
            [](const Symbol* s) { return s->lines.start; });
        while (it != entries_.begin()) {
            --it;
            if ((*it)->lines.encloses(range)) return *it;
        }
        return nullptr;
    }

    // Innermost symbols that share at least one line with the range.
    //
    // A symbol is dropped when the symbols nested inside it cover every
    // line of the range that falls within it; the edit belongs to them.
    auto innermost_intersecting(const LineRange& range) const -> std::vector<const Symbol*> {
        auto hits = std::vector<const Symbol*>{};
        for (const auto* s : entries_) {
            if (s->lines.start > range.end) break;
            if (s->lines.intersects(range)) hits.push_back(s);
        }

        auto result = std::vector<const Symbol*>{};
        for (const auto* outer : hits) {
            auto clipped = *outer->lines.intersection(range);
            // hits are sorted by start, so nested ranges arrive in order
            auto next_uncovered = clipped.start;
            for (const auto* inner : hits) {
                if (inner == outer || !outer->lines.encloses(inner->lines)) continue;
                if (inner->lines.start > next_uncovered) break;
                if (inner->lines.end >= next_uncovered) next_uncovered = inner->lines.end + 1;
            }
            if (next_uncovered <= clipped.end) result.push_back(outer);
        }
        return result;
    }

private:
    std::vector<const Symbol*> entries_;
};

}  // namespace mergeguard::detail
