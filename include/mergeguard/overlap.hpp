/// @file overlap.hpp
/// @brief Overlap engine: file- and symbol-level overlap of two proposals.

#pragma once

#include <mergeguard/symbol.hpp>
#include <mergeguard/types.hpp>
#include <mergeguard/view.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mergeguard {

/// One intersecting line span, attributed to the innermost enclosing symbol.
struct OverlapSpan {
    LineRange range;                    ///< Target-branch lines both proposals touch.
    std::optional<std::string> symbol;  ///< Qualified name; nullopt if no symbol encloses the span.

    auto operator==(const OverlapSpan&) const -> bool = default;
};

/// A symbol both proposals change within one shared file.
struct SharedSymbol {
    ChangedSymbol first;   ///< The change made by pair.first.
    ChangedSymbol second;  ///< The change made by pair.second.
    bool lines_intersect{false};  ///< True if their edits touch a common line of this symbol.

    auto operator==(const SharedSymbol&) const -> bool = default;
};

/// The overlap of two proposals within one file.
///
/// Computed with the pair normalized (first < second), so swapping the
/// inputs yields an identical record.
struct Overlap {
    ProposalPair pair;
    std::string path;
    std::vector<LineRange> first_ranges;   ///< Target-branch ranges touched by pair.first.
    std::vector<LineRange> second_ranges;  ///< Target-branch ranges touched by pair.second.
    std::vector<OverlapSpan> spans;        ///< Pairwise intersections of the two range sets.
    std::vector<SharedSymbol> shared_symbols;
    bool coarse_fallback{false};           ///< No usable symbols for this file: file-level only.

    /// True iff some range of one proposal intersects some range of the other.
    auto has_line_overlap() const -> bool { return !spans.empty(); }

    auto operator==(const Overlap&) const -> bool = default;
};

/// Compute one Overlap per file touched by both proposals, sorted by path.
///
/// Proposals with disjoint touched-file sets produce an empty result.
auto compute_overlaps(const ProposalView& a, const ProposalView& b) -> std::vector<Overlap>;

/// Intersections of two sorted, non-overlapping range lists.
auto intersect_ranges(const std::vector<LineRange>& a, const std::vector<LineRange>& b)
    -> std::vector<LineRange>;

}  // namespace mergeguard
