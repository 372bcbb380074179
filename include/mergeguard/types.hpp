/// @file types.hpp
/// @brief Core identity and range types: ProposalId, ProposalPair, LineRange.

#pragma once

#include <algorithm>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

namespace mergeguard {

/// Identifies a change proposal (pull/merge request number).
using ProposalId = std::uint64_t;

/// An inclusive range of 1-based line numbers.
///
/// Line numbers are discrete, so two ranges that share an endpoint
/// overlap. A valid range has start <= end.
struct LineRange {
    std::uint32_t start{0};  ///< First line in the range.
    std::uint32_t end{0};    ///< Last line in the range (inclusive).

    constexpr LineRange() = default;

    /// Construct from explicit endpoints.
    constexpr LineRange(std::uint32_t s, std::uint32_t e) : start{s}, end{e} {}

    /// Check the start <= end invariant.
    constexpr auto valid() const -> bool { return start <= end; }

    /// Number of lines covered.
    constexpr auto length() const -> std::uint32_t { return end - start + 1; }

    /// True if the two ranges share at least one line.
    constexpr auto intersects(const LineRange& other) const -> bool {
        return start <= other.end && other.start <= end;
    }

    /// True if the line lies inside this range.
    constexpr auto contains(std::uint32_t line) const -> bool {
        return start <= line && line <= end;
    }

    /// True if other lies entirely inside this range.
    constexpr auto encloses(const LineRange& other) const -> bool {
        return start <= other.start && other.end <= end;
    }

    /// The shared lines of two ranges, or nullopt if they are disjoint.
    constexpr auto intersection(const LineRange& other) const -> std::optional<LineRange> {
        if (!intersects(other)) return std::nullopt;
        return LineRange{std::max(start, other.start), std::min(end, other.end)};
    }

    auto operator<=>(const LineRange&) const = default;
    auto operator==(const LineRange&) const -> bool = default;
};

/// True if any range in a intersects any range in b.
template <typename RangeA, typename RangeB>
auto any_intersect(const RangeA& a, const RangeB& b) -> bool {
    for (const auto& ra : a) {
        for (const auto& rb : b) {
            if (ra.intersects(rb)) return true;
        }
    }
    return false;
}

/// An unordered pair of proposals, normalized so that first < second.
///
/// Guardrail violations use a degenerate pair (p, p).
struct ProposalPair {
    ProposalId first{0};
    ProposalId second{0};

    constexpr ProposalPair() = default;

    /// Construct, ordering the two ids.
    constexpr ProposalPair(ProposalId a, ProposalId b)
        : first{std::min(a, b)}, second{std::max(a, b)} {}

    /// True if this pair mentions the given proposal.
    constexpr auto involves(ProposalId id) const -> bool {
        return first == id || second == id;
    }

    /// The other side of the pair, from the perspective of id.
    constexpr auto other(ProposalId id) const -> ProposalId {
        return first == id ? second : first;
    }

    auto operator<=>(const ProposalPair&) const = default;
    auto operator==(const ProposalPair&) const -> bool = default;
};

}  // namespace mergeguard

// -- std::hash specializations ------------------------------------------------

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<mergeguard::ProposalPair> {
    auto operator()(const mergeguard::ProposalPair& p) const noexcept -> std::size_t {
        auto h1 = std::hash<std::uint64_t>{}(p.first);
        auto h2 = std::hash<std::uint64_t>{}(p.second);
        return h1 ^ (h2 << 1);
    }
};

/// @endcond
