/// @file proposal.hpp
/// @brief ChangeProposal: an open, unmerged pull/merge request.

#pragma once

#include <mergeguard/diff.hpp>
#include <mergeguard/types.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

/// Verdict on who authored a proposal.
enum class Authorship : std::uint8_t {
    unknown,       ///< No signal either way.
    human,         ///< Authored by a person.
    ai_suspected,  ///< Heuristics suggest machine generation.
    ai_confirmed,  ///< Commit metadata or an agent trace confirms machine generation.
};

/// Convert an Authorship to its string representation.
constexpr auto to_string_view(Authorship a) noexcept -> std::string_view {
    switch (a) {
        case Authorship::unknown:      return "unknown";
        case Authorship::human:        return "human";
        case Authorship::ai_suspected: return "ai_suspected";
        case Authorship::ai_confirmed: return "ai_confirmed";
    }
    return "unknown";
}

/// Parse an Authorship from its string representation.
auto parse_authorship(std::string_view text) -> std::optional<Authorship>;

/// Automated-authorship signals attached to a proposal.
struct AttributionSignals {
    Authorship authorship{Authorship::unknown};
    std::optional<double> confidence;  ///< Confidence in [0,1] that the proposal is machine-generated.
    std::vector<std::string> markers;  ///< Raw evidence (trailers, bot names, trace ids).

    /// True for ai_suspected and ai_confirmed.
    auto automated() const -> bool {
        return authorship == Authorship::ai_suspected || authorship == Authorship::ai_confirmed;
    }

    auto operator==(const AttributionSignals&) const -> bool = default;
};

/// An open change proposal and its parsed diff.
///
/// Immutable for the duration of one analysis run.
struct ChangeProposal {
    ProposalId id{0};
    std::string title;
    std::string source_branch;   ///< Head ref.
    std::string target_branch;   ///< Base ref.
    std::string head_sha;        ///< Head commit; empty if unknown.
    std::string base_sha;        ///< Base commit; empty if unknown.
    std::string author;
    std::vector<std::string> labels;
    AttributionSignals attribution;
    std::vector<FileDiff> files;  ///< One entry per touched file, in diff order.

    /// Paths of all touched files: proposal-branch paths plus the
    /// target-branch path of every renamed file.
    auto touched_paths() const -> std::set<std::string>;

    /// The diff of a touched file, or nullptr.
    auto find_file(std::string_view path) const -> const FileDiff*;

    /// The diff whose target-branch path is `path`, or nullptr.
    auto find_base_file(std::string_view path) const -> const FileDiff*;

    auto operator==(const ChangeProposal&) const -> bool = default;
};

/// Check proposal-level invariants plus every FileDiff.
/// @throws InputError (a std::invalid_argument) on a duplicate path or an invalid FileDiff.
void validate(const ChangeProposal& proposal);

}  // namespace mergeguard
