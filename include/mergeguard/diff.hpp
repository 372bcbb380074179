/// @file diff.hpp
/// @brief Structured unified-diff model: Hunk and FileDiff.

#pragma once

#include <mergeguard/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

/// How a file is affected by a change proposal.
enum class FileChange : std::uint8_t {
    added,     ///< The file does not exist on the target branch.
    modified,  ///< The file is edited in place.
    removed,   ///< The file is deleted.
    renamed,   ///< The file moved (and may also be edited).
};

/// Convert a FileChange to its string representation.
constexpr auto to_string_view(FileChange change) noexcept -> std::string_view {
    switch (change) {
        case FileChange::added:    return "added";
        case FileChange::modified: return "modified";
        case FileChange::removed:  return "removed";
        case FileChange::renamed:  return "renamed";
    }
    return "unknown";
}

/// Parse a FileChange from its string representation.
auto parse_file_change(std::string_view text) -> std::optional<FileChange>;

/// A contiguous block of added/removed lines within one file.
///
/// `before` is expressed in target-branch line numbers, `after` in
/// proposal-branch line numbers. A side that covers no lines (pure
/// insertion or pure deletion) is anchored at the line it follows, as in
/// the unified diff header `@@ -10,0 +11,2 @@`.
struct Hunk {
    LineRange before;                      ///< Lines replaced on the target branch.
    LineRange after;                       ///< Lines produced on the proposal branch.
    std::vector<std::string> added_lines;  ///< Literal added lines, without the '+'.
    std::vector<std::string> removed_lines;///< Literal removed lines, without the '-'.

    /// Build a hunk from the four numbers of a unified diff header.
    static auto from_header(std::uint32_t old_start, std::uint32_t old_count,
                            std::uint32_t new_start, std::uint32_t new_count) -> Hunk;

    auto operator==(const Hunk&) const -> bool = default;
};

/// The diff of a single file within a change proposal.
struct FileDiff {
    std::string path;                          ///< Path on the proposal branch.
    std::optional<std::string> previous_path;  ///< Path on the target branch if renamed.
    FileChange change{FileChange::modified};   ///< Kind of change.
    std::vector<Hunk> hunks;                   ///< Ordered, non-overlapping hunks.

    /// Path on the target branch: the previous path of a rename, else `path`.
    auto base_path() const -> const std::string& { return previous_path ? *previous_path : path; }

    /// Target-branch line ranges touched by this diff (one per hunk).
    auto touched_ranges() const -> std::vector<LineRange>;

    /// Proposal-branch line ranges of hunks that add lines.
    auto added_ranges() const -> std::vector<LineRange>;

    /// Number of added lines across all hunks.
    auto added_line_count() const -> std::size_t;

    /// Number of removed lines across all hunks.
    auto removed_line_count() const -> std::size_t;

    /// Added plus removed lines.
    auto changed_line_count() const -> std::size_t {
        return added_line_count() + removed_line_count();
    }

    auto operator==(const FileDiff&) const -> bool = default;
};

/// Check the FileDiff invariants.
/// @throws InputError (a std::invalid_argument) naming the path and the violated constraint
///   (empty path, inverted range, unordered or overlapping hunks, rename
///   without a previous path).
void validate(const FileDiff& diff);

}  // namespace mergeguard
