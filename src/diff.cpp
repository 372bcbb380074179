#include <mergeguard/diff.hpp>
#include <mergeguard/error.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace mergeguard {

namespace {

auto describe(const LineRange& r) -> std::string {
    return std::to_string(r.start) + "-" + std::to_string(r.end);
}

// A side with no lines is anchored at the line it follows.
auto side_range(std::uint32_t start, std::uint32_t count) -> LineRange {
    if (count == 0) return LineRange{start, start};
    return LineRange{start, start + count - 1};
}

}  // anonymous namespace

auto parse_file_change(std::string_view text) -> std::optional<FileChange> {
    if (text == "added")    return FileChange::added;
    if (text == "modified") return FileChange::modified;
    if (text == "removed")  return FileChange::removed;
    if (text == "renamed")  return FileChange::renamed;
    return std::nullopt;
}

auto Hunk::from_header(std::uint32_t old_start, std::uint32_t old_count,
                       std::uint32_t new_start, std::uint32_t new_count) -> Hunk {
    return Hunk{
        .before = side_range(old_start, old_count),
        .after = side_range(new_start, new_count),
        .added_lines = {},
        .removed_lines = {},
    };
}

auto FileDiff::touched_ranges() const -> std::vector<LineRange> {
    auto result = std::vector<LineRange>{};
    result.reserve(hunks.size());
    for (const auto& h : hunks) {
        result.push_back(h.before);
    }
    return result;
}

auto FileDiff::added_ranges() const -> std::vector<LineRange> {
    auto result = std::vector<LineRange>{};
    for (const auto& h : hunks) {
        if (!h.added_lines.empty()) result.push_back(h.after);
    }
    return result;
}

auto FileDiff::added_line_count() const -> std::size_t {
    auto total = std::size_t{0};
    for (const auto& h : hunks) total += h.added_lines.size();
    return total;
}

auto FileDiff::removed_line_count() const -> std::size_t {
    auto total = std::size_t{0};
    for (const auto& h : hunks) total += h.removed_lines.size();
    return total;
}

void validate(const FileDiff& diff) {
    if (diff.path.empty()) {
        throw InputError{ErrorKind::invalid_diff, "file diff has an empty path"};
    }
    if (diff.change == FileChange::renamed && !diff.previous_path) {
        throw InputError{ErrorKind::invalid_diff, "renamed file '" + diff.path + "' has no previous path"};
    }

    for (std::size_t i = 0; i < diff.hunks.size(); ++i) {
        const auto& h = diff.hunks[i];
        if (!h.before.valid() || !h.after.valid()) {
            throw InputError{ErrorKind::invalid_diff,
                "hunk " + std::to_string(i) + " of '" + diff.path +
                "' has an inverted range (before " + describe(h.before) +
                ", after " + describe(h.after) + ")"};
        }
        if (i == 0) continue;

        const auto& prev = diff.hunks[i - 1];
        if (prev.before.start > h.before.start || prev.after.start > h.after.start) {
            throw InputError{ErrorKind::invalid_diff,
                "hunks of '" + diff.path + "' are not ordered by position at index " +
                std::to_string(i)};
        }
        if (h.before.start <= prev.before.end) {
            throw InputError{ErrorKind::invalid_diff,
                "hunks of '" + diff.path + "' overlap: " + describe(prev.before) +
                " and " + describe(h.before)};
        }
    }
}

}  // namespace mergeguard
