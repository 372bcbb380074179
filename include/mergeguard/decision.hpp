/// @file decision.hpp
/// @brief Decisions recorded from merged proposals, and the log that holds them.

#pragma once

#include <mergeguard/types.hpp>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

/// The kinds of durable structural decisions extracted at merge time.
enum class DecisionKind : std::uint8_t {
    removal,    ///< A symbol was deliberately removed.
    migration,  ///< An old pattern was superseded by a new one.
    addition,   ///< A new symbol or pattern was introduced.
};

/// Convert a DecisionKind to its string representation.
constexpr auto to_string_view(DecisionKind k) noexcept -> std::string_view {
    switch (k) {
        case DecisionKind::removal:   return "removal";
        case DecisionKind::migration: return "migration";
        case DecisionKind::addition:  return "addition";
    }
    return "unknown";
}

/// Parse a DecisionKind from its string representation.
auto parse_decision_kind(std::string_view text) -> std::optional<DecisionKind>;

/// A durable fact learned from a previously merged proposal.
struct Decision {
    DecisionKind kind{DecisionKind::removal};
    std::string entity;                       ///< Symbol name, or a label for a migrated pattern.
    std::optional<std::string> module;        ///< Module the entity belonged to.
    std::optional<std::string> file;          ///< File the entity lived in.
    std::optional<std::string> old_pattern;   ///< Superseded content (migration).
    std::optional<std::string> new_pattern;   ///< Replacement content (migration).
    std::string description;
    ProposalId origin{0};                     ///< The merged proposal that made the decision.
    std::string author;
    std::int64_t timestamp{0};                ///< Merge time, Unix milliseconds.

    auto operator==(const Decision&) const -> bool = default;
};

/// Check that a decision can be matched: a non-empty entity, and for a
/// migration a non-empty old pattern.
/// @throws InputError (a std::invalid_argument) naming the decision.
void validate(const Decision& decision);

/// Read-only view over recorded decisions.
class DecisionSource {
public:
    virtual ~DecisionSource() = default;

    /// The most recent decisions, newest first, at most `limit` of them.
    virtual auto recent(std::size_t limit) const -> std::vector<Decision> = 0;
};

/// An append-only, in-memory decisions log.
///
/// Writers append at merge time; analysis runs only read through the
/// DecisionSource interface. Reads and appends may run concurrently.
class DecisionLog : public DecisionSource {
public:
    DecisionLog() = default;

    DecisionLog(const DecisionLog& other);
    auto operator=(const DecisionLog& other) -> DecisionLog&;

    /// Append one decision.
    void append(Decision decision);

    /// Number of recorded decisions.
    auto size() const -> std::size_t;

    /// Newest first by timestamp; equal timestamps keep reverse append order.
    auto recent(std::size_t limit) const -> std::vector<Decision> override;

    /// All decisions in append order.
    auto entries() const -> std::vector<Decision>;

private:
    std::vector<Decision> entries_;
    mutable std::shared_mutex mutex_;
};

/// Load a log from JSON lines (one Decision object per line; blank lines skipped).
/// @throws std::runtime_error naming the offending line on malformed input.
auto load_decisions(std::istream& in) -> DecisionLog;

/// Write a log as JSON lines in append order.
void save_decisions(const DecisionLog& log, std::ostream& out);

}  // namespace mergeguard
