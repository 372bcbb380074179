/// @file regression.hpp
/// @brief Regression detector: flags proposals that reverse recorded decisions.

#pragma once

#include <mergeguard/conflict.hpp>
#include <mergeguard/decision.hpp>
#include <mergeguard/view.hpp>

#include <chrono>
#include <cstdint>
#include <vector>

namespace mergeguard {

/// Check a proposal against recent decisions.
///
/// - removal: the proposal adds a symbol with the decision's name in the
///   decision's module (or, with no module recorded, in the decision's file).
/// - migration: an added line contains the decision's old pattern, within
///   the decision's file if one is recorded.
///
/// Matching is exact, so a symbol name no decision mentions never produces
/// a conflict. Severity is warning, critical when the decision is younger
/// than `recency_window` at `now_ms`.
/// @param decisions Newest first, already truncated to the configured depth.
/// @param now_ms Current time, Unix milliseconds.
/// @throws InputError if a decision fails validate().
auto detect_regressions(const ProposalView& view,
                        const std::vector<Decision>& decisions,
                        std::chrono::milliseconds recency_window,
                        std::int64_t now_ms) -> std::vector<Conflict>;

}  // namespace mergeguard
