/// @file guardrails.hpp
/// @brief Guardrail evaluator: declarative repository policy checks.

#pragma once

#include <mergeguard/config.hpp>
#include <mergeguard/conflict.hpp>
#include <mergeguard/proposal.hpp>
#include <mergeguard/view.hpp>

#include <string_view>
#include <vector>

namespace mergeguard {

/// File reported for violations that concern the whole proposal.
inline constexpr std::string_view proposal_wide_file = "<repo>";

/// True if the rule's activation condition holds for the proposal.
auto rule_active(const GuardrailRule& rule, const ChangeProposal& proposal) -> bool;

/// True if the file falls inside the rule's pattern scope.
auto rule_covers(const GuardrailRule& rule, std::string_view path) -> bool;

/// Evaluate every rule against one proposal.
///
/// Pure function of the rules and the proposal's diff and symbol data.
/// Each violation is a guardrail Conflict with `source == target ==
/// view.id()` and the rule's severity; its description names the rule,
/// the offending file and the constraint exceeded.
auto evaluate_guardrails(const ProposalView& view, const std::vector<GuardrailRule>& rules)
    -> std::vector<Conflict>;

}  // namespace mergeguard
