#include <mergeguard/conflict.hpp>

#include <algorithm>
#include <tuple>

namespace mergeguard {

auto parse_severity(std::string_view text) -> std::optional<Severity> {
    if (text == "critical") return Severity::critical;
    if (text == "warning")  return Severity::warning;
    if (text == "info")     return Severity::info;
    return std::nullopt;
}

auto parse_conflict_kind(std::string_view text) -> std::optional<ConflictKind> {
    if (text == "hard")        return ConflictKind::hard;
    if (text == "interface")   return ConflictKind::interface;
    if (text == "behavioral")  return ConflictKind::behavioral;
    if (text == "duplication") return ConflictKind::duplication;
    if (text == "regression")  return ConflictKind::regression;
    if (text == "guardrail")   return ConflictKind::guardrail;
    return std::nullopt;
}

auto conflict_order(const Conflict& a, const Conflict& b) -> bool {
    const auto sym_a = a.symbol.value_or(std::string{});
    const auto sym_b = b.symbol.value_or(std::string{});
    return std::tie(a.severity, a.source, a.target, a.kind, a.file, sym_a, a.description)
         < std::tie(b.severity, b.source, b.target, b.kind, b.file, sym_b, b.description);
}

void sort_conflicts(std::vector<Conflict>& conflicts) {
    std::ranges::stable_sort(conflicts, conflict_order);
}

}  // namespace mergeguard
