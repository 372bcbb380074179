#include <mergeguard/symbol.hpp>
#include <mergeguard/error.hpp>

#include "symbol_index.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace mergeguard {

auto parse_symbol_kind(std::string_view text) -> std::optional<SymbolKind> {
    if (text == "function") return SymbolKind::function;
    if (text == "method")   return SymbolKind::method;
    if (text == "class")    return SymbolKind::class_;
    return std::nullopt;
}

auto parse_extraction_status(std::string_view text) -> std::optional<ExtractionStatus> {
    if (text == "ok")                   return ExtractionStatus::ok;
    if (text == "unsupported_language") return ExtractionStatus::unsupported_language;
    if (text == "parse_error")          return ExtractionStatus::parse_error;
    return std::nullopt;
}

auto Signature::to_string() const -> std::string {
    auto out = std::string{"("};
    for (std::size_t i = 0; i < parameters.size(); ++i) {
        const auto& p = parameters[i];
        if (i > 0) out += ", ";
        out += p.name;
        if (p.type) out += ": " + *p.type;
        if (p.has_default) out += " = ...";
    }
    out += ")";
    if (returns) out += " -> " + *returns;
    return out;
}

void validate(const FileSymbols& file) {
    auto sorted = std::vector<const Symbol*>{};
    sorted.reserve(file.symbols.size());
    for (const auto& s : file.symbols) {
        if (!s.lines.valid()) {
            throw InputError{ErrorKind::invalid_symbol,
                "symbol '" + s.qualified_name() + "' in '" + file.path +
                "' has an inverted line range"};
        }
        if (s.file != file.path) {
            throw InputError{ErrorKind::invalid_symbol,
                "symbol '" + s.qualified_name() + "' is listed under '" + file.path +
                "' but defined in '" + s.file + "'"};
        }
        sorted.push_back(&s);
    }
    std::ranges::sort(sorted, [](const Symbol* a, const Symbol* b) {
        if (a->lines.start != b->lines.start) return a->lines.start < b->lines.start;
        return a->lines.end > b->lines.end;
    });

    // Sweep with a stack of currently open (enclosing) symbols.
    auto open = std::vector<const Symbol*>{};
    for (const auto* s : sorted) {
        while (!open.empty() && open.back()->lines.end < s->lines.start) open.pop_back();
        if (!open.empty()) {
            const auto* outer = open.back();
            if (!outer->lines.encloses(s->lines) || outer->lines == s->lines) {
                throw InputError{ErrorKind::invalid_symbol,
                    "symbols '" + outer->qualified_name() + "' and '" + s->qualified_name() +
                    "' in '" + file.path + "' overlap without strict enclosure"};
            }
        }
        open.push_back(s);
    }

    for (const auto& c : file.calls) {
        if (c.callee.empty()) {
            throw InputError{ErrorKind::invalid_symbol, "call site in '" + file.path + "' has no callee"};
        }
    }
}

namespace {

auto by_qualified_name(const FileSymbols* file) -> std::map<std::string, const Symbol*> {
    auto result = std::map<std::string, const Symbol*>{};
    if (!file) return result;
    for (const auto& s : file->symbols) result.emplace(s.qualified_name(), &s);
    return result;
}

// Smallest range covering both.
auto hull(const LineRange& a, const LineRange& b) -> LineRange {
    return LineRange{std::min(a.start, b.start), std::max(a.end, b.end)};
}

}  // anonymous namespace

auto derive_changed_symbols(const FileDiff& diff,
                            const FileSymbols* base,
                            const FileSymbols* head) -> std::vector<ChangedSymbol> {
    if (base && !base->usable()) base = nullptr;
    if (head && !head->usable()) head = nullptr;
    if (diff.change == FileChange::added) base = nullptr;
    if (diff.change == FileChange::removed) head = nullptr;

    const auto base_by_name = by_qualified_name(base);
    const auto head_by_name = by_qualified_name(head);
    auto result = std::vector<ChangedSymbol>{};

    // Symbols only on the proposal branch.
    for (const auto& [name, sym] : head_by_name) {
        if (base && base_by_name.contains(name)) continue;
        if (!base && diff.change != FileChange::added) continue;
        result.push_back(ChangedSymbol{
            .symbol = *sym,
            .touched = sym->lines,
            .change = SymbolChange::added,
            .new_signature = std::nullopt,
        });
    }

    if (!base) return result;

    // Attribute each touched target-branch range to its innermost symbols.
    auto touched = std::map<const Symbol*, LineRange>{};
    const auto index = detail::SymbolIndex{base->symbols};
    for (const auto& range : diff.touched_ranges()) {
        for (const auto* sym : index.innermost_intersecting(range)) {
            auto part = *sym->lines.intersection(range);
            auto [it, inserted] = touched.emplace(sym, part);
            if (!inserted) it->second = hull(it->second, part);
        }
    }

    for (const auto& s : base->symbols) {
        const auto name = s.qualified_name();
        const Symbol* after = nullptr;
        if (auto it = head_by_name.find(name); it != head_by_name.end()) after = it->second;
        auto hit = touched.find(&s);

        if (head && !after) {
            result.push_back(ChangedSymbol{
                .symbol = s,
                .touched = hit != touched.end() ? hit->second : s.lines,
                .change = SymbolChange::removed,
                .new_signature = std::nullopt,
            });
        } else if (!head && diff.change == FileChange::removed) {
            result.push_back(ChangedSymbol{
                .symbol = s,
                .touched = s.lines,
                .change = SymbolChange::removed,
                .new_signature = std::nullopt,
            });
        } else if (after && after->signature != s.signature) {
            result.push_back(ChangedSymbol{
                .symbol = s,
                .touched = hit != touched.end() ? hit->second : LineRange{s.lines.start, s.lines.start},
                .change = SymbolChange::signature_modified,
                .new_signature = after->signature,
            });
        } else if (hit != touched.end()) {
            result.push_back(ChangedSymbol{
                .symbol = s,
                .touched = hit->second,
                .change = SymbolChange::body_modified,
                .new_signature = std::nullopt,
            });
        }
    }
    return result;
}

}  // namespace mergeguard
