/// @file symbol.hpp
/// @brief Source-level symbol model: Symbol, FileSymbols, ChangedSymbol.

#pragma once

#include <mergeguard/diff.hpp>
#include <mergeguard/types.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

/// The kinds of named entities tracked by the symbol model.
enum class SymbolKind : std::uint8_t {
    function,  ///< A free function.
    method,    ///< A function owned by a class.
    class_,    ///< A class (may enclose methods).
};

/// Convert a SymbolKind to its string representation.
constexpr auto to_string_view(SymbolKind kind) noexcept -> std::string_view {
    switch (kind) {
        case SymbolKind::function: return "function";
        case SymbolKind::method:   return "method";
        case SymbolKind::class_:   return "class";
    }
    return "unknown";
}

/// Parse a SymbolKind from its string representation.
auto parse_symbol_kind(std::string_view text) -> std::optional<SymbolKind>;

/// One parameter of a callable signature.
struct Parameter {
    std::string name;                 ///< Parameter name.
    std::optional<std::string> type;  ///< Declared type, if any.
    bool has_default{false};          ///< True if the parameter is optional.

    auto operator==(const Parameter&) const -> bool = default;
};

/// An ordered parameter list plus an optional return descriptor.
struct Signature {
    std::vector<Parameter> parameters;   ///< Parameters in declaration order.
    std::optional<std::string> returns;  ///< Return descriptor, if any.

    /// Render as `(a: int, b = ...) -> R` for messages.
    auto to_string() const -> std::string;

    auto operator==(const Signature&) const -> bool = default;
};

/// A named, range-bounded source entity.
///
/// Symbols of one file either do not overlap or strictly enclose each
/// other (a class enclosing its methods).
struct Symbol {
    std::string name;                   ///< Unqualified name.
    SymbolKind kind{SymbolKind::function};
    std::string file;                   ///< Defining file path.
    LineRange lines;                    ///< Lines spanned by the definition.
    Signature signature;                ///< Parameters and return descriptor.
    std::string module;                 ///< Owning module (e.g. `billing.invoices`).
    std::optional<std::string> parent;  ///< Enclosing class name for methods.
    std::uint32_t nesting_depth{0};     ///< Maximum block nesting inside the body.
    std::uint32_t complexity{0};        ///< Cyclomatic complexity (0 = unknown).
    std::string source;                 ///< Body text, if the extractor provides it.

    /// `Parent.name` for methods, `name` otherwise.
    auto qualified_name() const -> std::string {
        return parent ? *parent + "." + name : name;
    }

    auto operator==(const Symbol&) const -> bool = default;
};

/// A call from inside a file to a named symbol.
struct CallSite {
    std::string callee;       ///< Called name as written (unqualified).
    std::uint32_t line{0};    ///< Line of the call.

    auto operator==(const CallSite&) const -> bool = default;
};

/// An import statement inside a file.
struct Import {
    std::string target;       ///< Imported module or path as written (`auth.session`, `./util`).
    std::uint32_t line{0};    ///< Line of the statement (0 = unknown).

    auto operator==(const Import&) const -> bool = default;
};

/// Outcome of symbol extraction for one file.
enum class ExtractionStatus : std::uint8_t {
    ok,                    ///< Symbols were extracted.
    unsupported_language,  ///< The extractor cannot parse this language (coarse fallback).
    parse_error,           ///< The language is supported but the content failed to parse.
};

/// Convert an ExtractionStatus to its string representation.
constexpr auto to_string_view(ExtractionStatus status) noexcept -> std::string_view {
    switch (status) {
        case ExtractionStatus::ok:                   return "ok";
        case ExtractionStatus::unsupported_language: return "unsupported_language";
        case ExtractionStatus::parse_error:          return "parse_error";
    }
    return "unknown";
}

/// Parse an ExtractionStatus from its string representation.
auto parse_extraction_status(std::string_view text) -> std::optional<ExtractionStatus>;

/// Everything the extractor knows about one file at one ref.
struct FileSymbols {
    std::string path;
    ExtractionStatus status{ExtractionStatus::ok};
    std::vector<Symbol> symbols;
    std::vector<Import> imports;
    std::vector<CallSite> calls;

    /// True if symbol-level analysis is possible for this file.
    auto usable() const -> bool { return status == ExtractionStatus::ok; }

    auto operator==(const FileSymbols&) const -> bool = default;
};

/// Check the FileSymbols invariants.
/// @throws InputError (a std::invalid_argument) on an inverted range, a symbol defined in
///   another file, or two symbols whose ranges cross without strict enclosure.
void validate(const FileSymbols& file);

/// How a proposal changes a symbol.
enum class SymbolChange : std::uint8_t {
    body_modified,       ///< Lines inside the body changed; signature intact.
    signature_modified,  ///< Parameters or return descriptor changed.
    added,               ///< The symbol exists only on the proposal branch.
    removed,             ///< The symbol exists only on the target branch.
};

/// Convert a SymbolChange to its string representation.
constexpr auto to_string_view(SymbolChange change) noexcept -> std::string_view {
    switch (change) {
        case SymbolChange::body_modified:      return "body_modified";
        case SymbolChange::signature_modified: return "signature_modified";
        case SymbolChange::added:              return "added";
        case SymbolChange::removed:            return "removed";
    }
    return "unknown";
}

/// A symbol together with the part of it a proposal touches.
///
/// For added symbols `symbol` and `touched` are proposal-branch
/// coordinates; for every other change they are target-branch coordinates.
struct ChangedSymbol {
    Symbol symbol;                                ///< The affected symbol.
    LineRange touched;                            ///< Subset of symbol.lines touched by the diff.
    SymbolChange change{SymbolChange::body_modified};
    std::optional<Signature> new_signature;       ///< Set for signature_modified.

    auto operator==(const ChangedSymbol&) const -> bool = default;
};

/// Derive the changed symbols of one file from its diff and the symbol sets
/// on either side.
///
/// Touched ranges are attributed to the innermost enclosing symbol, so an
/// edit inside a method does not also mark its class as modified.
/// @param diff The file's diff.
/// @param base Symbols on the target branch (nullptr if unavailable or new file).
/// @param head Symbols on the proposal branch (nullptr if unavailable or deleted file).
auto derive_changed_symbols(const FileDiff& diff,
                            const FileSymbols* base,
                            const FileSymbols* head) -> std::vector<ChangedSymbol>;

}  // namespace mergeguard
