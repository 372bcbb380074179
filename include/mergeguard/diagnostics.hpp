/// @file diagnostics.hpp
/// @brief Run diagnostics: what an analysis run observed but did not fail on.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mergeguard {

/// How noteworthy a diagnostic is.
enum class DiagnosticLevel : std::uint8_t {
    info,     ///< Expected degradation (ignored files, truncation).
    warning,  ///< Reduced coverage (coarse fallback, unavailable signal).
    error,    ///< A proposal or pair could not be analysed.
};

/// Convert a DiagnosticLevel to its string representation.
constexpr auto to_string_view(DiagnosticLevel level) noexcept -> std::string_view {
    switch (level) {
        case DiagnosticLevel::info:    return "info";
        case DiagnosticLevel::warning: return "warning";
        case DiagnosticLevel::error:   return "error";
    }
    return "unknown";
}

/// One diagnostic line. `code` is a stable machine-readable tag
/// (`coarse_fallback`, `deadline`, ...).
struct Diagnostic {
    DiagnosticLevel level{DiagnosticLevel::info};
    std::string code;
    std::string message;

    auto operator==(const Diagnostic&) const -> bool = default;
};

/// An append-only bag of diagnostics with per-level counters.
class Diagnostics {
public:
    void add(DiagnosticLevel level, std::string code, std::string message) {
        switch (level) {
            case DiagnosticLevel::info:    ++infos_; break;
            case DiagnosticLevel::warning: ++warnings_; break;
            case DiagnosticLevel::error:   ++errors_; break;
        }
        items_.push_back(Diagnostic{level, std::move(code), std::move(message)});
    }

    void info(std::string code, std::string message) { add(DiagnosticLevel::info, std::move(code), std::move(message)); }
    void warning(std::string code, std::string message) { add(DiagnosticLevel::warning, std::move(code), std::move(message)); }
    void error(std::string code, std::string message) { add(DiagnosticLevel::error, std::move(code), std::move(message)); }

    auto items() const -> const std::vector<Diagnostic>& { return items_; }
    auto empty() const -> bool { return items_.empty(); }
    auto info_count() const -> std::size_t { return infos_; }
    auto warning_count() const -> std::size_t { return warnings_; }
    auto error_count() const -> std::size_t { return errors_; }
    auto has_errors() const -> bool { return errors_ > 0; }

    /// Number of diagnostics with the given code.
    auto count(std::string_view code) const -> std::size_t {
        auto n = std::size_t{0};
        for (const auto& d : items_) {
            if (d.code == code) ++n;
        }
        return n;
    }

    auto operator==(const Diagnostics&) const -> bool = default;

private:
    std::vector<Diagnostic> items_;
    std::size_t infos_{0};
    std::size_t warnings_{0};
    std::size_t errors_{0};
};

}  // namespace mergeguard
