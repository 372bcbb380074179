/// @file collaborators.hpp
/// @brief Contracts with the hosting provider and the symbol extractor,
/// plus the concurrent input-gathering step built on them.

#pragma once

#include <mergeguard/config.hpp>
#include <mergeguard/diagnostics.hpp>
#include <mergeguard/engine.hpp>
#include <mergeguard/proposal.hpp>
#include <mergeguard/symbol.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mergeguard {

/// A code-hosting backend (GitHub- or GitLab-shaped).
///
/// Implementations do the network I/O; the engine never does.
class HostingProvider {
public:
    virtual ~HostingProvider() = default;

    /// Open proposals with their parsed diffs.
    virtual auto list_open_proposals() -> std::vector<ChangeProposal> = 0;

    /// File content at a ref, or nullopt if the file does not exist there.
    virtual auto file_content(std::string_view path, std::string_view ref) -> std::optional<std::string> = 0;

    /// Post (or update) the analysis comment on a proposal.
    virtual void post_comment(ProposalId id, const std::string& body) = 0;

    /// Set the proposal's commit status.
    virtual void set_status(ProposalId id, ReportStatus status, const std::string& description) = 0;
};

/// Source-level symbol extraction for one file.
///
/// Returns FileSymbols with status `unsupported_language` or `parse_error`
/// instead of throwing when a file cannot be analysed.
class SymbolExtractor {
public:
    virtual ~SymbolExtractor() = default;
    virtual auto extract(std::string_view path, std::string_view content) const -> FileSymbols = 0;
};

/// Thread-safe cache of extracted symbols keyed by (path, commit).
///
/// A miss only costs an extraction; it never changes a result.
/// gather_input() consults it only for proposals whose head_sha/base_sha
/// is set, since a branch name does not pin the content.
class SymbolCache {
public:
    auto lookup(const std::string& path, const std::string& ref) const -> std::optional<FileSymbols>;
    void store(const std::string& path, const std::string& ref, FileSymbols symbols);
    void clear();

    auto size() const -> std::size_t;
    auto hits() const -> std::size_t;
    auto misses() const -> std::size_t;

private:
    std::map<std::pair<std::string, std::string>, FileSymbols> entries_;
    mutable std::size_t hits_{0};
    mutable std::size_t misses_{0};
    mutable std::shared_mutex mutex_;
};

/// Fetch open proposals and extract symbols for every touched file on both
/// sides, concurrently. The dependency graph is built from the imports of
/// every extracted file.
///
/// Fetch or extraction failures leave the file without symbols (coarse
/// fallback) and add a diagnostic.
/// @param cache Optional; nullptr disables caching.
/// @throws whatever `list_open_proposals()` throws.
auto gather_input(HostingProvider& provider,
                  const SymbolExtractor& extractor,
                  const Config& config,
                  SymbolCache* cache = nullptr,
                  Diagnostics* diagnostics = nullptr) -> AnalysisInput;

/// Markdown comment summarising one report.
auto render_comment(const ProposalReport& report) -> std::string;

/// Post a comment and a status for every report without an error.
/// @return The number of proposals published.
auto publish(HostingProvider& provider, const AnalysisResult& result) -> std::size_t;

}  // namespace mergeguard
