/// @file view.hpp
/// @brief ProposalSymbols and ProposalView: a proposal joined with its symbol data.

#pragma once

#include <mergeguard/proposal.hpp>
#include <mergeguard/symbol.hpp>

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

/// Symbol data for the files a proposal touches.
///
/// `base` holds target-branch symbols keyed by target-branch path;
/// `head` holds proposal-branch symbols keyed by proposal-branch path.
/// A missing entry means the extractor was not run for that file.
struct ProposalSymbols {
    std::map<std::string, FileSymbols, std::less<>> base;
    std::map<std::string, FileSymbols, std::less<>> head;

    auto operator==(const ProposalSymbols&) const -> bool = default;
};

/// A proposal plus the derived per-run data every analysis step reads.
///
/// Holds references: the proposal and its symbols must outlive the view.
class ProposalView {
public:
    /// Derive changed symbols for every touched file.
    /// @throws InputError (a std::invalid_argument) if the proposal or its symbol data is malformed.
    ProposalView(const ChangeProposal& proposal, const ProposalSymbols& symbols);

    auto proposal() const -> const ChangeProposal& { return *proposal_; }
    auto id() const -> ProposalId { return proposal_->id; }

    /// Changed symbols across all touched files.
    auto changed() const -> const std::vector<ChangedSymbol>& { return changed_; }

    /// Changed symbols defined in one file.
    auto changed_in(std::string_view path) const -> std::vector<const ChangedSymbol*>;

    /// Target-branch symbols of a touched file, or nullptr if unusable.
    auto base_file(std::string_view path) const -> const FileSymbols*;

    /// Proposal-branch symbols of a touched file, or nullptr if unusable.
    auto head_file(std::string_view path) const -> const FileSymbols*;

    /// Touched files with no usable symbol data (coarse fallback).
    auto coarse_files() const -> const std::set<std::string>& { return coarse_files_; }

    /// True if the file is analysed at file level only; accepts either path of a rename.
    auto is_coarse(std::string_view path) const -> bool;

    /// Paths of all touched files.
    auto touched_paths() const -> const std::set<std::string>& { return touched_; }

private:
    const ChangeProposal* proposal_;
    const ProposalSymbols* symbols_;
    std::vector<ChangedSymbol> changed_;
    std::set<std::string> coarse_files_;
    std::set<std::string> touched_;
};

}  // namespace mergeguard
