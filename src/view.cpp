#include <mergeguard/view.hpp>

#include <iterator>
#include <string>

namespace mergeguard {

namespace {

auto lookup(const std::map<std::string, FileSymbols, std::less<>>& files, std::string_view path)
    -> const FileSymbols* {
    auto it = files.find(path);
    if (it == files.end() || !it->second.usable()) return nullptr;
    return &it->second;
}

}  // anonymous namespace

ProposalView::ProposalView(const ChangeProposal& proposal, const ProposalSymbols& symbols)
    : proposal_{&proposal}, symbols_{&symbols}, touched_{proposal.touched_paths()} {
    validate(proposal);
    for (const auto& [_, file] : symbols.base) validate(file);
    for (const auto& [_, file] : symbols.head) validate(file);

    for (const auto& diff : proposal.files) {
        const auto& base_path = diff.previous_path ? *diff.previous_path : diff.path;
        const auto* base = lookup(symbols.base, base_path);
        const auto* head = lookup(symbols.head, diff.path);

        const bool base_needed = diff.change != FileChange::added;
        const bool head_needed = diff.change != FileChange::removed;
        if ((base_needed && !base) || (!base_needed && head_needed && !head)) {
            coarse_files_.insert(diff.path);
        }

        auto derived = derive_changed_symbols(diff, base, head);
        changed_.insert(changed_.end(),
                        std::make_move_iterator(derived.begin()),
                        std::make_move_iterator(derived.end()));
    }
}

auto ProposalView::changed_in(std::string_view path) const -> std::vector<const ChangedSymbol*> {
    // base-side symbols of a renamed file carry the old path, head-side ones the new
    auto previous = std::string_view{};
    if (const auto* diff = proposal_->find_file(path); diff && diff->previous_path) {
        previous = *diff->previous_path;
    } else if (const auto* renamed = proposal_->find_base_file(path); renamed && renamed->previous_path) {
        previous = renamed->path;
    }

    auto result = std::vector<const ChangedSymbol*>{};
    for (const auto& cs : changed_) {
        if (cs.symbol.file == path || (!previous.empty() && cs.symbol.file == previous)) {
            result.push_back(&cs);
        }
    }
    return result;
}

auto ProposalView::is_coarse(std::string_view path) const -> bool {
    if (coarse_files_.contains(std::string{path})) return true;
    const auto* renamed = proposal_->find_base_file(path);
    return renamed && renamed->previous_path && coarse_files_.contains(renamed->path);
}

auto ProposalView::base_file(std::string_view path) const -> const FileSymbols* {
    if (const auto* diff = proposal_->find_file(path); diff && diff->previous_path) {
        return lookup(symbols_->base, *diff->previous_path);
    }
    return lookup(symbols_->base, path);
}

auto ProposalView::head_file(std::string_view path) const -> const FileSymbols* {
    return lookup(symbols_->head, path);
}

}  // namespace mergeguard
