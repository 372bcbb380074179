#include <mergeguard/proposal.hpp>
#include <mergeguard/error.hpp>

#include <stdexcept>
#include <string>

namespace mergeguard {

auto parse_authorship(std::string_view text) -> std::optional<Authorship> {
    if (text == "unknown")      return Authorship::unknown;
    if (text == "human")        return Authorship::human;
    if (text == "ai_suspected") return Authorship::ai_suspected;
    if (text == "ai_confirmed") return Authorship::ai_confirmed;
    return std::nullopt;
}

auto ChangeProposal::touched_paths() const -> std::set<std::string> {
    auto result = std::set<std::string>{};
    for (const auto& f : files) {
        result.insert(f.path);
        if (f.previous_path) result.insert(*f.previous_path);
    }
    return result;
}

auto ChangeProposal::find_file(std::string_view path) const -> const FileDiff* {
    for (const auto& f : files) {
        if (f.path == path) return &f;
    }
    return nullptr;
}

auto ChangeProposal::find_base_file(std::string_view path) const -> const FileDiff* {
    for (const auto& f : files) {
        if (f.base_path() == path) return &f;
    }
    return nullptr;
}

void validate(const ChangeProposal& proposal) {
    auto seen = std::set<std::string_view>{};
    for (const auto& f : proposal.files) {
        validate(f);
        if (!seen.insert(f.path).second) {
            throw InputError{ErrorKind::invalid_proposal,
                "proposal #" + std::to_string(proposal.id) + " lists '" + f.path + "' twice"};
        }
    }
    if (auto c = proposal.attribution.confidence; c && (*c < 0.0 || *c > 1.0)) {
        throw InputError{ErrorKind::invalid_proposal,
            "proposal #" + std::to_string(proposal.id) + " has attribution confidence outside [0,1]"};
    }
}

}  // namespace mergeguard
