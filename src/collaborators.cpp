#include <mergeguard/collaborators.hpp>

#include "executor.hpp"

#include <cmath>
#include <exception>
#include <mutex>
#include <set>

namespace mergeguard {

// -- SymbolCache --------------------------------------------------------------

auto SymbolCache::lookup(const std::string& path, const std::string& ref) const
    -> std::optional<FileSymbols> {
    auto lock = std::unique_lock{mutex_};  // counters are written
    auto it = entries_.find({path, ref});
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return it->second;
}

void SymbolCache::store(const std::string& path, const std::string& ref, FileSymbols symbols) {
    auto lock = std::unique_lock{mutex_};
    entries_.insert_or_assign({path, ref}, std::move(symbols));
}

void SymbolCache::clear() {
    auto lock = std::unique_lock{mutex_};
    entries_.clear();
}

auto SymbolCache::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return entries_.size();
}

auto SymbolCache::hits() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return hits_;
}

auto SymbolCache::misses() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return misses_;
}

// -- gather_input -------------------------------------------------------------

namespace {

struct FetchSlot {
    ProposalId proposal{0};
    std::string path;        // path at `ref`
    std::string key;         // path the symbols are filed under
    std::string ref;
    bool base{false};
    bool cacheable{false};   // `ref` names a commit, not a movable branch
    std::optional<FileSymbols> symbols;
    std::optional<std::string> failure;
};

}  // anonymous namespace

auto gather_input(HostingProvider& provider,
                  const SymbolExtractor& extractor,
                  const Config& config,
                  SymbolCache* cache,
                  Diagnostics* diagnostics) -> AnalysisInput {
    auto input = AnalysisInput{};
    input.proposals = provider.list_open_proposals();
    if (input.proposals.size() > config.max_open_prs) input.proposals.resize(config.max_open_prs);

    auto slots = std::vector<FetchSlot>{};
    for (auto& p : input.proposals) {
        drop_ignored_files(p, config.ignored_paths);
        const auto& base_ref = p.base_sha.empty() ? p.target_branch : p.base_sha;
        const auto& head_ref = p.head_sha.empty() ? p.source_branch : p.head_sha;
        for (const auto& diff : p.files) {
            if (diff.change != FileChange::added) {
                const auto& old_path = diff.previous_path ? *diff.previous_path : diff.path;
                slots.push_back(FetchSlot{.proposal = p.id, .path = old_path, .key = old_path,
                                          .ref = base_ref, .base = true,
                                          .cacheable = !p.base_sha.empty()});
            }
            if (diff.change != FileChange::removed) {
                slots.push_back(FetchSlot{.proposal = p.id, .path = diff.path, .key = diff.path,
                                          .ref = head_ref, .base = false,
                                          .cacheable = !p.head_sha.empty()});
            }
        }
    }

    // Providers are not required to be thread-safe; fetches are serialised.
    auto provider_mutex = std::mutex{};

    auto executor = tf::Executor{detail::resolve_worker_count(config.worker_count)};
    auto taskflow = tf::Taskflow{"gather"};
    for (auto& slot : slots) {
        taskflow.emplace([&, s = &slot] {
            try {
                if (cache && s->cacheable) {
                    if (auto hit = cache->lookup(s->path, s->ref)) {
                        s->symbols = std::move(hit);
                        return;
                    }
                }
                auto content = std::optional<std::string>{};
                {
                    auto lock = std::lock_guard{provider_mutex};
                    content = provider.file_content(s->path, s->ref);
                }
                if (!content) {
                    s->failure = "not found at " + s->ref;
                    return;
                }
                auto symbols = extractor.extract(s->path, *content);
                symbols.path = s->path;
                if (cache && s->cacheable) cache->store(s->path, s->ref, symbols);
                s->symbols = std::move(symbols);
            } catch (const std::exception& e) {
                s->failure = e.what();
            } catch (...) {
                s->failure = "non-standard exception";
            }
        });
    }
    executor.run(taskflow).wait();

    auto graph_files = std::map<std::string, const FileSymbols*>{};
    for (const auto& slot : slots) {
        if (slot.failure) {
            if (diagnostics) {
                diagnostics->warning("fetch_failed", "#" + std::to_string(slot.proposal) + ": "
                                                     + slot.path + ": " + *slot.failure);
            }
            continue;
        }
        if (!slot.symbols) continue;
        auto& entry = input.symbols[slot.proposal];
        auto& side = slot.base ? entry.base : entry.head;
        side.insert_or_assign(slot.key, *slot.symbols);
        if (slot.symbols->usable() && (slot.base || !graph_files.contains(slot.key))) {
            graph_files[slot.key] = &*slot.symbols;
        }
    }

    auto files = std::vector<FileSymbols>{};
    files.reserve(graph_files.size());
    for (const auto& [_, f] : graph_files) files.push_back(*f);
    input.graph = DependencyGraph::from_imports(files);
    return input;
}

// -- publishing ---------------------------------------------------------------

auto render_comment(const ProposalReport& report) -> std::string {
    auto out = std::string{"### Merge risk: "};
    out += std::to_string(static_cast<int>(std::lround(report.risk.composite)));
    out += "/100 (";
    out += to_string_view(report.status);
    out += ")\n\n";

    if (report.error) {
        out += "Analysis failed: " + report.error->message + "\n";
        return out;
    }
    if (report.conflicts.empty()) {
        out += "No conflicts with other open proposals.\n";
    } else {
        out += "| severity | kind | file | details |\n|---|---|---|---|\n";
        for (const auto& c : report.conflicts) {
            out += "| ";
            out += to_string_view(c.severity);
            out += " | ";
            out += to_string_view(c.kind);
            out += " | " + c.file + " | " + c.description + " |\n";
        }
    }
    if (report.partial) out += "\nSome comparisons did not finish before the deadline.\n";
    return out;
}

auto publish(HostingProvider& provider, const AnalysisResult& result) -> std::size_t {
    auto published = std::size_t{0};
    for (const auto& report : result.reports) {
        if (report.error) continue;
        provider.post_comment(report.id, render_comment(report));
        provider.set_status(report.id, report.status,
                            std::to_string(report.conflicts.size()) + " conflict(s), risk "
                            + std::to_string(static_cast<int>(std::lround(report.risk.composite))));
        ++published;
    }
    return published;
}

}  // namespace mergeguard
