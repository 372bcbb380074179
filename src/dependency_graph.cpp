#include <mergeguard/dependency_graph.hpp>

#include "glob.hpp"

#include <deque>
#include <utility>

namespace mergeguard {

void DependencyGraph::add_edge(const std::string& importer, const std::string& imported) {
    files_.insert(importer);
    files_.insert(imported);
    if (importer == imported) return;
    forward_[importer].insert(imported);
    reverse_[imported].insert(importer);
}

void DependencyGraph::add_file(const std::string& path) {
    files_.insert(path);
}

auto DependencyGraph::contains(std::string_view path) const -> bool {
    return files_.contains(path);
}

auto DependencyGraph::direct_dependents(std::string_view path) const -> std::set<std::string> {
    if (auto it = reverse_.find(path); it != reverse_.end()) return it->second;
    return {};
}

auto DependencyGraph::dependents(std::string_view path, std::size_t max_depth) const
    -> std::set<std::string> {
    return walk(reverse_, {std::string{path}}, max_depth);
}

auto DependencyGraph::dependencies(std::string_view path, std::size_t max_depth) const
    -> std::set<std::string> {
    return walk(forward_, {std::string{path}}, max_depth);
}

auto DependencyGraph::reverse_reach(const std::set<std::string>& roots, std::size_t max_depth) const
    -> std::set<std::string> {
    return walk(reverse_, roots, max_depth);
}

auto DependencyGraph::edge_count() const -> std::size_t {
    auto n = std::size_t{0};
    for (const auto& [_, targets] : forward_) n += targets.size();
    return n;
}

auto DependencyGraph::files() const -> std::vector<std::string> {
    return {files_.begin(), files_.end()};
}

auto DependencyGraph::edges() const -> std::vector<std::pair<std::string, std::string>> {
    auto result = std::vector<std::pair<std::string, std::string>>{};
    for (const auto& [from, targets] : forward_) {
        for (const auto& to : targets) result.emplace_back(from, to);
    }
    return result;
}

// Breadth-first over `adjacency` from every root; roots are excluded.
auto DependencyGraph::walk(const std::map<std::string, std::set<std::string>, std::less<>>& adjacency,
                           const std::set<std::string>& roots, std::size_t max_depth) const
    -> std::set<std::string> {
    auto visited = std::set<std::string>{roots};
    auto queue = std::deque<std::pair<std::string, std::size_t>>{};
    for (const auto& r : roots) queue.emplace_back(r, 0);

    auto reached = std::set<std::string>{};
    while (!queue.empty()) {
        auto [current, depth] = std::move(queue.front());
        queue.pop_front();
        if (depth >= max_depth) continue;

        auto it = adjacency.find(current);
        if (it == adjacency.end()) continue;
        for (const auto& next : it->second) {
            if (!visited.insert(next).second) continue;
            reached.insert(next);
            queue.emplace_back(next, depth + 1);
        }
    }
    return reached;
}

namespace {

auto strip_extension(std::string_view path) -> std::string_view {
    auto slash = path.rfind('/');
    auto dot = path.rfind('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) return path;
    return path.substr(0, dot);
}

auto parent_dir(std::string_view path) -> std::string_view {
    auto slash = path.rfind('/');
    return slash == std::string_view::npos ? std::string_view{} : path.substr(0, slash);
}

// Collapse "a/./b" and "a/x/../b".
auto normalize(std::string_view path) -> std::string {
    auto parts = std::vector<std::string_view>{};
    while (!path.empty()) {
        auto slash = path.find('/');
        auto part = path.substr(0, slash);
        if (part == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!part.empty() && part != ".") {
            parts.push_back(part);
        }
        if (slash == std::string_view::npos) break;
        path.remove_prefix(slash + 1);
    }
    auto out = std::string{};
    for (auto p : parts) {
        if (!out.empty()) out += '/';
        out += p;
    }
    return out;
}

}  // anonymous namespace

auto DependencyGraph::from_imports(const std::vector<FileSymbols>& files) -> DependencyGraph {
    auto graph = DependencyGraph{};

    // module stem -> path, e.g. "auth/session" -> "auth/session.py"
    auto by_stem = std::map<std::string, std::string, std::less<>>{};
    for (const auto& f : files) {
        graph.add_file(f.path);
        auto stem = std::string{strip_extension(f.path)};
        by_stem.emplace(stem, f.path);
        for (std::string_view package_init : {"/__init__", "/index", "/mod"}) {
            if (stem.ends_with(package_init)) {
                by_stem.emplace(stem.substr(0, stem.size() - package_init.size()), f.path);
            }
        }
    }

    for (const auto& f : files) {
        for (const auto& imp : f.imports) {
            auto key = std::string{};
            if (imp.target.starts_with(".")) {
                key = normalize(std::string{parent_dir(f.path)} + "/" + imp.target);
            } else {
                key = detail::module_to_path(imp.target);
            }
            key = std::string{strip_extension(key)};

            if (auto it = by_stem.find(key); it != by_stem.end()) {
                graph.add_edge(f.path, it->second);
            } else if (auto parent = parent_dir(key); !parent.empty()) {
                // `from pkg.mod import name` names a symbol, not a module
                if (auto pit = by_stem.find(parent); pit != by_stem.end()) graph.add_edge(f.path, pit->second);
            }
        }
    }
    return graph;
}

}  // namespace mergeguard
