/// @file dependency_graph.hpp
/// @brief File-level import graph used for interface checks and blast radius.

#pragma once

#include <mergeguard/symbol.hpp>

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mergeguard {

/// A directed graph of file-level imports.
///
/// An edge `a -> b` means file `a` imports file `b`; `b`'s dependents
/// are the files reachable over reverse edges.
class DependencyGraph {
public:
    DependencyGraph() = default;

    /// Record that `importer` imports `imported`. Self-edges are ignored.
    void add_edge(const std::string& importer, const std::string& imported);

    /// Mark a file as known even if it has no edges.
    void add_file(const std::string& path);

    /// True if the file was seen while building the graph.
    auto contains(std::string_view path) const -> bool;

    /// Files that import `path` directly.
    auto direct_dependents(std::string_view path) const -> std::set<std::string>;

    /// Files that transitively import `path`, up to `max_depth` hops.
    /// The file itself is not included.
    auto dependents(std::string_view path, std::size_t max_depth) const -> std::set<std::string>;

    /// Files `path` transitively imports, up to `max_depth` hops.
    auto dependencies(std::string_view path, std::size_t max_depth) const -> std::set<std::string>;

    /// Distinct files reachable over reverse edges from any of `roots`,
    /// excluding the roots themselves (the blast radius).
    auto reverse_reach(const std::set<std::string>& roots, std::size_t max_depth) const
        -> std::set<std::string>;

    /// Number of known files.
    auto file_count() const -> std::size_t { return files_.size(); }

    /// Number of distinct edges.
    auto edge_count() const -> std::size_t;

    /// Every known file, sorted.
    auto files() const -> std::vector<std::string>;

    /// Every edge as (importer, imported), sorted.
    auto edges() const -> std::vector<std::pair<std::string, std::string>>;

    /// Build a graph from extracted imports.
    ///
    /// Import targets are resolved against the known file paths: dotted
    /// modules map to slash paths (`auth.session` -> `auth/session.*` or
    /// `auth/session/__init__.*`), relative targets (`./util`) resolve
    /// against the importing file's directory. Unresolvable imports
    /// (third-party packages) are dropped.
    static auto from_imports(const std::vector<FileSymbols>& files) -> DependencyGraph;

private:
    auto walk(const std::map<std::string, std::set<std::string>, std::less<>>& adjacency,
              const std::set<std::string>& roots, std::size_t max_depth) const
        -> std::set<std::string>;

    std::set<std::string, std::less<>> files_;
    std::map<std::string, std::set<std::string>, std::less<>> forward_;
    std::map<std::string, std::set<std::string>, std::less<>> reverse_;
};

}  // namespace mergeguard
