/// @file classifier.hpp
/// @brief Conflict classifier: turns pairwise overlaps into typed conflicts.

#pragma once

#include <mergeguard/conflict.hpp>
#include <mergeguard/dependency_graph.hpp>
#include <mergeguard/overlap.hpp>
#include <mergeguard/symbol.hpp>
#include <mergeguard/view.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mergeguard {

/// Similarity of two added symbols in [0,1]. If it throws a std::exception
/// the classifier falls back to token_jaccard(); anything else propagates.
using SimilarityMeasure = std::function<double(const Symbol&, const Symbol&)>;

/// A symbol whose body both proposals modify at different lines.
struct BehavioralCase {
    ProposalId first{0};
    ProposalId second{0};
    std::string file;
    ChangedSymbol first_change;
    ChangedSymbol second_change;
};

/// Advisory severity for a behavioral case. nullopt keeps the default, as
/// does a std::exception; anything else propagates.
using SemanticAdjudicator = std::function<std::optional<Severity>(const BehavioralCase&)>;

/// Pluggable strategies and thresholds for classify().
struct ClassifierOptions {
    double duplication_threshold{0.7};
    SimilarityMeasure similarity;   ///< Empty: token_jaccard().
    SemanticAdjudicator adjudicator;  ///< Empty: behavioral conflicts stay at warning.
};

/// Conflicts found for one pair plus degraded-coverage remarks.
struct ClassificationResult {
    std::vector<Conflict> conflicts;
    std::vector<std::string> notes;
};

/// Classify the overlaps of two proposals.
///
/// Each symbol is classified at most once, in priority order
/// hard > interface > behavioral; duplication compares added symbols
/// and file-level hard conflicts cover spans no symbol encloses.
/// Conflicts use pair order: `source` is the lower proposal id.
/// @param overlaps Result of compute_overlaps(a, b).
auto classify(const ProposalView& a,
              const ProposalView& b,
              const std::vector<Overlap>& overlaps,
              const DependencyGraph& graph,
              const ClassifierOptions& options = {}) -> ClassificationResult;

/// Lower-cased identifier tokens of a symbol's name, signature and source.
/// `parseInvoice_total` yields {"parse", "invoice", "total"}.
auto normalized_tokens(const Symbol& symbol) -> std::vector<std::string>;

/// Jaccard index of the two symbols' normalized token sets.
auto token_jaccard(const Symbol& a, const Symbol& b) -> double;

}  // namespace mergeguard
