/// @file json.hpp
/// @brief nlohmann/json interoperability for mergeguard.
///
/// Provides ADL serialization (to_json/from_json) for the input model
/// (proposals, diffs, symbols, decisions), the configuration, and the
/// analysis output, plus snapshot import/export of a whole AnalysisInput.

#pragma once

#include <mergeguard/config.hpp>
#include <mergeguard/conflict.hpp>
#include <mergeguard/decision.hpp>
#include <mergeguard/diagnostics.hpp>
#include <mergeguard/diff.hpp>
#include <mergeguard/engine.hpp>
#include <mergeguard/error.hpp>
#include <mergeguard/proposal.hpp>
#include <mergeguard/risk.hpp>
#include <mergeguard/symbol.hpp>
#include <mergeguard/types.hpp>
#include <mergeguard/view.hpp>

#include <nlohmann/json.hpp>

namespace mergeguard {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Value types --------------------------------------------------------------

void to_json(nlohmann::json& j, const LineRange& r);
void from_json(const nlohmann::json& j, LineRange& r);

void to_json(nlohmann::json& j, const ProposalPair& p);

// -- Diff model ---------------------------------------------------------------

/// Hunks are read either as {"before", "after"} ranges or from the four
/// unified-diff header numbers {"old_start", "old_count", "new_start", "new_count"}.
void to_json(nlohmann::json& j, const Hunk& h);
void from_json(const nlohmann::json& j, Hunk& h);

void to_json(nlohmann::json& j, const FileDiff& d);
void from_json(const nlohmann::json& j, FileDiff& d);

// -- Symbol model -------------------------------------------------------------

void to_json(nlohmann::json& j, const Parameter& p);
void from_json(const nlohmann::json& j, Parameter& p);

void to_json(nlohmann::json& j, const Signature& s);
void from_json(const nlohmann::json& j, Signature& s);

void to_json(nlohmann::json& j, const Symbol& s);
void from_json(const nlohmann::json& j, Symbol& s);

void to_json(nlohmann::json& j, const CallSite& c);
void from_json(const nlohmann::json& j, CallSite& c);

void to_json(nlohmann::json& j, const Import& i);
void from_json(const nlohmann::json& j, Import& i);

/// Symbols without a "file" inherit the FileSymbols path.
void to_json(nlohmann::json& j, const FileSymbols& f);
void from_json(const nlohmann::json& j, FileSymbols& f);

/// {"base": [FileSymbols...], "head": [FileSymbols...]}
void to_json(nlohmann::json& j, const ProposalSymbols& s);
void from_json(const nlohmann::json& j, ProposalSymbols& s);

// -- Proposals and decisions --------------------------------------------------

void to_json(nlohmann::json& j, const AttributionSignals& a);
void from_json(const nlohmann::json& j, AttributionSignals& a);

void to_json(nlohmann::json& j, const ChangeProposal& p);
void from_json(const nlohmann::json& j, ChangeProposal& p);

void to_json(nlohmann::json& j, const Decision& d);
void from_json(const nlohmann::json& j, Decision& d);

// -- Configuration ------------------------------------------------------------

/// Same keys load_config() reads.
void to_json(nlohmann::json& j, const GuardrailRule& r);
void to_json(nlohmann::json& j, const Config& c);

// -- Output -------------------------------------------------------------------

void to_json(nlohmann::json& j, const Error& e);
void to_json(nlohmann::json& j, const Conflict& c);
void from_json(const nlohmann::json& j, Conflict& c);
void to_json(nlohmann::json& j, const FactorScore& f);
void to_json(nlohmann::json& j, const RiskBreakdown& r);
void to_json(nlohmann::json& j, const Diagnostic& d);
void to_json(nlohmann::json& j, const ProposalReport& r);
void to_json(nlohmann::json& j, const AnalysisResult& r);

// =============================================================================
// Snapshots
// =============================================================================

/// Read an analysis input snapshot:
///
///     {"proposals": [...],
///      "symbols": {"<id>": {"base": [...], "head": [...]}},
///      "graph": {"edges": [["importer", "imported"], ...]}}
///
/// Without "graph", the dependency graph is built from the imports of
/// every FileSymbols in the snapshot.
/// @throws std::runtime_error (or a nlohmann::json exception) on malformed input.
auto load_input(const nlohmann::json& j) -> AnalysisInput;

/// Write a snapshot load_input() accepts. The graph is written as edges.
auto export_input(const AnalysisInput& input) -> nlohmann::json;

}  // namespace mergeguard
