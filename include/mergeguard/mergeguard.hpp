/// @file mergeguard.hpp
/// @brief Umbrella header for the mergeguard library.
///
/// Include this single header for access to all public types: the diff
/// and symbol models, ChangeProposal, Conflict, Decision, Config, the
/// analysis steps, Engine, the collaborator contracts and JSON codecs.

#pragma once

#include <mergeguard/classifier.hpp>
#include <mergeguard/collaborators.hpp>
#include <mergeguard/config.hpp>
#include <mergeguard/conflict.hpp>
#include <mergeguard/decision.hpp>
#include <mergeguard/dependency_graph.hpp>
#include <mergeguard/diagnostics.hpp>
#include <mergeguard/diff.hpp>
#include <mergeguard/engine.hpp>
#include <mergeguard/error.hpp>
#include <mergeguard/guardrails.hpp>
#include <mergeguard/json.hpp>
#include <mergeguard/overlap.hpp>
#include <mergeguard/proposal.hpp>
#include <mergeguard/regression.hpp>
#include <mergeguard/risk.hpp>
#include <mergeguard/symbol.hpp>
#include <mergeguard/types.hpp>
#include <mergeguard/view.hpp>
