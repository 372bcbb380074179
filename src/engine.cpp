#include <mergeguard/engine.hpp>

#include <mergeguard/guardrails.hpp>
#include <mergeguard/overlap.hpp>
#include <mergeguard/regression.hpp>

#include "executor.hpp"
#include "glob.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <utility>

namespace mergeguard {

auto AnalysisResult::report_for(ProposalId id) const -> const ProposalReport* {
    auto it = std::ranges::find_if(reports, [id](const ProposalReport& r) { return r.id == id; });
    return it == reports.end() ? nullptr : &*it;
}

auto drop_ignored_files(ChangeProposal& proposal, const std::vector<std::string>& ignored) -> std::size_t {
    auto removed = std::erase_if(proposal.files, [&](const FileDiff& f) {
        return std::ranges::any_of(ignored, [&](const std::string& glob) {
            return detail::glob_match(glob, f.path);
        });
    });
    return static_cast<std::size_t>(removed);
}

Engine::Engine(Config config)
    : config_{std::move(config)} {
    validate(config_);
}

namespace {

struct PairSlot {
    std::size_t first{0};
    std::size_t second{0};
    bool done{false};
    ClassificationResult result;
    std::optional<std::string> failure;
};

struct ProposalSlot {
    bool guardrails_done{false};
    bool regressions_done{false};
    std::vector<Conflict> guardrails;
    std::vector<Conflict> regressions;
    std::optional<std::string> guardrail_failure;
    std::optional<std::string> regression_failure;
};

auto disjoint(const std::set<std::string>& a, const std::set<std::string>& b) -> bool {
    const auto& small = a.size() <= b.size() ? a : b;
    const auto& large = a.size() <= b.size() ? b : a;
    return std::ranges::none_of(small, [&](const std::string& p) { return large.contains(p); });
}

auto status_of(const ProposalReport& report) -> ReportStatus {
    if (report.error) return ReportStatus::error;
    if (report.conflicts.empty()) return ReportStatus::pass;
    auto critical = std::ranges::any_of(report.conflicts, [](const Conflict& c) {
        return c.severity == Severity::critical;
    });
    return critical ? ReportStatus::fail : ReportStatus::warn;
}

auto wall_clock_ms() -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // anonymous namespace

auto Engine::analyze(const AnalysisInput& input, const AnalysisOptions& options) const -> AnalysisResult {
    const auto started = std::chrono::steady_clock::now();
    auto result = AnalysisResult{};
    auto& diag = result.diagnostics;

    // Working copies: truncated to the configured maximum, ignored files dropped.
    auto proposals = input.proposals;
    if (proposals.size() > config_.max_open_prs) {
        diag.info("truncated", "analysing the first " + std::to_string(config_.max_open_prs) + " of "
                               + std::to_string(proposals.size()) + " open proposals");
        proposals.resize(config_.max_open_prs);
    }
    for (auto& p : proposals) {
        if (auto n = drop_ignored_files(p, config_.ignored_paths); n > 0) {
            diag.info("ignored_files", "#" + std::to_string(p.id) + ": ignored " + std::to_string(n) + " file(s)");
        }
    }

    const auto empty_symbols = ProposalSymbols{};
    auto views = std::vector<std::unique_ptr<ProposalView>>(proposals.size());
    result.reports.resize(proposals.size());
    for (std::size_t i = 0; i < proposals.size(); ++i) {
        auto& report = result.reports[i];
        report.id = proposals[i].id;
        auto sym = input.symbols.find(proposals[i].id);
        const auto& symbols = sym == input.symbols.end() ? empty_symbols : sym->second;
        try {
            views[i] = std::make_unique<ProposalView>(proposals[i], symbols);
        } catch (const InputError& e) {
            report.error = Error{e.kind(), e.what()};
            diag.error(std::string{to_string_view(e.kind())}, "#" + std::to_string(report.id) + ": " + e.what());
            continue;
        } catch (const std::exception& e) {
            report.error = Error{ErrorKind::invalid_proposal, e.what()};
            diag.error("invalid_proposal", "#" + std::to_string(report.id) + ": " + e.what());
            continue;
        }
        for (const auto& path : views[i]->coarse_files()) {
            diag.warning("coarse_fallback", "#" + std::to_string(report.id) + ": no usable symbols for "
                                            + path + "; file-level analysis only");
        }
    }

    auto decisions = std::vector<Decision>{};
    if (config_.check_regressions && options.decisions) {
        try {
            decisions = options.decisions->recent(config_.decisions_log_depth);
        } catch (const std::exception& e) {
            diag.warning("decisions_unavailable", std::string{"decisions log unavailable: "} + e.what());
        }
    }
    const auto now = options.now.value_or(wall_clock_ms());

    auto classifier_options = ClassifierOptions{
        .duplication_threshold = config_.duplication_threshold,
        .similarity = options.similarity,
        .adjudicator = options.adjudicator,
    };

    // Pre-filter: only pairs that share a touched file are compared.
    auto pairs = std::vector<PairSlot>{};
    for (std::size_t i = 0; i < views.size(); ++i) {
        if (!views[i]) continue;
        for (std::size_t j = i + 1; j < views.size(); ++j) {
            if (!views[j]) continue;
            if (disjoint(views[i]->touched_paths(), views[j]->touched_paths())) {
                ++result.filtered_pairs;
                continue;
            }
            pairs.push_back(PairSlot{.first = i, .second = j});
        }
    }
    auto per_proposal = std::vector<ProposalSlot>(views.size());

    auto executor = tf::Executor{detail::resolve_worker_count(config_.worker_count)};
    auto taskflow = tf::Taskflow{"analysis"};

    for (auto& slot : pairs) {
        taskflow.emplace([&, s = &slot] {
            try {
                const auto& a = *views[s->first];
                const auto& b = *views[s->second];
                s->result = classify(a, b, compute_overlaps(a, b), input.graph, classifier_options);
            } catch (const std::exception& e) {
                s->failure = e.what();
            } catch (...) {
                s->failure = "non-standard exception";
            }
            s->done = true;
        });
    }
    for (std::size_t i = 0; i < views.size(); ++i) {
        if (!views[i]) continue;
        auto* slot = &per_proposal[i];
        const auto* view = views[i].get();
        taskflow.emplace([&, slot, view] {
            try {
                slot->guardrails = evaluate_guardrails(*view, config_.rules);
            } catch (const std::exception& e) {
                slot->guardrail_failure = e.what();
            } catch (...) {
                slot->guardrail_failure = "non-standard exception";
            }
            slot->guardrails_done = true;
        });
        if (decisions.empty()) {
            slot->regressions_done = true;
            continue;
        }
        taskflow.emplace([&, slot, view] {
            try {
                slot->regressions = detect_regressions(*view, decisions, config_.regression_recency_window, now);
            } catch (const std::exception& e) {
                slot->regression_failure = e.what();
            } catch (...) {
                slot->regression_failure = "non-standard exception";
            }
            slot->regressions_done = true;
        });
    }

    auto run = executor.run(taskflow);
    if (options.deadline && run.wait_until(*options.deadline) == std::future_status::timeout) {
        run.cancel();
        result.deadline_hit = true;
    }
    run.wait();

    if (result.deadline_hit) {
        diag.warning("deadline", "deadline reached; reporting completed comparisons only");
    }

    // Merge slots into reports.
    auto compared_with = std::vector<std::set<std::size_t>>(views.size());
    for (auto& slot : pairs) {
        auto& ra = result.reports[slot.first];
        auto& rb = result.reports[slot.second];
        const auto pair = ProposalPair{ra.id, rb.id};
        if (!slot.done) {
            result.skipped_pairs.push_back(pair);
            ra.partial = true;
            rb.partial = true;
            continue;
        }
        if (slot.failure) {
            diag.error("pair_failed", "#" + std::to_string(pair.first) + " vs #" + std::to_string(pair.second)
                                      + ": " + *slot.failure);
            ra.partial = true;
            rb.partial = true;
            continue;
        }
        ++result.compared_pairs;
        for (const auto& note : slot.result.notes) diag.warning("degraded", note);
        if (slot.result.conflicts.empty()) {
            compared_with[slot.first].insert(slot.second);
            compared_with[slot.second].insert(slot.first);
        }
        for (const auto& c : slot.result.conflicts) {
            ra.conflicts.push_back(c);
            rb.conflicts.push_back(c);
        }
    }

    for (std::size_t i = 0; i < views.size(); ++i) {
        auto& report = result.reports[i];
        if (!views[i]) continue;
        const auto& slot = per_proposal[i];
        if (!slot.guardrails_done || !slot.regressions_done) report.partial = true;

        auto failure = slot.guardrail_failure ? slot.guardrail_failure : slot.regression_failure;
        if (failure) {
            report.error = Error{ErrorKind::analysis_failed, *failure};
            report.conflicts.clear();
            diag.error("proposal_failed", "#" + std::to_string(report.id) + ": " + *failure);
            continue;
        }
        report.conflicts.insert(report.conflicts.end(), slot.guardrails.begin(), slot.guardrails.end());
        report.conflicts.insert(report.conflicts.end(), slot.regressions.begin(), slot.regressions.end());
        sort_conflicts(report.conflicts);

        // Conflict-free partners: pre-filtered pairs plus compared pairs with no conflict.
        for (std::size_t j = 0; j < views.size(); ++j) {
            if (j == i || !views[j]) continue;
            const bool filtered = disjoint(views[i]->touched_paths(), views[j]->touched_paths());
            if (filtered || compared_with[i].contains(j)) report.clean_pairs.push_back(proposals[j].id);
        }

        auto notes = std::vector<std::string>{};
        report.risk = score_risk(*views[i], report.conflicts, input.graph, config_, options.signals, &notes);
        for (auto& note : notes) diag.info("signal_unavailable", std::move(note));
        report.exceeds_threshold = report.risk.composite >= config_.risk_threshold;
    }

    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    for (auto& report : result.reports) {
        report.status = status_of(report);
        report.duration = result.duration;
    }
    return result;
}

}  // namespace mergeguard
