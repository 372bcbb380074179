#include <mergeguard/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mergeguard {

namespace {

template <typename T>
void get_value(const nlohmann::json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) it->get_to(out);
}

template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) out = it->template get<T>();
}

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template <typename Parse>
auto parse_enum(const nlohmann::json& j, std::string_view what, Parse parse) {
    auto text = j.get<std::string>();
    auto value = parse(text);
    if (!value) throw std::runtime_error{"unknown " + std::string{what} + " '" + text + "'"};
    return *value;
}

template <typename Parse, typename E>
void get_enum(const nlohmann::json& j, const char* key, Parse parse, E& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) out = parse_enum(*it, key, parse);
}

}  // anonymous namespace

// -- Value types --------------------------------------------------------------

void to_json(nlohmann::json& j, const LineRange& r) {
    j = nlohmann::json{{"start", r.start}, {"end", r.end}};
}

void from_json(const nlohmann::json& j, LineRange& r) {
    j.at("start").get_to(r.start);
    j.at("end").get_to(r.end);
}

void to_json(nlohmann::json& j, const ProposalPair& p) {
    j = nlohmann::json::array({p.first, p.second});
}

// -- Diff model ---------------------------------------------------------------

void to_json(nlohmann::json& j, const Hunk& h) {
    j = nlohmann::json{
        {"before", h.before},
        {"after", h.after},
        {"added", h.added_lines},
        {"removed", h.removed_lines},
    };
}

void from_json(const nlohmann::json& j, Hunk& h) {
    if (j.contains("old_start")) {
        h = Hunk::from_header(j.at("old_start").get<std::uint32_t>(), j.value("old_count", 1u),
                              j.at("new_start").get<std::uint32_t>(), j.value("new_count", 1u));
    } else {
        j.at("before").get_to(h.before);
        j.at("after").get_to(h.after);
    }
    get_value(j, "added", h.added_lines);
    get_value(j, "removed", h.removed_lines);
}

void to_json(nlohmann::json& j, const FileDiff& d) {
    j = nlohmann::json{
        {"path", d.path},
        {"change", to_string_view(d.change)},
        {"hunks", d.hunks},
    };
    put_optional(j, "previous_path", d.previous_path);
}

void from_json(const nlohmann::json& j, FileDiff& d) {
    j.at("path").get_to(d.path);
    get_optional(j, "previous_path", d.previous_path);
    get_enum(j, "change", parse_file_change, d.change);
    get_value(j, "hunks", d.hunks);
}

// -- Symbol model -------------------------------------------------------------

void to_json(nlohmann::json& j, const Parameter& p) {
    j = nlohmann::json{{"name", p.name}, {"has_default", p.has_default}};
    put_optional(j, "type", p.type);
}

void from_json(const nlohmann::json& j, Parameter& p) {
    j.at("name").get_to(p.name);
    get_optional(j, "type", p.type);
    get_value(j, "has_default", p.has_default);
}

void to_json(nlohmann::json& j, const Signature& s) {
    j = nlohmann::json{{"parameters", s.parameters}};
    put_optional(j, "returns", s.returns);
}

void from_json(const nlohmann::json& j, Signature& s) {
    get_value(j, "parameters", s.parameters);
    get_optional(j, "returns", s.returns);
}

void to_json(nlohmann::json& j, const Symbol& s) {
    j = nlohmann::json{
        {"name", s.name},
        {"kind", to_string_view(s.kind)},
        {"file", s.file},
        {"lines", s.lines},
        {"signature", s.signature},
        {"module", s.module},
        {"nesting_depth", s.nesting_depth},
        {"complexity", s.complexity},
    };
    put_optional(j, "parent", s.parent);
    if (!s.source.empty()) j["source"] = s.source;
}

void from_json(const nlohmann::json& j, Symbol& s) {
    j.at("name").get_to(s.name);
    get_enum(j, "kind", parse_symbol_kind, s.kind);
    get_value(j, "file", s.file);
    j.at("lines").get_to(s.lines);
    get_value(j, "signature", s.signature);
    get_value(j, "module", s.module);
    get_optional(j, "parent", s.parent);
    get_value(j, "nesting_depth", s.nesting_depth);
    get_value(j, "complexity", s.complexity);
    get_value(j, "source", s.source);
}

void to_json(nlohmann::json& j, const CallSite& c) {
    j = nlohmann::json{{"callee", c.callee}, {"line", c.line}};
}

void from_json(const nlohmann::json& j, CallSite& c) {
    j.at("callee").get_to(c.callee);
    j.at("line").get_to(c.line);
}

void to_json(nlohmann::json& j, const Import& i) {
    j = nlohmann::json{{"target", i.target}, {"line", i.line}};
}

void from_json(const nlohmann::json& j, Import& i) {
    j.at("target").get_to(i.target);
    get_value(j, "line", i.line);
}

void to_json(nlohmann::json& j, const FileSymbols& f) {
    j = nlohmann::json{
        {"path", f.path},
        {"status", to_string_view(f.status)},
        {"symbols", f.symbols},
        {"imports", f.imports},
        {"calls", f.calls},
    };
}

void from_json(const nlohmann::json& j, FileSymbols& f) {
    j.at("path").get_to(f.path);
    get_enum(j, "status", parse_extraction_status, f.status);
    get_value(j, "symbols", f.symbols);
    get_value(j, "imports", f.imports);
    get_value(j, "calls", f.calls);
    for (auto& s : f.symbols) {
        if (s.file.empty()) s.file = f.path;
    }
}

void to_json(nlohmann::json& j, const ProposalSymbols& s) {
    auto base = nlohmann::json::array();
    auto head = nlohmann::json::array();
    for (const auto& [_, f] : s.base) base.push_back(f);
    for (const auto& [_, f] : s.head) head.push_back(f);
    j = nlohmann::json{{"base", std::move(base)}, {"head", std::move(head)}};
}

void from_json(const nlohmann::json& j, ProposalSymbols& s) {
    for (const char* side : {"base", "head"}) {
        auto it = j.find(side);
        if (it == j.end() || it->is_null()) continue;
        auto& target = std::string_view{side} == "base" ? s.base : s.head;
        for (const auto& f : *it) {
            auto file = f.get<FileSymbols>();
            auto path = file.path;
            target.insert_or_assign(std::move(path), std::move(file));
        }
    }
}

// -- Proposals and decisions --------------------------------------------------

void to_json(nlohmann::json& j, const AttributionSignals& a) {
    j = nlohmann::json{{"authorship", to_string_view(a.authorship)}, {"markers", a.markers}};
    put_optional(j, "confidence", a.confidence);
}

void from_json(const nlohmann::json& j, AttributionSignals& a) {
    get_enum(j, "authorship", parse_authorship, a.authorship);
    get_optional(j, "confidence", a.confidence);
    get_value(j, "markers", a.markers);
}

void to_json(nlohmann::json& j, const ChangeProposal& p) {
    j = nlohmann::json{
        {"id", p.id},
        {"title", p.title},
        {"source_branch", p.source_branch},
        {"target_branch", p.target_branch},
        {"head_sha", p.head_sha},
        {"base_sha", p.base_sha},
        {"author", p.author},
        {"labels", p.labels},
        {"attribution", p.attribution},
        {"files", p.files},
    };
}

void from_json(const nlohmann::json& j, ChangeProposal& p) {
    j.at("id").get_to(p.id);
    get_value(j, "title", p.title);
    get_value(j, "source_branch", p.source_branch);
    get_value(j, "target_branch", p.target_branch);
    get_value(j, "head_sha", p.head_sha);
    get_value(j, "base_sha", p.base_sha);
    get_value(j, "author", p.author);
    get_value(j, "labels", p.labels);
    get_value(j, "attribution", p.attribution);
    get_value(j, "files", p.files);
}

void to_json(nlohmann::json& j, const Decision& d) {
    j = nlohmann::json{
        {"kind", to_string_view(d.kind)},
        {"entity", d.entity},
        {"description", d.description},
        {"origin", d.origin},
        {"author", d.author},
        {"timestamp", d.timestamp},
    };
    put_optional(j, "module", d.module);
    put_optional(j, "file", d.file);
    put_optional(j, "old_pattern", d.old_pattern);
    put_optional(j, "new_pattern", d.new_pattern);
}

void from_json(const nlohmann::json& j, Decision& d) {
    d.kind = parse_enum(j.at("kind"), "decision kind", parse_decision_kind);
    get_value(j, "entity", d.entity);
    get_optional(j, "module", d.module);
    get_optional(j, "file", d.file);
    get_optional(j, "old_pattern", d.old_pattern);
    get_optional(j, "new_pattern", d.new_pattern);
    get_value(j, "description", d.description);
    j.at("origin").get_to(d.origin);
    get_value(j, "author", d.author);
    j.at("timestamp").get_to(d.timestamp);
}

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, const GuardrailRule& r) {
    j = nlohmann::json{
        {"name", r.name},
        {"when", to_string_view(r.when)},
        {"severity", to_string_view(r.severity)},
    };
    put_optional(j, "pattern", r.pattern);
    if (!r.forbidden_imports.empty()) j["cannot_import_from"] = r.forbidden_imports;
    if (!r.forbidden_content.empty()) j["must_not_contain"] = r.forbidden_content;
    put_optional(j, "max_files_changed", r.max_files_changed);
    put_optional(j, "max_lines_changed", r.max_lines_changed);
    put_optional(j, "max_function_lines", r.max_function_lines);
    put_optional(j, "max_cyclomatic_complexity", r.max_cyclomatic_complexity);
    if (!r.message.empty()) j["message"] = r.message;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"risk_threshold", c.risk_threshold},
        {"check_regressions", c.check_regressions},
        {"max_open_prs", c.max_open_prs},
        {"decisions_log_depth", c.decisions_log_depth},
        {"weights", {
            {"conflict_severity", c.weights.conflict_severity},
            {"blast_radius", c.weights.blast_radius},
            {"pattern_deviation", c.weights.pattern_deviation},
            {"churn", c.weights.churn},
            {"attribution", c.weights.attribution},
        }},
        {"rules", c.rules},
        {"ignored_paths", c.ignored_paths},
        {"blast_radius_depth", c.blast_radius_depth},
        {"blast_radius_saturation", c.blast_radius_saturation},
        {"duplication_threshold", c.duplication_threshold},
        {"regression_recency_window_hours",
         std::chrono::duration_cast<std::chrono::hours>(c.regression_recency_window).count()},
        {"worker_count", c.worker_count},
    };
}

// -- Output -------------------------------------------------------------------

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"kind", to_string_view(e.kind)}, {"message", e.message}};
}

void to_json(nlohmann::json& j, const Conflict& c) {
    j = nlohmann::json{
        {"kind", to_string_view(c.kind)},
        {"severity", to_string_view(c.severity)},
        {"source", c.source},
        {"target", c.target},
        {"file", c.file},
        {"description", c.description},
        {"recommendation", c.recommendation},
        {"coarse", c.coarse},
    };
    put_optional(j, "symbol", c.symbol);
    put_optional(j, "source_lines", c.source_lines);
    put_optional(j, "target_lines", c.target_lines);
    put_optional(j, "note", c.note);
}

void from_json(const nlohmann::json& j, Conflict& c) {
    c.kind = parse_enum(j.at("kind"), "conflict kind", parse_conflict_kind);
    c.severity = parse_enum(j.at("severity"), "severity", parse_severity);
    j.at("source").get_to(c.source);
    j.at("target").get_to(c.target);
    get_value(j, "file", c.file);
    get_optional(j, "symbol", c.symbol);
    get_value(j, "description", c.description);
    get_value(j, "recommendation", c.recommendation);
    get_optional(j, "source_lines", c.source_lines);
    get_optional(j, "target_lines", c.target_lines);
    get_value(j, "coarse", c.coarse);
    get_optional(j, "note", c.note);
}

void to_json(nlohmann::json& j, const FactorScore& f) {
    j = nlohmann::json{
        {"raw", f.raw},
        {"weight", f.weight},
        {"weighted", f.weighted},
        {"available", f.available},
    };
}

void to_json(nlohmann::json& j, const RiskBreakdown& r) {
    auto factors = nlohmann::json::object();
    for (auto f : all_risk_factors) factors[std::string{to_string_view(f)}] = r.factor(f);
    j = nlohmann::json{{"composite", r.composite}, {"factors", std::move(factors)}};
}

void to_json(nlohmann::json& j, const Diagnostic& d) {
    j = nlohmann::json{{"level", to_string_view(d.level)}, {"code", d.code}, {"message", d.message}};
}

void to_json(nlohmann::json& j, const ProposalReport& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"status", to_string_view(r.status)},
        {"risk", r.risk},
        {"exceeds_threshold", r.exceeds_threshold},
        {"conflicts", r.conflicts},
        {"clean_pairs", r.clean_pairs},
        {"partial", r.partial},
        {"duration_ms", r.duration.count()},
    };
    if (r.error) j["error"] = *r.error;
}

void to_json(nlohmann::json& j, const AnalysisResult& r) {
    j = nlohmann::json{
        {"reports", r.reports},
        {"diagnostics", r.diagnostics.items()},
        {"compared_pairs", r.compared_pairs},
        {"filtered_pairs", r.filtered_pairs},
        {"skipped_pairs", r.skipped_pairs},
        {"deadline_hit", r.deadline_hit},
        {"duration_ms", r.duration.count()},
    };
}

// =============================================================================
// Snapshots
// =============================================================================

auto load_input(const nlohmann::json& j) -> AnalysisInput {
    if (!j.is_object()) throw std::runtime_error{"analysis input must be a JSON object"};

    auto input = AnalysisInput{};
    get_value(j, "proposals", input.proposals);

    if (auto it = j.find("symbols"); it != j.end() && !it->is_null()) {
        for (const auto& [key, value] : it->items()) {
            auto id = ProposalId{};
            try {
                id = std::stoull(key);
            } catch (const std::exception&) {
                throw std::runtime_error{"symbols key '" + key + "' is not a proposal id"};
            }
            input.symbols[id] = value.get<ProposalSymbols>();
        }
    }

    if (auto it = j.find("graph"); it != j.end() && !it->is_null()) {
        for (const auto& f : it->value("files", nlohmann::json::array())) {
            input.graph.add_file(f.get<std::string>());
        }
        for (const auto& edge : it->value("edges", nlohmann::json::array())) {
            if (!edge.is_array() || edge.size() != 2) {
                throw std::runtime_error{"graph edges must be [importer, imported] pairs"};
            }
            input.graph.add_edge(edge[0].get<std::string>(), edge[1].get<std::string>());
        }
    } else {
        auto files = std::map<std::string, FileSymbols>{};
        for (const auto& [_, sym] : input.symbols) {
            for (const auto& [path, f] : sym.base) files.insert_or_assign(path, f);
            for (const auto& [path, f] : sym.head) files.emplace(path, f);
        }
        auto list = std::vector<FileSymbols>{};
        for (auto& [_, f] : files) {
            if (f.usable()) list.push_back(std::move(f));
        }
        input.graph = DependencyGraph::from_imports(list);
    }
    return input;
}

auto export_input(const AnalysisInput& input) -> nlohmann::json {
    auto symbols = nlohmann::json::object();
    for (const auto& [id, s] : input.symbols) symbols[std::to_string(id)] = s;

    auto edges = nlohmann::json::array();
    for (const auto& [from, to] : input.graph.edges()) edges.push_back(nlohmann::json::array({from, to}));

    return nlohmann::json{
        {"proposals", input.proposals},
        {"symbols", std::move(symbols)},
        {"graph", {{"files", input.graph.files()}, {"edges", std::move(edges)}}},
    };
}

}  // namespace mergeguard
