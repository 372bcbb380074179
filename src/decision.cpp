#include <mergeguard/decision.hpp>
#include <mergeguard/error.hpp>
#include <mergeguard/json.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <istream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace mergeguard {

auto parse_decision_kind(std::string_view text) -> std::optional<DecisionKind> {
    if (text == "removal")   return DecisionKind::removal;
    if (text == "migration") return DecisionKind::migration;
    if (text == "addition")  return DecisionKind::addition;
    return std::nullopt;
}

void validate(const Decision& decision) {
    const auto origin = "decision from #" + std::to_string(decision.origin);
    if (decision.entity.empty()) {
        throw InputError{ErrorKind::invalid_decision, origin + " names no entity"};
    }
    if (decision.kind == DecisionKind::migration && (!decision.old_pattern || decision.old_pattern->empty())) {
        throw InputError{ErrorKind::invalid_decision,
                         origin + " migrates '" + decision.entity + "' but has no old pattern"};
    }
}

DecisionLog::DecisionLog(const DecisionLog& other) {
    auto lock = std::shared_lock{other.mutex_};
    entries_ = other.entries_;
}

auto DecisionLog::operator=(const DecisionLog& other) -> DecisionLog& {
    if (this != &other) {
        auto copy = other.entries();
        auto lock = std::unique_lock{mutex_};
        entries_ = std::move(copy);
    }
    return *this;
}

void DecisionLog::append(Decision decision) {
    auto lock = std::unique_lock{mutex_};
    entries_.push_back(std::move(decision));
}

auto DecisionLog::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return entries_.size();
}

auto DecisionLog::recent(std::size_t limit) const -> std::vector<Decision> {
    auto result = std::vector<Decision>{};
    {
        auto lock = std::shared_lock{mutex_};
        result.assign(entries_.rbegin(), entries_.rend());
    }
    std::ranges::stable_sort(result, [](const Decision& a, const Decision& b) {
        return a.timestamp > b.timestamp;
    });
    if (result.size() > limit) result.resize(limit);
    return result;
}

auto DecisionLog::entries() const -> std::vector<Decision> {
    auto lock = std::shared_lock{mutex_};
    return entries_;
}

auto load_decisions(std::istream& in) -> DecisionLog {
    auto log = DecisionLog{};
    auto line = std::string{};
    auto line_no = std::size_t{0};
    while (std::getline(in, line)) {
        ++line_no;
        if (std::ranges::all_of(line, [](unsigned char c) { return std::isspace(c) != 0; })) {
            continue;
        }
        try {
            auto decision = nlohmann::json::parse(line).get<Decision>();
            validate(decision);
            log.append(std::move(decision));
        } catch (const std::exception& e) {
            throw std::runtime_error{
                "decisions log line " + std::to_string(line_no) + ": " + e.what()};
        }
    }
    return log;
}

void save_decisions(const DecisionLog& log, std::ostream& out) {
    for (const auto& d : log.entries()) {
        out << nlohmann::json(d).dump() << '\n';
    }
}

}  // namespace mergeguard
