#include "minuniq/game/round.hh"

#include <algorithm>
#include <charconv>
#include <string>
#include <unordered_map>

namespace minuniq::game {

std::optional<size_t> RoundOutcome::winner() const noexcept {
    if (survivors.empty()) {
        return std::nullopt;
    }
    return survivors.front();
}

RoundOutcome compute_round_outcome(const std::vector<Value>& values) {
    std::unordered_map<Value, size_t> occurrences;
    for (auto val : values) {
        ++occurrences[val];
    }
    RoundOutcome res;
    for (size_t i = 0; i < values.size(); ++i) {
        if (occurrences[values[i]] == 1) {
            res.survivors.emplace_back(i);
        }
    }
    // Survivors have pairwise distinct values, so no tie-break is needed
    std::sort(res.survivors.begin(), res.survivors.end(), [&](size_t a, size_t b) {
        return values[a] < values[b];
    });
    return res;
}

std::optional<Value> parse_value(std::string_view str) noexcept {
    Value val{};
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), val);
    if (str.empty() or ec != std::errc{} or ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return val;
}

std::string format_values(const std::vector<Value>& values) {
    std::string res;
    for (auto val : values) {
        if (not res.empty()) {
            res += ' ';
        }
        res += std::to_string(val);
    }
    return res;
}

std::optional<std::vector<Value>> parse_values(std::string_view line) {
    std::vector<Value> res;
    if (line.empty()) {
        return res;
    }
    for (;;) {
        auto space = line.find(' ');
        auto val = parse_value(line.substr(0, space));
        if (not val) {
            return std::nullopt;
        }
        res.emplace_back(*val);
        if (space == std::string_view::npos) {
            return res;
        }
        line.remove_prefix(space + 1);
    }
}

} // namespace minuniq::game
