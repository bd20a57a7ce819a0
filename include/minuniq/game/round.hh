#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace minuniq::game {

using Value = uint32_t;

// Value of a competitor that has no usable value (errored)
constexpr Value SENTINEL = std::numeric_limits<Value>::max();

struct RoundOutcome {
    // Indices of the competitors that submitted a unique value, by increasing value
    std::vector<size_t> survivors;

    // The first survivor, if any
    [[nodiscard]] std::optional<size_t> winner() const noexcept;
};

// Values submitted more than once are eliminated; the smallest of the remaining ones wins.
// values[i] is the value of the i-th competitor.
[[nodiscard]] RoundOutcome compute_round_outcome(const std::vector<Value>& values);

// Parses a non-negative decimal number with no sign, whitespace or trailing characters
[[nodiscard]] std::optional<Value> parse_value(std::string_view str) noexcept;

// "v0 v1 ... vn-1" (no trailing newline)
[[nodiscard]] std::string format_values(const std::vector<Value>& values);

// Inverse of format_values()
[[nodiscard]] std::optional<std::vector<Value>> parse_values(std::string_view line);

} // namespace minuniq::game
