#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace mockmcp {

/// Lenient conversions of dynamic JSON arguments. Tools never reject their
/// input; missing or malformed members fall back to defaults instead.
namespace coerce {

/// null, false, numeric zero, "", [] and {} are falsy.
[[nodiscard]] bool is_truthy(const nlohmann::json& v);

/// Member `key` of `obj` when `obj` is an object containing it, null otherwise.
[[nodiscard]] nlohmann::json member(const nlohmann::json& obj, std::string_view key);

/// `v` if truthy, `fallback` otherwise.
[[nodiscard]] nlohmann::json or_default(const nlohmann::json& v, nlohmann::json fallback);

/// Strings verbatim. Otherwise: None, True/False, integers, floats as
/// format_double(), and containers as [a, b] / {'k': v} with nested strings
/// quoted.
[[nodiscard]] std::string to_display_string(const nlohmann::json& v);

/// Numbers, booleans and decimal strings ("2.5", " -3 ", "inf").
[[nodiscard]] std::optional<double> to_number(const nlohmann::json& v);

/// Integers, finite numbers (truncated), booleans and digit strings ("42", "-7").
/// nullopt when `v` is not integral; throws std::out_of_range when it is but
/// does not fit in int64_t.
[[nodiscard]] std::optional<int64_t> to_integer(const nlohmann::json& v);

/// Shortest round-trip decimal text of `value`: fixed notation with a
/// fractional part for decimal exponents in [-4, 16), scientific otherwise.
[[nodiscard]] std::string format_double(double value);

/// Drop trailing '0' characters, then trailing '.' characters.
[[nodiscard]] std::string strip_trailing_zeros(std::string text);

} // namespace coerce
} // namespace mockmcp
