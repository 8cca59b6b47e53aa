#include "mockmcp/coerce.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

namespace mockmcp {
namespace coerce {

namespace {

std::string_view trim(std::string_view s) {
    size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != b[i]) return false;
    }
    return true;
}

// Drops '_' digit separators ("1_000"). False when one is not between two digits.
bool strip_digit_separators(std::string_view in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '_') {
            out += in[i];
            continue;
        }
        bool digit_before = i > 0 && std::isdigit(static_cast<unsigned char>(in[i - 1]));
        bool digit_after = i + 1 < in.size() && std::isdigit(static_cast<unsigned char>(in[i + 1]));
        if (!digit_before || !digit_after) return false;
    }
    return true;
}

std::optional<double> parse_decimal(std::string_view text) {
    std::string_view s = trim(text);
    if (s.empty()) return std::nullopt;

    bool negative = false;
    if (s.front() == '+' || s.front() == '-') {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }
    if (s.empty() || s.front() == '+' || s.front() == '-') return std::nullopt;

    if (iequals(s, "inf") || iequals(s, "infinity")) {
        double inf = std::numeric_limits<double>::infinity();
        return negative ? -inf : inf;
    }
    if (iequals(s, "nan")) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    std::string cleaned;
    if (!strip_digit_separators(s, cleaned)) return std::nullopt;

    double value = 0.0;
    const char* end = cleaned.data() + cleaned.size();
    auto [ptr, ec] = std::from_chars(cleaned.data(), end, value, std::chars_format::general);
    if (ptr != end) return std::nullopt;
    if (ec == std::errc::result_out_of_range) {
        // Overflow saturates to infinity, underflow to zero.
        value = std::strtod(cleaned.c_str(), nullptr);
    } else if (ec != std::errc()) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

std::optional<int64_t> parse_integer(std::string_view text) {
    std::string_view s = trim(text);
    std::string cleaned;
    if (!strip_digit_separators(s, cleaned)) return std::nullopt;

    std::string_view digits = cleaned;
    if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
        digits.remove_prefix(1);
    }
    if (digits.empty()) return std::nullopt;
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    // from_chars rejects an explicit '+'.
    std::string_view number = cleaned.front() == '+' ? digits : std::string_view(cleaned);

    int64_t value = 0;
    const char* end = number.data() + number.size();
    auto [ptr, ec] = std::from_chars(number.data(), end, value);
    if (ec == std::errc::result_out_of_range) {
        throw std::out_of_range("integer out of range: " + std::string(number));
    }
    if (ec != std::errc() || ptr != end) return std::nullopt;
    return value;
}

// Quoted form of a string nested in a container: single quotes unless the text
// holds a single quote and no double quote.
void append_quoted(std::string& out, const std::string& text) {
    const char quote = (text.find('\'') != std::string::npos && text.find('"') == std::string::npos)
        ? '"' : '\'';
    out += quote;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (ch == quote || ch == '\\') {
            out += '\\';
            out += ch;
        } else if (ch == '\n') {
            out += "\\n";
        } else if (ch == '\r') {
            out += "\\r";
        } else if (ch == '\t') {
            out += "\\t";
        } else if (c < 0x20 || c == 0x7f) {
            static const char hex[] = "0123456789abcdef";
            out += "\\x";
            out += hex[c >> 4];
            out += hex[c & 0xf];
        } else {
            out += ch;
        }
    }
    out += quote;
}

void append_repr(std::string& out, const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            out += "None";
            break;
        case nlohmann::json::value_t::boolean:
            out += v.get<bool>() ? "True" : "False";
            break;
        case nlohmann::json::value_t::number_integer:
            out += std::to_string(v.get<int64_t>());
            break;
        case nlohmann::json::value_t::number_unsigned:
            out += std::to_string(v.get<uint64_t>());
            break;
        case nlohmann::json::value_t::number_float:
            out += format_double(v.get<double>());
            break;
        case nlohmann::json::value_t::string:
            append_quoted(out, v.get_ref<const std::string&>());
            break;
        case nlohmann::json::value_t::array: {
            out += '[';
            bool first = true;
            for (const auto& elem : v) {
                if (!first) out += ", ";
                first = false;
                append_repr(out, elem);
            }
            out += ']';
            break;
        }
        case nlohmann::json::value_t::object: {
            out += '{';
            bool first = true;
            for (auto it = v.begin(); it != v.end(); ++it) {
                if (!first) out += ", ";
                first = false;
                append_quoted(out, it.key());
                out += ": ";
                append_repr(out, it.value());
            }
            out += '}';
            break;
        }
        default:
            out += "None";
            break;
    }
}

} // anonymous namespace

bool is_truthy(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            return false;
        case nlohmann::json::value_t::boolean:
            return v.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return v.get<int64_t>() != 0;
        case nlohmann::json::value_t::number_unsigned:
            return v.get<uint64_t>() != 0;
        case nlohmann::json::value_t::number_float:
            return v.get<double>() != 0.0;
        case nlohmann::json::value_t::string:
            return !v.get_ref<const std::string&>().empty();
        default:
            return !v.empty();
    }
}

nlohmann::json member(const nlohmann::json& obj, std::string_view key) {
    if (!obj.is_object()) return nullptr;
    auto it = obj.find(std::string(key));
    if (it == obj.end()) return nullptr;
    return *it;
}

nlohmann::json or_default(const nlohmann::json& v, nlohmann::json fallback) {
    return is_truthy(v) ? v : fallback;
}

std::string to_display_string(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    std::string out;
    append_repr(out, v);
    return out;
}

std::optional<double> to_number(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::number_integer:
            return static_cast<double>(v.get<int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return static_cast<double>(v.get<uint64_t>());
        case nlohmann::json::value_t::number_float:
            return v.get<double>();
        case nlohmann::json::value_t::boolean:
            return v.get<bool>() ? 1.0 : 0.0;
        case nlohmann::json::value_t::string:
            return parse_decimal(v.get_ref<const std::string&>());
        default:
            return std::nullopt;
    }
}

std::optional<int64_t> to_integer(const nlohmann::json& v) {
    switch (v.type()) {
        case nlohmann::json::value_t::number_integer:
            return v.get<int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            auto u = v.get<uint64_t>();
            if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw std::out_of_range("integer out of range: " + std::to_string(u));
            }
            return static_cast<int64_t>(u);
        }
        case nlohmann::json::value_t::number_float: {
            double d = std::trunc(v.get<double>());
            if (!std::isfinite(d)) return std::nullopt;
            // 2^63 is exactly representable; anything at or beyond it overflows.
            constexpr double limit = 9223372036854775808.0;
            if (d >= limit || d < -limit) {
                throw std::out_of_range("integer out of range: " + format_double(d));
            }
            return static_cast<int64_t>(d);
        }
        case nlohmann::json::value_t::boolean:
            return v.get<bool>() ? 1 : 0;
        case nlohmann::json::value_t::string:
            return parse_integer(v.get_ref<const std::string&>());
        default:
            return std::nullopt;
    }
}

std::string format_double(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value < 0 ? "-inf" : "inf";

    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
    std::string sci(buf, res.ptr);

    bool negative = sci.front() == '-';
    if (negative) sci.erase(0, 1);

    size_t e_pos = sci.find('e');
    int exponent = std::stoi(sci.substr(e_pos + 1));
    std::string digits;
    for (char c : sci.substr(0, e_pos)) {
        if (c != '.') digits += c;
    }

    // Position of the decimal point relative to the first significant digit.
    const int decpt = exponent + 1;
    const int ndigits = static_cast<int>(digits.size());
    std::string out;
    if (decpt > -4 && decpt <= 16) {
        if (decpt <= 0) {
            out = "0." + std::string(static_cast<size_t>(-decpt), '0') + digits;
        } else if (decpt >= ndigits) {
            out = digits + std::string(static_cast<size_t>(decpt - ndigits), '0') + ".0";
        } else {
            out = digits.substr(0, static_cast<size_t>(decpt)) + "." +
                  digits.substr(static_cast<size_t>(decpt));
        }
    } else {
        out = digits.substr(0, 1);
        if (ndigits > 1) out += "." + digits.substr(1);
        out += exponent < 0 ? "e-" : "e+";
        std::string exp_digits = std::to_string(std::abs(exponent));
        if (exp_digits.size() < 2) exp_digits.insert(0, "0");
        out += exp_digits;
    }
    return negative ? "-" + out : out;
}

std::string strip_trailing_zeros(std::string text) {
    auto last = text.find_last_not_of('0');
    text.erase(last == std::string::npos ? 0 : last + 1);
    last = text.find_last_not_of('.');
    text.erase(last == std::string::npos ? 0 : last + 1);
    return text;
}

} // namespace coerce
} // namespace mockmcp
