#include "mockmcp/codec.hpp"
#include "mockmcp/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace mockmcp {

namespace {

// True when `s` is exactly a JSON number literal.
bool is_number_literal(std::string_view s) {
    size_t i = 0;
    auto digits = [&]() {
        size_t start = i;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') ++i;
        return i > start;
    };
    if (i < s.size() && s[i] == '-') ++i;
    if (i < s.size() && s[i] == '0') {
        ++i;
    } else if (!digits()) {
        return false;
    }
    if (i < s.size() && s[i] == '.') {
        ++i;
        if (!digits()) return false;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
        if (!digits()) return false;
    }
    return i == s.size();
}

// Numbers beyond 64-bit integers or double range (100000000000000000000, 1e400)
// are still valid JSON; they decode to the nearest double, overflowing to +-inf.
double wide_number(std::string_view token) {
    while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back()))) {
        token.remove_suffix(1);
    }
    if (!is_number_literal(token)) {
        throw McpParseError("JSON parse error: invalid number '" + std::string(token) + "'");
    }
    std::string copy(token);
    return std::strtod(copy.c_str(), nullptr);
}

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                // Duplicate keys: the last one wins.
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Read the token first: get_number() does not consume the value on failure.
            std::string_view token = val.raw_json_token();
            auto parsed = val.get_number();
            simdjson::error_code error = parsed.error();
            if (error == simdjson::BIGINT_ERROR || error == simdjson::NUMBER_ERROR) {
                return nlohmann::json(wide_number(token));
            }
            if (error) throw simdjson::simdjson_error(error);
            simdjson::ondemand::number num = parsed.value_unsafe();
            switch (num.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return nlohmann::json(num.get_int64());
                case simdjson::ondemand::number_type::unsigned_integer:
                    return nlohmann::json(num.get_uint64());
                default:
                    return nlohmann::json(num.get_double());
            }
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            // Consume the literal so a malformed one ("nul") is still reported.
            bool is_null = val.is_null();
            if (!is_null) throw McpParseError("JSON parse error: invalid null literal");
            return nlohmann::json(nullptr);
        }
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json parse_object_document(std::string_view raw) {
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::json_type type;
    error = doc.type().get(type);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }
    if (type != simdjson::ondemand::json_type::object) {
        throw McpParseError("Message must be a JSON object");
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::object root = doc.get_object();
        j = nlohmann::json::object();
        for (auto field : root) {
            std::string_view key = field.unescaped_key();
            j[std::string(key)] = simdjson_to_nlohmann(field.value());
        }
    } catch (const simdjson::simdjson_error& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw McpParseError("JSON parse error: trailing content after document");
    }
    return j;
}

} // anonymous namespace

JsonRpcRequest Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    nlohmann::json j = parse_object_document(raw);

    JsonRpcRequest req;
    from_json(j, req);
    return req;
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    // Compact dump never emits raw newlines; keep one response per line even
    // when a string carries invalid UTF-8.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace mockmcp
