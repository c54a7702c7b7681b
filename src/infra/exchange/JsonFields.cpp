#include "infra/exchange/JsonFields.h"

#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

#include <boost/json/object.hpp>
#include <boost/json/string.hpp>

namespace infra::exchange {

namespace json = boost::json;

namespace {

std::string_view trimmed(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

bool parseDecimalText(std::string_view text, double& out) {
    const auto body = trimmed(text);
    if (body.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const std::string copy(body);
        const double parsed = std::stod(copy, &consumed);
        if (consumed != copy.size() || !std::isfinite(parsed)) {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::logic_error&) {
        return false;
    }
}

bool parseIntegerText(std::string_view text, std::int64_t& out) {
    const auto body = trimmed(text);
    if (body.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        const std::string copy(body);
        const long long parsed = std::stoll(copy, &consumed, 10);
        if (consumed != copy.size()) {
            return false;
        }
        out = static_cast<std::int64_t>(parsed);
        return true;
    }
    catch (const std::logic_error&) {
        return false;
    }
}

bool readDecimal(const json::value& value, double& out) {
    switch (value.kind()) {
    case json::kind::double_:
        if (!std::isfinite(value.get_double())) {
            return false;
        }
        out = value.get_double();
        return true;
    case json::kind::int64:
        out = static_cast<double>(value.get_int64());
        return true;
    case json::kind::uint64:
        out = static_cast<double>(value.get_uint64());
        return true;
    case json::kind::string: {
        const auto& str = value.get_string();
        return parseDecimalText(std::string_view(str.data(), str.size()), out);
    }
    default:
        return false;
    }
}

bool readInt64(const json::value& value, std::int64_t& out) {
    switch (value.kind()) {
    case json::kind::int64:
        out = value.get_int64();
        return true;
    case json::kind::uint64:
        if (value.get_uint64() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return false;
        }
        out = static_cast<std::int64_t>(value.get_uint64());
        return true;
    case json::kind::string: {
        const auto& str = value.get_string();
        return parseIntegerText(std::string_view(str.data(), str.size()), out);
    }
    default:
        return false;
    }
}

bool readUint32(const json::value& value, std::uint32_t& out) {
    std::int64_t wide = 0;
    if (!readInt64(value, wide)) {
        return false;
    }
    if (wide < 0 || wide > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
        return false;
    }
    out = static_cast<std::uint32_t>(wide);
    return true;
}

bool readString(const json::value& value, std::string& out) {
    if (!value.is_string()) {
        return false;
    }
    const auto& str = value.get_string();
    out.assign(str.data(), str.size());
    return true;
}

const json::value* field(const json::object& object, std::string_view key) {
    return object.if_contains(json::string_view(key.data(), key.size()));
}

}  // namespace infra::exchange
