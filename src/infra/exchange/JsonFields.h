#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <boost/json/value.hpp>

namespace infra::exchange {

// Field readers shared by the gateways. Upstream APIs send prices both as JSON
// numbers and as decimal text; every reader rejects partial or non-finite input.
bool parseDecimalText(std::string_view text, double& out);
bool parseIntegerText(std::string_view text, std::int64_t& out);

bool readDecimal(const boost::json::value& value, double& out);
bool readInt64(const boost::json::value& value, std::int64_t& out);
bool readUint32(const boost::json::value& value, std::uint32_t& out);
bool readString(const boost::json::value& value, std::string& out);

// Returns the field or nullptr when the object lacks it.
const boost::json::value* field(const boost::json::object& object, std::string_view key);

}  // namespace infra::exchange
