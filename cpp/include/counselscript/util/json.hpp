#pragma once

#include <string>

#include <boost/json.hpp>

#include "counselscript/types.hpp"

namespace counselscript::util {

boost::json::value to_json(const AttributeValue& value);
boost::json::object to_json(const Attributes& attrs);

// Nested arrays and objects are kept as their serialized text
Attributes attributes_from_json(const boost::json::object& obj);

std::string serialize_attributes(const Attributes& attrs);

// Empty map for empty input; throws InvalidArgumentError on malformed JSON
Attributes parse_attributes(const std::string& json_text);

} // namespace counselscript::util
