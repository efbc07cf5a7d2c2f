#pragma once

#include <string>

namespace counselscript::util {

// Random RFC 4122 identifier in canonical text form
std::string generate_id();

bool is_valid_id(const std::string& id);

} // namespace counselscript::util
