#pragma once

#include <cstddef>
#include <string>

namespace nestsh::utf8_utils {

// Byte length of the code point starting at pos. Invalid or truncated
// sequences count as a single byte.
size_t codepoint_length(const std::string& str, size_t pos);

std::string to_lowercase(const std::string& str);

std::string to_uppercase(const std::string& str);

}  // namespace nestsh::utf8_utils
