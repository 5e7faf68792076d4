#pragma once

#include <cstdint>
#include <string>

namespace atlasfix::core {

bool parse_positive_int(const std::string& value, int& out);
bool parse_non_negative_int(const std::string& value, int& out);

// Decimal or 0x-prefixed hexadecimal.
bool parse_uint32(const std::string& value, std::uint32_t& out);

// true/false, yes/no, on/off, 1/0 (case-insensitive).
bool parse_bool_value(const std::string& value, bool& out);

std::string trim_copy(const std::string& s);
std::string to_lower_copy(std::string value);

} // namespace atlasfix::core
