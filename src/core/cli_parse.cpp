#include "cli_parse.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <limits>

namespace atlasfix::core {

bool parse_positive_int(const std::string& value, int& out) {
    int parsed = 0;
    if (!parse_non_negative_int(value, parsed) || parsed == 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_non_negative_int(const std::string& value, int& out) {
    int parsed = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        return false;
    }
    if (parsed < 0) {
        return false;
    }
    out = parsed;
    return true;
}

bool parse_uint32(const std::string& value, std::uint32_t& out) {
    if (value.empty()) {
        return false;
    }
    int base = 10;
    size_t start = 0;
    if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
        base = 16;
        start = 2;
    }
    std::uint64_t parsed = 0;
    const char* first = value.data() + start;
    const char* last = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(first, last, parsed, base);
    if (ec != std::errc() || ptr != last) {
        return false;
    }
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        return false;
    }
    out = static_cast<std::uint32_t>(parsed);
    return true;
}

bool parse_bool_value(const std::string& value, bool& out) {
    const std::string lower = to_lower_copy(trim_copy(value));
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

std::string trim_copy(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace atlasfix::core
