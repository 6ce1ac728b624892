#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace statcube {

// Integer value of `text` (optional surrounding whitespace and sign), if it fits in 64 bits
std::optional<int64_t> parse_integer(std::string_view text);

// Integer if `text` parses as one, otherwise the string unchanged
boost::json::value coerce_to_int(const std::string& text);
boost::json::value coerce_to_int(const char* text);
boost::json::value coerce_to_int(const boost::json::value& value);

/**
 * Canonical string form of a category identifier.
 * Integers print in decimal, integral doubles print as integers, other doubles
 * in shortest round-trip form; strings come back unchanged.
 */
std::string coerce_to_str(const boost::json::value& value);

inline std::string to_std_string(const boost::json::string& s) {
    return std::string(s.data(), s.size());
}

inline std::string to_std_string(boost::json::string_view s) {
    return std::string(s.data(), s.size());
}

} // namespace statcube
