#include "statcube/scalar.hpp"

#include <charconv>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace statcube {

namespace {

std::string format_double(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";

    if (std::trunc(d) == d && std::fabs(d) < 9.2e18) {
        return std::to_string(static_cast<int64_t>(d));
    }

    for (int precision = 15; precision <= 17; ++precision) {
        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss << std::setprecision(precision) << d;
        if (precision == 17 || std::stod(ss.str()) == d) {
            return ss.str();
        }
    }
    return {};
}

} // anonymous namespace

std::optional<int64_t> parse_integer(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;

    std::string_view digits = text.substr(begin, end - begin);
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && digits.front() == '-') return std::nullopt;
    }
    if (digits.empty()) return std::nullopt;

    int64_t value = 0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) return std::nullopt;
    return value;
}

boost::json::value coerce_to_int(const std::string& text) {
    if (auto parsed = parse_integer(text)) {
        return *parsed;
    }
    return boost::json::value(boost::json::string(text));
}

boost::json::value coerce_to_int(const char* text) {
    return coerce_to_int(std::string(text));
}

boost::json::value coerce_to_int(const boost::json::value& value) {
    switch (value.kind()) {
        case boost::json::kind::int64:
        case boost::json::kind::uint64:
            return value;
        case boost::json::kind::double_: {
            double d = value.get_double();
            if (std::isfinite(d) && std::trunc(d) == d && std::fabs(d) < 9.2e18) {
                return static_cast<int64_t>(d);
            }
            return value;
        }
        case boost::json::kind::string:
            return coerce_to_int(to_std_string(value.get_string()));
        default:
            return value;
    }
}

std::string coerce_to_str(const boost::json::value& value) {
    switch (value.kind()) {
        case boost::json::kind::string:
            return to_std_string(value.get_string());
        case boost::json::kind::int64:
            return std::to_string(value.get_int64());
        case boost::json::kind::uint64:
            return std::to_string(value.get_uint64());
        case boost::json::kind::double_:
            return format_double(value.get_double());
        case boost::json::kind::bool_:
            return value.get_bool() ? "true" : "false";
        case boost::json::kind::null:
            return "null";
        default:
            return boost::json::serialize(value);
    }
}

} // namespace statcube
