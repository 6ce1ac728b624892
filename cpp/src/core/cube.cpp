#include "statcube/cube.hpp"
#include "statcube/error.hpp"
#include "statcube/scalar.hpp"

#include <limits>

namespace statcube {

namespace {

const boost::json::array* find_list(const boost::json::object& doc, const char* key) {
    if (const auto* top = doc.if_contains(key)) {
        if (const auto* list = top->if_array()) return list;
    }
    if (const auto* dims = doc.if_contains("dimension")) {
        if (const auto* dims_obj = dims->if_object()) {
            if (const auto* nested = dims_obj->if_contains(key)) {
                if (const auto* list = nested->if_array()) return list;
            }
        }
    }
    return nullptr;
}

std::size_t to_size(const boost::json::value& v) {
    switch (v.kind()) {
        case boost::json::kind::int64:
            if (v.get_int64() >= 0) return static_cast<std::size_t>(v.get_int64());
            break;
        case boost::json::kind::uint64:
            return static_cast<std::size_t>(v.get_uint64());
        case boost::json::kind::double_: {
            double d = v.get_double();
            // 2^64 and above do not fit; the cast would be undefined
            if (d >= 0 && d < 18446744073709551616.0 &&
                static_cast<double>(static_cast<std::size_t>(d)) == d) {
                return static_cast<std::size_t>(d);
            }
            break;
        }
        case boost::json::kind::string:
            if (auto parsed = parse_integer(to_std_string(v.get_string()))) {
                if (*parsed >= 0) return static_cast<std::size_t>(*parsed);
            }
            break;
        default:
            break;
    }
    throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT,
                            "dimension size is not a non-negative integer",
                            boost::json::serialize(v));
}

} // anonymous namespace

bool is_version_2(const boost::json::object& doc) {
    const auto* version = doc.if_contains("version");
    if (!version) return false;

    double number = 0.0;
    switch (version->kind()) {
        case boost::json::kind::string:
            try {
                number = std::stod(to_std_string(version->get_string()));
            } catch (const std::exception&) {
                return false;
            }
            break;
        case boost::json::kind::int64:  number = static_cast<double>(version->get_int64()); break;
        case boost::json::kind::uint64: number = static_cast<double>(version->get_uint64()); break;
        case boost::json::kind::double_: number = version->get_double(); break;
        default:
            return false;
    }
    return number >= 2.0;
}

std::vector<std::string> dimension_ids(const boost::json::object& doc) {
    const auto* list = find_list(doc, "id");
    if (!list) {
        throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT, "document has no dimension id list", "id");
    }

    std::vector<std::string> ids;
    ids.reserve(list->size());
    for (const auto& id : *list) {
        ids.push_back(coerce_to_str(id));
    }
    return ids;
}

std::optional<std::vector<std::size_t>> find_dimension_sizes(const boost::json::object& doc) {
    const auto* list = find_list(doc, "size");
    if (!list) return std::nullopt;

    std::vector<std::size_t> sizes;
    sizes.reserve(list->size());
    for (const auto& size : *list) {
        sizes.push_back(to_size(size));
    }
    return sizes;
}

std::vector<std::size_t> dimension_sizes(const boost::json::object& doc) {
    auto sizes = find_dimension_sizes(doc);
    if (!sizes) {
        throw StatcubeException(ErrorCode::MISSING_SIZE, "document has no dimension size list", "size");
    }
    return *sizes;
}

std::size_t cell_count(const std::vector<std::size_t>& sizes) {
    std::size_t total = 1;
    for (std::size_t size : sizes) {
        if (size != 0 && total > std::numeric_limits<std::size_t>::max() / size) {
            throw IndexOutOfRangeError("cube cell count overflows", "size");
        }
        total *= size;
    }
    return total;
}

const boost::json::object& as_document(const boost::json::value& value) {
    if (const auto* obj = value.if_object()) return *obj;
    throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT, "JSON-stat document must be an object",
                            to_std_string(boost::json::to_string(value.kind())));
}

} // namespace statcube
