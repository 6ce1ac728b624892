#include "statcube/values.hpp"
#include "statcube/cube.hpp"
#include "statcube/error.hpp"
#include "statcube/scalar.hpp"

namespace statcube {

namespace {

void place_sparse(boost::json::array& dense, const boost::json::object& sparse) {
    for (const auto& kv : sparse) {
        std::string key = to_std_string(kv.key());
        auto offset = parse_integer(key);
        if (!offset || *offset < 0) {
            throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT,
                                    "sparse value key is not a flat index", key);
        }
        if (static_cast<uint64_t>(*offset) >= dense.size()) {
            throw IndexOutOfRangeError("sparse value index past cube size " +
                                       std::to_string(dense.size()), key);
        }
        dense[static_cast<std::size_t>(*offset)] = kv.value();
    }
}

bool holds_mappings(const boost::json::array& values) {
    for (const auto& v : values) {
        if (v.is_object()) return true;
    }
    return false;
}

} // anonymous namespace

boost::json::array resolve_values(const boost::json::object& doc, const std::string& value_key) {
    const auto* values = doc.if_contains(value_key);
    if (!values) {
        throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT, "document has no value member", value_key);
    }

    if (const auto* list = values->if_array()) {
        if (!holds_mappings(*list)) {
            return *list;
        }
    } else if (!values->is_object()) {
        throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT,
                                "value must be a list or an object", value_key);
    }

    boost::json::array dense;
    dense.resize(cell_count(dimension_sizes(doc)));

    if (const auto* sparse = values->if_object()) {
        place_sparse(dense, *sparse);
    } else {
        for (const auto& fragment : values->get_array()) {
            const auto* sparse = fragment.if_object();
            if (!sparse) {
                throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT,
                                        "value list mixes mappings and scalars", value_key);
            }
            place_sparse(dense, *sparse);
        }
    }
    return dense;
}

} // namespace statcube
