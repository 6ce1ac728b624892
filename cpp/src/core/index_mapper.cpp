#include "statcube/index_mapper.hpp"
#include "statcube/cube.hpp"
#include "statcube/dimension.hpp"
#include "statcube/error.hpp"
#include "statcube/values.hpp"

namespace statcube {

std::size_t flat_index(const std::vector<std::size_t>& positions,
                       const std::vector<std::size_t>& sizes) {
    STATCUBE_CHECK(positions.size() == sizes.size(), ErrorCode::SHAPE_MISMATCH,
                   std::to_string(positions.size()) + " positions for " +
                   std::to_string(sizes.size()) + " dimensions", "positions");

    std::size_t flat = 0;
    std::size_t weight = 1;
    for (std::size_t d = sizes.size(); d-- > 0;) {
        if (positions[d] >= sizes[d]) {
            throw IndexOutOfRangeError("position " + std::to_string(positions[d]) +
                                       " outside dimension of size " + std::to_string(sizes[d]),
                                       std::to_string(d));
        }
        flat += positions[d] * weight;
        weight *= sizes[d];
    }
    return flat;
}

std::vector<std::size_t> dimension_positions(std::size_t flat,
                                             const std::vector<std::size_t>& sizes) {
    if (flat >= cell_count(sizes)) {
        throw IndexOutOfRangeError("flat index outside cube", std::to_string(flat));
    }

    std::vector<std::size_t> positions(sizes.size(), 0);
    for (std::size_t d = sizes.size(); d-- > 0;) {
        positions[d] = flat % sizes[d];
        flat /= sizes[d];
    }
    return positions;
}

std::vector<std::size_t> dimension_indices(const CategoryQuery& query,
                                           const boost::json::object& doc) {
    std::vector<std::size_t> indices;
    for (const auto& dimension_id : dimension_ids(doc)) {
        const std::string* requested = nullptr;
        for (const auto& [dim, category] : query) {
            if (dim == dimension_id) {
                requested = &category;
                break;
            }
        }
        if (!requested) {
            throw StatcubeException(ErrorCode::INCOMPLETE_QUERY,
                                    "query names no category for dimension", dimension_id);
        }

        auto position = category_position(doc, dimension_id, *requested);
        if (!position) {
            throw StatcubeException(ErrorCode::UNKNOWN_CATEGORY,
                                    "category not in dimension " + dimension_id, *requested);
        }
        indices.push_back(*position);
    }
    return indices;
}

boost::json::value value_by_index(const boost::json::object& doc, std::size_t flat,
                                  const std::string& value_key) {
    boost::json::array values = resolve_values(doc, value_key);
    if (flat >= values.size()) {
        throw IndexOutOfRangeError("value index past " + std::to_string(values.size()) + " values",
                                   std::to_string(flat));
    }
    return values[flat];
}

boost::json::value value_at(const boost::json::object& doc,
                            const std::vector<std::size_t>& positions,
                            const std::string& value_key) {
    return value_by_index(doc, flat_index(positions, dimension_sizes(doc)), value_key);
}

boost::json::value point_lookup(const boost::json::object& doc, const CategoryQuery& query,
                                const std::string& value_key) {
    return value_at(doc, dimension_indices(query, doc), value_key);
}

} // namespace statcube
