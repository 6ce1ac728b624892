#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace statcube {

// =============================================================================
// Mixed-radix index mapping
// =============================================================================
// Dimension 0 is outermost (slowest varying), the last dimension innermost.
// The weight of dimension d is the product of the sizes after d, so for
// sizes [2,3]: (0,0)->0, (0,2)->2, (1,0)->3, (1,2)->5.
// =============================================================================

// Ordered (dimension id, category id) pairs
using CategoryQuery = std::vector<std::pair<std::string, std::string>>;

/**
 * Flat value index of one cell.
 * Throws ShapeMismatch when the lengths differ and IndexOutOfRange when a
 * position is not below its dimension size.
 */
std::size_t flat_index(const std::vector<std::size_t>& positions,
                       const std::vector<std::size_t>& sizes);

// Inverse of flat_index. Throws IndexOutOfRange when flat >= product(sizes).
std::vector<std::size_t> dimension_positions(std::size_t flat,
                                             const std::vector<std::size_t>& sizes);

/**
 * Category position per dimension, in declared dimension order.
 * Throws IncompleteQuery when the query does not name a dimension and
 * UnknownCategory when a named category is not part of its dimension.
 */
std::vector<std::size_t> dimension_indices(const CategoryQuery& query,
                                           const boost::json::object& doc);

// Value at a flat index. Throws IndexOutOfRange past the value array.
boost::json::value value_by_index(const boost::json::object& doc, std::size_t flat,
                                  const std::string& value_key = "value");

// Value at per-dimension category positions
boost::json::value value_at(const boost::json::object& doc,
                            const std::vector<std::size_t>& positions,
                            const std::string& value_key = "value");

// dimension_indices -> flat_index -> value
boost::json::value point_lookup(const boost::json::object& doc, const CategoryQuery& query,
                                const std::string& value_key = "value");

} // namespace statcube
