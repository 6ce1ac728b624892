#pragma once

#include <boost/json.hpp>

#include <string>

namespace statcube {

/**
 * Dense flat value array of a cube document.
 *
 * A dense `value` list is returned unchanged. A sparse `value` object (keys
 * are decimal flat indices) is expanded to product(size) entries with null
 * in every unmapped cell; a list of such objects is expanded the same way.
 *
 * Throws MalformedDocument when `value_key` is missing or a sparse key is not
 * a non-negative integer, MissingSize when sparse data has no size list, and
 * IndexOutOfRange when a sparse key is past the end of the cube.
 */
boost::json::array resolve_values(const boost::json::object& doc,
                                  const std::string& value_key = "value");

} // namespace statcube
