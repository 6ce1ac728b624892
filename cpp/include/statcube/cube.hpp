#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace statcube {

// =============================================================================
// Cube document shape accessors
// =============================================================================
// Version >= 2.0 datasets carry `id` and `size` at the top level; older ones
// nest them under `dimension`. These helpers look in both places.
// =============================================================================

// True when `version` is present and its numeric value is >= 2.0
bool is_version_2(const boost::json::object& doc);

// Ordered dimension ids. Throws MalformedDocument when neither list exists.
std::vector<std::string> dimension_ids(const boost::json::object& doc);

// Ordered dimension sizes, or nullopt when neither list exists
std::optional<std::vector<std::size_t>> find_dimension_sizes(const boost::json::object& doc);

// As find_dimension_sizes, throwing MissingSize when absent
std::vector<std::size_t> dimension_sizes(const boost::json::object& doc);

// Product of sizes (1 for no dimensions). Throws IndexOutOfRange on overflow.
std::size_t cell_count(const std::vector<std::size_t>& sizes);

// Document body as an object; throws MalformedDocument otherwise
const boost::json::object& as_document(const boost::json::value& value);

} // namespace statcube
