#pragma once

#include "statcube/table.hpp"
#include "statcube/types.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace statcube {

enum class BundleLayout {
    List,    // array of envelopes
    Object   // one object keyed dataset1, dataset2, ...
};

/**
 * Encode a flat table as a JSON-stat cube.
 *
 * Every column except `value_key` is a dimension; its unique values in
 * first-seen order are the categories. Each row's value lands at the flat
 * index of its category positions, so rows may come in any order and cells
 * without a row stay null.
 *
 * Version 2.0 yields {version, class, id, size, dimension, value}; version 1.3
 * yields {"dataset<ordinal>": {dimension: {..., id, size}, value}}.
 *
 * Throws NoValueColumn, DuplicateColumn, or DuplicateKey when two rows share
 * a category combination.
 */
boost::json::object encode(const Table& table, const std::string& value_key = "value",
                           Version version = Version::V2_0, std::size_t ordinal = 1);

boost::json::value encode_bundle(const std::vector<Table>& tables,
                                 const std::string& value_key = "value",
                                 Version version = Version::V2_0,
                                 BundleLayout layout = BundleLayout::List);

} // namespace statcube
