#pragma once

#include "statcube/table.hpp"
#include "statcube/types.hpp"

#include <boost/json.hpp>

#include <string>
#include <vector>

namespace statcube {

/**
 * Decode one cube document into a flat table.
 *
 * Columns are the dimension names (labels or ids, per `naming`) in declared
 * order followed by `value_key`. Row i carries the i-th value of the dense
 * value array. Throws ShapeMismatch when the number of category combinations
 * differs from the number of values.
 */
Table decode(const boost::json::object& doc, Naming naming = Naming::Label,
             const std::string& value_key = "value");

/**
 * Decode every dataset in a bundle: a single 2.0 dataset (`class: dataset`),
 * a 1.x object of named datasets, or a list of either.
 */
std::vector<Table> decode_bundle(const boost::json::value& bundle, Naming naming = Naming::Label,
                                 const std::string& value_key = "value");

} // namespace statcube
