#pragma once

#include "statcube/document.hpp"
#include "statcube/io/fetcher.hpp"
#include "statcube/logging.hpp"
#include "statcube/table.hpp"
#include "statcube/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace statcube {

// Number of entries in the collection's link.item list
std::size_t collection_size(const Document& collection);

/**
 * Entry `element` of a collection as a document of the item's class.
 * Items that embed their content are used as-is; others are fetched by href.
 * Throws MalformedDocument for unknown classes or items without content,
 * IndexOutOfRange past the item list.
 */
Document collection_item(const Document& collection, std::size_t element, const Fetcher& fetcher);

/**
 * Every dataset reachable from a collection, depth-first in item order,
 * descending into nested collections. Items of other classes are skipped.
 * Throws UnsupportedOutputFormat when `collection` is not a collection.
 */
std::vector<Table> write_tables(const Document& collection, const Fetcher& fetcher, Logger& logger,
                                Naming naming = Naming::Label,
                                const std::string& value_key = "value");

} // namespace statcube
