#pragma once

#include "statcube/types.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace statcube {

struct Category {
    std::string id;
    std::string label;
    std::size_t position = 0;

    bool operator==(const Category& other) const {
        return id == other.id && label == other.label && position == other.position;
    }
};

// Label or id of a category, depending on naming
const std::string& category_name(const Category& category, Naming naming) noexcept;

/**
 * Normalized `category.index`.
 *
 * JSON-stat allows either an ordered list of ids (position = offset) or an
 * object mapping id -> position. Both forms become an ordered list of
 * (id, position) pairs in declaration order; lookups by id are linear for the
 * list form and hashed for the mapping form.
 */
class CategoryIndex {
public:
    enum class Form {
        List,
        Mapping
    };

    // Throws MalformedDimension for anything but a list or an object of integer positions
    static CategoryIndex from_json(const boost::json::value& index, const std::string& dimension_id);

    Form form() const noexcept { return form_; }
    const std::vector<std::pair<std::string, std::size_t>>& entries() const noexcept { return entries_; }
    std::size_t size() const noexcept { return entries_.size(); }

    std::optional<std::size_t> position_of(const std::string& id) const;

private:
    Form form_ = Form::List;
    std::vector<std::pair<std::string, std::size_t>> entries_;
    std::unordered_map<std::string, std::size_t> lookup_;
};

/**
 * Descriptor of dimension `dimension_id`.
 * A document that itself carries `category` (a 2.0 dimension document) is its
 * own descriptor; otherwise `dimension[dimension_id]` is used.
 * Throws MalformedDimension when neither applies.
 */
const boost::json::object& find_dimension_descriptor(const boost::json::object& doc,
                                                     const std::string& dimension_id);

/**
 * Ordered categories of one dimension, ascending by position.
 *
 * Labels come from `category.label`; an id missing there is its own label.
 * Without `category.index` the dimension has a single category: the first
 * `category.label` id, at position 0.
 */
std::vector<Category> resolve_dimension(const boost::json::object& doc,
                                        const std::string& dimension_id);

/**
 * Position of one category within a dimension: a linear search of a list
 * index, a direct lookup in a mapping index. Without an index the only
 * category (the first labelled id) sits at position 0.
 */
std::optional<std::size_t> category_position(const boost::json::object& doc,
                                             const std::string& dimension_id,
                                             const std::string& category_id);

// Column name for a dimension: its label (or the id when empty) for Naming::Label
std::string dimension_name(const boost::json::object& doc,
                           const std::string& dimension_id, Naming naming);

} // namespace statcube
