#include "statcube/dimension.hpp"
#include "statcube/error.hpp"
#include "statcube/scalar.hpp"

#include <algorithm>

namespace statcube {

namespace {

std::size_t to_position(const boost::json::value& v, const std::string& dimension_id) {
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
        default:
            break;
    }
    throw MalformedDimensionError("category position " + boost::json::serialize(v) +
                                  " is not a non-negative integer", dimension_id);
}

const boost::json::object& category_of(const boost::json::object& descriptor,
                                       const std::string& dimension_id) {
    const auto* category = descriptor.if_contains("category");
    if (!category || !category->is_object()) {
        throw MalformedDimensionError("dimension has no category object", dimension_id);
    }
    return category->get_object();
}

const boost::json::object* label_map_of(const boost::json::object& category,
                                        const std::string& dimension_id) {
    const auto* labels = category.if_contains("label");
    if (!labels) return nullptr;
    if (!labels->is_object()) {
        throw MalformedDimensionError("category.label must be an object", dimension_id);
    }
    return &labels->get_object();
}

} // anonymous namespace

const std::string& category_name(const Category& category, Naming naming) noexcept {
    return naming == Naming::Label ? category.label : category.id;
}

CategoryIndex CategoryIndex::from_json(const boost::json::value& index, const std::string& dimension_id) {
    CategoryIndex result;

    if (const auto* list = index.if_array()) {
        result.form_ = Form::List;
        result.entries_.reserve(list->size());
        for (std::size_t i = 0; i < list->size(); ++i) {
            result.entries_.emplace_back(coerce_to_str((*list)[i]), i);
        }
        return result;
    }

    if (const auto* mapping = index.if_object()) {
        result.form_ = Form::Mapping;
        result.entries_.reserve(mapping->size());
        for (const auto& kv : *mapping) {
            std::string id = to_std_string(kv.key());
            std::size_t position = to_position(kv.value(), dimension_id);
            result.lookup_.emplace(id, position);
            result.entries_.emplace_back(std::move(id), position);
        }
        return result;
    }

    throw MalformedDimensionError("category.index must be a list or an object", dimension_id);
}

std::optional<std::size_t> CategoryIndex::position_of(const std::string& id) const {
    if (form_ == Form::Mapping) {
        auto it = lookup_.find(id);
        if (it == lookup_.end()) return std::nullopt;
        return it->second;
    }
    for (const auto& [entry_id, position] : entries_) {
        if (entry_id == id) return position;
    }
    return std::nullopt;
}

const boost::json::object& find_dimension_descriptor(const boost::json::object& doc,
                                                     const std::string& dimension_id) {
    if (doc.contains("category")) {
        return doc;
    }

    const auto* dims = doc.if_contains("dimension");
    if (!dims || !dims->is_object()) {
        throw MalformedDimensionError("document has no dimension object", dimension_id);
    }
    const auto* descriptor = dims->get_object().if_contains(dimension_id);
    if (!descriptor || !descriptor->is_object()) {
        throw MalformedDimensionError("dimension not found", dimension_id);
    }
    return descriptor->get_object();
}

std::vector<Category> resolve_dimension(const boost::json::object& doc,
                                        const std::string& dimension_id) {
    const auto& descriptor = find_dimension_descriptor(doc, dimension_id);
    const auto& category = category_of(descriptor, dimension_id);
    const auto* labels = label_map_of(category, dimension_id);

    std::vector<Category> categories;

    if (const auto* index = category.if_contains("index")) {
        CategoryIndex normalized = CategoryIndex::from_json(*index, dimension_id);
        categories.reserve(normalized.size());
        for (const auto& [id, position] : normalized.entries()) {
            std::string label = id;
            if (labels) {
                if (const auto* found = labels->if_contains(id)) {
                    label = coerce_to_str(*found);
                }
            }
            categories.push_back(Category{id, std::move(label), position});
        }
    } else {
        // Constant dimension: a single category at position 0
        if (!labels || labels->empty()) {
            throw MalformedDimensionError("dimension has neither category.index nor category.label",
                                          dimension_id);
        }
        const auto& first = *labels->begin();
        categories.push_back(Category{to_std_string(first.key()), coerce_to_str(first.value()), 0});
    }

    std::stable_sort(categories.begin(), categories.end(),
                     [](const Category& a, const Category& b) { return a.position < b.position; });
    return categories;
}

std::optional<std::size_t> category_position(const boost::json::object& doc,
                                             const std::string& dimension_id,
                                             const std::string& category_id) {
    const auto& descriptor = find_dimension_descriptor(doc, dimension_id);
    const auto& category = category_of(descriptor, dimension_id);

    if (const auto* index = category.if_contains("index")) {
        return CategoryIndex::from_json(*index, dimension_id).position_of(category_id);
    }

    const auto* labels = label_map_of(category, dimension_id);
    if (!labels || labels->empty()) {
        throw MalformedDimensionError("dimension has neither category.index nor category.label",
                                      dimension_id);
    }
    if (to_std_string(labels->begin()->key()) == category_id) return 0;
    return std::nullopt;
}

std::string dimension_name(const boost::json::object& doc,
                           const std::string& dimension_id, Naming naming) {
    if (naming == Naming::Id) {
        return dimension_id;
    }

    const auto& descriptor = find_dimension_descriptor(doc, dimension_id);
    if (const auto* label = descriptor.if_contains("label")) {
        std::string name = label->is_null() ? std::string() : coerce_to_str(*label);
        if (!name.empty()) return name;
    }
    return dimension_id;
}

} // namespace statcube
