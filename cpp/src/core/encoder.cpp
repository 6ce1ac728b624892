#include "statcube/encoder.hpp"
#include "statcube/cube.hpp"
#include "statcube/error.hpp"
#include "statcube/index_mapper.hpp"
#include "statcube/scalar.hpp"

#include <cmath>
#include <unordered_map>
#include <unordered_set>

namespace statcube {

namespace {

// Unique categories of one column in first-seen order
struct ColumnCategories {
    std::string name;
    std::size_t column = 0;
    std::vector<std::string> ids;
    std::unordered_map<std::string, std::size_t> positions;

    std::size_t position_of(const Cell& cell) {
        std::string id = coerce_to_str(cell);
        auto it = positions.find(id);
        if (it != positions.end()) return it->second;

        std::size_t position = ids.size();
        positions.emplace(id, position);
        ids.push_back(std::move(id));
        return position;
    }

    boost::json::object descriptor() const {
        boost::json::object index;
        boost::json::object label;
        for (std::size_t i = 0; i < ids.size(); ++i) {
            index[ids[i]] = static_cast<std::int64_t>(i);
            label[ids[i]] = ids[i];
        }

        boost::json::object category;
        category["index"] = std::move(index);
        category["label"] = std::move(label);

        boost::json::object result;
        result["label"] = name;
        result["category"] = std::move(category);
        return result;
    }
};

boost::json::value normalize_value(const Cell& cell) {
    if (cell.is_double() && std::isnan(cell.get_double())) {
        return nullptr;
    }
    return cell;
}

} // anonymous namespace

boost::json::object encode(const Table& table, const std::string& value_key,
                           Version version, std::size_t ordinal) {
    const auto value_column = table.find_column(value_key);
    if (!value_column) {
        throw StatcubeException(ErrorCode::NO_VALUE_COLUMN, "table has no value column", value_key);
    }

    std::vector<ColumnCategories> columns;
    std::unordered_set<std::string> seen_names;
    for (std::size_t c = 0; c < table.column_count(); ++c) {
        const std::string& name = table.columns()[c];
        if (!seen_names.insert(name).second) {
            throw StatcubeException(ErrorCode::DUPLICATE_COLUMN,
                                    "non-value columns must form a unique key", name);
        }
        if (c == *value_column) continue;

        ColumnCategories categories;
        categories.name = name;
        categories.column = c;
        columns.push_back(std::move(categories));
    }

    // First pass: categories and per-row positions
    std::vector<std::vector<std::size_t>> row_positions;
    row_positions.reserve(table.row_count());
    for (const auto& row : table.rows()) {
        std::vector<std::size_t> positions;
        positions.reserve(columns.size());
        for (auto& column : columns) {
            positions.push_back(column.position_of(row[column.column]));
        }
        row_positions.push_back(std::move(positions));
    }

    std::vector<std::size_t> sizes;
    sizes.reserve(columns.size());
    for (const auto& column : columns) {
        sizes.push_back(column.ids.size());
    }

    // Second pass: place each value at its computed flat index
    // Without rows there are no cells, even for a cube with no dimensions
    boost::json::array values;
    values.resize(table.empty() ? 0 : cell_count(sizes));
    std::vector<bool> filled(values.size(), false);
    for (std::size_t r = 0; r < table.row_count(); ++r) {
        const std::size_t flat = flat_index(row_positions[r], sizes);
        if (filled[flat]) {
            throw StatcubeException(ErrorCode::DUPLICATE_KEY,
                                    "two rows share one category combination", std::to_string(r));
        }
        filled[flat] = true;
        values[flat] = normalize_value(table.rows()[r][*value_column]);
    }

    boost::json::array id_list;
    boost::json::array size_list;
    boost::json::object dimension;
    for (std::size_t d = 0; d < columns.size(); ++d) {
        id_list.emplace_back(columns[d].name);
        size_list.emplace_back(static_cast<std::int64_t>(sizes[d]));
        dimension[columns[d].name] = columns[d].descriptor();
    }

    if (version == Version::V2_0) {
        boost::json::object dataset;
        dataset["version"] = version_string(version);
        dataset["class"] = "dataset";
        dataset["id"] = std::move(id_list);
        dataset["size"] = std::move(size_list);
        dataset["dimension"] = std::move(dimension);
        dataset[value_key] = std::move(values);
        return dataset;
    }

    dimension["id"] = std::move(id_list);
    dimension["size"] = std::move(size_list);

    boost::json::object body;
    body["dimension"] = std::move(dimension);
    body[value_key] = std::move(values);

    boost::json::object envelope;
    envelope["dataset" + std::to_string(ordinal)] = std::move(body);
    return envelope;
}

boost::json::value encode_bundle(const std::vector<Table>& tables, const std::string& value_key,
                                 Version version, BundleLayout layout) {
    if (layout == BundleLayout::List) {
        boost::json::array result;
        for (std::size_t i = 0; i < tables.size(); ++i) {
            result.emplace_back(encode(tables[i], value_key, version, i + 1));
        }
        return result;
    }

    boost::json::object result;
    for (std::size_t i = 0; i < tables.size(); ++i) {
        boost::json::object encoded = encode(tables[i], value_key, version, i + 1);
        if (version == Version::V2_0) {
            result["dataset" + std::to_string(i + 1)] = std::move(encoded);
        } else {
            for (auto& kv : encoded) {
                result[kv.key()] = std::move(kv.value());
            }
        }
    }
    return result;
}

} // namespace statcube
