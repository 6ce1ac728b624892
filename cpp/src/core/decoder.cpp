#include "statcube/decoder.hpp"
#include "statcube/cube.hpp"
#include "statcube/dimension.hpp"
#include "statcube/error.hpp"
#include "statcube/row_generator.hpp"
#include "statcube/scalar.hpp"
#include "statcube/values.hpp"

namespace statcube {

namespace {

void decode_object(const boost::json::object& obj, Naming naming, const std::string& value_key,
                   std::vector<Table>& out) {
    if (const auto* cls = obj.if_contains("class")) {
        if (coerce_to_str(*cls) != "dataset") {
            throw StatcubeException(ErrorCode::MALFORMED_DOCUMENT,
                                    "bundle member is not a dataset", coerce_to_str(*cls));
        }
        out.push_back(decode(obj, naming, value_key));
        return;
    }

    // 1.x bundle: every member is a named dataset
    for (const auto& kv : obj) {
        out.push_back(decode(as_document(kv.value()), naming, value_key));
    }
}

} // anonymous namespace

Table decode(const boost::json::object& doc, Naming naming, const std::string& value_key) {
    const std::vector<std::string> ids = dimension_ids(doc);
    const auto sizes = find_dimension_sizes(doc);
    if (sizes) {
        STATCUBE_CHECK(sizes->size() == ids.size(), ErrorCode::SHAPE_MISMATCH,
                       std::to_string(sizes->size()) + " sizes for " +
                       std::to_string(ids.size()) + " dimensions", "size");
    }

    std::vector<std::vector<Category>> dimensions;
    std::vector<std::string> columns;
    dimensions.reserve(ids.size());
    columns.reserve(ids.size() + 1);
    for (std::size_t d = 0; d < ids.size(); ++d) {
        dimensions.push_back(resolve_dimension(doc, ids[d]));
        if (sizes && dimensions.back().size() != (*sizes)[d]) {
            throw StatcubeException(ErrorCode::SHAPE_MISMATCH,
                                    std::to_string(dimensions.back().size()) + " categories for size " +
                                    std::to_string((*sizes)[d]), ids[d]);
        }
        columns.push_back(dimension_name(doc, ids[d], naming));
    }
    columns.push_back(value_key);

    const boost::json::array values = resolve_values(doc, value_key);
    if (ids.empty() && values.empty()) {
        // Encoded from a table with no rows
        return Table(std::move(columns));
    }
    const RowGenerator rows(std::move(dimensions), naming);
    if (rows.size() != values.size()) {
        throw StatcubeException(ErrorCode::SHAPE_MISMATCH,
                                std::to_string(rows.size()) + " category combinations for " +
                                std::to_string(values.size()) + " values", value_key);
    }

    Table table(std::move(columns));
    table.reserve(rows.size());
    for (auto it = rows.begin(); it != rows.end(); ++it) {
        Row row;
        row.reserve(it->size() + 1);
        for (const auto& name : *it) {
            row.emplace_back(boost::json::string(name));
        }
        row.push_back(values[it.ordinal()]);
        table.add_row(std::move(row));
    }
    return table;
}

std::vector<Table> decode_bundle(const boost::json::value& bundle, Naming naming,
                                 const std::string& value_key) {
    std::vector<Table> tables;

    if (const auto* list = bundle.if_array()) {
        for (const auto& element : *list) {
            decode_object(as_document(element), naming, value_key, tables);
        }
        return tables;
    }

    decode_object(as_document(bundle), naming, value_key, tables);
    return tables;
}

} // namespace statcube
