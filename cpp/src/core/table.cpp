#include "statcube/table.hpp"
#include "statcube/error.hpp"

#include <utility>

namespace statcube {

Table::Table(std::vector<std::string> columns)
    : columns_(std::move(columns)) {}

Table::Table(std::vector<std::string> columns, std::vector<Row> rows)
    : columns_(std::move(columns)) {
    rows_.reserve(rows.size());
    for (auto& row : rows) {
        add_row(std::move(row));
    }
}

void Table::add_row(Row row) {
    if (row.size() != columns_.size()) {
        throw StatcubeException(ErrorCode::SHAPE_MISMATCH,
                                "row has " + std::to_string(row.size()) + " cells, table has " +
                                std::to_string(columns_.size()) + " columns",
                                std::to_string(rows_.size()));
    }
    rows_.push_back(std::move(row));
}

std::optional<std::size_t> Table::find_column(const std::string& name) const {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i] == name) return i;
    }
    return std::nullopt;
}

const Cell& Table::at(std::size_t row, std::size_t column) const {
    if (row >= rows_.size() || column >= columns_.size()) {
        throw IndexOutOfRangeError("cell outside table",
                                   std::to_string(row) + "," + std::to_string(column));
    }
    return rows_[row][column];
}

bool Table::operator==(const Table& other) const {
    return columns_ == other.columns_ && rows_ == other.rows_;
}

} // namespace statcube
