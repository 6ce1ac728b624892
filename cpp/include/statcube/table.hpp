#pragma once

#include <boost/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace statcube {

// A cell holds a category (string or number) or a value (number, string or null)
using Cell = boost::json::value;
using Row = std::vector<Cell>;

/**
 * Flat row-oriented table: named columns, rows of equal width.
 * Column names need not be unique; the encoder rejects duplicates itself.
 */
class Table {
public:
    Table() = default;
    explicit Table(std::vector<std::string> columns);
    Table(std::vector<std::string> columns, std::vector<Row> rows);

    const std::vector<std::string>& columns() const noexcept { return columns_; }
    const std::vector<Row>& rows() const noexcept { return rows_; }

    std::size_t column_count() const noexcept { return columns_.size(); }
    std::size_t row_count() const noexcept { return rows_.size(); }
    bool empty() const noexcept { return rows_.empty(); }

    // Throws ShapeMismatch when the row width differs from the column count
    void add_row(Row row);
    void reserve(std::size_t rows) { rows_.reserve(rows); }

    // First column with this name
    std::optional<std::size_t> find_column(const std::string& name) const;

    const Cell& at(std::size_t row, std::size_t column) const;

    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::vector<std::string> columns_;
    std::vector<Row> rows_;
};

} // namespace statcube
