#pragma once

#include "statcube/dimension.hpp"
#include "statcube/types.hpp"

#include <cstddef>
#include <iterator>
#include <string>
#include <vector>

namespace statcube {

/**
 * Lazy enumeration of every category combination, one category per dimension,
 * in row-major order: dimension 0 outermost, the last dimension fastest.
 *
 * Iteration is an odometer (one counter per dimension, the innermost one
 * increments and carries outward), so any number of dimensions works. The
 * range is restartable: each begin() starts over from the first row.
 * Zero dimensions yield one empty row; an empty dimension yields no rows.
 */
class RowGenerator {
public:
    using Row = std::vector<std::string>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Row;
        using difference_type = std::ptrdiff_t;
        using pointer = const Row*;
        using reference = const Row&;

        iterator() = default;

        reference operator*() const { return row_; }
        pointer operator->() const { return &row_; }

        iterator& operator++();
        iterator operator++(int) {
            iterator previous = *this;
            ++(*this);
            return previous;
        }

        // Ordinal of the current row, which equals its flat value index
        std::size_t ordinal() const noexcept { return ordinal_; }

        bool operator==(const iterator& other) const noexcept {
            return owner_ == other.owner_ && ordinal_ == other.ordinal_;
        }
        bool operator!=(const iterator& other) const noexcept { return !(*this == other); }

    private:
        friend class RowGenerator;
        iterator(const RowGenerator* owner, std::size_t ordinal);

        const RowGenerator* owner_ = nullptr;
        std::size_t ordinal_ = 0;
        std::vector<std::size_t> counters_;
        Row row_;
    };

    RowGenerator(std::vector<std::vector<Category>> dimensions, Naming naming);

    iterator begin() const;
    iterator end() const;

    // Product of the dimension cardinalities
    std::size_t size() const noexcept { return size_; }

    std::vector<Row> materialize() const;

private:
    const std::string& name(std::size_t dimension, std::size_t position) const {
        return category_name(dimensions_[dimension][position], naming_);
    }

    std::vector<std::vector<Category>> dimensions_;
    Naming naming_;
    std::size_t size_;
};

} // namespace statcube
