#include "statcube/row_generator.hpp"
#include "statcube/cube.hpp"

#include <utility>

namespace statcube {

RowGenerator::RowGenerator(std::vector<std::vector<Category>> dimensions, Naming naming)
    : dimensions_(std::move(dimensions))
    , naming_(naming)
    , size_(0) {
    std::vector<std::size_t> cardinalities;
    cardinalities.reserve(dimensions_.size());
    for (const auto& dimension : dimensions_) {
        cardinalities.push_back(dimension.size());
    }
    size_ = cell_count(cardinalities);
}

RowGenerator::iterator::iterator(const RowGenerator* owner, std::size_t ordinal)
    : owner_(owner)
    , ordinal_(ordinal) {
    if (ordinal_ >= owner_->size_) {
        return;
    }
    const std::size_t n = owner_->dimensions_.size();
    counters_.assign(n, 0);
    row_.reserve(n);
    for (std::size_t d = 0; d < n; ++d) {
        row_.push_back(owner_->name(d, 0));
    }
}

RowGenerator::iterator& RowGenerator::iterator::operator++() {
    ++ordinal_;
    if (ordinal_ >= owner_->size_) {
        counters_.clear();
        row_.clear();
        return *this;
    }

    // Odometer step: bump the innermost counter, carry while it wraps
    for (std::size_t d = counters_.size(); d-- > 0;) {
        if (++counters_[d] < owner_->dimensions_[d].size()) {
            row_[d] = owner_->name(d, counters_[d]);
            break;
        }
        counters_[d] = 0;
        row_[d] = owner_->name(d, 0);
    }
    return *this;
}

RowGenerator::iterator RowGenerator::begin() const {
    return iterator(this, 0);
}

RowGenerator::iterator RowGenerator::end() const {
    return iterator(this, size_);
}

std::vector<RowGenerator::Row> RowGenerator::materialize() const {
    std::vector<Row> rows;
    rows.reserve(size_);
    for (const auto& row : *this) {
        rows.push_back(row);
    }
    return rows;
}

} // namespace statcube
