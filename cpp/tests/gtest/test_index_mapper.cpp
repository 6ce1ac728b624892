// =============================================================================
// Index Mapper Tests
// =============================================================================

#include <gtest/gtest.h>
#include "statcube/error.hpp"
#include "statcube/index_mapper.hpp"
#include "statcube_test_data.hpp"

#include <vector>

using namespace statcube;
using namespace statcube::test_data;

class IndexMapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        population_ = parse_object(kPopulation20);
        unemployment_ = parse_object(kUnemployment13);
    }
    void TearDown() override {}

    const boost::json::object& unemployment() const {
        return unemployment_.at("dataset").as_object();
    }

    boost::json::object population_;
    boost::json::object unemployment_;
};

// Row-major: the last dimension varies fastest
TEST_F(IndexMapperTest, FlatIndexRowMajor) {
    const std::vector<std::size_t> sizes = {2, 3};
    EXPECT_EQ(flat_index({0, 0}, sizes), 0u);
    EXPECT_EQ(flat_index({0, 2}, sizes), 2u);
    EXPECT_EQ(flat_index({1, 0}, sizes), 3u);
    EXPECT_EQ(flat_index({1, 2}, sizes), 5u);
}

TEST_F(IndexMapperTest, FlatIndexOfNoDimensionsIsZero) {
    EXPECT_EQ(flat_index({}, {}), 0u);
}

TEST_F(IndexMapperTest, FlatIndexRejectsOutOfRangePosition) {
    EXPECT_THROW(flat_index({2, 0}, {2, 3}), IndexOutOfRangeError);
    EXPECT_THROW(flat_index({0, 3}, {2, 3}), IndexOutOfRangeError);
}

TEST_F(IndexMapperTest, FlatIndexRejectsArityMismatch) {
    try {
        flat_index({0}, {2, 3});
        FAIL() << "expected ShapeMismatch";
    } catch (const StatcubeException& e) {
        EXPECT_EQ(e.code(), ErrorCode::SHAPE_MISMATCH);
    }
}

// Every flat index of a 2x3x4 cube maps back to the same positions
TEST_F(IndexMapperTest, DimensionPositionsInvertsFlatIndex) {
    const std::vector<std::size_t> sizes = {2, 3, 4};
    for (std::size_t flat = 0; flat < 24; ++flat) {
        EXPECT_EQ(flat_index(dimension_positions(flat, sizes), sizes), flat);
    }
    EXPECT_EQ(dimension_positions(23, sizes), (std::vector<std::size_t>{1, 2, 3}));
    EXPECT_THROW(dimension_positions(24, sizes), IndexOutOfRangeError);
}

TEST_F(IndexMapperTest, DimensionIndicesUsesDeclaredOrder) {
    // Query order does not matter; the result follows the id list
    CategoryQuery query = {{"year", "2020"}, {"area", "US"}};
    EXPECT_EQ(dimension_indices(query, population_), (std::vector<std::size_t>{1, 1}));
}

TEST_F(IndexMapperTest, DimensionIndicesRejectsUnknownCategory) {
    CategoryQuery query = {{"area", "MX"}, {"year", "2020"}};
    try {
        dimension_indices(query, population_);
        FAIL() << "expected UnknownCategory";
    } catch (const StatcubeException& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNKNOWN_CATEGORY);
        EXPECT_EQ(e.context(), "MX");
    }
}

TEST_F(IndexMapperTest, DimensionIndicesRejectsIncompleteQuery) {
    CategoryQuery query = {{"area", "CA"}};
    try {
        dimension_indices(query, population_);
        FAIL() << "expected IncompleteQuery";
    } catch (const StatcubeException& e) {
        EXPECT_EQ(e.code(), ErrorCode::INCOMPLETE_QUERY);
        EXPECT_EQ(e.context(), "year");
    }
}

TEST_F(IndexMapperTest, PointLookupFindsCell) {
    EXPECT_EQ(point_lookup(population_, {{"area", "US"}, {"year", "2020"}}), boost::json::value(4));
    EXPECT_EQ(point_lookup(population_, {{"area", "CA"}, {"year", "2019"}}), boost::json::value(1));
    EXPECT_EQ(point_lookup(population_, {{"area", "US"}, {"year", "2019"}}), boost::json::value(3));
}

TEST_F(IndexMapperTest, ValueAtPositions) {
    EXPECT_EQ(value_at(population_, {1, 1}), boost::json::value(4));
    EXPECT_EQ(value_at(population_, {0, 1}), boost::json::value(2));
}

// Sparse 1.x values: unmapped cells read back as null
TEST_F(IndexMapperTest, PointLookupOnSparseLegacyDataset) {
    const auto& cube = unemployment();
    EXPECT_EQ(point_lookup(cube, {{"concept", "UNR"}, {"sex", "M"}, {"age", "Y15-24"}}),
              boost::json::value(10.5));
    EXPECT_EQ(point_lookup(cube, {{"concept", "UNR"}, {"sex", "F"}, {"age", "Y25-74"}}),
              boost::json::value(4.25));
    EXPECT_TRUE(point_lookup(cube, {{"concept", "UNR"}, {"sex", "M"}, {"age", "Y25-74"}}).is_null());
}

TEST_F(IndexMapperTest, ValueByIndexPastEnd) {
    EXPECT_THROW(value_by_index(population_, 4), IndexOutOfRangeError);
}
