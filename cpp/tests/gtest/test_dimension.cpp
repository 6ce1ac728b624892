// =============================================================================
// Dimension Resolution Tests
// =============================================================================

#include <gtest/gtest.h>
#include "statcube/error.hpp"
#include "statcube/dimension.hpp"
#include "statcube_test_data.hpp"

using namespace statcube;
using namespace statcube::test_data;

class DimensionTest : public ::testing::Test {
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

TEST_F(DimensionTest, ListIndexWithLabels) {
    auto cats = resolve_dimension(population_, "area");
    ASSERT_EQ(cats.size(), 2u);
    EXPECT_EQ(cats[0], (Category{"CA", "Canada", 0}));
    EXPECT_EQ(cats[1], (Category{"US", "United States", 1}));
}

// Mapping declared as {"2020": 1, "2019": 0} comes back sorted by position,
// and ids without a label stand in for it
TEST_F(DimensionTest, MappingIndexSortedAndLabelFallback) {
    auto cats = resolve_dimension(population_, "year");
    ASSERT_EQ(cats.size(), 2u);
    EXPECT_EQ(cats[0], (Category{"2019", "2019", 0}));
    EXPECT_EQ(cats[1], (Category{"2020", "2020", 1}));
}

TEST_F(DimensionTest, ConstantDimensionWithoutIndex) {
    auto cats = resolve_dimension(unemployment(), "concept");
    ASSERT_EQ(cats.size(), 1u);
    EXPECT_EQ(cats[0], (Category{"UNR", "Unemployment rate", 0}));
    EXPECT_EQ(category_position(unemployment(), "concept", "UNR"), 0u);
    EXPECT_FALSE(category_position(unemployment(), "concept", "EMP").has_value());
}

// Label order in the document does not influence category order
TEST_F(DimensionTest, LabelOrderIgnored) {
    auto cats = resolve_dimension(unemployment(), "sex");
    ASSERT_EQ(cats.size(), 2u);
    EXPECT_EQ(cats[0].id, "M");
    EXPECT_EQ(cats[0].label, "Male");
    EXPECT_EQ(cats[1].id, "F");
    EXPECT_EQ(cats[1].label, "Female");
}

TEST_F(DimensionTest, CategoryPosition) {
    EXPECT_EQ(category_position(population_, "area", "US"), 1u);
    EXPECT_EQ(category_position(population_, "year", "2019"), 0u);
    EXPECT_FALSE(category_position(population_, "area", "MX").has_value());
}

TEST_F(DimensionTest, CategoryIndexForms) {
    auto list = CategoryIndex::from_json(boost::json::parse(R"(["x", "y", "z"])"), "d");
    EXPECT_EQ(list.form(), CategoryIndex::Form::List);
    EXPECT_EQ(list.size(), 3u);
    EXPECT_EQ(list.position_of("z"), 2u);

    auto mapping = CategoryIndex::from_json(boost::json::parse(R"({"y": 1, "x": 0})"), "d");
    EXPECT_EQ(mapping.form(), CategoryIndex::Form::Mapping);
    EXPECT_EQ(mapping.position_of("y"), 1u);
    EXPECT_FALSE(mapping.position_of("z").has_value());
}

TEST_F(DimensionTest, CategoryIndexRejectsBadPositions) {
    EXPECT_THROW(CategoryIndex::from_json(boost::json::parse(R"({"x": -1})"), "d"),
                 MalformedDimensionError);
    EXPECT_THROW(CategoryIndex::from_json(boost::json::parse(R"({"x": "first"})"), "d"),
                 MalformedDimensionError);
    EXPECT_THROW(CategoryIndex::from_json(boost::json::parse("42"), "d"), MalformedDimensionError);
}

TEST_F(DimensionTest, MissingIndexAndLabel) {
    auto doc = parse_object(R"({"id": ["d"], "size": [1], "dimension": {"d": {"category": {}}}})");
    try {
        resolve_dimension(doc, "d");
        FAIL() << "expected MalformedDimension";
    } catch (const MalformedDimensionError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MALFORMED_DIMENSION);
        EXPECT_EQ(e.context(), "d");
    }
}

TEST_F(DimensionTest, UnknownDimension) {
    EXPECT_THROW(resolve_dimension(population_, "sex"), MalformedDimensionError);
}

TEST_F(DimensionTest, DimensionDocumentIsItsOwnDescriptor) {
    auto doc = parse_object(R"({
        "version": "2.0", "class": "dimension", "label": "Sex",
        "category": {"index": ["T", "F"], "label": {"T": "Total", "F": "Female"}}
    })");
    auto cats = resolve_dimension(doc, "sex");
    ASSERT_EQ(cats.size(), 2u);
    EXPECT_EQ(cats[1], (Category{"F", "Female", 1}));
}

TEST_F(DimensionTest, DimensionName) {
    EXPECT_EQ(dimension_name(population_, "area", Naming::Label), "Area");
    EXPECT_EQ(dimension_name(population_, "area", Naming::Id), "area");
    // Empty label falls back to the id
    EXPECT_EQ(dimension_name(population_, "year", Naming::Label), "year");
}

TEST_F(DimensionTest, CategoryName) {
    Category c{"US", "United States", 1};
    EXPECT_EQ(category_name(c, Naming::Label), "United States");
    EXPECT_EQ(category_name(c, Naming::Id), "US");
}

TEST_F(DimensionTest, CategoryIndexRejectsHugePosition) {
    EXPECT_THROW(CategoryIndex::from_json(boost::json::parse(R"({"x": 1e300})"), "d"),
                 MalformedDimensionError);
    EXPECT_THROW(CategoryIndex::from_json(boost::json::parse(R"({"x": 18446744073709551616.0})"), "d"),
                 MalformedDimensionError);
}
