// =============================================================================
// Collection Traversal Tests
// =============================================================================

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "statcube/collection.hpp"
#include "statcube/error.hpp"
#include "statcube_test_data.hpp"

#include <memory>

using namespace statcube;
using namespace statcube::test_data;
using ::testing::_;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

// Remote dataset, remote dimension, nested collection with an inline dataset
const char* const kCollection = R"({
    "version": "2.0",
    "class": "collection",
    "label": "Statistics",
    "link": {
        "item": [
            {"class": "dataset", "href": "https://example.org/pop.json", "label": "Population"},
            {"class": "dimension", "href": "https://example.org/sex.json", "label": "Sex"},
            {
                "class": "collection",
                "href": "https://example.org/labour",
                "label": "Labour",
                "link": {
                    "item": [
                        {
                            "class": "dataset",
                            "href": "https://example.org/labour/hours.json",
                            "label": "Hours",
                            "id": ["sector"],
                            "size": [2],
                            "dimension": {
                                "sector": {
                                    "label": "Sector",
                                    "category": {"index": ["A", "B"]}
                                }
                            },
                            "value": [38.5, 40]
                        }
                    ]
                }
            }
        ]
    }
})";

const char* const kSexDimension = R"({
    "version": "2.0",
    "class": "dimension",
    "label": "Sex",
    "category": {"index": ["F", "M"], "label": {"F": "Female", "M": "Male"}}
})";

} // anonymous namespace

class CollectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        collection_ = std::make_unique<Document>(
            read(DocumentClass::Collection, boost::json::parse(kCollection)));
    }
    void TearDown() override {}

    std::unique_ptr<Document> collection_;
    StrictMock<MockFetcher> fetcher_;
};

TEST_F(CollectionTest, Size) {
    EXPECT_EQ(collection_size(*collection_), 3u);
}

TEST_F(CollectionTest, ItemFetchedByHref) {
    EXPECT_CALL(fetcher_, fetch("https://example.org/sex.json"))
        .WillOnce(Return(boost::json::parse(kSexDimension)));

    Document item = collection_item(*collection_, 1, fetcher_);
    EXPECT_EQ(item.document_class(), DocumentClass::Dimension);

    Table table = write_table(item);
    EXPECT_EQ(table.columns(), (std::vector<std::string>{"id", "Sex", "index"}));
    EXPECT_EQ(table.rows()[1], (Row{"M", "Male", 1}));
}

// Embedded content is used without a round trip
TEST_F(CollectionTest, InlineItem) {
    Document nested = collection_item(*collection_, 2, fetcher_);
    EXPECT_EQ(nested.document_class(), DocumentClass::Collection);
    EXPECT_EQ(collection_size(nested), 1u);

    Document hours = collection_item(nested, 0, fetcher_);
    EXPECT_EQ(hours.document_class(), DocumentClass::Dataset);
    EXPECT_EQ(write_table(hours).rows()[0], (Row{"A", 38.5}));
}

TEST_F(CollectionTest, ItemOutOfRange) {
    EXPECT_THROW(collection_item(*collection_, 3, fetcher_), IndexOutOfRangeError);
}

TEST_F(CollectionTest, ItemWithoutContentOrHref) {
    Document broken = read(DocumentClass::Collection, boost::json::parse(R"({
        "class": "collection",
        "link": {"item": [{"class": "dataset", "label": "Orphan"}]}
    })"));
    try {
        collection_item(broken, 0, fetcher_);
        FAIL() << "expected MalformedDocument";
    } catch (const StatcubeException& e) {
        EXPECT_EQ(e.code(), ErrorCode::MALFORMED_DOCUMENT);
        EXPECT_EQ(e.context(), "Orphan");
    }
}

// Depth-first walk: the dimension item is skipped and never fetched
TEST_F(CollectionTest, WriteTablesWalksNestedCollections) {
    EXPECT_CALL(fetcher_, fetch("https://example.org/pop.json"))
        .WillOnce(Return(boost::json::parse(kPopulation20)));

    auto logger = Logger::null();
    auto tables = write_tables(*collection_, fetcher_, *logger, Naming::Id);

    ASSERT_EQ(tables.size(), 2u);
    EXPECT_EQ(tables[0].columns(), (std::vector<std::string>{"area", "year", "value"}));
    EXPECT_EQ(tables[0].row_count(), 4u);
    EXPECT_EQ(tables[1].columns(), (std::vector<std::string>{"sector", "value"}));
    EXPECT_EQ(tables[1].at(1, 1), boost::json::value(40));
}

TEST_F(CollectionTest, WriteTablesRequiresCollection) {
    Document dataset = read(DocumentClass::Dataset, boost::json::parse(kPopulation20));
    auto logger = Logger::null();
    try {
        write_tables(dataset, fetcher_, *logger);
        FAIL() << "expected UnsupportedOutputFormat";
    } catch (const StatcubeException& e) {
        EXPECT_EQ(e.code(), ErrorCode::UNSUPPORTED_OUTPUT_FORMAT);
    }
}

TEST_F(CollectionTest, FetchFailureAbortsWalk) {
    EXPECT_CALL(fetcher_, fetch(_))
        .WillOnce(::testing::Throw(NetworkError("connection refused", "https://example.org/pop.json")));

    auto logger = Logger::null();
    EXPECT_THROW(write_tables(*collection_, fetcher_, *logger), NetworkError);
}
