// =============================================================================
// Shared JSON-stat samples and mocks for the statcube test suites
// =============================================================================

#pragma once

#include <gmock/gmock.h>
#include <boost/json.hpp>

#include "statcube/io/fetcher.hpp"

#include <string>

namespace statcube::test_data {

// area (list index) x year (mapping index declared out of order), dense values
inline const char* const kPopulation20 = R"({
    "version": "2.0",
    "class": "dataset",
    "label": "Population",
    "id": ["area", "year"],
    "size": [2, 2],
    "dimension": {
        "area": {
            "label": "Area",
            "category": {
                "index": ["CA", "US"],
                "label": {"CA": "Canada", "US": "United States"}
            }
        },
        "year": {
            "label": "",
            "category": {
                "index": {"2020": 1, "2019": 0}
            }
        }
    },
    "value": [1, 2, 3, 4]
})";

// 1.x bundle: id/size nested under dimension, sparse values, constant dimension
inline const char* const kUnemployment13 = R"({
    "dataset": {
        "label": "Unemployment",
        "dimension": {
            "id": ["concept", "sex", "age"],
            "size": [1, 2, 2],
            "concept": {
                "label": "Concept",
                "category": {"label": {"UNR": "Unemployment rate"}}
            },
            "sex": {
                "label": "Sex",
                "category": {
                    "index": {"M": 0, "F": 1},
                    "label": {"F": "Female", "M": "Male"}
                }
            },
            "age": {
                "label": "Age",
                "category": {
                    "index": ["Y15-24", "Y25-74"],
                    "label": {"Y15-24": "15 to 24", "Y25-74": "25 to 74"}
                }
            }
        },
        "value": {"0": 10.5, "3": 4.25}
    }
})";

inline boost::json::object parse_object(const char* text) {
    return boost::json::parse(text).as_object();
}

class MockFetcher : public Fetcher {
public:
    MOCK_METHOD(boost::json::value, fetch, (const std::string& url), (const, override));
};

} // namespace statcube::test_data
