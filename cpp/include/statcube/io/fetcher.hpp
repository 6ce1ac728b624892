#pragma once

#include <boost/json.hpp>

#include <string>

namespace statcube {

/**
 * Retrieval of remote JSON-stat documents.
 *
 * fetch() returns the deserialized body of `url` or throws HttpError
 * (non-2xx status), InvalidUrlError (malformed or unsupported URL) or
 * NetworkError (anything else on the wire). Malformed JSON bodies propagate
 * the parser's boost::system::system_error. Implementations do not retry.
 */
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual boost::json::value fetch(const std::string& url) const = 0;
};

} // namespace statcube
