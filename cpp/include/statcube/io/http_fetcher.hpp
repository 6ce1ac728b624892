#pragma once

#include "statcube/config.hpp"
#include "statcube/io/fetcher.hpp"
#include "statcube/logging.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace statcube {

struct Url {
    std::string scheme;   // lower case: http or https
    std::string host;
    uint16_t port = 0;
    std::string target;   // path and query, at least "/"

    bool secure() const noexcept { return scheme == "https"; }
};

/**
 * Split an absolute http(s) URL. Throws InvalidUrlError for malformed URLs
 * and for schemes this fetcher cannot speak (ftp, ftps, ...).
 */
Url parse_url(const std::string& url);

/**
 * Fetcher over Boost.Beast: one synchronous GET per call with
 * `Accept: application/json`, TLS for https, redirects followed up to
 * FetchConfig::max_redirects. No connection reuse and no retries.
 */
class HttpFetcher : public Fetcher {
public:
    HttpFetcher(FetchConfig config, std::shared_ptr<Logger> logger);

    boost::json::value fetch(const std::string& url) const override;

    const FetchConfig& config() const noexcept { return config_; }

private:
    struct Response {
        int status = 0;
        std::string reason;
        std::string location;
        std::string body;
    };

    Response get(const Url& url) const;

    FetchConfig config_;
    std::shared_ptr<Logger> logger_;
};

} // namespace statcube
