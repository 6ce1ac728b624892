#include "statcube/io/http_fetcher.hpp"
#include "statcube/error.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <limits>
#include <utility>

namespace statcube {

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Run one asynchronous operation to completion. The stream deadline set with
// expires_after() bounds the wait; an expired deadline completes with error::timeout.
template<typename Initiate>
beast::error_code run_operation(asio::io_context& ioc, Initiate&& initiate) {
    beast::error_code result = asio::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

void check(const beast::error_code& ec) {
    if (ec) {
        throw beast::system_error(ec);
    }
}

tcp::resolver::results_type resolve(asio::io_context& ioc, const Url& url,
                                    std::chrono::seconds timeout) {
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type endpoints;
    beast::error_code result = asio::error::would_block;
    resolver.async_resolve(url.host, std::to_string(url.port),
                           [&](beast::error_code ec, tcp::resolver::results_type found) {
                               result = ec;
                               endpoints = std::move(found);
                           });
    ioc.restart();
    ioc.run_for(timeout);
    if (result == asio::error::would_block) {
        resolver.cancel();
        ioc.restart();
        ioc.run();
        throw beast::system_error(beast::error_code(beast::error::timeout));
    }
    check(result);
    return endpoints;
}

template<typename Stream>
void exchange(asio::io_context& ioc, Stream& stream, const http::request<http::empty_body>& request,
              http::response<http::string_body>& response) {
    check(run_operation(ioc, [&](auto handler) { http::async_write(stream, request, handler); }));

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit((std::numeric_limits<std::uint64_t>::max)());
    check(run_operation(ioc, [&](auto handler) { http::async_read(stream, buffer, parser, handler); }));
    response = parser.release();
}

// Resolve a Location header against the URL that produced it
std::string redirect_target(const Url& from, const std::string& location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }
    std::string base = from.scheme + "://" + from.host;
    bool default_port = (from.secure() && from.port == 443) || (!from.secure() && from.port == 80);
    if (!default_port) {
        base += ":" + std::to_string(from.port);
    }
    if (!location.empty() && location.front() == '/') {
        return base + location;
    }
    std::string path = from.target.substr(0, from.target.find('?'));
    return base + path.substr(0, path.rfind('/') + 1) + location;
}

} // anonymous namespace

Url parse_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw InvalidUrlError("missing scheme", url);
    }

    Url result;
    result.scheme = to_lower(url.substr(0, scheme_end));
    if (result.scheme != "http" && result.scheme != "https") {
        throw InvalidUrlError("unsupported scheme " + result.scheme, url);
    }

    const auto authority_begin = scheme_end + 3;
    const auto authority_end = url.find_first_of("/?#", authority_begin);
    std::string authority = url.substr(authority_begin, authority_end - authority_begin);
    if (authority.find('@') != std::string::npos) {
        authority = authority.substr(authority.rfind('@') + 1);
    }

    result.port = result.secure() ? 443 : 80;
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']', colon) == std::string::npos) {
        const std::string port = authority.substr(colon + 1);
        if (port.empty() || port.size() > 5 ||
            !std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            throw InvalidUrlError("bad port", url);
        }
        const unsigned long number = std::stoul(port);
        if (number == 0 || number > 65535) {
            throw InvalidUrlError("bad port", url);
        }
        result.port = static_cast<uint16_t>(number);
        authority = authority.substr(0, colon);
    }
    if (authority.size() > 1 && authority.front() == '[' && authority.back() == ']') {
        authority = authority.substr(1, authority.size() - 2);
    }
    if (authority.empty()) {
        throw InvalidUrlError("missing host", url);
    }
    result.host = authority;

    if (authority_end == std::string::npos) {
        result.target = "/";
    } else {
        result.target = url.substr(authority_end, url.find('#', authority_end) - authority_end);
        if (result.target.empty() || result.target.front() != '/') {
            result.target.insert(result.target.begin(), '/');
        }
    }
    return result;
}

HttpFetcher::HttpFetcher(FetchConfig config, std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , logger_(logger ? std::move(logger) : Logger::null()) {}

HttpFetcher::Response HttpFetcher::get(const Url& url) const {
    asio::io_context ioc;
    const auto timeout = std::chrono::seconds(config_.timeout_seconds);

    http::request<http::empty_body> request{http::verb::get, url.target, 11};
    request.set(http::field::host, url.host);
    request.set(http::field::user_agent, config_.user_agent);
    request.set(http::field::accept, "application/json");

    http::response<http::string_body> response;
    const auto endpoints = resolve(ioc, url, timeout);

    // One deadline covers connect, handshake, request and response
    if (url.secure()) {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(config_.verify_peer ? ssl::verify_peer : ssl::verify_none);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str())) {
            throw beast::system_error(
                beast::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
        }
        if (config_.verify_peer) {
            stream.set_verify_callback(ssl::host_name_verification(url.host));
        }

        beast::get_lowest_layer(stream).expires_after(timeout);
        check(run_operation(ioc, [&](auto handler) {
            beast::get_lowest_layer(stream).async_connect(endpoints, handler);
        }));
        check(run_operation(ioc, [&](auto handler) {
            stream.async_handshake(ssl::stream_base::client, handler);
        }));
        exchange(ioc, stream, request, response);

        // peers routinely drop the connection instead of a close_notify
        run_operation(ioc, [&](auto handler) { stream.async_shutdown(handler); });
    } else {
        beast::tcp_stream stream(ioc);
        stream.expires_after(timeout);
        check(run_operation(ioc, [&](auto handler) { stream.async_connect(endpoints, handler); }));
        exchange(ioc, stream, request, response);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    Response result;
    result.status = static_cast<int>(response.result_int());
    result.reason = std::string(response.reason());
    if (auto location = response.find(http::field::location); location != response.end()) {
        result.location = std::string(location->value());
    }
    result.body = std::move(response.body());
    return result;
}

boost::json::value HttpFetcher::fetch(const std::string& url) const {
    std::string current = url;

    for (uint32_t redirects = 0;; ++redirects) {
        const Url parsed = parse_url(current);
        logger_->debug("GET " + current);

        Response response;
        try {
            response = get(parsed);
        } catch (const boost::system::system_error& e) {
            logger_->error("fetch: NetworkError = " + std::string(e.what()) + " " + current);
            throw NetworkError(e.what(), current);
        }

        if (response.status >= 300 && response.status < 400 && !response.location.empty()) {
            if (redirects >= config_.max_redirects) {
                logger_->error("fetch: too many redirects " + url);
                throw NetworkError("too many redirects", url);
            }
            current = redirect_target(parsed, response.location);
            logger_->info("fetch: " + std::to_string(response.status) + " redirect to " + current);
            continue;
        }

        if (response.status < 200 || response.status >= 300) {
            logger_->error("fetch: HTTPError = " + std::to_string(response.status) + " " +
                           response.reason + " " + current);
            throw HttpError(response.status, response.reason, current);
        }

        logger_->debug("fetch: " + std::to_string(response.body.size()) + " bytes from " + current);
        return boost::json::parse(response.body);
    }
}

} // namespace statcube
