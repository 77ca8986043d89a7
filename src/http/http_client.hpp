#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/filesystem.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "fetch_error.hpp"
#include "../listing/listing.hpp"

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;

// Anything that can turn a url into a response body. The resilient fetcher
// and the listing service only see this, tests plug in their own.
class HttpTransport {
    public:
        virtual ~HttpTransport() = default;

        virtual net::awaitable<FetchResult> fetch(
            const std::string& url,
            const std::optional<Credentials>& credentials,
            std::chrono::seconds timeout
        ) = 0;
};

// bytes received so far, total when the server sent a Content-Length
using ProgressFn = std::function<void(std::uint64_t, std::optional<std::uint64_t>)>;

class HttpClient : public HttpTransport {
    public:
        HttpClient();
        ~HttpClient() override {};

        net::awaitable<FetchResult> fetch(
            const std::string& url,
            const std::optional<Credentials>& credentials,
            std::chrono::seconds timeout
        ) override;

        // One GET without retries, nullopt when the server answered with a
        // non error status.
        net::awaitable<std::optional<FetchError>> probe(
            const std::string& url,
            const std::optional<Credentials>& credentials,
            std::chrono::seconds timeout = std::chrono::seconds(10)
        );

        // Streams the response body into `dest`. The file is only created
        // once a 2xx header arrived, on failure after that the partial file
        // is left for the caller to clean up.
        net::awaitable<std::optional<FetchError>> download(
            const std::string& url,
            const std::optional<Credentials>& credentials,
            const boost::filesystem::path& dest,
            ProgressFn progress,
            std::chrono::seconds timeout = std::chrono::hours(24)
        );

        // Aborts the request in flight, if any. It completes with
        // operation_aborted, later requests are not affected.
        void cancel();

    private:
        struct Target {
            bool tls = false;
            std::string host;        // what the resolver gets, no brackets
            std::string host_header; // host[:port] as written in the url
            std::string port;
            std::string path;
        };

        // What came back from a single request, before redirects are applied.
        struct Hop {
            beast::error_code ec;
            unsigned status = 0;
            std::string location;
            std::string body;
            std::optional<FetchError> error; // set when the exchange itself failed
        };

        ssl::context ssl_ctx_;
        std::function<void()> abort_active_;

        static std::optional<Target> split_url(const std::string& url);
        static std::string basic_auth(const Credentials& credentials);

        net::awaitable<Hop> do_request(
            const Target& target,
            const std::optional<Credentials>& credentials,
            std::chrono::seconds timeout,
            const boost::filesystem::path* sink,
            const ProgressFn& progress
        );

        template <class Stream>
        net::awaitable<Hop> do_exchange(
            Stream& stream,
            const Target& target,
            const std::optional<Credentials>& credentials,
            const boost::filesystem::path* sink,
            const ProgressFn& progress
        );

        net::awaitable<Hop> follow(
            std::string url,
            const std::optional<Credentials>& credentials,
            std::chrono::seconds timeout,
            const boost::filesystem::path* sink,
            const ProgressFn& progress
        );
};
