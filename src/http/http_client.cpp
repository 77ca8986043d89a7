#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/url.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

#include <memory>

#include "http_client.hpp"
#include "url.hpp"

#define SAMFTP_VERSION "0.1.0"
#define USER_AGENT "samftp/" SAMFTP_VERSION
#define MAX_REDIRECTS 10

namespace urls = boost::urls;
namespace fs   = boost::filesystem;
using tcp      = net::ip::tcp;

namespace {

// Keeps HttpClient::cancel pointed at the live stream for one request.
struct ActiveStream {
    std::function<void()>& slot;

    template <class Stream>
    ActiveStream(std::function<void()>& s, Stream& stream) : slot(s) {
        slot = [&stream] { beast::get_lowest_layer(stream).cancel(); };
    }
    ~ActiveStream() { slot = nullptr; }
};

} // namespace

HttpClient::HttpClient()
    : ssl_ctx_(ssl::context::tls_client)
{
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

std::optional<HttpClient::Target> HttpClient::split_url(const std::string& url) {
    auto u = urls::parse_uri(url);
    if (!u)
        return std::nullopt;

    Target t;
    if (u->scheme_id() == urls::scheme::https)
        t.tls = true;
    else if (u->scheme_id() != urls::scheme::http)
        return std::nullopt;

    t.host = std::string(u->encoded_host_address());
    if (t.host.empty())
        return std::nullopt;
    t.host_header = std::string(u->encoded_host_and_port());
    t.port = u->has_port() ? std::string(u->port()) : (t.tls ? "443" : "80");

    t.path = std::string(u->encoded_path());
    if (t.path.empty())
        t.path = "/";
    if (u->has_query())
        t.path += "?" + std::string(u->encoded_query());
    return t;
}

std::string HttpClient::basic_auth(const Credentials& credentials) {
    std::string plain = credentials.username + ":" + credentials.password;

    // EVP_EncodeBlock NUL terminates
    std::string encoded(4 * ((plain.size() + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()),
        reinterpret_cast<const unsigned char*>(plain.data()),
        static_cast<int>(plain.size()));
    encoded.resize(n);
    return "Basic " + encoded;
}

template <class Stream>
net::awaitable<HttpClient::Hop> HttpClient::do_exchange(
    Stream& stream,
    const Target& target,
    const std::optional<Credentials>& credentials,
    const fs::path* sink,
    const ProgressFn& progress)
{
    Hop hop;

    http::request<http::empty_body> req{http::verb::get, target.path, 11};
    req.set(http::field::host, target.host_header);
    req.set(http::field::user_agent, USER_AGENT);
    if (credentials)
        req.set(http::field::authorization, basic_auth(*credentials));

    co_await http::async_write(stream, req, net::redirect_error(net::use_awaitable, hop.ec));
    if (hop.ec)
        co_return hop;

    // Headers first, the body type depends on what they say
    beast::flat_buffer buffer;
    http::response_parser<http::empty_body> header;
    co_await http::async_read_header(stream, buffer, header, net::redirect_error(net::use_awaitable, hop.ec));
    if (hop.ec)
        co_return hop;

    hop.status = header.get().result_int();
    if (hop.status >= 300 && hop.status < 400) {
        auto it = header.get().find(http::field::location);
        if (it != header.get().end()) {
            hop.location = std::string(it->value());
            co_return hop;
        }
    }
    if (hop.status >= 400)
        co_return hop;

    if (sink == nullptr) {
        http::response_parser<http::string_body> parser{std::move(header)};
        parser.body_limit(boost::none);
        co_await http::async_read(stream, buffer, parser, net::redirect_error(net::use_awaitable, hop.ec));
        if (!hop.ec)
            hop.body = std::move(parser.get().body());
        co_return hop;
    }

    http::response_parser<http::file_body> parser{std::move(header)};
    parser.body_limit(boost::none);

    beast::error_code ec;
    parser.get().body().open(sink->string().c_str(), beast::file_mode::write, ec);
    if (ec) {
        hop.error = FetchError{FetchErrc::connection_error, 0,
            "Could not open " + sink->string() + ": " + ec.message()};
        co_return hop;
    }

    std::optional<std::uint64_t> total;
    if (auto len = parser.content_length())
        total = *len;

    std::uint64_t received = 0;
    while (!parser.is_done()) {
        auto n = co_await http::async_read_some(stream, buffer, parser,
            net::redirect_error(net::use_awaitable, hop.ec));
        if (hop.ec)
            co_return hop;
        received += n;
        if (progress)
            progress(received, total);
    }
    co_return hop;
}

net::awaitable<HttpClient::Hop> HttpClient::do_request(
    const Target& target,
    const std::optional<Credentials>& credentials,
    std::chrono::seconds timeout,
    const fs::path* sink,
    const ProgressFn& progress)
{
    auto executor = co_await net::this_coro::executor;
    Hop hop;

    // one deadline for the whole request, name lookup included
    auto deadline = net::steady_timer::clock_type::now() + timeout;

    auto resolver = std::make_shared<tcp::resolver>(executor);
    net::steady_timer resolve_timer(executor, deadline);
    resolve_timer.async_wait([weak = std::weak_ptr<tcp::resolver>(resolver)](const boost::system::error_code& ec) {
        if (ec)
            return;
        if (auto r = weak.lock())
            r->cancel();
    });
    abort_active_ = [weak = std::weak_ptr<tcp::resolver>(resolver)] {
        if (auto r = weak.lock())
            r->cancel();
    };

    auto results = co_await resolver->async_resolve(target.host, target.port,
        net::redirect_error(net::use_awaitable, hop.ec));
    abort_active_ = nullptr;
    bool expired = net::steady_timer::clock_type::now() >= deadline;
    resolve_timer.cancel();
    if (hop.ec == net::error::operation_aborted && expired)
        hop.ec = beast::error::timeout;
    if (hop.ec)
        co_return hop;

    if (!target.tls) {
        beast::tcp_stream stream(executor);
        ActiveStream active(abort_active_, stream);
        stream.expires_at(deadline);

        co_await stream.async_connect(results, net::redirect_error(net::use_awaitable, hop.ec));
        if (hop.ec)
            co_return hop;

        hop = co_await do_exchange(stream, target, credentials, sink, progress);

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        co_return hop;
    }

    beast::ssl_stream<beast::tcp_stream> stream(executor, ssl_ctx_);
    ActiveStream active(abort_active_, stream);

    // SNI, a lot of virtual hosts refuse the handshake without it
    if (!SSL_set_tlsext_host_name(stream.native_handle(), target.host.c_str())) {
        hop.ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        co_return hop;
    }
    stream.set_verify_callback(ssl::host_name_verification(target.host));

    beast::get_lowest_layer(stream).expires_at(deadline);
    co_await beast::get_lowest_layer(stream).async_connect(results,
        net::redirect_error(net::use_awaitable, hop.ec));
    if (hop.ec)
        co_return hop;

    co_await stream.async_handshake(ssl::stream_base::client,
        net::redirect_error(net::use_awaitable, hop.ec));
    if (hop.ec)
        co_return hop;

    hop = co_await do_exchange(stream, target, credentials, sink, progress);

    // plenty of servers just drop the connection, nothing to report
    beast::error_code ignored;
    co_await stream.async_shutdown(net::redirect_error(net::use_awaitable, ignored));
    co_return hop;
}

void HttpClient::cancel() {
    if (abort_active_)
        abort_active_();
}

net::awaitable<HttpClient::Hop> HttpClient::follow(
    std::string url,
    const std::optional<Credentials>& credentials,
    std::chrono::seconds timeout,
    const fs::path* sink,
    const ProgressFn& progress)
{
    std::string origin;
    for (int hops = 0; hops <= MAX_REDIRECTS; ++hops) {
        auto target = split_url(url);
        if (!target) {
            Hop hop;
            hop.error = FetchError{FetchErrc::connection_error, 0, "Request error: unsupported url " + url};
            co_return hop;
        }
        if (hops == 0)
            origin = target->host_header;

        // credentials never leave the host they were given for
        auto hop = co_await do_request(*target,
            target->host_header == origin ? credentials : std::nullopt,
            timeout, sink, progress);
        if (hop.ec || hop.error || hop.location.empty())
            co_return hop;

        auto next = resolve_url(url, hop.location);
        if (!next) {
            hop.error = FetchError{FetchErrc::connection_error, hop.status,
                "Request error: bad redirect to " + hop.location};
            co_return hop;
        }
        url = std::move(*next);
    }

    Hop hop;
    hop.error = FetchError{FetchErrc::connection_error, 0, "Request error: too many redirects"};
    co_return hop;
}

net::awaitable<FetchResult> HttpClient::fetch(
    const std::string& url,
    const std::optional<Credentials>& credentials,
    std::chrono::seconds timeout)
{
    Hop hop;
    std::optional<FetchError> failure;
    try {
        hop = co_await follow(url, credentials, timeout, nullptr, {});
    } catch (const std::exception& e) {
        failure = FetchError{FetchErrc::connection_error, 0, std::string("Request error: ") + e.what()};
    }

    if (failure)
        co_return *failure;
    if (hop.error)
        co_return *hop.error;
    if (hop.ec)
        co_return classify_transport_error(hop.ec, timeout);
    if (auto err = classify_status(hop.status, url))
        co_return *err;

    co_return std::move(hop.body);
}

net::awaitable<std::optional<FetchError>> HttpClient::probe(
    const std::string& url,
    const std::optional<Credentials>& credentials,
    std::chrono::seconds timeout)
{
    auto result = co_await fetch(url, credentials, timeout);
    if (auto* err = std::get_if<FetchError>(&result))
        co_return *err;
    co_return std::nullopt;
}

net::awaitable<std::optional<FetchError>> HttpClient::download(
    const std::string& url,
    const std::optional<Credentials>& credentials,
    const fs::path& dest,
    ProgressFn progress,
    std::chrono::seconds timeout)
{
    Hop hop;
    std::optional<FetchError> failure;
    try {
        hop = co_await follow(url, credentials, timeout, &dest, progress);
    } catch (const std::exception& e) {
        failure = FetchError{FetchErrc::connection_error, 0, std::string("Request error: ") + e.what()};
    }

    if (failure)
        co_return failure;
    if (hop.error)
        co_return hop.error;
    if (hop.ec)
        co_return classify_transport_error(hop.ec, timeout);
    co_return classify_status(hop.status, url);
}
