#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>

#include "fetch_error.hpp"

namespace beast = boost::beast;
namespace net   = boost::asio;

const char* to_string(FetchErrc kind) {
    switch (kind) {
        case FetchErrc::connection_error:     return "ConnectionError";
        case FetchErrc::timeout:              return "Timeout";
        case FetchErrc::authentication_error: return "AuthenticationError";
        case FetchErrc::not_found:            return "NotFoundError";
        case FetchErrc::server_error:         return "ServerError";
    }
    return "UnknownError";
}

bool is_retryable(FetchErrc kind) {
    switch (kind) {
        case FetchErrc::connection_error:
        case FetchErrc::timeout:
        case FetchErrc::server_error:
            return true;
        case FetchErrc::authentication_error:
        case FetchErrc::not_found:
            return false;
    }
    return false;
}

std::optional<FetchError> classify_status(unsigned status, const std::string& url) {
    if (status == 401)
        return FetchError{FetchErrc::authentication_error, status,
            "Authentication required - invalid or missing credentials"};
    if (status == 403)
        return FetchError{FetchErrc::authentication_error, status,
            "Access forbidden - check permissions"};
    if (status == 404)
        return FetchError{FetchErrc::not_found, status, "Resource not found: " + url};
    if (status >= 500)
        return FetchError{FetchErrc::server_error, status,
            "Server error (HTTP " + std::to_string(status) + ")"};
    if (status >= 400)
        return FetchError{FetchErrc::connection_error, status,
            "Client error (HTTP " + std::to_string(status) + ")"};
    return std::nullopt;
}

FetchError classify_transport_error(const beast::error_code& ec, std::chrono::seconds timeout) {
    if (ec == beast::error::timeout || ec == net::error::timed_out)
        return {FetchErrc::timeout, 0,
            "Request timeout after " + std::to_string(timeout.count()) + " seconds"};

    if (ec == net::error::host_not_found ||
        ec == net::error::host_not_found_try_again ||
        ec == net::error::connection_refused ||
        ec == net::error::connection_reset ||
        ec == net::error::connection_aborted ||
        ec == net::error::network_unreachable ||
        ec == net::error::host_unreachable ||
        ec == net::error::network_down)
        return {FetchErrc::connection_error, 0,
            "Connection failed - check network and server address: " + ec.message()};

    return {FetchErrc::connection_error, 0, "Request error: " + ec.message()};
}
