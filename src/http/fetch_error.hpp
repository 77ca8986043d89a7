#pragma once

#include <boost/beast/core/error.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <variant>

enum class FetchErrc {
    connection_error,
    timeout,
    authentication_error,
    not_found,
    server_error,
};

struct FetchError {
    FetchErrc kind;
    unsigned status = 0; // HTTP status, 0 when the transport failed
    std::string message;
};

// Either the value or the reason it could not be produced.
template <typename T>
using Expected = std::variant<T, FetchError>;

// Response body on success.
using FetchResult = Expected<std::string>;

const char* to_string(FetchErrc kind);

// Only these are worth another attempt, auth and 404 will not fix themselves.
bool is_retryable(FetchErrc kind);

// Maps a status line to an error, nullopt for anything that is not an error.
// 401/403/404 first, then >=500, then the remaining 4xx.
std::optional<FetchError> classify_status(unsigned status, const std::string& url);

FetchError classify_transport_error(const boost::beast::error_code& ec, std::chrono::seconds timeout);
