#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <optional>
#include <string>

#include "http_client.hpp"

struct FetcherOptions {
    int max_retries = 3; // attempts in total, not retries after the first
    std::chrono::seconds timeout{30};
};

// Retries connection errors, timeouts and 5xx with exponential backoff:
// 1s after the first failed attempt, then 2s, 4s... with no cap or jitter.
// Auth failures and 404 come back straight away. When every attempt failed
// the last error is returned.
//
// Not thread safe. cancel() must run on the executor driving the fetch.
class ResilientFetcher {
    public:
        explicit ResilientFetcher(HttpTransport& transport, FetcherOptions options = {})
            : transport_(transport), options_(options) {}
        virtual ~ResilientFetcher() {};

        net::awaitable<FetchResult> fetch_with_retry(
            const std::string& url,
            const std::optional<Credentials>& credentials
        );

        // Stops the current sequence at the next backoff. A request already
        // on the wire is not interrupted.
        void cancel();

        const FetcherOptions& options() const { return options_; }

    protected:
        // Returns false when the wait was cancelled.
        virtual net::awaitable<bool> backoff(std::chrono::seconds delay);

    private:
        HttpTransport& transport_;
        FetcherOptions options_;
        bool cancelled_ = false;
        net::steady_timer* pending_ = nullptr;
};
