#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <algorithm>
#include <iostream>

#include "resilient_fetcher.hpp"

void ResilientFetcher::cancel() {
    cancelled_ = true;
    if (pending_)
        pending_->cancel();
}

net::awaitable<bool> ResilientFetcher::backoff(std::chrono::seconds delay) {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor, delay);

    pending_ = &timer;
    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    pending_ = nullptr;

    co_return !ec && !cancelled_;
}

net::awaitable<FetchResult> ResilientFetcher::fetch_with_retry(
    const std::string& url,
    const std::optional<Credentials>& credentials)
{
    cancelled_ = false;
    const int attempts = std::max(options_.max_retries, 1);
    std::optional<FetchError> last;

    for (int attempt = 0; attempt < attempts; ++attempt) {
        auto result = co_await transport_.fetch(url, credentials, options_.timeout);

        auto* err = std::get_if<FetchError>(&result);
        if (err == nullptr || !is_retryable(err->kind))
            co_return result;
        last = std::move(*err);

        if (attempt + 1 == attempts) {
            std::cerr << "All " << attempts << " attempts failed" << std::endl;
            break;
        }
        if (cancelled_)
            break;

        auto delay = std::chrono::seconds(1LL << attempt);
        std::cerr << "Attempt " << attempt + 1 << " failed, retrying in " << delay.count() << "s..." << std::endl;
        if (!co_await backoff(delay)) {
            std::cerr << "Retry cancelled" << std::endl;
            break;
        }
    }

    co_return std::move(*last);
}
