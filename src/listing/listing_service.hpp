#pragma once

#include <boost/asio/awaitable.hpp>

#include <functional>
#include <optional>
#include <string>

#include "listing.hpp"
#include "../cache/listing_store.hpp"
#include "../http/resilient_fetcher.hpp"

using ListingResult = Expected<Listing>;

// Serves listings from the store while they are fresh and goes to the
// network otherwise. Only successfully parsed listings are ever stored.
//
// Concurrent callers asking for the same cold url each fetch it, the last
// put wins.
class ListingService {
    public:
        ListingService(
            ListingStore& store,
            ResilientFetcher& fetcher,
            ListingStore::Clock clock = [] { return std::chrono::system_clock::now(); }
        )
            : store_(store), fetcher_(fetcher), clock_(std::move(clock)) {}
        ~ListingService() {};

        net::awaitable<ListingResult> get_listing(
            const std::string& url,
            const std::optional<Credentials>& credentials,
            bool force_refresh = false
        );

        void invalidate(const std::string& url);

        ListingStore& store() { return store_; }

    private:
        ListingStore& store_;
        ResilientFetcher& fetcher_;
        ListingStore::Clock clock_;
};
