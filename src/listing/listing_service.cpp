#include "listing_service.hpp"
#include "listing_parser.hpp"
#include "../cache/cache_key.hpp"

net::awaitable<ListingResult> ListingService::get_listing(
    const std::string& url,
    const std::optional<Credentials>& credentials,
    bool force_refresh)
{
    auto key = derive_key(url);

    if (!force_refresh) {
        if (auto cached = store_.lookup(key))
            co_return Listing{std::move(cached->folders), std::move(cached->files)};
    }

    auto fetched = co_await fetcher_.fetch_with_retry(url, credentials);
    if (auto* err = std::get_if<FetchError>(&fetched))
        co_return std::move(*err);

    auto listing = parse_listing(url, std::get<std::string>(fetched));
    store_.put(key, ListingEntry{url, clock_(), listing.folders, listing.files});
    co_return listing;
}

void ListingService::invalidate(const std::string& url) {
    store_.invalidate(derive_key(url));
}
