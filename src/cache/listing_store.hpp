#pragma once

#include <boost/filesystem.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "../listing/listing.hpp"

struct CacheStats {
    std::size_t total_entries = 0;
    std::size_t valid_entries = 0;
    std::size_t expired_entries = 0;
    std::uintmax_t size_bytes = 0;
    std::int64_t ttl_seconds = 0;
    std::string location;
};

// Two tier listing cache: an in-process map over a single JSON document on
// disk. Entries older than the ttl are dropped when they are looked at.
//
// The JSON file is read-modify-written as a whole on every mutation and is
// assumed to belong to this process only. Two processes writing the same file
// race and the last writer wins.
class ListingStore {
    public:
        using Clock = std::function<std::chrono::system_clock::time_point()>;

        explicit ListingStore(
            boost::filesystem::path cache_file,
            std::chrono::seconds ttl = std::chrono::seconds(300),
            Clock clock = [] { return std::chrono::system_clock::now(); }
        );
        ~ListingStore() {};

        std::optional<ListingEntry> lookup(const std::string& key);
        void put(const std::string& key, ListingEntry entry);
        void invalidate(const std::string& key);
        void clear_all();

        // Scans the durable tier only, the in-process tier may keep serving
        // an entry until its own lookup notices the age.
        std::size_t purge_expired();
        CacheStats stats() const;

        std::chrono::seconds ttl() const { return ttl_; }
        const boost::filesystem::path& location() const { return cache_file_; }

    private:
        using Document = std::map<std::string, ListingEntry, std::less<>>;

        boost::filesystem::path cache_file_;
        std::chrono::seconds ttl_;
        Clock clock_;
        Document memory_;

        bool is_expired(const ListingEntry& entry) const;
        Document load_document() const;
        bool save_document(const Document& doc) const;
};
