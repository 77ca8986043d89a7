#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iostream>

#include "listing_store.hpp"

namespace fs = boost::filesystem;
using json = nlohmann::json;

namespace {

double to_epoch_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

// nullopt when the clock cannot represent s
std::optional<std::chrono::system_clock::time_point> from_epoch_seconds(double s) {
    static const double limit =
        std::chrono::duration<double>(std::chrono::system_clock::duration::max()).count() - 1.0;
    if (!std::isfinite(s) || std::abs(s) >= limit)
        return std::nullopt;

    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(s)));
}

bool is_ref(const json& j) {
    return j.is_object()
        && j.contains("name") && j["name"].is_string()
        && j.contains("url") && j["url"].is_string();
}

// Strict: anything not shaped like an entry is rejected as a whole.
std::optional<ListingEntry> entry_from_json(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    if (!j.contains("url") || !j["url"].is_string())
        return std::nullopt;
    if (!j.contains("timestamp") || !j["timestamp"].is_number())
        return std::nullopt;
    if (!j.contains("folders") || !j["folders"].is_array())
        return std::nullopt;
    if (!j.contains("files") || !j["files"].is_array())
        return std::nullopt;

    auto fetched_at = from_epoch_seconds(j["timestamp"].get<double>());
    if (!fetched_at)
        return std::nullopt;

    ListingEntry e;
    e.url = j["url"].get<std::string>();
    e.fetched_at = *fetched_at;

    for (const auto& f : j["folders"]) {
        if (!is_ref(f))
            return std::nullopt;
        e.folders.push_back({f["name"].get<std::string>(), f["url"].get<std::string>()});
    }
    for (const auto& f : j["files"]) {
        if (!is_ref(f))
            return std::nullopt;
        FileRef ref{f["name"].get<std::string>(), f["url"].get<std::string>(), std::nullopt};
        if (f.contains("size")) {
            if (!f["size"].is_number_unsigned())
                return std::nullopt;
            ref.size = f["size"].get<std::uint64_t>();
        }
        e.files.push_back(std::move(ref));
    }
    return e;
}

json entry_to_json(const ListingEntry& e) {
    json folders = json::array();
    for (const auto& f : e.folders)
        folders.push_back({{"name", f.name}, {"url", f.url}});

    json files = json::array();
    for (const auto& f : e.files) {
        json jf = {{"name", f.name}, {"url", f.url}};
        if (f.size)
            jf["size"] = *f.size;
        files.push_back(std::move(jf));
    }

    return {
        {"url", e.url},
        {"timestamp", to_epoch_seconds(e.fetched_at)},
        {"folders", std::move(folders)},
        {"files", std::move(files)},
    };
}

} // namespace

ListingStore::ListingStore(fs::path cache_file, std::chrono::seconds ttl, Clock clock)
    : cache_file_(std::move(cache_file)), ttl_(ttl), clock_(std::move(clock))
{
    boost::system::error_code ec;
    auto dir = cache_file_.parent_path();
    if (!dir.empty())
        fs::create_directories(dir, ec);
    if (ec)
        std::cerr << "Warning: Could not create cache directory " << dir << ": " << ec.message() << std::endl;
}

bool ListingStore::is_expired(const ListingEntry& entry) const {
    // an entry exactly ttl old is still served
    return clock_() - entry.fetched_at > ttl_;
}

ListingStore::Document ListingStore::load_document() const {
    Document doc;

    boost::system::error_code ec;
    if (!fs::exists(cache_file_, ec))
        return doc;

    std::ifstream in(cache_file_.string());
    if (!in)
        return doc;

    json root = json::parse(in, nullptr, false);
    if (root.is_discarded() || !root.is_object())
        return doc;

    std::size_t skipped = 0;
    for (const auto& item : root.items()) {
        auto entry = entry_from_json(item.value());
        if (!entry) {
            ++skipped;
            continue;
        }
        doc.emplace(item.key(), std::move(*entry));
    }
    if (skipped)
        std::cerr << "Warning: skipped " << skipped << " malformed cache record(s) in " << cache_file_ << std::endl;

    return doc;
}

bool ListingStore::save_document(const Document& doc) const {
    json root = json::object();
    for (const auto& [key, entry] : doc)
        root[key] = entry_to_json(entry);

    std::ofstream out(cache_file_.string(), std::ios::trunc);
    if (!out) {
        std::cerr << "Warning: Could not save cache to disk: cannot open " << cache_file_ << std::endl;
        return false;
    }
    out << root.dump(2);
    out.flush();
    if (!out) {
        std::cerr << "Warning: Could not save cache to disk: write to " << cache_file_ << " failed" << std::endl;
        return false;
    }
    return true;
}

std::optional<ListingEntry> ListingStore::lookup(const std::string& key) {
    auto it = memory_.find(key);
    if (it != memory_.end()) {
        if (!is_expired(it->second))
            return it->second;
        memory_.erase(it);
    }

    auto doc = load_document();
    auto dit = doc.find(key);
    if (dit == doc.end())
        return std::nullopt;

    if (is_expired(dit->second)) {
        doc.erase(dit);
        save_document(doc);
        return std::nullopt;
    }

    memory_.insert_or_assign(key, dit->second);
    return dit->second;
}

void ListingStore::put(const std::string& key, ListingEntry entry) {
    memory_.insert_or_assign(key, entry);

    // failing here only costs us the entry on the next run
    auto doc = load_document();
    doc.insert_or_assign(key, std::move(entry));
    save_document(doc);
}

void ListingStore::invalidate(const std::string& key) {
    memory_.erase(key);

    auto doc = load_document();
    if (doc.erase(key))
        save_document(doc);
}

void ListingStore::clear_all() {
    memory_.clear();

    boost::system::error_code ec;
    if (!fs::exists(cache_file_, ec))
        return;
    fs::remove(cache_file_, ec);
    if (ec)
        std::cerr << "Warning: Could not delete cache file: " << ec.message() << std::endl;
}

std::size_t ListingStore::purge_expired() {
    auto doc = load_document();
    std::size_t removed = std::erase_if(doc, [this](const auto& kv) {
        return is_expired(kv.second);
    });

    if (removed > 0)
        save_document(doc);
    return removed;
}

CacheStats ListingStore::stats() const {
    CacheStats s;
    auto doc = load_document();

    s.total_entries = doc.size();
    for (const auto& [_, entry] : doc) {
        if (is_expired(entry))
            ++s.expired_entries;
    }
    s.valid_entries = s.total_entries - s.expired_entries;

    boost::system::error_code ec;
    auto size = fs::file_size(cache_file_, ec);
    s.size_bytes = ec ? 0 : size;
    s.ttl_seconds = ttl_.count();
    s.location = cache_file_.string();
    return s;
}
