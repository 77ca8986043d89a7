#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <fstream>

#include "cache/listing_store.hpp"
#include "test_support.hpp"

namespace fs = boost::filesystem;
using namespace std::chrono_literals;

class ListingStoreTest : public TempDirTest {
    protected:
        ManualClock clock;
        fs::path file;

        void SetUp() override {
            TempDirTest::SetUp();
            file = dir / "cache" / "directory_cache.json";
        }

        ListingStore make_store() {
            return ListingStore(file, 300s, clock.fn());
        }

        ListingEntry entry(const std::string& url, std::chrono::system_clock::time_point at) {
            return ListingEntry{
                url,
                at,
                {{"..", "http://h/"}, {"sub", url + "sub/"}},
                {{"a.mp4", url + "a.mp4", std::nullopt}, {"b.jpg", url + "b.jpg", 2048}},
            };
        }

        nlohmann::json read_json() {
            std::ifstream in(file.string());
            return nlohmann::json::parse(in);
        }
};

TEST_F(ListingStoreTest, ConstructorCreatesDirectory) {
    auto store = make_store();
    EXPECT_TRUE(fs::is_directory(file.parent_path()));
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(ListingStoreTest, RoundTripInProcess) {
    auto store = make_store();
    auto e = entry("http://h/a/", clock.now);
    store.put("k", e);

    auto got = store.lookup("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->url, e.url);
    EXPECT_EQ(got->fetched_at, e.fetched_at);
    EXPECT_EQ(got->folders, e.folders);
    EXPECT_EQ(got->files, e.files);
}

TEST_F(ListingStoreTest, RoundTripThroughDisk) {
    auto e = entry("http://h/a/", clock.now);
    {
        auto store = make_store();
        store.put("k", e);
    }

    auto fresh = make_store();
    auto got = fresh.lookup("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->url, e.url);
    EXPECT_EQ(got->folders, e.folders);
    EXPECT_EQ(got->files, e.files);
    EXPECT_LT(std::chrono::abs(got->fetched_at - e.fetched_at), 1ms);
}

TEST_F(ListingStoreTest, DurableFormat) {
    auto store = make_store();
    store.put("k", entry("http://h/a/", clock.now));

    auto j = read_json();
    ASSERT_TRUE(j.contains("k"));
    EXPECT_EQ(j["k"]["url"], "http://h/a/");
    EXPECT_DOUBLE_EQ(j["k"]["timestamp"].get<double>(), 1700000000.0);
    EXPECT_EQ(j["k"]["folders"][1]["name"], "sub");
    EXPECT_EQ(j["k"]["files"][0].contains("size"), false);
    EXPECT_EQ(j["k"]["files"][1]["size"], 2048);
}

TEST_F(ListingStoreTest, EntryExactlyTtlOldIsFresh) {
    auto store = make_store();
    store.put("k", entry("http://h/a/", clock.now));

    clock.now += 300s;
    EXPECT_TRUE(store.lookup("k").has_value());

    // same answer when it has to come from disk
    auto fresh = make_store();
    EXPECT_TRUE(fresh.lookup("k").has_value());
}

TEST_F(ListingStoreTest, EntryPastTtlIsGoneAndPurged) {
    auto store = make_store();
    store.put("k", entry("http://h/a/", clock.now));

    clock.now += 300s + 1ms;
    EXPECT_FALSE(store.lookup("k").has_value());

    auto j = read_json();
    EXPECT_FALSE(j.contains("k"));
    EXPECT_EQ(store.stats().total_entries, 0u);
}

TEST_F(ListingStoreTest, ExpiredOnDiskIsRemovedFromFile) {
    {
        auto store = make_store();
        store.put("old", entry("http://h/old/", clock.now - 1h));
        store.put("new", entry("http://h/new/", clock.now));
    }

    auto fresh = make_store();
    EXPECT_FALSE(fresh.lookup("old").has_value());

    auto j = read_json();
    EXPECT_FALSE(j.contains("old"));
    EXPECT_TRUE(j.contains("new"));
}

TEST_F(ListingStoreTest, CorruptFileBehavesLikeMissingFile) {
    fs::create_directories(file.parent_path());
    write_file(file, "{ this is not json");

    auto store = make_store();
    EXPECT_FALSE(store.lookup("k").has_value());

    auto s = store.stats();
    EXPECT_EQ(s.total_entries, 0u);
    EXPECT_EQ(s.valid_entries, 0u);

    // and the next put replaces it with a valid document
    store.put("k", entry("http://h/a/", clock.now));
    EXPECT_TRUE(read_json().contains("k"));
}

TEST_F(ListingStoreTest, NonObjectDocumentIsEmpty) {
    fs::create_directories(file.parent_path());
    write_file(file, "[1, 2, 3]");

    auto store = make_store();
    EXPECT_FALSE(store.lookup("k").has_value());
    EXPECT_EQ(store.stats().total_entries, 0u);
}

TEST_F(ListingStoreTest, MalformedRecordsAreSkipped) {
    fs::create_directories(file.parent_path());
    write_file(file, R"({
        "good": {"url": "http://h/", "timestamp": 1700000000.0,
                 "folders": [{"name": "..", "url": "http://h/"}],
                 "files": [{"name": "x", "url": "http://h/x"}]},
        "bad_ts": {"url": "http://h/", "timestamp": "yesterday", "folders": [], "files": []},
        "bad_file": {"url": "http://h/", "timestamp": 1700000000.0, "folders": [],
                     "files": [{"name": 3, "url": "http://h/x"}]},
        "not_an_object": 42
    })");

    auto store = make_store();
    EXPECT_TRUE(store.lookup("good").has_value());
    EXPECT_FALSE(store.lookup("bad_ts").has_value());
    EXPECT_FALSE(store.lookup("bad_file").has_value());
    EXPECT_FALSE(store.lookup("not_an_object").has_value());
    EXPECT_EQ(store.stats().total_entries, 1u);
}

TEST_F(ListingStoreTest, InvalidateRemovesFromBothTiers) {
    auto store = make_store();
    store.put("k", entry("http://h/a/", clock.now));
    store.invalidate("k");

    EXPECT_FALSE(store.lookup("k").has_value());
    EXPECT_FALSE(read_json().contains("k"));

    auto fresh = make_store();
    EXPECT_FALSE(fresh.lookup("k").has_value());
}

TEST_F(ListingStoreTest, InvalidateUnknownKeyIsNoop) {
    auto store = make_store();
    store.invalidate("missing");
    store.invalidate("missing");
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(ListingStoreTest, ClearAllDropsEverything) {
    auto store = make_store();
    store.put("a", entry("http://h/a/", clock.now));
    store.put("b", entry("http://h/b/", clock.now));

    store.clear_all();
    EXPECT_FALSE(fs::exists(file));
    EXPECT_FALSE(store.lookup("a").has_value());
    EXPECT_FALSE(store.lookup("b").has_value());

    // nothing to delete the second time round
    store.clear_all();
}

TEST_F(ListingStoreTest, PurgeExpiredCountsRemovedEntries) {
    auto store = make_store();
    store.put("old1", entry("http://h/1/", clock.now - 400s));
    store.put("old2", entry("http://h/2/", clock.now - 301s));
    store.put("edge", entry("http://h/3/", clock.now - 300s));
    store.put("new", entry("http://h/4/", clock.now));

    EXPECT_EQ(store.purge_expired(), 2u);

    auto j = read_json();
    EXPECT_FALSE(j.contains("old1"));
    EXPECT_FALSE(j.contains("old2"));
    EXPECT_TRUE(j.contains("edge"));
    EXPECT_TRUE(j.contains("new"));

    EXPECT_EQ(store.purge_expired(), 0u);
}

TEST_F(ListingStoreTest, PurgeExpiredOnMissingFile) {
    auto store = make_store();
    EXPECT_EQ(store.purge_expired(), 0u);
    EXPECT_FALSE(fs::exists(file));
}

TEST_F(ListingStoreTest, StatsDescribeDurableTier) {
    auto store = make_store();
    auto empty = store.stats();
    EXPECT_EQ(empty.total_entries, 0u);
    EXPECT_EQ(empty.size_bytes, 0u);
    EXPECT_EQ(empty.ttl_seconds, 300);
    EXPECT_EQ(empty.location, file.string());

    store.put("a", entry("http://h/a/", clock.now - 1h));
    store.put("b", entry("http://h/b/", clock.now));
    store.put("c", entry("http://h/c/", clock.now - 10s));

    auto s = store.stats();
    EXPECT_EQ(s.total_entries, 3u);
    EXPECT_EQ(s.valid_entries, 2u);
    EXPECT_EQ(s.expired_entries, 1u);
    EXPECT_EQ(s.size_bytes, fs::file_size(file));
    EXPECT_GT(s.size_bytes, 0u);
}

TEST_F(ListingStoreTest, UnwritableLocationStillServesFromMemory) {
    // a regular file where the cache directory should be
    write_file(dir / "blocker", "");
    ListingStore store(dir / "blocker" / "cache.json", 300s, clock.fn());

    auto e = entry("http://h/a/", clock.now);
    store.put("k", e);

    auto got = store.lookup("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->files, e.files);
    EXPECT_EQ(store.stats().total_entries, 0u);
}

TEST_F(ListingStoreTest, PutReplacesWholeEntry) {
    auto store = make_store();
    store.put("k", entry("http://h/a/", clock.now));

    ListingEntry replacement{"http://h/a/", clock.now, {{"..", "http://h/"}}, {}};
    store.put("k", replacement);

    auto got = store.lookup("k");
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(got->folders.size(), 1u);
    EXPECT_TRUE(got->files.empty());

    auto fresh = make_store();
    auto from_disk = fresh.lookup("k");
    ASSERT_TRUE(from_disk.has_value());
    EXPECT_TRUE(from_disk->files.empty());
}

TEST_F(ListingStoreTest, UnrepresentableTimestampIsMalformed) {
    fs::create_directories(file.parent_path());
    write_file(file, R"({
        "good": {"url": "http://h/", "timestamp": 1700000000.5, "folders": [], "files": []},
        "huge": {"url": "http://h/", "timestamp": 1e300, "folders": [], "files": []},
        "tiny": {"url": "http://h/", "timestamp": -1e300, "folders": [], "files": []},
        "far": {"url": "http://h/", "timestamp": 1e19, "folders": [], "files": []}
    })");

    auto store = make_store();
    EXPECT_TRUE(store.lookup("good").has_value());
    EXPECT_FALSE(store.lookup("huge").has_value());
    EXPECT_FALSE(store.lookup("tiny").has_value());
    EXPECT_FALSE(store.lookup("far").has_value());
    EXPECT_EQ(store.stats().total_entries, 1u);
}
