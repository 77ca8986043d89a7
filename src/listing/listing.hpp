#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct FolderRef {
    std::string name;
    std::string url;

    bool operator==(const FolderRef&) const = default;
};

struct FileRef {
    std::string name;
    std::string url;
    std::optional<std::uint64_t> size; // not every index reports it

    bool operator==(const FileRef&) const = default;
};

// What a directory URL shows: folders first (".." at the front), then files.
struct Listing {
    std::vector<FolderRef> folders;
    std::vector<FileRef> files;

    bool operator==(const Listing&) const = default;
};

// A cached listing. Replaced wholesale on refresh, never edited in place.
struct ListingEntry {
    std::string url;
    std::chrono::system_clock::time_point fetched_at;
    std::vector<FolderRef> folders;
    std::vector<FileRef> files;
};

struct Credentials {
    std::string username;
    std::string password;
};
