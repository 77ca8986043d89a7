#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/filesystem.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "http_client.hpp"

// "1.5 MB" style, 1024 based.
std::string format_size(std::uint64_t bytes);

class Downloader {
    public:
        explicit Downloader(HttpClient& client) : client_(client) {}
        ~Downloader() {};

        // Saves the file as dest_dir/<name>. The body goes to <name>.part
        // first and only replaces <name> once complete, so a failed download
        // never touches a file already there. Returns false on any failure,
        // the reason is printed.
        net::awaitable<bool> download_file(
            const FileRef& file,
            const boost::filesystem::path& dest_dir,
            const std::optional<Credentials>& credentials
        );

        // One after the other, returns how many made it.
        net::awaitable<std::size_t> download_all(
            const std::vector<FileRef>& files,
            const boost::filesystem::path& dest_dir,
            const std::optional<Credentials>& credentials
        );

        // Aborts the transfer in flight and skips the remaining files of
        // the current download_all.
        void cancel();

    private:
        HttpClient& client_;
        bool cancelled_ = false;

        static std::string local_name(const FileRef& file);
};
