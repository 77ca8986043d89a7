#include <boost/url.hpp>

#include <cstdio>
#include <iostream>
#include <iterator>

#include "downloader.hpp"

namespace fs   = boost::filesystem;
namespace urls = boost::urls;

std::string format_size(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024)
        return std::to_string(bytes) + " B";

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

std::string Downloader::local_name(const FileRef& file) {
    // never let a name from the page climb out of dest_dir
    auto name = fs::path(file.name).filename().string();
    if (!name.empty() && name != "." && name != "..")
        return name;

    auto u = urls::parse_uri(file.url);
    if (u && !u->segments().empty())
        name = fs::path(std::string(u->segments().back())).filename().string();
    if (name.empty() || name == "." || name == "..")
        name = "download";
    return name;
}

net::awaitable<bool> Downloader::download_file(
    const FileRef& file,
    const fs::path& dest_dir,
    const std::optional<Credentials>& credentials)
{
    const auto name = local_name(file);

    boost::system::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        std::cerr << "Error saving " << name << ": " << ec.message() << std::endl;
        co_return false;
    }
    const auto dest = dest_dir / name;
    const auto part = dest_dir / (name + ".part");

    auto progress = [&name](std::uint64_t received, std::optional<std::uint64_t> total) {
        std::cout << "\rDownloading " << name << ": " << format_size(received);
        if (total && *total > 0)
            std::cout << " / " << format_size(*total) << " (" << (received * 100 / *total) << "%)";
        std::cout << std::flush;
    };

    auto err = co_await client_.download(file.url, credentials, part, progress);
    std::cout << std::endl;

    if (err) {
        std::cerr << "Error downloading " << name << ": " << err->message << std::endl;
        fs::remove(part, ec);
        co_return false;
    }

    fs::rename(part, dest, ec);
    if (ec) {
        std::cerr << "Error saving " << name << ": " << ec.message() << std::endl;
        boost::system::error_code ignored;
        fs::remove(part, ignored);
        co_return false;
    }
    co_return true;
}

net::awaitable<std::size_t> Downloader::download_all(
    const std::vector<FileRef>& files,
    const fs::path& dest_dir,
    const std::optional<Credentials>& credentials)
{
    if (files.empty()) {
        std::cout << "No files to download in this directory." << std::endl;
        co_return 0;
    }

    std::cout << "\nStarting download of " << files.size() << " files to '" << dest_dir.string() << "'...\n" << std::endl;

    cancelled_ = false;
    std::size_t ok = 0;
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (cancelled_) {
            std::cout << "Download cancelled, " << files.size() - i << " files skipped" << std::endl;
            break;
        }
        std::cout << "[" << i + 1 << "/" << files.size() << "] ";
        if (co_await download_file(files[i], dest_dir, credentials)) {
            ++ok;
            std::cout << "✓ " << files[i].name << std::endl;
        } else {
            std::cout << "✗ " << files[i].name << std::endl;
        }
    }

    std::cout << "\nDownload complete! " << ok << "/" << files.size() << " files downloaded successfully.\n" << std::endl;
    co_return ok;
}

void Downloader::cancel() {
    cancelled_ = true;
    client_.cancel();
}
