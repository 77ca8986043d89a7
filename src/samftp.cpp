#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>

#include "cache/listing_store.hpp"
#include "config/config.hpp"
#include "http/downloader.hpp"
#include "http/http_client.hpp"
#include "http/resilient_fetcher.hpp"
#include "listing/listing_service.hpp"

struct Config {
    std::string url;
    int server = 0;
    bool list_servers = false;
    std::string user;
    std::string password;
    bool refresh = false;
    int ttl_sec = 300;
    int retries = 3;
    int timeout_sec = 30;
    std::string cache_file;
    std::string download_dir;
    bool invalidate = false;
    bool cache_stats = false;
    bool clear_cache = false;
    bool purge_expired = false;
    bool probe = false;
    bool verbose = false;
};

void print_help_and_exit() {
    std::cout <<
        "Usage:\n"
        "  samftp [options]\n\n"
        "Options:\n"
        "  -h, --help\n"
        "      Show this help and exit\n"
        "  -u, --url <url>\n"
        "      Directory listing to show\n"
        "  -s, --server <n>\n"
        "      Use the n-th server from ~/.samftp-cli.env instead of --url\n"
        "  -l, --list-servers\n"
        "      Print the configured servers and exit\n"
        "  -U, --user <name>\n"
        "  -P, --password <password>\n"
        "      Basic auth credentials\n"
        "  -f, --refresh\n"
        "      Ignore the cache and fetch the listing again\n"
        "  -t, --ttl <sec>\n"
        "      How long a cached listing stays fresh (default: 300)\n"
        "  -r, --retries <n>\n"
        "      Attempts before giving up on a listing (default: 3)\n"
        "  -T, --timeout <sec>\n"
        "      Request timeout (default: 30)\n"
        "  -c, --cache-file <path>\n"
        "      Where the listing cache lives\n"
        "      (default: ~/.cache/samftp-cli/directory_cache.json)\n"
        "  -d, --download <dir>\n"
        "      Download every file of the listing into <dir>\n"
        "  -i, --invalidate\n"
        "      Drop the cached listing of --url\n"
        "  -S, --cache-stats\n"
        "      Print cache statistics\n"
        "  -C, --clear-cache\n"
        "      Remove every cached listing\n"
        "  -x, --purge-expired\n"
        "      Remove expired listings from the cache file\n"
        "  -p, --probe\n"
        "      Check that --url answers (10s timeout) and exit\n"
        "  -v, --verbose\n"
        "      Print the effective options\n";
    std::exit(0);
}

int parse_number(const char* arg, const char* option) {
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(arg, &end, 10);
    if (errno != 0 || end == arg || *end != '\0' || v < 0 || v > 1000000) {
        std::cerr << "Error: invalid value '" << arg << "' for " << option << std::endl;
        std::exit(EINVAL);
    }
    return static_cast<int>(v);
}

void validate_config(Config& cfg) {
    if (cfg.server > 0) {
        auto servers = load_servers(config_path());
        if (cfg.server > static_cast<int>(servers.size())) {
            std::cerr << "Error: no server #" << cfg.server << " in " << config_path() << std::endl;
            std::exit(EINVAL);
        }
        cfg.url = servers[cfg.server - 1].url;
    }

    bool cache_only = cfg.cache_stats || cfg.clear_cache || cfg.purge_expired;
    if (cfg.url.empty() && !cache_only && !cfg.list_servers) {
        std::cerr << "Error: must specify --url/-u or --server/-s" << std::endl;
        std::exit(EINVAL);
    }

    if (cfg.retries < 1) {
        std::cerr << "Error: --retries must be at least 1" << std::endl;
        std::exit(EINVAL);
    }

    if (!cfg.password.empty() && cfg.user.empty()) {
        std::cerr << "Error: --password needs --user" << std::endl;
        std::exit(EINVAL);
    }

    if (cfg.cache_file.empty())
        cfg.cache_file = default_cache_file().string();
}

Config parse_args(int argc, char** argv) {
    Config cfg;

    static option long_opts[] = {
        {"help",          no_argument,       nullptr, 'h'},
        {"url",           required_argument, nullptr, 'u'},
        {"server",        required_argument, nullptr, 's'},
        {"list-servers",  no_argument,       nullptr, 'l'},
        {"user",          required_argument, nullptr, 'U'},
        {"password",      required_argument, nullptr, 'P'},
        {"refresh",       no_argument,       nullptr, 'f'},
        {"ttl",           required_argument, nullptr, 't'},
        {"retries",       required_argument, nullptr, 'r'},
        {"timeout",       required_argument, nullptr, 'T'},
        {"cache-file",    required_argument, nullptr, 'c'},
        {"download",      required_argument, nullptr, 'd'},
        {"invalidate",    no_argument,       nullptr, 'i'},
        {"cache-stats",   no_argument,       nullptr, 'S'},
        {"clear-cache",   no_argument,       nullptr, 'C'},
        {"purge-expired", no_argument,       nullptr, 'x'},
        {"probe",         no_argument,       nullptr, 'p'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "hu:s:lU:P:ft:r:T:c:d:iSCxpv", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'h':
                print_help_and_exit();
                break;
            case 'u':
                cfg.url = std::string(optarg);
                break;
            case 's':
                cfg.server = parse_number(optarg, "--server");
                break;
            case 'l':
                cfg.list_servers = true;
                break;
            case 'U':
                cfg.user = std::string(optarg);
                break;
            case 'P':
                cfg.password = std::string(optarg);
                break;
            case 'f':
                cfg.refresh = true;
                break;
            case 't':
                cfg.ttl_sec = parse_number(optarg, "--ttl");
                break;
            case 'r':
                cfg.retries = parse_number(optarg, "--retries");
                break;
            case 'T':
                cfg.timeout_sec = parse_number(optarg, "--timeout");
                break;
            case 'c':
                cfg.cache_file = std::string(optarg);
                break;
            case 'd':
                cfg.download_dir = std::string(optarg);
                break;
            case 'i':
                cfg.invalidate = true;
                break;
            case 'S':
                cfg.cache_stats = true;
                break;
            case 'C':
                cfg.clear_cache = true;
                break;
            case 'x':
                cfg.purge_expired = true;
                break;
            case 'p':
                cfg.probe = true;
                break;
            case 'v':
                cfg.verbose = true;
                break;
            default:
                print_help_and_exit();
        }
    }
    validate_config(cfg);

    return cfg;
}

void print_error(const FetchError& err) {
    std::cerr << "Error: " << err.message << std::endl;
    switch (err.kind) {
        case FetchErrc::authentication_error:
            std::cerr << "Hint: check --user/--password" << std::endl;
            break;
        case FetchErrc::not_found:
            std::cerr << "Hint: the folder may have moved, try its parent" << std::endl;
            break;
        case FetchErrc::timeout:
            std::cerr << "Hint: raise --timeout for slow servers" << std::endl;
            break;
        case FetchErrc::connection_error:
        case FetchErrc::server_error:
            break;
    }
}

void print_listing(const Listing& listing) {
    for (const auto& f : listing.folders)
        std::cout << "[D] " << f.name << "\t" << f.url << "\n";
    for (const auto& f : listing.files) {
        std::cout << "[F] " << f.name;
        if (f.size)
            std::cout << " (" << format_size(*f.size) << ")";
        std::cout << "\t" << f.url << "\n";
    }
    std::cout << listing.folders.size() - 1 << " folders, " << listing.files.size() << " files" << std::endl;
}

void print_stats(const CacheStats& s) {
    std::cout << "Cache location:  " << s.location << "\n"
              << "TTL:             " << s.ttl_seconds << "s\n"
              << "Total entries:   " << s.total_entries << "\n"
              << "Valid entries:   " << s.valid_entries << "\n"
              << "Expired entries: " << s.expired_entries << "\n"
              << "Size:            " << format_size(s.size_bytes) << std::endl;
}

net::awaitable<int> run(const Config& cfg, ListingService& service, HttpClient& client, Downloader& downloader) {
    std::optional<Credentials> credentials;
    if (!cfg.user.empty())
        credentials = Credentials{cfg.user, cfg.password};

    if (cfg.probe) {
        auto err = co_await client.probe(cfg.url, credentials);
        if (err) {
            print_error(*err);
            co_return 1;
        }
        std::cout << cfg.url << " is reachable" << std::endl;
        co_return 0;
    }

    auto result = co_await service.get_listing(cfg.url, credentials, cfg.refresh);
    if (auto* err = std::get_if<FetchError>(&result)) {
        print_error(*err);
        co_return 1;
    }

    const auto& listing = std::get<Listing>(result);
    print_listing(listing);

    if (!cfg.download_dir.empty())
        co_await downloader.download_all(listing.files, cfg.download_dir, credentials);

    co_return 0;
}

int main(int argc, char **argv) {

    Config cfg = parse_args(argc, argv);

    if (cfg.verbose) {
        std::cout << "====== OPTIONS ======== " << std::endl;
        std::cout << "url=" << cfg.url << std::endl;
        std::cout << "user=" << cfg.user << std::endl;
        std::cout << "refresh=" << cfg.refresh << std::endl;
        std::cout << "ttl_sec=" << cfg.ttl_sec << std::endl;
        std::cout << "retries=" << cfg.retries << std::endl;
        std::cout << "timeout_sec=" << cfg.timeout_sec << std::endl;
        std::cout << "cache_file=" << cfg.cache_file << std::endl;
        std::cout << "download_dir=" << cfg.download_dir << std::endl;
        std::cout << "======================= " << std::endl;
    }

    if (cfg.list_servers) {
        auto servers = load_servers(config_path());
        if (servers.empty()) {
            std::cerr << "Warning: No server configurations found." << std::endl;
            std::cerr << "Please create a configuration file at: " << config_path().string() << std::endl;
            return 0;
        }
        for (std::size_t i = 0; i < servers.size(); ++i)
            std::cout << i + 1 << ". " << servers[i].name << "\t" << servers[i].url << std::endl;
        return 0;
    }

    ListingStore store(cfg.cache_file, std::chrono::seconds(cfg.ttl_sec));

    if (cfg.clear_cache) {
        store.clear_all();
        std::cout << "Cache cleared" << std::endl;
    }
    if (cfg.purge_expired)
        std::cout << "Removed " << store.purge_expired() << " expired entries" << std::endl;
    if (cfg.cache_stats)
        print_stats(store.stats());
    if (cfg.url.empty())
        return 0;

    std::unique_ptr<HttpClient> client;
    try {
        client = std::make_unique<HttpClient>();
    } catch (const std::exception& e) {
        std::cerr << "Error: could not set up TLS: " << e.what() << std::endl;
        return 1;
    }

    ResilientFetcher fetcher(*client, FetcherOptions{cfg.retries, std::chrono::seconds(cfg.timeout_sec)});
    ListingService service(store, fetcher);
    Downloader downloader(*client);

    if (cfg.invalidate) {
        service.invalidate(cfg.url);
        std::cout << "Invalidated " << cfg.url << std::endl;
        return 0;
    }

    net::io_context ioc(1);

    int rc = 0;

    // First ^C gives up on retries and the transfer in flight, the second
    // one stops everything.
    net::signal_set signals(ioc, SIGINT, SIGTERM);
    int interrupts = 0;
    std::function<void(const boost::system::error_code&, int)> on_signal =
        [&](const boost::system::error_code& ec, int) {
            if (ec)
                return;
            if (++interrupts > 1) {
                std::cerr << "Interrupted" << std::endl;
                rc = 1;
                ioc.stop();
                return;
            }
            std::cerr << "Cancelling, press ^C again to quit" << std::endl;
            fetcher.cancel();
            downloader.cancel();
            signals.async_wait(on_signal);
        };
    signals.async_wait(on_signal);

    net::co_spawn(
        ioc,
        run(cfg, service, *client, downloader),
        [&rc, &signals](std::exception_ptr e, int result) {
            signals.cancel();
            if (e) {
                try { std::rethrow_exception(e); }
                catch (std::exception const& ex) {
                    std::cerr << "Error " << ex.what() << std::endl;
                }
                rc = 1;
                return;
            }
            rc = result;
        });
    ioc.run();

    return rc;
}
