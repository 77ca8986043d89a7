#pragma once

#include <boost/filesystem.hpp>

#include <map>
#include <string>
#include <vector>

struct Server {
    std::string name;
    std::string url;
};

// ~/.samftp-cli.env
boost::filesystem::path config_path();

// $XDG_CACHE_HOME/samftp-cli/directory_cache.json, ~/.cache/... otherwise
boost::filesystem::path default_cache_file();

// KEY=VALUE lines, '#' comments, optional "export " prefix and quotes.
// A missing file is just empty.
std::map<std::string, std::string> read_env_file(const boost::filesystem::path& file);

// SERVER_1_NAME/SERVER_1_URL, SERVER_2_..., up to the first incomplete pair.
// The process environment wins over the file.
std::vector<Server> load_servers(const boost::filesystem::path& env_file);
