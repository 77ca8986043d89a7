#include <cstdlib>
#include <fstream>

#include "config.hpp"

namespace fs = boost::filesystem;

namespace {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    return home ? fs::path(home) : fs::current_path();
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r");
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(begin, end - begin + 1);
}

} // namespace

fs::path config_path() {
    return home_dir() / ".samftp-cli.env";
}

fs::path default_cache_file() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    fs::path base = (xdg && *xdg) ? fs::path(xdg) : home_dir() / ".cache";
    return base / "samftp-cli" / "directory_cache.json";
}

std::map<std::string, std::string> read_env_file(const fs::path& file) {
    std::map<std::string, std::string> vars;

    std::ifstream in(file.string());
    if (!in)
        return vars;

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#')
            continue;
        if (line.starts_with("export "))
            line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos)
            continue;

        auto key = trim(line.substr(0, eq));
        auto value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front())
            value = value.substr(1, value.size() - 2);

        if (!key.empty())
            vars[key] = value;
    }
    return vars;
}

std::vector<Server> load_servers(const fs::path& env_file) {
    auto vars = read_env_file(env_file);
    auto lookup = [&vars](const std::string& key) -> std::string {
        if (const char* v = std::getenv(key.c_str()))
            return v;
        auto it = vars.find(key);
        return it == vars.end() ? std::string() : it->second;
    };

    std::vector<Server> servers;
    for (int i = 1;; ++i) {
        auto prefix = "SERVER_" + std::to_string(i);
        auto name = lookup(prefix + "_NAME");
        auto url = lookup(prefix + "_URL");
        if (name.empty() || url.empty())
            break;
        servers.push_back({std::move(name), std::move(url)});
    }
    return servers;
}
