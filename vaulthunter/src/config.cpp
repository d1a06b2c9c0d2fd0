/**
 * @file config.cpp
 * @brief Configuration file and environment lookup
 */

#include "../include/vaulthunter.h"
#include "log.h"
#include "string_utils.h"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#if !defined(_WIN32)
#include <pwd.h>
#include <unistd.h>
#endif

namespace vaulthunter {

using json = nlohmann::json;

namespace {

std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::string();
}

std::string user_home_dir() {
    std::string home = env_or_empty("HOME");
#if !defined(_WIN32)
    if (home.empty()) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_dir) {
            home = pw->pw_dir;
        }
    }
#endif
    return home.empty() ? std::string(".") : home;
}

std::string current_user_name() {
    std::string name = env_or_empty("USER");
#if !defined(_WIN32)
    if (name.empty()) {
        struct passwd* pw = getpwuid(geteuid());
        if (pw && pw->pw_name) {
            name = pw->pw_name;
        }
    }
#else
    if (name.empty()) {
        name = env_or_empty("USERNAME");
    }
#endif
    return name;
}

std::vector<std::string> split_words(const std::string& text) {
    std::istringstream in(text);
    std::vector<std::string> words;
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

template<typename T>
void read_key(const json& doc, const char* key, T& target) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return;
    }
    try {
        target = it->get<T>();
    } catch (const json::exception&) {
        throw LocalError(std::string("Invalid config value for '") + key + "'");
    }
}

} // namespace

// ============================================================================
// CONFIG PATHS
// ============================================================================

ConfigPaths ConfigPaths::from_environment() {
    std::string config_home = env_or_empty("XDG_CONFIG_HOME");
    if (config_home.empty()) {
        config_home = user_home_dir() + "/.config";
    }
    std::string cache_home = env_or_empty("XDG_CACHE_HOME");
    if (cache_home.empty()) {
        cache_home = user_home_dir() + "/.cache";
    }

    ConfigPaths paths;
    paths.config_file = config_home + "/vault-hunter/config.json";
    paths.cache_file = cache_home + "/vault-hunter/runtime.json";
    paths.user_name = current_user_name();
    return paths;
}

// ============================================================================
// CONFIG
// ============================================================================

std::string Config::lowercase_username() const {
    return to_lower(username);
}

std::optional<std::vector<std::string>> Config::clipboard_command() const {
    if (clipboard_prog) {
        auto words = split_words(*clipboard_prog);
        if (words.empty()) {
            return std::nullopt;
        }
        return words;
    }
#if defined(__APPLE__)
    return std::vector<std::string>{"pbcopy"};
#elif defined(__linux__)
    return std::vector<std::string>{"xclip", "-selection", "clipboard"};
#else
    return std::nullopt;
#endif
}

Config Config::defaults(const ConfigPaths& paths) {
    Config config;
    config.username = paths.user_name;
    config.cache_path = paths.cache_file;
    return config;
}

Config Config::from_json(const std::string& text, const ConfigPaths& paths) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        throw LocalError("Failed to parse config file");
    }
    if (!doc.is_object()) {
        throw LocalError("Config file is not a JSON object");
    }

    Config config = defaults(paths);
    read_key(doc, "end_point", config.end_point);
    read_key(doc, "username", config.username);
    read_key(doc, "ca_certs", config.ca_certs);
    read_key(doc, "timeout_seconds", config.timeout_seconds);
    read_key(doc, "token_max_ttl", config.token_max_ttl);
    read_key(doc, "cache_path", config.cache_path);

    std::string clipboard;
    auto it = doc.find("clipboard_prog");
    if (it != doc.end() && !it->is_null()) {
        read_key(doc, "clipboard_prog", clipboard);
        config.clipboard_prog = clipboard;
    }

    if (config.timeout_seconds <= 0) {
        throw LocalError("Invalid config value for 'timeout_seconds'");
    }
    return config;
}

Config Config::load(const ConfigPaths& paths) {
    std::error_code ec;
    if (!std::filesystem::exists(paths.config_file, ec)) {
        LOG_DEBUG("CONFIG", "No config file at " + paths.config_file + ", using defaults");
        return defaults(paths);
    }

    std::ifstream in(paths.config_file);
    if (!in) {
        throw LocalError("Failed to read config file: " + paths.config_file);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    LOG_DEBUG("CONFIG", "Loading " + paths.config_file);
    return from_json(buffer.str(), paths);
}

} // namespace vaulthunter
