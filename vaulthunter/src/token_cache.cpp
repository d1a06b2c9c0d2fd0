/**
 * @file token_cache.cpp
 * @brief Persistent runtime cache implementation
 */

#include "token_cache.h"
#include "log.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <system_error>

namespace vaulthunter {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

json read_document(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw LocalError("Failed to open runtime info file: " + path);
    }
    json data;
    try {
        in >> data;
    } catch (const json::exception&) {
        throw LocalError("Failed to read JSON from runtime info file: " + path);
    }
    if (!data.is_object()) {
        throw LocalError("Runtime info file is not a JSON object: " + path);
    }
    return data;
}

} // namespace

TokenCache::TokenCache(std::string path)
    : path_(std::move(path))
{
}

bool TokenCache::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::optional<std::string> TokenCache::get(const std::string& key) const {
    if (!exists()) {
        return std::nullopt;
    }

    json data = read_document(path_);
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw LocalError("Invalid runtime info for key '" + key + "'");
    }
    return it->get<std::string>();
}

void TokenCache::set(const std::string& key, const std::optional<std::string>& value) {
    json data = json::object();
    if (exists()) {
        try {
            data = read_document(path_);
        } catch (const LocalError& e) {
            // An unreadable cache is rewritten from scratch
            LOG_WARN("CACHE", std::string(e.what()) + ", starting a new one");
        }
    }

    if (value) {
        data[key] = *value;
    } else {
        data.erase(key);
    }

    fs::path file(path_);
    std::error_code ec;
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
        if (ec) {
            throw LocalError("Failed to create directory for runtime info file: " + ec.message());
        }
    }

    write_private_file(path_, data.dump(2) + "\n");
    LOG_DEBUG("CACHE", std::string(value ? "Stored '" : "Removed '") + key + "'");
}

} // namespace vaulthunter
