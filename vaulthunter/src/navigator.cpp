/**
 * @file navigator.cpp
 * @brief Secret tree navigator implementation
 */

#include "navigator.h"
#include "api.h"
#include "json_utils.h"
#include "log.h"
#include "string_utils.h"

namespace vaulthunter {

using json = nlohmann::json;

Navigator::Navigator(transport::Transport& transport, const std::string& username)
    : transport_(transport), username_(to_lower(username))
{
}

std::vector<TreeEntry> Navigator::list(const Path& path) {
    std::string endpoint = api::metadata_endpoint(username_, path);
    auto response = transport_.send_request("LIST", endpoint);
    json body = api::expect_json(response, "Failed to list " + endpoint);

    if (!body.contains("data") || !body["data"].is_object() ||
        !body["data"].contains("keys") || !body["data"]["keys"].is_array()) {
        throw MalformedResponseError("List result is not a list: " + endpoint);
    }

    // The only way to tell a directory from a key is the trailing slash
    std::vector<TreeEntry> entries;
    for (const auto& item : body["data"]["keys"]) {
        if (!item.is_string()) {
            throw MalformedResponseError("List item is not a string: " + endpoint);
        }
        TreeEntry entry = TreeEntry::from_listing(item.get<std::string>());
        if (entry.name.empty() || entry.name.find(Path::SEPARATOR) != std::string::npos) {
            throw MalformedResponseError("Invalid list item '" + item.get<std::string>() +
                                         "' in " + endpoint);
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

SecretRecord Navigator::get(const Path& path) {
    auto response = transport_.send_request("GET", api::data_endpoint(username_, path));
    json body = api::expect_json(response, "Failed to get " + path.str());

    // KV v2 wraps the fields as {"data": {"data": {...}, "metadata": {...}}}
    if (!body.contains("data") || !body["data"].is_object() ||
        !body["data"].contains("data") || !body["data"]["data"].is_object()) {
        throw MalformedResponseError("Get result is not a dict: " + path.str());
    }

    SecretRecord record;
    for (const auto& [field, value] : body["data"]["data"].items()) {
        record[field] = json_to_text(value);
    }
    return record;
}

void Navigator::walk(const KeyVisitor& on_key) {
    std::vector<Path> frontier{Path()};
    size_t level = 0;

    while (!frontier.empty()) {
        LOG_DEBUG("NAVIGATOR", "Level " + std::to_string(level) + ": " +
                  std::to_string(frontier.size()) + " director" +
                  (frontier.size() == 1 ? "y" : "ies"));

        std::vector<Path> next_frontier;
        for (const auto& dir : frontier) {
            for (const auto& entry : list(dir)) {
                if (entry.is_dir()) {
                    next_frontier.push_back(dir.pushed(entry.name));
                } else {
                    on_key(dir.pushed(entry.name));
                }
            }
        }
        frontier.swap(next_frontier);
        ++level;
    }
}

std::vector<Path> Navigator::search(const std::string& pattern) {
    const std::string needle = to_lower(pattern);
    std::vector<Path> matches;

    walk([&](const Path& key_path) {
        if (to_lower(key_path.leaf()).find(needle) != std::string::npos) {
            matches.push_back(key_path);
        }
    });

    LOG_INFO("NAVIGATOR", std::to_string(matches.size()) + " match(es) for '" + pattern + "'");
    return matches;
}

std::vector<ExportEntry> Navigator::export_all() {
    std::vector<ExportEntry> entries;

    walk([&](const Path& key_path) {
        entries.push_back(ExportEntry{key_path, get(key_path)});
    });

    LOG_INFO("NAVIGATOR", "Exported " + std::to_string(entries.size()) + " record(s)");
    return entries;
}

} // namespace vaulthunter
