/**
 * @file navigator.h
 * @brief Secret tree navigator: listing, lookup and breadth-first traversal
 *
 * DO NOT include this file directly. Use vaulthunter.h instead.
 */

#pragma once

#include "../include/vaulthunter.h"
#include "transport/transport.h"

#include <functional>
#include <string>
#include <vector>

namespace vaulthunter {

/**
 * @brief Walks a tree whose only primitive is "list the children of a directory"
 *
 * Requests go through the transport, which carries the session token.
 */
class Navigator {
public:
    using KeyVisitor = std::function<void(const Path& key_path)>;

    /**
     * @param transport Authenticated transport
     * @param username Configured username (lower-cased internally)
     */
    Navigator(transport::Transport& transport, const std::string& username);

    /**
     * @brief Immediate children of a directory
     * @throws StoreError if the body carries an errors array
     * @throws MalformedResponseError if data.keys is missing or not a list of names
     */
    std::vector<TreeEntry> list(const Path& path);

    /**
     * @brief Field map stored at a leaf (the data.data envelope is peeled)
     */
    SecretRecord get(const Path& path);

    /**
     * @brief Breadth-first walk calling on_key for every leaf
     *
     * Each level's frontier is listed completely before the next level starts.
     * Keys are never listed.
     */
    void walk(const KeyVisitor& on_key);

    std::vector<Path> search(const std::string& pattern);
    std::vector<ExportEntry> export_all();

private:
    transport::Transport& transport_;
    std::string username_;
};

} // namespace vaulthunter
