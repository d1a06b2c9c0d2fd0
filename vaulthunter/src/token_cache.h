/**
 * @file token_cache.h
 * @brief Persistent runtime cache (one JSON object file)
 *
 * DO NOT include this file directly. Use vaulthunter.h instead.
 */

#pragma once

#include <optional>
#include <string>

namespace vaulthunter {

/**
 * @brief Small key-value store persisted as a single JSON object
 *
 * Holds the session token and the last export time between runs.
 * Not safe under concurrent writers from several processes.
 */
class TokenCache {
public:
    static constexpr const char* TOKEN_KEY = "token";
    static constexpr const char* LAST_EXPORT_KEY = "last_export";

    explicit TokenCache(std::string path);

    /**
     * @brief Read one value
     * @return The value, or nullopt if the file or the key does not exist
     * @throws LocalError if the file exists but cannot be read, is not a JSON
     *         object, or the value is not a string
     */
    std::optional<std::string> get(const std::string& key) const;

    /**
     * @brief Write or remove one value
     *
     * Other keys are preserved. The file and its directory are created with
     * owner-only permissions when missing.
     *
     * @param value New value, or nullopt to remove the key
     * @throws LocalError on read, parse or write failure
     */
    void set(const std::string& key, const std::optional<std::string>& value);

    bool exists() const;
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace vaulthunter
