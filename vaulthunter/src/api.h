/**
 * @file api.h
 * @brief Vault HTTP API endpoints and response decoding
 *
 * DO NOT include this file directly. Use vaulthunter.h instead.
 */

#pragma once

#include "transport/transport.h"

#include <nlohmann/json.hpp>

#include <string>

namespace vaulthunter {

class Path;

namespace api {

// ============================================================================
// ENDPOINTS
// ============================================================================

constexpr const char* LOOKUP_SELF = "/v1/auth/token/lookup-self";
constexpr const char* REVOKE_SELF = "/v1/auth/token/revoke-self";
constexpr const char* HEALTH = "/v1/sys/health";
constexpr const char* MOUNTS = "/v1/sys/mounts";

/// Mount point of the KV v2 engine holding the secrets
constexpr const char* SECRET_MOUNT = "passwords";

/// username must already be lower-cased
std::string login_endpoint(const std::string& username);
std::string metadata_endpoint(const std::string& username, const Path& path);
std::string data_endpoint(const std::string& username, const Path& path);

// ============================================================================
// RESPONSE DECODING
// ============================================================================

/**
 * @brief Decode a response that must be a successful JSON exchange
 *
 * An empty body decodes as an empty object.
 *
 * @param response Transport response
 * @param action Prefix for error messages (e.g., "Failed to list a/b")
 * @return Parsed body
 * @throws TransportError if no HTTP response was received
 * @throws StoreError if the body has an "errors" message or the status is not 2xx
 * @throws MalformedResponseError if the body is not JSON
 */
nlohmann::json expect_json(const transport::Response& response, const std::string& action);

/**
 * @brief Throw TransportError if no HTTP response was received
 */
void ensure_delivered(const transport::Response& response, const std::string& action);

} // namespace api
} // namespace vaulthunter
