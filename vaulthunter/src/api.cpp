/**
 * @file api.cpp
 * @brief Vault HTTP API endpoints and response decoding
 */

#include "api.h"
#include "json_utils.h"
#include "log.h"

namespace vaulthunter {
namespace api {

using json = nlohmann::json;

std::string login_endpoint(const std::string& username) {
    return "/v1/auth/userpass/login/" + username;
}

// The root path renders as "", which keeps the trailing '/' of the mount
// prefix; the server lists the user's top level for it.
std::string metadata_endpoint(const std::string& username, const Path& path) {
    return std::string("/v1/") + SECRET_MOUNT + "/metadata/" + username + "/" + path.str();
}

std::string data_endpoint(const std::string& username, const Path& path) {
    return std::string("/v1/") + SECRET_MOUNT + "/data/" + username + "/" + path.str();
}

void ensure_delivered(const transport::Response& response, const std::string& action) {
    if (!response.success) {
        throw TransportError(action + ": " + response.error);
    }
}

json expect_json(const transport::Response& response, const std::string& action) {
    ensure_delivered(response, action);

    json body = json::object();
    if (!response.body.empty()) {
        try {
            body = json::parse(response.body);
        } catch (const json::parse_error& e) {
            LOG_ERROR("API", action + ": " + e.what());
            if (!response.ok()) {
                throw StoreError(action + ": HTTP " + std::to_string(response.status_code),
                                 response.status_code);
            }
            throw MalformedResponseError(action + ": failed to parse JSON");
        }
    }

    if (auto message = first_error(body)) {
        throw StoreError(action + ": " + *message, response.status_code);
    }
    if (!response.ok()) {
        throw StoreError(action + ": HTTP " + std::to_string(response.status_code),
                         response.status_code);
    }
    return body;
}

} // namespace api
} // namespace vaulthunter
