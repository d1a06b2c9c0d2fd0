/**
 * @file session.cpp
 * @brief Session manager implementation
 */

#include "session.h"
#include "api.h"
#include "json_utils.h"
#include "log.h"
#include "string_utils.h"

#include <iostream>

namespace vaulthunter {

using json = nlohmann::json;

Session::Session(transport::Transport& transport,
                 TokenCache& cache,
                 const std::string& username,
                 PasswordPrompt prompt,
                 int token_max_ttl)
    : transport_(transport),
      cache_(cache),
      username_(to_lower(username)),
      prompt_(std::move(prompt)),
      token_max_ttl_(token_max_ttl)
{
}

void Session::adopt_token(const std::optional<std::string>& token) {
    token_ = token;
    transport_.set_token(token);
}

// ============================================================================
// BOOTSTRAP
// ============================================================================

void Session::login() {
    std::optional<std::string> cached;
    try {
        cached = cache_.get(TokenCache::TOKEN_KEY);
    } catch (const LocalError& e) {
        LOG_WARN("SESSION", std::string("Ignoring unreadable token cache: ") + e.what());
    }

    if (cached) {
        adopt_token(cached);
        state_ = SessionState::Probing;
        LOG_DEBUG("SESSION", "Validating cached token");
        try {
            lookup_self();
            state_ = SessionState::Authenticated;
            LOG_INFO("SESSION", "Reusing cached token");
            return;
        } catch (const VaultHunterError& e) {
            LOG_WARN("SESSION", std::string("Cached token rejected: ") + e.what());
            adopt_token(std::nullopt);
        }
    } else {
        LOG_DEBUG("SESSION", "No cached token");
    }

    login_interactive();
}

void Session::load_cached() {
    auto cached = cache_.get(TokenCache::TOKEN_KEY);
    if (!cached) {
        throw NoCredentialSourceError("No cached token available");
    }
    adopt_token(cached);
    state_ = SessionState::Probing;
}

json Session::lookup_self() {
    auto response = transport_.send_request("GET", api::LOOKUP_SELF);
    return api::expect_json(response, "Failed to lookup token");
}

// ============================================================================
// CREDENTIAL LOGIN
// ============================================================================

void Session::login_interactive() {
    if (!prompt_) {
        state_ = SessionState::Failed;
        throw NoCredentialSourceError("No cached token and no password prompt available");
    }

    auto password = prompt_("Password: ");
    if (!password) {
        state_ = SessionState::Failed;
        throw NoCredentialSourceError("Failed to read password");
    }

    login_with_password(*password);
}

void Session::login_with_password(const std::string& password) {
    LOG_INFO("SESSION", "Logging in as " + username_);

    try {
        // The login call itself is never signed with a stale token
        adopt_token(std::nullopt);

        json payload = {
            {"password", password},
            {"token_max_ttl", token_max_ttl_}
        };
        auto response = transport_.send_request("POST", api::login_endpoint(username_),
                                                payload.dump());

        json body;
        try {
            body = api::expect_json(response, "Failed to login");
        } catch (const StoreError& e) {
            throw AuthRejectedError(e.what());
        }

        std::string token;
        if (body.contains("auth") && body["auth"].is_object()) {
            token = json_value<std::string>(body["auth"], "client_token");
        }
        if (token.empty()) {
            throw MalformedResponseError("Login response carries no client token");
        }

        adopt_token(token);
        cache_.set(TokenCache::TOKEN_KEY, token);
        state_ = SessionState::Authenticated;
        LOG_INFO("SESSION", "Logged in, token cached");
    } catch (const VaultHunterError& e) {
        state_ = SessionState::Failed;
        LOG_ERROR("SESSION", e.what());
        throw;
    }
}

// ============================================================================
// LOGOUT
// ============================================================================

void Session::logout() {
    if (!token_) {
        LOG_DEBUG("SESSION", "No token to revoke");
        return;
    }

    auto response = transport_.send_request("POST", api::REVOKE_SELF);
    api::ensure_delivered(response, "Failed to send logout request");

    if (response.status_code == 403) {
        std::cerr << "Invalid token. Maybe it has expired. Clearing token cache..." << std::endl;
        LOG_WARN("SESSION", "Token already invalid (HTTP 403)");
    } else if (!response.ok()) {
        std::string message = "HTTP " + std::to_string(response.status_code);
        json body = json::parse(response.body, nullptr, false);
        if (auto error = first_error(body)) {
            message = *error;
        }
        throw StoreError("Failed to logout: " + message, response.status_code);
    }

    adopt_token(std::nullopt);
    state_ = SessionState::NoToken;
    if (cache_.exists()) {
        cache_.set(TokenCache::TOKEN_KEY, std::nullopt);
    }
    LOG_INFO("SESSION", "Logged out");
}

} // namespace vaulthunter
