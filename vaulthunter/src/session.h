/**
 * @file session.h
 * @brief Session manager: token reuse, validation and login
 *
 * DO NOT include this file directly. Use vaulthunter.h instead.
 */

#pragma once

#include "../include/vaulthunter.h"
#include "token_cache.h"
#include "transport/transport.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace vaulthunter {

/**
 * @brief Owns the authentication state of one process
 *
 * The session is the only writer of the token. Every change is pushed to
 * the transport (for request signing) and persisted in the token cache.
 */
class Session {
public:
    /**
     * @param transport Transport used for every auth call
     * @param cache Token cache
     * @param username Configured username (lower-cased internally)
     * @param prompt Password source for interactive login (may be empty)
     * @param token_max_ttl Requested token lifetime in seconds
     */
    Session(transport::Transport& transport,
            TokenCache& cache,
            const std::string& username,
            PasswordPrompt prompt,
            int token_max_ttl);

    /**
     * @brief Bootstrap: cached token, validated, else one interactive login
     *
     * @throws NoCredentialSourceError, AuthRejectedError, TransportError,
     *         MalformedResponseError if interactive login fails
     */
    void login();

    /**
     * @brief Load the cached token without validation
     * @throws NoCredentialSourceError if no token is cached
     * @throws LocalError if the cache cannot be read
     */
    void load_cached();

    /**
     * @brief Ask the server about the current token
     *
     * Any successful response counts; its shape is not checked.
     */
    nlohmann::json lookup_self();

    /**
     * @brief Prompt for the password and log in
     */
    void login_interactive();

    /**
     * @brief Log in with the given password and cache the issued token
     */
    void login_with_password(const std::string& password);

    /**
     * @brief Revoke the token server-side and forget it locally
     *
     * No-op without a token. A 403 (token already invalid) still clears
     * the token, with a notice on stderr.
     */
    void logout();

    SessionState state() const { return state_; }
    const std::optional<std::string>& token() const { return token_; }

private:
    void adopt_token(const std::optional<std::string>& token);

    transport::Transport& transport_;
    TokenCache& cache_;
    std::string username_;
    PasswordPrompt prompt_;
    int token_max_ttl_;

    SessionState state_ = SessionState::NoToken;
    std::optional<std::string> token_;
};

} // namespace vaulthunter
