/**
 * @file vaulthunter.cpp
 * @brief Main Client class implementation
 *
 * Composes the transport, the token cache, the session manager and the
 * tree navigator behind the public Client interface.
 */

#include "../include/vaulthunter.h"
#include "api.h"
#include "log.h"
#include "navigator.h"
#include "session.h"
#include "token_cache.h"
#include "transport/transport.h"

#include <nlohmann/json.hpp>

namespace vaulthunter {

using json = nlohmann::json;

// ============================================================================
// Client IMPLEMENTATION
// ============================================================================

class Client::Impl {
public:
    Config config;
    std::unique_ptr<transport::Transport> transport;
    TokenCache cache;
    Session session;
    Navigator navigator;

    Impl(const Config& cfg, std::unique_ptr<transport::Transport> t, PasswordPrompt prompt)
        : config(cfg),
          transport(std::move(t)),
          cache(config.cache_path),
          session(*transport, cache, config.username, std::move(prompt), config.token_max_ttl),
          navigator(*transport, config.username)
    {
        LOG_DEBUG("CLIENT", "Client for " + transport->get_server_url() +
                  " as " + config.lowercase_username());
    }

    HealthStatus health() {
        auto response = transport->send_request("GET", api::HEALTH);
        api::ensure_delivered(response, "Failed to send health request");
        return health_status_from_http(response.status_code);
    }

    std::string list_mounts() {
        auto response = transport->send_request("GET", api::MOUNTS);
        return api::expect_json(response, "Failed to list mounts").dump(2);
    }

    std::optional<long long> last_export_time() {
        auto value = cache.get(TokenCache::LAST_EXPORT_KEY);
        if (!value) {
            return std::nullopt;
        }
        try {
            size_t used = 0;
            long long t = std::stoll(*value, &used);
            if (used != value->size()) {
                throw LocalError("Invalid last export time: " + *value);
            }
            return t;
        } catch (const std::logic_error&) {
            throw LocalError("Invalid last export time: " + *value);
        }
    }
};

static std::unique_ptr<transport::Transport> require_transport(
    std::unique_ptr<transport::Transport> transport) {
    if (!transport) {
        throw std::invalid_argument("Client requires a transport");
    }
    return transport;
}

// ============================================================================
// Client PUBLIC METHODS
// ============================================================================

Client::Client(const Config& config, PasswordPrompt prompt)
    : impl_(std::make_unique<Impl>(
          config,
          transport::create_transport(config.end_point, config.ca_certs, config.timeout_seconds),
          prompt ? std::move(prompt) : PasswordPrompt(&read_password)))
{
}

Client::Client(const Config& config, std::unique_ptr<transport::Transport> transport,
               PasswordPrompt prompt)
    : impl_(std::make_unique<Impl>(config, require_transport(std::move(transport)),
                                   std::move(prompt)))
{
}

Client::~Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&&) noexcept = default;

void Client::login() {
    impl_->session.login();
}

void Client::login_cached() {
    impl_->session.load_cached();
}

void Client::login_with_password(const std::string& password) {
    impl_->session.login_with_password(password);
}

void Client::logout() {
    impl_->session.logout();
}

bool Client::logout_cached() {
    try {
        impl_->session.load_cached();
    } catch (const NoCredentialSourceError&) {
        LOG_INFO("CLIENT", "No cached token to revoke");
        return false;
    } catch (const LocalError& e) {
        LOG_WARN("CLIENT", std::string("Ignoring unreadable token cache: ") + e.what());
        return false;
    }
    impl_->session.logout();
    return true;
}

std::string Client::lookup_token() {
    return impl_->session.lookup_self().dump(2);
}

SessionState Client::state() const {
    return impl_->session.state();
}

bool Client::authenticated() const {
    return impl_->session.state() == SessionState::Authenticated;
}

std::vector<TreeEntry> Client::list(const Path& path) {
    return impl_->navigator.list(path);
}

SecretRecord Client::get(const Path& path) {
    return impl_->navigator.get(path);
}

std::vector<Path> Client::search(const std::string& pattern) {
    return impl_->navigator.search(pattern);
}

std::vector<ExportEntry> Client::export_all() {
    return impl_->navigator.export_all();
}

HealthStatus Client::health() {
    return impl_->health();
}

std::string Client::list_mounts() {
    return impl_->list_mounts();
}

std::optional<long long> Client::last_export_time() {
    return impl_->last_export_time();
}

void Client::set_last_export_time(long long unix_time) {
    impl_->cache.set(TokenCache::LAST_EXPORT_KEY, std::to_string(unix_time));
}

const Config& Client::config() const {
    return impl_->config;
}

} // namespace vaulthunter
