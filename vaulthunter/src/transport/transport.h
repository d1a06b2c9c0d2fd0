#pragma once

/**
 * @file transport.h
 * @brief Abstract transport interface for requests to the Vault HTTP API
 *
 * The session manager and the tree navigator only talk to this interface,
 * so they can be driven by an in-memory implementation in tests.
 */

#include <string>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace vaulthunter {
namespace transport {

/**
 * @brief Response structure from transport layer
 */
struct Response {
    bool success = false;   ///< false if no HTTP response was received
    int status_code = 0;
    std::string body;
    std::string error;

    bool ok() const { return success && status_code >= 200 && status_code < 300; }
};

/**
 * @brief Abstract base class for transport implementations
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * @brief Send a request and wait for response
     *
     * The current token, if any, is attached as a bearer credential.
     * No retry is attempted.
     *
     * @param method HTTP method ("GET", "POST", "LIST", ...)
     * @param endpoint API endpoint (e.g., "/v1/auth/token/lookup-self")
     * @param body Request body (JSON string, empty for none)
     * @param headers Additional headers
     * @return Response with status and body
     */
    virtual Response send_request(
        const std::string& method,
        const std::string& endpoint,
        const std::string& body = "",
        const std::map<std::string, std::string>& headers = {}
    ) = 0;

    /**
     * @brief Set the bearer token for subsequent requests
     * @param token Token, or nullopt to send requests unauthenticated
     */
    virtual void set_token(const std::optional<std::string>& token) = 0;

    /**
     * @brief Get the bearer token (if set)
     */
    virtual std::optional<std::string> get_token() const = 0;

    /**
     * @brief Get the server URL
     */
    virtual std::string get_server_url() const = 0;
};

/**
 * @brief Factory function to create the HTTPS transport
 *
 * @param server_url Server URL
 * @param ca_certs PEM files used as trust roots
 * @param timeout_seconds Network timeout
 * @throws LocalError if a CA certificate cannot be loaded
 */
std::unique_ptr<Transport> create_transport(
    const std::string& server_url,
    const std::vector<std::string>& ca_certs,
    int timeout_seconds
);

} // namespace transport
} // namespace vaulthunter
