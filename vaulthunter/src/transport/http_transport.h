#pragma once

/**
 * @file http_transport.h
 * @brief HTTP transport implementation using http::Client
 */

#include "transport.h"
#include "../http.h"

namespace vaulthunter {
namespace transport {

/**
 * @brief HTTP-based transport implementation
 *
 * Wraps http::Client and adds the bearer token to every request.
 */
class HTTPTransport : public Transport {
public:
    /**
     * @brief Construct HTTP transport
     * @param server_url Server URL (e.g., "https://vault.example.com/")
     * @param ca_certs PEM files used as trust roots
     * @param timeout_seconds Network timeout
     * @throws LocalError if a CA certificate cannot be loaded
     */
    HTTPTransport(const std::string& server_url,
                  const std::vector<std::string>& ca_certs,
                  int timeout_seconds = 30);

    ~HTTPTransport() override;

    // Non-copyable
    HTTPTransport(const HTTPTransport&) = delete;
    HTTPTransport& operator=(const HTTPTransport&) = delete;

    Response send_request(
        const std::string& method,
        const std::string& endpoint,
        const std::string& body = "",
        const std::map<std::string, std::string>& headers = {}
    ) override;

    void set_token(const std::optional<std::string>& token) override;
    std::optional<std::string> get_token() const override;
    std::string get_server_url() const override;

private:
    std::string server_url_;
    std::optional<std::string> token_;
    std::unique_ptr<http::Client> http_client_;
};

} // namespace transport
} // namespace vaulthunter
