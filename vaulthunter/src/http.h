/**
 * @file http.h
 * @brief Internal HTTP client for Vault Hunter
 *
 * DO NOT include this file directly. Use vaulthunter.h instead.
 */

#pragma once

#include <string>
#include <map>
#include <vector>
#include <memory>

namespace vaulthunter {
namespace http {

/**
 * @brief HTTP response structure
 */
struct Response {
    int status_code = 0;        ///< HTTP status code (200, 404, etc.)
    std::string body;           ///< Response body
    std::string error;          ///< Error message if any

    bool ok() const { return status_code >= 200 && status_code < 300; }
};

/**
 * @brief HTTP client class
 *
 * Wraps one cpp-httplib client bound to a base URL. A path in the base
 * URL (e.g. "https://host/vault/") prefixes every endpoint.
 */
class Client {
public:
    /**
     * @brief Construct HTTP client
     * @param base_url Base URL (e.g., "https://vault.example.com/")
     * @param ca_certs PEM files trusted in addition to the system roots
     * @param timeout_seconds Connection, read and write timeout
     * @throws LocalError if the URL is invalid or a CA file cannot be loaded
     */
    Client(const std::string& base_url,
           const std::vector<std::string>& ca_certs,
           int timeout_seconds = 30);

    ~Client();

    // Non-copyable
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /**
     * @brief Send one request
     * @param method HTTP method, including non-standard ones such as "LIST"
     * @param endpoint Endpoint path (e.g., "/v1/sys/health")
     * @param json_body JSON body string, empty for none
     * @param extra_headers Additional headers for this request
     * @return Response; status_code is 0 and error is set if no response was received
     */
    Response request(
        const std::string& method,
        const std::string& endpoint,
        const std::string& json_body = "",
        const std::map<std::string, std::string>& extra_headers = {}
    );

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace http
} // namespace vaulthunter
