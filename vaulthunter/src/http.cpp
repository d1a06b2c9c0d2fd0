/**
 * @file http.cpp
 * @brief HTTP client implementation using cpp-httplib
 */

#include "http.h"
#include "ca_store.h"
#include "log.h"

// Enable OpenSSL support for HTTPS
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

#include <regex>

namespace vaulthunter {
namespace http {

// ============================================================================
// IMPLEMENTATION
// ============================================================================

struct Client::Impl {
    std::string base_url;
    std::string host;
    std::string base_path;
    int port = 443;
    bool use_ssl = true;

    std::unique_ptr<httplib::Client> client;

    int timeout_seconds = 30;

    void parse_url() {
        std::regex url_regex(R"(^(https?):\/\/([^:\/]+)(?::(\d+))?(\/.*)?$)");
        std::smatch match;

        if (!std::regex_match(base_url, match, url_regex)) {
            throw LocalError("Invalid end point URL: " + base_url);
        }

        use_ssl = (match[1].str() == "https");
        host = match[2].str();
        if (match[3].matched) {
            port = std::stoi(match[3].str());
        } else {
            port = use_ssl ? 443 : 80;
        }

        // Endpoints start with '/', so keep the prefix without its trailing one
        base_path = match[4].matched ? match[4].str() : "";
        while (!base_path.empty() && base_path.back() == '/') {
            base_path.pop_back();
        }
    }

    void setup_client(const std::vector<std::string>& ca_certs) {
        // Certificates are loaded even for plain HTTP so that a broken
        // configuration is reported at construction time
        X509StorePtr store = load_ca_store(ca_certs);

        std::string scheme = use_ssl ? "https" : "http";
        std::string url = scheme + "://" + host + ":" + std::to_string(port);

        client = std::make_unique<httplib::Client>(url);

        client->set_connection_timeout(timeout_seconds, 0);
        client->set_read_timeout(timeout_seconds, 0);
        client->set_write_timeout(timeout_seconds, 0);

        if (use_ssl) {
            client->enable_server_certificate_verification(true);
            if (!ca_certs.empty()) {
                // The SSL context takes ownership of the store
                client->set_ca_cert_store(store.release());
            }
        }

        client->set_default_headers({
            {"Accept", "application/json"}
        });
    }
};

// ============================================================================
// PUBLIC METHODS
// ============================================================================

Client::Client(const std::string& base_url,
               const std::vector<std::string>& ca_certs,
               int timeout_seconds)
    : impl_(std::make_unique<Impl>())
{
    impl_->base_url = base_url;
    impl_->timeout_seconds = timeout_seconds;
    impl_->parse_url();
    impl_->setup_client(ca_certs);
}

Client::~Client() = default;

Response Client::request(
    const std::string& method,
    const std::string& endpoint,
    const std::string& json_body,
    const std::map<std::string, std::string>& extra_headers
) {
    Response response;

    httplib::Request req;
    req.method = method;
    req.path = impl_->base_path + endpoint;
    for (const auto& [name, value] : extra_headers) {
        req.set_header(name, value);
    }
    if (!json_body.empty()) {
        req.set_header("Content-Type", "application/json");
        req.body = json_body;
    }

    auto result = impl_->client->send(req);

    if (result) {
        response.status_code = result->status;
        response.body = result->body;
    } else {
        response.error = "Request failed: " + httplib::to_string(result.error());
    }

    return response;
}

} // namespace http
} // namespace vaulthunter
