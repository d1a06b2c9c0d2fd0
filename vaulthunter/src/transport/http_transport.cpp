/**
 * @file http_transport.cpp
 * @brief HTTP transport implementation using http::Client
 */

#include "http_transport.h"
#include "../log.h"

#include <sstream>

namespace vaulthunter {
namespace transport {

HTTPTransport::HTTPTransport(const std::string& server_url,
                             const std::vector<std::string>& ca_certs,
                             int timeout_seconds)
    : server_url_(server_url),
      http_client_(std::make_unique<http::Client>(server_url, ca_certs, timeout_seconds))
{
    LOG_DEBUG("TRANSPORT", "HTTP transport ready for " + server_url_);
}

HTTPTransport::~HTTPTransport() = default;

// ============================================================================
// REQUEST/RESPONSE
// ============================================================================

Response HTTPTransport::send_request(
    const std::string& method,
    const std::string& endpoint,
    const std::string& body,
    const std::map<std::string, std::string>& headers
) {
    Response response;

    std::map<std::string, std::string> request_headers = headers;
    if (token_ && !token_->empty()) {
        request_headers["Authorization"] = "Bearer " + *token_;
    }

    LOG_DEBUG("TRANSPORT", method + " " + endpoint);

    try {
        auto http_response = http_client_->request(method, endpoint, body, request_headers);

        if (http_response.status_code == 0) {
            response.success = false;
            response.error = http_response.error;
            LOG_ERROR("TRANSPORT", response.error);
            return response;
        }

        response.status_code = http_response.status_code;
        response.body = http_response.body;
        response.success = true;

        if (!http_response.ok()) {
            std::ostringstream oss;
            oss << "HTTP " << http_response.status_code;
            response.error = oss.str();
        }
    } catch (const std::exception& e) {
        response.success = false;
        response.error = e.what();
        LOG_ERROR("TRANSPORT", response.error);
    }

    return response;
}

// ============================================================================
// CONFIGURATION
// ============================================================================

void HTTPTransport::set_token(const std::optional<std::string>& token) {
    token_ = token;
}

std::optional<std::string> HTTPTransport::get_token() const {
    return token_;
}

std::string HTTPTransport::get_server_url() const {
    return server_url_;
}

// ============================================================================
// FACTORY FUNCTION
// ============================================================================

std::unique_ptr<Transport> create_transport(
    const std::string& server_url,
    const std::vector<std::string>& ca_certs,
    int timeout_seconds
) {
    return std::make_unique<HTTPTransport>(server_url, ca_certs, timeout_seconds);
}

} // namespace transport
} // namespace vaulthunter
