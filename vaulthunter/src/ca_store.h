/**
 * @file ca_store.h
 * @brief Trust store construction for HTTPS connections
 *
 * DO NOT include this file directly. Use vaulthunter.h instead.
 */

#pragma once

#include <openssl/x509.h>

#include <memory>
#include <string>
#include <vector>

namespace vaulthunter {
namespace http {

using X509StorePtr = std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)>;

/**
 * @brief Build a store holding the system roots plus every configured PEM file
 *
 * A file may hold a chain; it must hold at least one certificate.
 *
 * @throws LocalError if a file cannot be read or holds no certificate
 */
X509StorePtr load_ca_store(const std::vector<std::string>& ca_certs);

} // namespace http
} // namespace vaulthunter
