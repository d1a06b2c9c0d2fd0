/**
 * @file ca_store.cpp
 * @brief Trust store construction using OpenSSL
 */

#include "ca_store.h"
#include "log.h"

#include <openssl/err.h>
#include <openssl/pem.h>

#include <fstream>
#include <iterator>

namespace vaulthunter {
namespace http {

namespace {

std::string read_file(const std::string& filename) {
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        throw LocalError("Failed to open CA cert: " + filename);
    }
    std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw LocalError("Failed to read CA cert: " + filename);
    }
    return data;
}

int add_pem_certificates(X509_STORE* store, const std::string& filename) {
    std::string pem = read_file(filename);

    BIO* bio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (!bio) {
        throw LocalError("Failed to allocate BIO for CA cert: " + filename);
    }

    int loaded = 0;
    while (X509* cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)) {
        if (X509_STORE_add_cert(store, cert) != 1) {
            // Already present in the store
            ERR_clear_error();
        }
        X509_free(cert);
        ++loaded;
    }
    // PEM_read_bio_X509 leaves "no start line" on the queue at end of input
    ERR_clear_error();
    BIO_free(bio);

    return loaded;
}

} // namespace

X509StorePtr load_ca_store(const std::vector<std::string>& ca_certs) {
    X509StorePtr store(X509_STORE_new(), &X509_STORE_free);
    if (!store) {
        throw LocalError("Failed to allocate certificate store");
    }

    // Configured certificates extend the system roots, they do not replace them
    if (X509_STORE_set_default_paths(store.get()) != 1) {
        ERR_clear_error();
        LOG_WARN("HTTP", "Could not load the system certificate store");
    }

    for (const auto& filename : ca_certs) {
        int loaded = add_pem_certificates(store.get(), filename);
        if (loaded == 0) {
            throw LocalError("Invalid CA cert: " + filename);
        }
        LOG_DEBUG("HTTP", "Loaded " + std::to_string(loaded) + " certificate(s) from " + filename);
    }

    return store;
}

} // namespace http
} // namespace vaulthunter
