#include <gtest/gtest.h>

#include "ca_store.h"
#include "test_certs.h"
#include "test_helpers.h"
#include <vaulthunter.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace vaulthunter;
using namespace vaulthunter::testing;

namespace {

class CaStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_self_signed_pem(dir.file("internal.pem"), "internal-root");
        write_self_signed_pem(dir.file("system.pem"), "system-root");
        std::filesystem::create_directories(dir.file("certs"));
    }

    TempDir dir;
};

} // namespace

TEST_F(CaStoreTest, ConfiguredCertificateIsTrusted) {
    auto store = http::load_ca_store({dir.file("internal.pem")});
    auto cert = read_pem(dir.file("internal.pem"));
    ASSERT_TRUE(cert);
    EXPECT_TRUE(verifies(store.get(), cert.get()));
}

TEST_F(CaStoreTest, SystemRootsStayAlongsideConfiguredCertificates) {
    // OpenSSL reads its default roots from SSL_CERT_FILE / SSL_CERT_DIR
    ScopedEnv cert_file("SSL_CERT_FILE", dir.file("system.pem").c_str());
    ScopedEnv cert_dir("SSL_CERT_DIR", dir.file("certs").c_str());

    auto store = http::load_ca_store({dir.file("internal.pem")});

    auto internal = read_pem(dir.file("internal.pem"));
    auto system = read_pem(dir.file("system.pem"));
    ASSERT_TRUE(internal);
    ASSERT_TRUE(system);
    EXPECT_TRUE(verifies(store.get(), internal.get()));
    EXPECT_TRUE(verifies(store.get(), system.get()));
}

TEST_F(CaStoreTest, SystemRootsAreLoadedWithoutConfiguredCertificates) {
    ScopedEnv cert_file("SSL_CERT_FILE", dir.file("system.pem").c_str());
    ScopedEnv cert_dir("SSL_CERT_DIR", dir.file("certs").c_str());

    auto store = http::load_ca_store({});

    auto system = read_pem(dir.file("system.pem"));
    ASSERT_TRUE(system);
    EXPECT_TRUE(verifies(store.get(), system.get()));
}

TEST_F(CaStoreTest, UnconfiguredCertificateIsNotTrusted) {
    ScopedEnv cert_file("SSL_CERT_FILE", dir.file("system.pem").c_str());
    ScopedEnv cert_dir("SSL_CERT_DIR", dir.file("certs").c_str());
    write_self_signed_pem(dir.file("stranger.pem"), "stranger");

    auto store = http::load_ca_store({dir.file("internal.pem")});

    auto stranger = read_pem(dir.file("stranger.pem"));
    ASSERT_TRUE(stranger);
    EXPECT_FALSE(verifies(store.get(), stranger.get()));
}

TEST_F(CaStoreTest, ChainFileLoadsEveryCertificate) {
    std::ifstream a(dir.file("internal.pem"));
    std::ifstream b(dir.file("system.pem"));
    std::stringstream chain;
    chain << a.rdbuf() << b.rdbuf();
    dir.write("chain.pem", chain.str());

    auto store = http::load_ca_store({dir.file("chain.pem")});

    auto system = read_pem(dir.file("system.pem"));
    ASSERT_TRUE(system);
    EXPECT_TRUE(verifies(store.get(), system.get()));
}

TEST_F(CaStoreTest, BrokenFilesAreLocalErrors) {
    dir.write("garbage.pem", "not a certificate\n");
    EXPECT_THROW(http::load_ca_store({dir.file("missing.pem")}), LocalError);
    EXPECT_THROW(http::load_ca_store({dir.file("internal.pem"), dir.file("garbage.pem")}),
                 LocalError);
}
