#include <gtest/gtest.h>

#include "test_helpers.h"
#include <vaulthunter.h>

#include <sys/stat.h>

#include <filesystem>

using namespace vaulthunter;
using vaulthunter::testing::TempDir;
namespace fs = std::filesystem;

namespace {

/// Sets the process umask for the scope
class ScopedUmask {
public:
    explicit ScopedUmask(mode_t mask) : old_(::umask(mask)) {}
    ~ScopedUmask() { ::umask(old_); }

    ScopedUmask(const ScopedUmask&) = delete;
    ScopedUmask& operator=(const ScopedUmask&) = delete;

private:
    mode_t old_;
};

mode_t mode_of(const std::string& path) {
    struct stat st {};
    EXPECT_EQ(::stat(path.c_str(), &st), 0) << path;
    return st.st_mode & 0777;
}

} // namespace

TEST(PrivateFileTest, NewFileIsOwnerOnlyUnderPermissiveUmask) {
    ScopedUmask open_umask(0);
    TempDir dir;

    write_private_file(dir.file("runtime.json"), "{\"token\": \"s.abc\"}\n");

    EXPECT_EQ(mode_of(dir.file("runtime.json")), static_cast<mode_t>(0600));
    EXPECT_EQ(dir.read("runtime.json"), "{\"token\": \"s.abc\"}\n");
}

TEST(PrivateFileTest, ExistingFileIsRestrictedAndReplaced) {
    TempDir dir;
    dir.write("export.json", "a much longer previous content that must disappear\n");
    fs::permissions(dir.file("export.json"),
                    fs::perms::owner_read | fs::perms::owner_write |
                    fs::perms::group_read | fs::perms::others_read);

    write_private_file(dir.file("export.json"), "[]\n");

    EXPECT_EQ(mode_of(dir.file("export.json")), static_cast<mode_t>(0600));
    EXPECT_EQ(dir.read("export.json"), "[]\n");
}

TEST(PrivateFileTest, MissingDirectoryIsLocalError) {
    TempDir dir;
    EXPECT_THROW(write_private_file(dir.file("missing/export.json"), "[]\n"), LocalError);
}

TEST(PrivateFileTest, TokenCacheFileIsOwnerOnlyUnderPermissiveUmask) {
    ScopedUmask open_umask(0);
    TempDir dir;
    ConfigPaths paths;
    paths.config_file = dir.file("config.json");
    paths.cache_file = dir.file("cache/runtime.json");
    paths.user_name = "alice";

    Config config = Config::defaults(paths);
    Client client(config);
    client.set_last_export_time(1700000000LL);

    EXPECT_EQ(mode_of(dir.file("cache/runtime.json")), static_cast<mode_t>(0600));
}
