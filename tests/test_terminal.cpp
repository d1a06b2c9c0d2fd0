#include <gtest/gtest.h>

#include "test_helpers.h"
#include <vaulthunter.h>

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace vaulthunter;
using vaulthunter::testing::TempDir;
namespace fs = std::filesystem;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

std::string write_script(const TempDir& dir, const std::string& name, const std::string& body) {
    dir.write(name, "#!/bin/sh\n" + body + "\n");
    fs::permissions(dir.file(name), fs::perms::owner_all);
    return dir.file(name);
}

} // namespace

TEST(ClipboardTest, ContentIsWrittenToProgramStdin) {
    TempDir dir;
    std::string script = write_script(dir, "copy.sh", "cat > \"$1\"");

    Config config;
    config.clipboard_prog = script + " " + dir.file("clipboard.txt");

    EXPECT_TRUE(copy_to_clipboard("s3cret-value", config));
    EXPECT_EQ(read_file(dir.file("clipboard.txt")), "s3cret-value");
}

TEST(ClipboardTest, MissingProgramFallsBack) {
    Config config;
    config.clipboard_prog = "/nonexistent/vaulthunter-clipboard";
    EXPECT_FALSE(copy_to_clipboard("x", config));
}

TEST(ClipboardTest, DisabledClipboardFallsBack) {
    Config config;
    config.clipboard_prog = "";
    EXPECT_FALSE(copy_to_clipboard("x", config));
}

TEST(ClipboardTest, FailingProgramIsAnError) {
    TempDir dir;
    std::string script = write_script(dir, "fail.sh", "cat > /dev/null\nexit 3");

    Config config;
    config.clipboard_prog = script;

    try {
        copy_to_clipboard("x", config);
        FAIL() << "expected LocalError";
    } catch (const LocalError& e) {
        EXPECT_EQ(std::string(e.what()), "Clipboard program failed with code: 3");
    }
}

TEST(ClipboardTest, ProgramIgnoringInputDoesNotBreakTheWriter) {
    TempDir dir;
    std::string script = write_script(dir, "ignore.sh", "exit 0");

    Config config;
    config.clipboard_prog = script;

    EXPECT_TRUE(copy_to_clipboard(std::string(1 << 20, 'x'), config));
}
