#include <gtest/gtest.h>

#include "fake_transport.h"
#include "navigator.h"

#include <algorithm>
#include <set>

using namespace vaulthunter;
using vaulthunter::testing::FakeTransport;
using json = nlohmann::json;

namespace {

const std::string ROOT_LIST = "/v1/passwords/metadata/alice/";

std::set<std::string> as_strings(const std::vector<Path>& paths) {
    std::set<std::string> out;
    for (const auto& p : paths) out.insert(p.str());
    return out;
}

class NavigatorTest : public ::testing::Test {
protected:
    FakeTransport transport;
    Navigator navigator{transport, "Alice"};
};

} // namespace

TEST_F(NavigatorTest, ListPartitionsKeysAndDirectories) {
    transport.respond("LIST", ROOT_LIST, 200,
                      {{"data", {{"keys", {"web/", "github", "mail/", "bank"}}}}});

    auto entries = navigator.list(Path());
    ASSERT_EQ(entries.size(), 4u);

    size_t dirs = std::count_if(entries.begin(), entries.end(),
                                [](const TreeEntry& e) { return e.is_dir(); });
    EXPECT_EQ(dirs, 2u);
    for (const auto& e : entries) {
        EXPECT_EQ(e.name.find('/'), std::string::npos);
    }
    EXPECT_EQ(entries[0].name, "web");
    EXPECT_TRUE(entries[0].is_dir());
    EXPECT_EQ(entries[1].name, "github");
    EXPECT_TRUE(entries[1].is_key());
}

TEST_F(NavigatorTest, ListUsesLowercasedUsernameAndPath) {
    transport.respond("LIST", "/v1/passwords/metadata/alice/web/work", 200,
                      {{"data", {{"keys", json::array()}}}});

    EXPECT_TRUE(navigator.list(Path::parse("web/work")).empty());
    ASSERT_EQ(transport.requests.size(), 1u);
    EXPECT_EQ(transport.requests[0].method, "LIST");
}

TEST_F(NavigatorTest, ListSurfacesEmbeddedErrorAsStoreError) {
    transport.respond("LIST", ROOT_LIST, 200, {{"errors", json::array({"permission denied"})}});

    try {
        navigator.list(Path());
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Store);
        EXPECT_NE(std::string(e.what()).find("permission denied"), std::string::npos);
    }
}

TEST_F(NavigatorTest, ListRejectsUnexpectedShape) {
    transport.respond("LIST", ROOT_LIST, 200, {{"data", {{"keys", "github"}}}});
    EXPECT_THROW(navigator.list(Path()), MalformedResponseError);

    transport.respond("LIST", ROOT_LIST, 200, {{"data", {{"keys", {1, 2}}}}});
    EXPECT_THROW(navigator.list(Path()), MalformedResponseError);

    transport.respond("LIST", ROOT_LIST, 200, {{"data", {{"keys", json::array({"/"})}}}});
    EXPECT_THROW(navigator.list(Path()), MalformedResponseError);
}

TEST_F(NavigatorTest, ListReportsUnreachableServerAsTransportError) {
    transport.on("LIST", ROOT_LIST, [](const FakeTransport::Request&) {
        return FakeTransport::unreachable();
    });
    EXPECT_THROW(navigator.list(Path()), TransportError);
}

TEST_F(NavigatorTest, NonJsonBodyIsMalformed) {
    transport.on("LIST", ROOT_LIST, [](const FakeTransport::Request&) {
        transport::Response res;
        res.success = true;
        res.status_code = 200;
        res.body = "<html>";
        return res;
    });
    EXPECT_THROW(navigator.list(Path()), MalformedResponseError);
}

TEST_F(NavigatorTest, GetPeelsTwoEnvelopeLevels) {
    transport.respond("GET", "/v1/passwords/data/alice/web/github", 200,
                      {{"data", {
                          {"data", {{"Username", "alice"}, {"Password", "s3cret"}, {"Pin", 1234}}},
                          {"metadata", {{"version", 3}}}
                      }}});

    SecretRecord record = navigator.get(Path::parse("web/github"));
    ASSERT_EQ(record.size(), 3u);
    EXPECT_EQ(record["Username"], "alice");
    EXPECT_EQ(record[PASSWORD_FIELD], "s3cret");
    EXPECT_EQ(record["Pin"], "1234");
}

TEST_F(NavigatorTest, GetRejectsMissingEnvelope) {
    transport.respond("GET", "/v1/passwords/data/alice/github", 200,
                      {{"data", {{"Password", "x"}}}});
    EXPECT_THROW(navigator.get(Path::parse("github")), MalformedResponseError);
}

TEST_F(NavigatorTest, GetOfMissingKeyIsStoreError) {
    try {
        navigator.get(Path::parse("nothing"));
        FAIL() << "expected StoreError";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.status_code(), 404);
    }
}

TEST_F(NavigatorTest, EmptyPatternFindsEveryLeafAtAnyDepth) {
    transport.serve_tree("alice", {
        {"top", {}},
        {"a/one", {}},
        {"a/b/two", {}},
        {"a/b/c/d/three", {}},
        {"x/y/four", {}},
    });

    auto found = navigator.search("");
    EXPECT_EQ(found.size(), 5u);
    EXPECT_EQ(as_strings(found),
              std::set<std::string>({"top", "a/one", "a/b/two", "a/b/c/d/three", "x/y/four"}));
}

TEST_F(NavigatorTest, SearchIsCaseInsensitive) {
    transport.serve_tree("alice", {
        {"personal/Email", {}},
        {"work/GMAIL-backup", {}},
        {"work/github", {}},
    });

    EXPECT_EQ(as_strings(navigator.search("mail")),
              std::set<std::string>({"personal/Email", "work/GMAIL-backup"}));
    EXPECT_EQ(as_strings(navigator.search("MAIL")),
              std::set<std::string>({"personal/Email", "work/GMAIL-backup"}));
}

TEST_F(NavigatorTest, SearchFoldsAsciiOnly) {
    transport.serve_tree("alice", {
        {"personal/\xC3\x89mail", {}},
        {"personal/\xC3\xA9" "cole", {}},
    });

    EXPECT_EQ(as_strings(navigator.search("MAIL")),
              std::set<std::string>({"personal/\xC3\x89mail"}));
    EXPECT_EQ(as_strings(navigator.search("\xC3\xA9")),
              std::set<std::string>({"personal/\xC3\xA9" "cole"}));
    EXPECT_TRUE(navigator.search("\xC3\x89" "cole").empty());
}

TEST_F(NavigatorTest, SearchMatchesLeafNameOnly) {
    transport.serve_tree("alice", {{"mail/github", {}}});
    EXPECT_TRUE(navigator.search("mail").empty());
}

TEST_F(NavigatorTest, TraversalListsEachDirectoryOnceAndNeverAKey) {
    transport.serve_tree("alice", {
        {"a/b", {}},
        {"a/c/d", {}},
        {"e", {}},
        {"f/g/h/i", {}},
    });

    navigator.search("");

    std::set<std::string> listed;
    for (const auto& r : transport.requests) {
        ASSERT_EQ(r.method, "LIST");
        EXPECT_TRUE(listed.insert(r.endpoint).second) << "listed twice: " << r.endpoint;
    }
    const std::string prefix = "/v1/passwords/metadata/alice/";
    EXPECT_EQ(listed, std::set<std::string>({
        prefix, prefix + "a", prefix + "a/c", prefix + "f", prefix + "f/g", prefix + "f/g/h"
    }));
}

TEST_F(NavigatorTest, TraversalIsBreadthFirst) {
    transport.serve_tree("alice", {
        {"a/b/c/deep", {}},
        {"z/shallow", {}},
    });

    navigator.search("");

    // Both depth-1 directories are listed before any depth-2 directory
    std::vector<size_t> depths;
    for (const auto& r : transport.requests) {
        depths.push_back(Path::parse(r.endpoint).depth() - 4);
    }
    EXPECT_TRUE(std::is_sorted(depths.begin(), depths.end()));
}

TEST_F(NavigatorTest, SearchAndExportOnSmallTree) {
    transport.serve_tree("alice", {
        {"a/b", {{"Password", "pb"}, {"URL", "https://b"}}},
        {"c", {{"Password", "pc"}}},
    });

    auto found = navigator.search("b");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], Path::parse("a/b"));

    auto exported = navigator.export_all();
    ASSERT_EQ(exported.size(), 2u);
    std::map<std::string, SecretRecord> by_path;
    for (const auto& e : exported) by_path[e.path.str()] = e.record;
    EXPECT_EQ(by_path["a/b"]["Password"], "pb");
    EXPECT_EQ(by_path["a/b"]["URL"], "https://b");
    EXPECT_EQ(by_path["c"]["Password"], "pc");
}

TEST_F(NavigatorTest, ExportPropagatesStoreErrors) {
    transport.serve_tree("alice", {{"a", {}}});
    transport.respond("GET", "/v1/passwords/data/alice/a", 403, {{"errors", json::array({"permission denied"})}});
    EXPECT_THROW(navigator.export_all(), StoreError);
}
