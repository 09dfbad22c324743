#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/Config.hpp"

#include <sys/stat.h>

using takeout::core::Config;
using takeout::core::json;
using takeout::test::TempDir;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override { Config::instance().setDefaults(); }

    Config& config = Config::instance();
    TempDir dir;
};

TEST_F(ConfigTest, Defaults) {
    EXPECT_EQ(config.get<int>("downloads.chunkSize", 0), 32768);
    EXPECT_EQ(config.get<int>("uploads.checkpointInterval", 0), 100);
    EXPECT_TRUE(config.get<bool>("downloads.verifyChecksums", false));
    EXPECT_EQ(config.get<std::string>("source.baseUrl"), "https://www.googleapis.com/drive/v3");
}

TEST_F(ConfigTest, MissingOrMistypedKeysFallBack) {
    EXPECT_EQ(config.get<int>("downloads.nothing", 7), 7);
    EXPECT_EQ(config.get<int>("server.url.deeper", 8), 8);
    EXPECT_EQ(config.get<int>("source.baseUrl", 9), 9);
    EXPECT_FALSE(config.has("nope"));
}

TEST_F(ConfigTest, SetCreatesIntermediateObjects) {
    config.set("server.url", std::string("https://photos.example.com"));
    config.set("extra.nested.value", 42);

    EXPECT_EQ(config.get<std::string>("server.url"), "https://photos.example.com");
    EXPECT_EQ(config.get<int>("extra.nested.value"), 42);
    EXPECT_TRUE(config.has("extra.nested"));
}

TEST_F(ConfigTest, RemoveLeavesSiblings) {
    config.remove("downloads.chunkSize");
    EXPECT_FALSE(config.has("downloads.chunkSize"));
    EXPECT_TRUE(config.has("downloads.connectTimeout"));
    config.remove("not.there");
}

TEST_F(ConfigTest, MergePatch) {
    config.merge(json{{"uploads", {{"checkpointInterval", 5}}}});
    EXPECT_EQ(config.get<int>("uploads.checkpointInterval"), 5);
    EXPECT_EQ(config.get<int>("uploads.timeout"), 300000);
}

TEST_F(ConfigTest, SaveIsOwnerOnlyAndReloads) {
    auto path = dir / "conf" / "config.json";
    config.set("server.apiKey", std::string("secret"));
    ASSERT_TRUE(config.save(path.string()));

    struct stat st{};
    ASSERT_EQ(::stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600u);
    ASSERT_EQ(::stat((dir / "conf").c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0700u);

    config.setDefaults();
    EXPECT_EQ(config.get<std::string>("server.apiKey"), "");
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.get<std::string>("server.apiKey"), "secret");
    EXPECT_EQ(config.path(), path.string());
}

TEST_F(ConfigTest, LoadMergesOverDefaults) {
    auto path = dir / "config.json";
    takeout::test::writeAll(path, R"({"downloads": {"chunkSize": 1024}})");

    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.get<int>("downloads.chunkSize"), 1024);
    EXPECT_EQ(config.get<int>("downloads.lowSpeedTimeout"), 60);
}

TEST_F(ConfigTest, InvalidFileIsRejected) {
    auto path = dir / "config.json";
    takeout::test::writeAll(path, "{ not json");
    EXPECT_FALSE(config.load(path.string()));

    takeout::test::writeAll(path, "[1, 2]");
    EXPECT_FALSE(config.load(path.string()));

    EXPECT_FALSE(config.load((dir / "missing.json").string()));
    EXPECT_EQ(config.get<int>("downloads.chunkSize"), 32768);
}
