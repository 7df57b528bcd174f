#include <gtest/gtest.h>

#include "modelfetch/config.hpp"
#include "modelfetch/errors.hpp"
#include "support/test_helpers.hpp"

using namespace modelfetch;
using namespace modelfetch::test_support;
using namespace std::chrono_literals;

TEST(Config, DefaultsDeriveDirectories) {
    ManagerConfig config;
    config.base_dir = "/data/models";
    EXPECT_EQ(config.tempDir().string(), "/data/models/.downloads");
    EXPECT_EQ(config.stateDir().string(), "/data/models/.state");

    config.state_dir = "/var/lib/modelfetch";
    EXPECT_EQ(config.stateDir().string(), "/var/lib/modelfetch");
    EXPECT_EQ(config.grace_delay, 1000ms);
    EXPECT_EQ(config.progress_interval, 500ms);
    EXPECT_FALSE(config.resume_on_foreground);
}

TEST(Config, FileOverlaysOnlyGivenKeys) {
    TempDir dir;
    const auto path = dir.path() / "modelfetch.json";
    writeFile(path, R"({
        "base_dir": "/srv/models",
        "grace_delay_ms": 250,
        "connect_timeout_s": 5,
        "resume_on_foreground": true,
        "auth_token": "hf_abc",
        "something_else": [1, 2, 3]
    })");

    ManagerConfig base;
    base.user_agent = "custom-agent";
    const auto config = loadConfigFile(path, base);
    EXPECT_EQ(config.base_dir.string(), "/srv/models");
    EXPECT_EQ(config.grace_delay, 250ms);
    EXPECT_EQ(config.connect_timeout, 5s);
    EXPECT_TRUE(config.resume_on_foreground);
    EXPECT_EQ(config.auth_token, "hf_abc");
    EXPECT_EQ(config.user_agent, "custom-agent");
    EXPECT_EQ(config.progress_interval, 500ms);
}

TEST(Config, BadFilesAreRejected) {
    TempDir dir;
    EXPECT_THROW(loadConfigFile(dir.path() / "missing.json"), InvalidArgumentError);

    writeFile(dir.path() / "broken.json", "{ base_dir: ");
    EXPECT_THROW(loadConfigFile(dir.path() / "broken.json"), InvalidArgumentError);

    writeFile(dir.path() / "array.json", "[1, 2]");
    EXPECT_THROW(loadConfigFile(dir.path() / "array.json"), InvalidArgumentError);

    writeFile(dir.path() / "type.json", R"({"grace_delay_ms": "soon"})");
    EXPECT_THROW(loadConfigFile(dir.path() / "type.json"), InvalidArgumentError);

    writeFile(dir.path() / "negative.json", R"({"progress_interval_ms": -1})");
    EXPECT_THROW(loadConfigFile(dir.path() / "negative.json"), InvalidArgumentError);

    writeFile(dir.path() / "temp.json", R"({"temp_dir_name": "a/b"})");
    EXPECT_THROW(loadConfigFile(dir.path() / "temp.json"), InvalidArgumentError);
}
