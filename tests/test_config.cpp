#include <gtest/gtest.h>
#include "utils/config.h"
#include <filesystem>
#include <fstream>

using namespace snipguard::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "snipguard_config_test";
        std::filesystem::create_directories(testDir);
    }
    
    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }
    
    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = testDir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
    
    std::filesystem::path testDir;
};

TEST_F(ConfigTest, DefaultsMatchDocumentedValues) {
    Config config;
    SandboxSettings sandbox = config.getSandboxSettings();
    EXPECT_EQ(sandbox.profile, "permissive");
    EXPECT_EQ(sandbox.maxMemoryMb, 2048u);
    EXPECT_EQ(sandbox.maxTimeSeconds, 120u);
    EXPECT_DOUBLE_EQ(sandbox.memoryTolerance, 1.5);
    EXPECT_FALSE(sandbox.enableStaticAnalysis);
    EXPECT_TRUE(sandbox.enableTextRepair);
    EXPECT_TRUE(sandbox.enforcePolicy.empty());
    EXPECT_EQ(config.getLogSettings().level, "info");
}

TEST_F(ConfigTest, LoadParsesKeyValueFile) {
    std::string path = writeFile("sandbox.conf",
        "# comment line\n"
        "sandbox.profile = hardened\n"
        "sandbox.max_time_seconds=30\n"
        "sandbox.allowed_modules = math, json ,re\n"
        "policy.dangerous_builtins=eval,exec\n"
        "not a setting\n"
        "log.file = /tmp/sg.log\n");
    
    Config config;
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getConfigPath(), path);
    
    SandboxSettings sandbox = config.getSandboxSettings();
    EXPECT_EQ(sandbox.profile, "hardened");
    EXPECT_EQ(sandbox.maxTimeSeconds, 30u);
    EXPECT_EQ(sandbox.allowedModules, (std::vector<std::string>{"math", "json", "re"}));
    EXPECT_EQ(config.getPolicySettings().dangerousBuiltins, (std::vector<std::string>{"eval", "exec"}));
    EXPECT_EQ(config.getLogSettings().file, "/tmp/sg.log");
    EXPECT_FALSE(config.has("not a setting"));
}

TEST_F(ConfigTest, MissingFileFails) {
    Config config;
    EXPECT_FALSE(config.load((testDir / "absent.conf").string()));
}

TEST_F(ConfigTest, TypedGettersFallBack) {
    Config config;
    config.set("a.int", "twelve");
    config.set("a.bool", "maybe");
    EXPECT_EQ(config.getInt("a.int", 3), 3);
    EXPECT_TRUE(config.getBool("a.bool", true));
    EXPECT_EQ(config.getString("a.none", "fallback"), "fallback");
    
    config.set("a.flag", true);
    config.set("a.ratio", 2.5);
    EXPECT_TRUE(config.getBool("a.flag"));
    EXPECT_DOUBLE_EQ(config.getDouble("a.ratio"), 2.5);
}

TEST_F(ConfigTest, SaveRoundTripsThroughLoad) {
    Config config;
    config.set("sandbox.profile", "hardened");
    config.setList("sandbox.allowed_builtins", {"len", "sum"});
    std::string path = (testDir / "saved.conf").string();
    ASSERT_TRUE(config.save(path));
    
    Config reloaded;
    reloaded.clear();
    ASSERT_TRUE(reloaded.load(path));
    EXPECT_EQ(reloaded.getString("sandbox.profile"), "hardened");
    EXPECT_EQ(reloaded.getList("sandbox.allowed_builtins"), (std::vector<std::string>{"len", "sum"}));
}

TEST_F(ConfigTest, KeysMergeAndRemove) {
    Config base;
    base.clear();
    base.set("sandbox.profile", "permissive");
    base.set("log.level", "debug");
    
    Config overlay;
    overlay.clear();
    overlay.set("sandbox.profile", "hardened");
    base.merge(overlay);
    
    EXPECT_EQ(base.getString("sandbox.profile"), "hardened");
    EXPECT_EQ(base.keys("sandbox."), (std::vector<std::string>{"sandbox.profile"}));
    base.remove("log.level");
    EXPECT_FALSE(base.has("log.level"));
    EXPECT_EQ(base.size(), 1u);
}

TEST_F(ConfigTest, ChangeCallbackSeesKeys) {
    Config config;
    std::vector<std::string> changed;
    config.onChange([&](const std::string& key) { changed.push_back(key); });
    config.set("sandbox.max_time_seconds", 5);
    config.remove("sandbox.max_time_seconds");
    EXPECT_EQ(changed, (std::vector<std::string>{"sandbox.max_time_seconds", "sandbox.max_time_seconds"}));
}
