#include "util/bundler_config.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

namespace bundler {
namespace {

nlohmann::json MinimalConfig() {
    return nlohmann::json{{"package", {{"name", "App"}, {"version", "1.0.0"}}}};
}

TEST(BundlerConfigTest, MinimalConfigKeepsDefaults) {
    BundlerConfig cfg;
    auto r = BundlerConfig::FromJson(MinimalConfig(), cfg);
    ASSERT_TRUE(r.is_ok()) << r.message();

    EXPECT_EQ(cfg.package.name, "App");
    EXPECT_EQ(cfg.package.version, "1.0.0");
    EXPECT_EQ(cfg.toolchain.url, kDefaultToolchainUrl);
    EXPECT_EQ(cfg.toolchain.sha256, kDefaultToolchainSha256);
    EXPECT_EQ(cfg.tools.harvest, "heat.exe");
    EXPECT_EQ(cfg.tools.compile, "candle.exe");
    EXPECT_EQ(cfg.tools.link, "light.exe");
    EXPECT_EQ(cfg.options.arch, "x64");
    EXPECT_EQ(cfg.options.platform, "x64");
    EXPECT_EQ(cfg.options.component_group, "AppFiles");
    EXPECT_EQ(cfg.options.directory_ref, "APPLICATIONFOLDER");
    EXPECT_TRUE(cfg.options.manifest_template.empty());
    EXPECT_TRUE(cfg.options.tool_launcher.empty());
    EXPECT_TRUE(cfg.toolchain_dir.empty());
    EXPECT_TRUE(cfg.capture_stderr);
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(BundlerConfigTest, OverridesEveryKnob) {
    nlohmann::json j = MinimalConfig();
    j["toolchain_url"] = "https://mirror.example/wix.zip";
    j["toolchain_sha256"] = "ab";
    j["toolchain_dir"] = "/opt/wix";
    j["harvest_tool"] = "heat";
    j["compile_tool"] = "candle";
    j["link_tool"] = "light";
    j["tool_launcher"] = "wine";
    j["arch"] = "x86";
    j["platform"] = "x86";
    j["component_group"] = "Payload";
    j["directory_ref"] = "INSTALLDIR";
    j["source_dir_var"] = "AppSource";
    j["manifest_template"] = "installer/main.wxs.tpl";
    j["capture_stderr"] = false;
    j["log_level"] = "warning";
    j["package"]["manufacturer"] = "Example Corp";
    j["package"]["upgrade_code"] = "GUID";
    j["package"]["main_binary"] = "app.exe";

    BundlerConfig cfg;
    auto r = BundlerConfig::FromJson(j, cfg);
    ASSERT_TRUE(r.is_ok()) << r.message();

    EXPECT_EQ(cfg.toolchain.url, "https://mirror.example/wix.zip");
    EXPECT_EQ(cfg.toolchain.sha256, "ab");
    EXPECT_EQ(cfg.toolchain_dir, "/opt/wix");
    EXPECT_EQ(cfg.tools.harvest, "heat");
    EXPECT_EQ(cfg.tools.compile, "candle");
    EXPECT_EQ(cfg.tools.link, "light");
    EXPECT_EQ(cfg.options.tool_launcher, "wine");
    EXPECT_EQ(cfg.options.arch, "x86");
    EXPECT_EQ(cfg.options.platform, "x86");
    EXPECT_EQ(cfg.options.component_group, "Payload");
    EXPECT_EQ(cfg.options.directory_ref, "INSTALLDIR");
    EXPECT_EQ(cfg.options.source_dir_var, "AppSource");
    EXPECT_EQ(cfg.options.manifest_template, "installer/main.wxs.tpl");
    EXPECT_FALSE(cfg.capture_stderr);
    ASSERT_TRUE(cfg.log_level.has_value());
    EXPECT_EQ(*cfg.log_level, LogLevel::Warn);
    EXPECT_EQ(cfg.package.manufacturer, "Example Corp");
    EXPECT_EQ(cfg.package.upgrade_code, "GUID");
    EXPECT_EQ(cfg.package.main_binary, "app.exe");
}

TEST(BundlerConfigTest, RejectsWrongTypes) {
    BundlerConfig cfg;

    nlohmann::json j = MinimalConfig();
    j["arch"] = 64;
    auto r = BundlerConfig::FromJson(j, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "'arch' must be a string");

    j = MinimalConfig();
    j["capture_stderr"] = "yes";
    r = BundlerConfig::FromJson(j, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "'capture_stderr' must be a boolean");

    j = MinimalConfig();
    j["package"]["version"] = 1;
    r = BundlerConfig::FromJson(j, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "package: 'version' must be a string");

    j = MinimalConfig();
    j["package"] = "App";
    r = BundlerConfig::FromJson(j, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "'package' must be an object");

    r = BundlerConfig::FromJson(nlohmann::json::array(), cfg);
    EXPECT_FALSE(r.is_ok());
}

TEST(BundlerConfigTest, RequiresPackageIdentity) {
    BundlerConfig cfg;
    auto r = BundlerConfig::FromJson(nlohmann::json::object(), cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "missing 'package' section");

    r = BundlerConfig::FromJson(nlohmann::json{{"package", {{"version", "1.0"}}}}, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "package.name is required");

    r = BundlerConfig::FromJson(nlohmann::json{{"package", {{"name", "App"}}}}, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "package.version is required");
}

TEST(BundlerConfigTest, RejectsEmptyToolNameAndUnknownLogLevel) {
    BundlerConfig cfg;
    nlohmann::json j = MinimalConfig();
    j["link_tool"] = "";
    auto r = BundlerConfig::FromJson(j, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "tool names must not be empty");

    j = MinimalConfig();
    j["log_level"] = "chatty";
    r = BundlerConfig::FromJson(j, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "unknown log_level: chatty");
}

TEST(BundlerConfigTest, LoadFromFileReportsPath) {
    testutil::TemporaryDirectory tmp;
    const std::string good = (tmp / "bundle.json").string();
    ASSERT_TRUE(testutil::WriteFile(good, MinimalConfig().dump(2)));

    BundlerConfig cfg;
    auto r = BundlerConfig::LoadFromFile(good, cfg);
    ASSERT_TRUE(r.is_ok()) << r.message();
    EXPECT_EQ(cfg.package.name, "App");

    const std::string broken = (tmp / "broken.json").string();
    ASSERT_TRUE(testutil::WriteFile(broken, "{ \"package\": "));
    r = BundlerConfig::LoadFromFile(broken, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message().rfind("invalid JSON in " + broken, 0), 0u);

    const std::string incomplete = (tmp / "incomplete.json").string();
    ASSERT_TRUE(testutil::WriteFile(incomplete, "{}"));
    r = BundlerConfig::LoadFromFile(incomplete, cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message(), "missing 'package' section (" + incomplete + ")");

    r = BundlerConfig::LoadFromFile((tmp / "absent.json").string(), cfg);
    EXPECT_FALSE(r.is_ok());
    EXPECT_EQ(r.message().rfind("cannot open config: ", 0), 0u);
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_TRUE(ParseLogLevel("debug") == LogLevel::Debug);
    EXPECT_TRUE(ParseLogLevel("info") == LogLevel::Info);
    EXPECT_TRUE(ParseLogLevel("warn") == LogLevel::Warn);
    EXPECT_TRUE(ParseLogLevel("error") == LogLevel::Error);
    EXPECT_FALSE(ParseLogLevel("loud").has_value());
}

} // namespace
} // namespace bundler
