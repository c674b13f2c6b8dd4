#include "toolchain/archive_extractor.hpp"
#include "testing.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <string>

namespace bundler {
namespace {

namespace fs = std::filesystem;

TEST(ArchiveExtractorTest, ExtractsNestedEntriesCreatingParents) {
    testutil::TemporaryDirectory tmp;
    const auto zip = testutil::BuildZip({
        {"heat.exe", "heat"},
        {"sdk/inc/wcautil.h", "#pragma once\n"},
        {"doc/readme/licence.txt", "MS-RL\n"},
    });

    const fs::path dst = tmp / "wix";
    ArchiveExtractor extractor;
    ArchiveExtractor::Stats stats{};
    auto res = extractor.ExtractToDir(zip, dst.string(), &stats);
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(stats.entries, 3u);
    EXPECT_EQ(testutil::ReadFile(dst / "heat.exe"), "heat");
    EXPECT_EQ(testutil::ReadFile(dst / "sdk" / "inc" / "wcautil.h"), "#pragma once\n");
    EXPECT_EQ(testutil::ReadFile(dst / "doc" / "readme" / "licence.txt"), "MS-RL\n");
}

TEST(ArchiveExtractorTest, OverwritesExistingFiles) {
    testutil::TemporaryDirectory tmp;
    const fs::path dst = tmp / "wix";
    ASSERT_TRUE(testutil::WriteFile(dst / "light.exe", "stale contents that are longer"));

    const auto zip = testutil::BuildZip({{"light.exe", "fresh"}});
    ArchiveExtractor extractor;
    auto res = extractor.ExtractToDir(zip, dst.string());
    ASSERT_TRUE(res.is_ok()) << res.msg;

    EXPECT_EQ(testutil::ReadFile(dst / "light.exe"), "fresh");
}

TEST(ArchiveExtractorTest, RejectsEntryEscapingDestination) {
    testutil::TemporaryDirectory tmp;
    const auto zip = testutil::BuildZip({{"../outside.txt", "nope"}});

    ArchiveExtractor extractor;
    auto res = extractor.ExtractToDir(zip, (tmp / "wix").string());
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe path"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp / "outside.txt"));
}

TEST(ArchiveExtractorTest, RejectsAbsoluteEntry) {
    testutil::TemporaryDirectory tmp;
    const auto zip = testutil::BuildZip({{"/heat.exe", "rooted"}});

    ArchiveExtractor extractor;
    auto res = extractor.ExtractToDir(zip, (tmp / "wix").string());
    ASSERT_FALSE(res.is_ok());
    EXPECT_NE(res.msg.find("Unsafe path in archive: /heat.exe"), std::string::npos);
    EXPECT_FALSE(fs::exists(tmp / "wix" / "heat.exe"));
}

TEST(ArchiveExtractorTest, GarbageInputFails) {
    testutil::TemporaryDirectory tmp;
    const auto garbage = testutil::Bytes(std::string(512, '\x5a'));

    ArchiveExtractor extractor;
    auto res = extractor.ExtractToDir(garbage, (tmp / "wix").string());
    EXPECT_FALSE(res.is_ok());
}

} // namespace
} // namespace bundler
