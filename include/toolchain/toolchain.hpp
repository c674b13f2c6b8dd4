#pragma once

#include "util/result.hpp"

#include <filesystem>
#include <string>

namespace bundler {

// Pinned WiX 3.11.1 binaries. Upgrading the default toolchain means changing
// both constants; a config file can override them per build.
inline constexpr const char kDefaultToolchainUrl[] =
    "https://github.com/wixtoolset/wix3/releases/download/wix3111rtm/wix311-binaries.zip";
inline constexpr const char kDefaultToolchainSha256[] =
    "37f0a533b0978a454efb5dc3bd3598becf9660aaf4287e55bf68ca6b527d051d";

struct ToolchainSource {
    std::string url = kDefaultToolchainUrl;
    std::string sha256 = kDefaultToolchainSha256;
};

struct ToolNames {
    std::string harvest = "heat.exe";
    std::string compile = "candle.exe";
    std::string link = "light.exe";
};

// A directory holding the harvest, compile and link tools.
struct ToolchainInstallation {
    std::filesystem::path root;
    ToolNames tools;

    std::filesystem::path HarvestTool() const { return root / tools.harvest; }
    std::filesystem::path CompileTool() const { return root / tools.compile; }
    std::filesystem::path LinkTool() const { return root / tools.link; }

    // All three tools exist as regular files and are executable.
    Result Validate() const;

    // Adds the owner/group/other execute bits to the three tools. Archives
    // built on Windows carry no execute permission.
    Result MarkToolsExecutable() const;
};

} // namespace bundler
