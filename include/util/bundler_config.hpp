#pragma once

#include "bundle/bundle_request.hpp"
#include "bundle/manifest_context.hpp"
#include "toolchain/toolchain.hpp"
#include "util/logger.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace bundler {

struct BundlerConfig {
    ToolchainSource toolchain;
    std::string toolchain_dir;
    ToolNames tools;
    BundleOptions options;
    PackageMetadata package;
    bool capture_stderr = true;
    std::optional<LogLevel> log_level;

    static Result LoadFromFile(const std::string& path, BundlerConfig& out);
    static Result FromJson(const nlohmann::json& j, BundlerConfig& out);
};

} // namespace bundler
