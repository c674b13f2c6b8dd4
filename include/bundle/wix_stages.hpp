#pragma once

#include "bundle/bundle_request.hpp"
#include "bundle/stage.hpp"
#include "toolchain/toolchain.hpp"

#include <filesystem>
#include <vector>

namespace bundler {

// Argument vectors for the heat / candle / light invocations. Paths in the
// request are expected to be absolute; every stage runs in the build dir.
Stage MakeHarvestStage(const ToolchainInstallation& toolchain, const BundleRequest& request);

// One candle invocation per source: the harvested fragment, then the manifest.
std::vector<Stage> MakeCompileStages(const ToolchainInstallation& toolchain,
                                     const BundleRequest& request);

Stage MakeLinkStage(const ToolchainInstallation& toolchain,
                    const BundleRequest& request,
                    const std::vector<std::filesystem::path>& objects);

} // namespace bundler
