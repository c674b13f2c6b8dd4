#include "toolchain/toolchain.hpp"

#include <array>
#include <unistd.h>

namespace bundler {

namespace fs = std::filesystem;

Result ToolchainInstallation::Validate() const {
    const std::array<fs::path, 3> required = {HarvestTool(), CompileTool(), LinkTool()};
    for (const auto& tool : required) {
        std::error_code ec;
        if (!fs::is_regular_file(tool, ec)) {
            return Result::Fail(ENOENT, "toolchain tool missing: " + tool.string());
        }
        if (::access(tool.c_str(), X_OK) != 0) {
            return Result::FromErrno("toolchain tool not executable: " + tool.string());
        }
    }
    return Result::Ok();
}

Result ToolchainInstallation::MarkToolsExecutable() const {
    const std::array<fs::path, 3> required = {HarvestTool(), CompileTool(), LinkTool()};
    for (const auto& tool : required) {
        std::error_code ec;
        if (!fs::is_regular_file(tool, ec)) continue;
        fs::permissions(tool,
                        fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add,
                        ec);
        if (ec) {
            return Result::Fail(ec.value(), "chmod failed: " + tool.string() + ": " + ec.message());
        }
    }
    return Result::Ok();
}

} // namespace bundler
