#include "bundle/wix_stages.hpp"

#include <string>
#include <utility>

namespace bundler {

namespace fs = std::filesystem;

namespace {

Stage MakeStage(std::string name,
                const fs::path& tool,
                std::vector<std::string> args,
                const BundleRequest& request) {
    Stage stage;
    stage.name = std::move(name);
    stage.working_dir = request.build_dir;
    if (request.options.tool_launcher.empty()) {
        stage.tool = tool;
        stage.args = std::move(args);
    } else {
        stage.tool = request.options.tool_launcher;
        stage.args.reserve(args.size() + 1);
        stage.args.push_back(tool.string());
        for (auto& arg : args) stage.args.push_back(std::move(arg));
    }
    return stage;
}

fs::path ObjectFor(const std::string& source_file) {
    return fs::path(source_file).replace_extension(".wixobj");
}

} // namespace

Stage MakeHarvestStage(const ToolchainInstallation& toolchain, const BundleRequest& request) {
    const BundleOptions& opt = request.options;
    std::vector<std::string> args = {
        "dir",
        request.source_dir.string(),
        "-platform", opt.platform,
        "-cg", opt.component_group,
        "-dr", opt.directory_ref,
        "-gg",
        "-srd",
        "-out", opt.harvest_file,
        "-var", "var." + opt.source_dir_var,
    };
    Stage stage = MakeStage("harvest", toolchain.HarvestTool(), std::move(args), request);
    stage.outputs.push_back(request.build_dir / opt.harvest_file);
    return stage;
}

std::vector<Stage> MakeCompileStages(const ToolchainInstallation& toolchain,
                                     const BundleRequest& request) {
    const BundleOptions& opt = request.options;
    std::vector<Stage> stages;
    for (const std::string& source : {opt.harvest_file, opt.manifest_file}) {
        std::vector<std::string> args = {
            "-arch", opt.arch,
            "-d" + opt.source_dir_var + "=" + request.source_dir.string(),
            source,
        };
        Stage stage = MakeStage("compile", toolchain.CompileTool(), std::move(args), request);
        stage.outputs.push_back(request.build_dir / ObjectFor(source));
        stages.push_back(std::move(stage));
    }
    return stages;
}

Stage MakeLinkStage(const ToolchainInstallation& toolchain,
                    const BundleRequest& request,
                    const std::vector<fs::path>& objects) {
    std::vector<std::string> args = {"-o", request.output_path.string()};
    for (const auto& obj : objects) {
        args.push_back(obj.filename().string());
    }
    Stage stage = MakeStage("link", toolchain.LinkTool(), std::move(args), request);
    stage.outputs.push_back(request.output_path);
    return stage;
}

} // namespace bundler
