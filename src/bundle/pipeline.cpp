#include "bundle/pipeline.hpp"

#include "bundle/wix_stages.hpp"
#include "util/file_utils.hpp"
#include "util/logger.hpp"

#include <vector>

namespace bundler {

namespace fs = std::filesystem;

namespace {

fs::path Absolute(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    return ec ? p : abs.lexically_normal();
}

} // namespace

const char* ToString(PipelineState state) {
    switch (state) {
        case PipelineState::Preparing:  return "Preparing";
        case PipelineState::Harvesting: return "Harvesting";
        case PipelineState::Compiling:  return "Compiling";
        case PipelineState::Linking:    return "Linking";
        case PipelineState::Done:       return "Done";
        case PipelineState::Failed:     return "Failed";
    }
    return "Unknown";
}

BundlePipeline::BundlePipeline(std::shared_ptr<const IToolchainProvider> toolchain,
                               std::shared_ptr<const IStageRunner> runner)
    : toolchain_(std::move(toolchain)),
      runner_(runner ? std::move(runner) : std::make_shared<ProcessStageRunner>()) {}

void BundlePipeline::Enter(PipelineState state) {
    state_ = state;
    LogDebug("pipeline: %s", ToString(state));
    if (observer_) observer_->OnStateChanged(state);
}

std::unexpected<PipelineFailure> BundlePipeline::Fail(std::string msg,
                                                      decltype(PipelineFailure::cause) cause) {
    PipelineFailure failure{.stage = state_, .msg = std::move(msg), .cause = std::move(cause)};
    LogError("bundle failed while %s: %s", ToString(failure.stage), failure.msg.c_str());
    Enter(PipelineState::Failed);
    return std::unexpected(std::move(failure));
}

std::expected<void, PipelineFailure> BundlePipeline::Prepare(const BundleRequest& request,
                                                             ToolchainInstallation& out_toolchain) {
    // Any failure from here on must not leave a previous run's package
    // looking fresh.
    auto rm_res = RemoveIfExists(request.output_path.string());
    if (!rm_res.is_ok()) return Fail(rm_res.message(), rm_res);

    if (!toolchain_) {
        return Fail("no toolchain provider", Result::Fail(-1, "no toolchain provider"));
    }
    auto toolchain = toolchain_->Provide();
    if (!toolchain) {
        const AcquireError& e = toolchain.error();
        return Fail(std::string("toolchain ") + ToString(e.kind) + " error: " + e.msg, e);
    }
    out_toolchain = std::move(*toolchain);

    std::error_code ec;
    if (!fs::is_directory(request.source_dir, ec)) {
        const std::string msg = "source directory does not exist: " + request.source_dir.string();
        return Fail(msg, Result::Fail(ENOENT, msg));
    }

    fs::create_directories(request.build_dir, ec);
    if (ec) {
        const std::string msg = "cannot create build directory " + request.build_dir.string() +
                                ": " + ec.message();
        return Fail(msg, Result::Fail(ec.value(), msg));
    }
    if (request.output_path.has_parent_path()) {
        fs::create_directories(request.output_path.parent_path(), ec);
        if (ec) {
            const std::string msg = "cannot create output directory: " + ec.message();
            return Fail(msg, Result::Fail(ec.value(), msg));
        }
    }

    std::string template_source;
    if (request.options.manifest_template.empty()) {
        template_source = DefaultManifestTemplate();
    } else {
        auto load_res = LoadTemplateFile(request.options.manifest_template, template_source);
        if (!load_res.is_ok()) return Fail(load_res.message(), load_res);
    }

    ManifestContext context;
    context.source_dir = request.source_dir.string();
    context.component_group = request.options.component_group;
    context.directory_ref = request.options.directory_ref;
    context.source_dir_var = request.options.source_dir_var;
    context.arch = request.options.arch;
    context.package = request.package;
    context.files = request.files;

    auto rendered = renderer_.Render(template_source, context);
    if (!rendered) return Fail(Describe(rendered.error()), rendered.error());

    const fs::path manifest_path = request.build_dir / request.options.manifest_file;
    auto write_res = WriteFileAtomic(manifest_path.string(), *rendered);
    if (!write_res.is_ok()) return Fail(write_res.message(), write_res);

    LogInfo("Rendered manifest %s", manifest_path.c_str());
    return {};
}

std::expected<void, PipelineFailure> BundlePipeline::RunStage(const Stage& stage) {
    LogInfo("Running %s: %s", stage.name.c_str(), stage.tool.c_str());

    LoggerLineSink log_sink(stage.name);
    std::expected<void, StageError> res;
    if (line_sink_) {
        TeeLineSink tee(log_sink, *line_sink_);
        res = runner_->Run(stage, tee);
    } else {
        res = runner_->Run(stage, log_sink);
    }

    if (!res) return Fail(stage.name + ": " + Describe(res.error()), res.error());
    return {};
}

std::expected<fs::path, PipelineFailure> BundlePipeline::Run(const BundleRequest& raw_request) {
    BundleRequest request = raw_request;
    request.source_dir = Absolute(request.source_dir);
    request.build_dir = Absolute(request.build_dir);
    request.output_path = Absolute(request.output_path);

    Enter(PipelineState::Preparing);
    ToolchainInstallation toolchain;
    if (auto prep = Prepare(request, toolchain); !prep) {
        return std::unexpected(std::move(prep.error()));
    }

    Enter(PipelineState::Harvesting);
    if (auto r = RunStage(MakeHarvestStage(toolchain, request)); !r) {
        return std::unexpected(std::move(r.error()));
    }

    Enter(PipelineState::Compiling);
    std::vector<fs::path> objects;
    for (const Stage& stage : MakeCompileStages(toolchain, request)) {
        if (auto r = RunStage(stage); !r) {
            return std::unexpected(std::move(r.error()));
        }
        objects.insert(objects.end(), stage.outputs.begin(), stage.outputs.end());
    }

    Enter(PipelineState::Linking);
    if (auto r = RunStage(MakeLinkStage(toolchain, request, objects)); !r) {
        return std::unexpected(std::move(r.error()));
    }

    Enter(PipelineState::Done);
    LogInfo("Bundle written to %s", request.output_path.c_str());
    return request.output_path;
}

} // namespace bundler
