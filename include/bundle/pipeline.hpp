#pragma once

#include "bundle/bundle_request.hpp"
#include "bundle/line_sinks.hpp"
#include "bundle/manifest_renderer.hpp"
#include "bundle/stage_runner.hpp"
#include "toolchain/toolchain_acquirer.hpp"
#include "util/result.hpp"

#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <variant>

namespace bundler {

enum class PipelineState {
    Preparing,
    Harvesting,
    Compiling,
    Linking,
    Done,
    Failed,
};

const char* ToString(PipelineState state);

struct PipelineFailure {
    PipelineState stage = PipelineState::Preparing;  // state the run failed in
    std::string msg;
    std::variant<std::monostate, Result, AcquireError, RenderError, StageError> cause;

    const StageError* stage_error() const { return std::get_if<StageError>(&cause); }
    const AcquireError* acquire_error() const { return std::get_if<AcquireError>(&cause); }
    const RenderError* render_error() const { return std::get_if<RenderError>(&cause); }
};

class IPipelineObserver {
  public:
    virtual ~IPipelineObserver() = default;
    virtual void OnStateChanged(PipelineState state) = 0;
};

// Preparing -> Harvesting -> Compiling -> Linking -> Done. The first failure
// ends the run in Failed; a failed run must be restarted from scratch.
class BundlePipeline {
  public:
    BundlePipeline(std::shared_ptr<const IToolchainProvider> toolchain,
                   std::shared_ptr<const IStageRunner> runner);

    void SetObserver(IPipelineObserver* observer) { observer_ = observer; }
    // Receives tool output in addition to the log.
    void SetLineSink(ILineSink* sink) { line_sink_ = sink; }

    std::expected<std::filesystem::path, PipelineFailure> Run(const BundleRequest& request);

    PipelineState State() const { return state_; }

  private:
    void Enter(PipelineState state);
    std::unexpected<PipelineFailure> Fail(std::string msg,
                                          decltype(PipelineFailure::cause) cause);

    std::expected<void, PipelineFailure> Prepare(const BundleRequest& request,
                                                 ToolchainInstallation& out_toolchain);
    std::expected<void, PipelineFailure> RunStage(const Stage& stage);

    std::shared_ptr<const IToolchainProvider> toolchain_;
    std::shared_ptr<const IStageRunner> runner_;
    ManifestRenderer renderer_;
    IPipelineObserver* observer_ = nullptr;
    ILineSink* line_sink_ = nullptr;
    PipelineState state_ = PipelineState::Preparing;
};

} // namespace bundler
