#pragma once

#include "bundle/line_sinks.hpp"
#include "bundle/stage.hpp"

#include <expected>
#include <string>

namespace bundler {

struct StageError {
    enum class Kind {
        SpawnFailed,
        NonZeroExit,
    };

    Kind kind = Kind::SpawnFailed;
    std::string tool;
    int code = 0;       // NonZeroExit: exit status, or 128 + signal number
    std::string cause;  // SpawnFailed: why the tool could not be started
};

std::string Describe(const StageError& e);

class IStageRunner {
  public:
    virtual ~IStageRunner() = default;
    virtual std::expected<void, StageError> Run(const Stage& stage, ILineSink& sink) const = 0;
};

// Runs the stage tool as a child process. Output is drained on a dedicated
// thread and forwarded line by line, in order, before the exit status is
// interpreted. No retries and no timeout: a hung tool hangs the caller.
class ProcessStageRunner final : public IStageRunner {
  public:
    struct Options {
        // Merge the tool's stderr into the forwarded line stream.
        bool capture_stderr = true;
    };

    ProcessStageRunner() = default;
    explicit ProcessStageRunner(const Options& opt) : opt_(opt) {}

    std::expected<void, StageError> Run(const Stage& stage, ILineSink& sink) const override;

  private:
    Options opt_{};
};

} // namespace bundler
