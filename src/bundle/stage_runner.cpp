#include "bundle/stage_runner.hpp"

#include "io/fd.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstring>
#include <string_view>
#include <system_error>
#include <thread>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace bundler {

namespace {

// Written by the child to the status pipe when it cannot exec the tool.
struct ChildFailure {
    int step = 0;
    int err = 0;
};

enum ChildStep : int {
    kStepChdir = 1,
    kStepRedirect = 2,
    kStepExec = 3,
};

const char* StepName(int step) {
    switch (step) {
        case kStepChdir:    return "chdir";
        case kStepRedirect: return "redirect output";
        case kStepExec:     return "exec";
        default:            return "spawn";
    }
}

[[noreturn]] void FailChild(int status_fd, int step) {
    const ChildFailure failure{step, errno};
    ssize_t n;
    do {
        n = ::write(status_fd, &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::_exit(127);
}

class LineSplitter {
  public:
    explicit LineSplitter(ILineSink& sink) : sink_(sink) {}

    void Feed(std::string_view chunk) {
        while (!chunk.empty()) {
            const auto nl = chunk.find('\n');
            if (nl == std::string_view::npos) {
                pending_.append(chunk);
                return;
            }
            pending_.append(chunk.substr(0, nl));
            Emit();
            chunk.remove_prefix(nl + 1);
        }
    }

    void Finish() {
        if (!pending_.empty()) Emit();
    }

  private:
    void Emit() {
        if (!pending_.empty() && pending_.back() == '\r') pending_.pop_back();
        sink_.OnLine(pending_);
        pending_.clear();
    }

    ILineSink& sink_;
    std::string pending_;
};

void DrainLines(int fd, ILineSink& sink) {
    LineSplitter splitter(sink);
    std::vector<char> buf(16 * 1024);
    while (true) {
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            LogWarn("reading tool output failed: %s", std::strerror(errno));
            break;
        }
        splitter.Feed(std::string_view(buf.data(), static_cast<size_t>(n)));
    }
    splitter.Finish();
}

pid_t WaitForExit(pid_t pid, int& status) {
    pid_t w;
    do {
        w = ::waitpid(pid, &status, 0);
    } while (w < 0 && errno == EINTR);
    return w;
}

} // namespace

std::string Describe(const StageError& e) {
    if (e.kind == StageError::Kind::SpawnFailed) {
        return "failed to start " + e.tool + ": " + e.cause;
    }
    return e.tool + " exited with code " + std::to_string(e.code);
}

std::expected<void, StageError> ProcessStageRunner::Run(const Stage& stage, ILineSink& sink) const {
    const std::string tool_path = stage.tool.string();
    const std::string tool_name = stage.tool.filename().string();

    auto spawn_failed = [&](std::string cause) {
        return std::unexpected(StageError{.kind = StageError::Kind::SpawnFailed,
                                          .tool = tool_name,
                                          .code = 0,
                                          .cause = std::move(cause)});
    };

    Pipe output;
    if (!Pipe::Create(output)) return spawn_failed(std::string("pipe: ") + std::strerror(errno));
    Pipe status;
    if (!Pipe::Create(status)) return spawn_failed(std::string("pipe: ") + std::strerror(errno));

    // argv must be built before fork; the child only makes async-signal-safe calls.
    std::vector<char*> argv;
    argv.reserve(stage.args.size() + 2);
    argv.push_back(const_cast<char*>(tool_path.c_str()));
    for (const auto& arg : stage.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const std::string cwd = stage.working_dir.string();
    const bool capture_stderr = opt_.capture_stderr;

    LogDebug("spawn [%s] %s (cwd=%s, %zu args)",
             stage.name.c_str(), tool_path.c_str(), cwd.c_str(), stage.args.size());

    const pid_t pid = ::fork();
    if (pid < 0) return spawn_failed(std::string("fork: ") + std::strerror(errno));

    if (pid == 0) {
        const int status_fd = status.write_end.Get();
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) FailChild(status_fd, kStepChdir);
        if (::dup2(output.write_end.Get(), STDOUT_FILENO) < 0) FailChild(status_fd, kStepRedirect);
        if (capture_stderr && ::dup2(output.write_end.Get(), STDERR_FILENO) < 0) {
            FailChild(status_fd, kStepRedirect);
        }
        ::execvp(argv[0], argv.data());
        FailChild(status_fd, kStepExec);
    }

    output.write_end.Close();
    status.write_end.Close();

    // The status pipe is close-on-exec: EOF means the exec succeeded.
    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(status.read_end.Get(), &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int ignored = 0;
        (void)WaitForExit(pid, ignored);
        return spawn_failed(std::string(StepName(failure.step)) + " " +
                            (failure.step == kStepChdir ? cwd : tool_path) + ": " +
                            std::strerror(failure.err));
    }

    const int out_fd = output.read_end.Get();
    std::thread reader;
    try {
        reader = std::thread([out_fd, &sink] { DrainLines(out_fd, sink); });
    } catch (const std::system_error& e) {
        LogWarn("reader thread unavailable (%s), draining inline", e.what());
        DrainLines(out_fd, sink);
    }

    int wait_status = 0;
    const pid_t w = WaitForExit(pid, wait_status);
    const int wait_errno = errno;
    if (reader.joinable()) reader.join();

    if (w < 0) {
        return std::unexpected(StageError{.kind = StageError::Kind::NonZeroExit,
                                          .tool = tool_name,
                                          .code = -1,
                                          .cause = std::string("waitpid: ") + std::strerror(wait_errno)});
    }

    if (WIFEXITED(wait_status)) {
        const int code = WEXITSTATUS(wait_status);
        if (code == 0) return {};
        return std::unexpected(StageError{.kind = StageError::Kind::NonZeroExit,
                                          .tool = tool_name,
                                          .code = code,
                                          .cause = {}});
    }

    int code = 1;
    std::string cause;
    if (WIFSIGNALED(wait_status)) {
        code = 128 + WTERMSIG(wait_status);
        cause = std::string("killed by signal ") + std::to_string(WTERMSIG(wait_status));
    }
    return std::unexpected(StageError{.kind = StageError::Kind::NonZeroExit,
                                      .tool = tool_name,
                                      .code = code,
                                      .cause = std::move(cause)});
}

} // namespace bundler
