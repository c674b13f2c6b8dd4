#include "bundle/pipeline.hpp"
#include "util/bundler_config.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <string>

namespace {

constexpr const char* kConfigEnv = "BUNDLER_CONFIG";

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -c <config.json> -s <source dir> -o <output.msi> [options]\n"
        "\n"
        "Options:\n"
        "  -c, --config           Bundle configuration (default: $%s)\n"
        "  -s, --source           Directory with the application files to package\n"
        "  -o, --output           Installer package to write\n"
        "  -b, --build-dir        Working directory (default: <output dir>/wix)\n"
        "  -t, --toolchain-dir    WiX toolset directory (default: config or <output dir>/WixTools)\n"
        "      --offline          Use the toolchain directory as-is, never download\n"
        "      --log-level        debug|info|warn|error\n"
        "  -v, --verbose          Same as --log-level debug\n"
        "  -h, --help             Show this help\n",
        argv0, kConfigEnv);
}

enum LongOnly : int {
    kOptOffline = 1000,
    kOptLogLevel,
};

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    if (const char* env = std::getenv(kConfigEnv)) config_path = env;
    std::string source_dir;
    std::string output_path;
    std::string build_dir;
    std::string toolchain_dir;
    std::string log_level_cli;
    bool offline = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"source", required_argument, nullptr, 's'},
        {"output", required_argument, nullptr, 'o'},
        {"build-dir", required_argument, nullptr, 'b'},
        {"toolchain-dir", required_argument, nullptr, 't'},
        {"offline", no_argument, nullptr, kOptOffline},
        {"log-level", required_argument, nullptr, kOptLogLevel},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvc:s:o:b:t:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'c': config_path = optarg; break;
            case 's': source_dir = optarg; break;
            case 'o': output_path = optarg; break;
            case 'b': build_dir = optarg; break;
            case 't': toolchain_dir = optarg; break;
            case 'v': verbose = true; break;
            case kOptOffline: offline = true; break;
            case kOptLogLevel: log_level_cli = optarg; break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (config_path.empty() || source_dir.empty() || output_path.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    bundler::BundlerConfig cfg;
    if (auto r = bundler::BundlerConfig::LoadFromFile(config_path, cfg); !r.is_ok()) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    auto& logger = bundler::Logger::Instance();
    if (cfg.log_level) logger.SetLevel(*cfg.log_level);
    if (!log_level_cli.empty()) {
        auto lvl = bundler::ParseLogLevel(log_level_cli);
        if (!lvl) {
            std::fprintf(stderr, "Invalid --log-level: %s\n", log_level_cli.c_str());
            return 2;
        }
        logger.SetLevel(*lvl);
    }
    if (verbose) logger.SetLevel(bundler::LogLevel::Debug);

    namespace fs = std::filesystem;
    const fs::path output_dir = fs::absolute(output_path).parent_path();
    if (build_dir.empty()) build_dir = (output_dir / "wix").string();
    if (toolchain_dir.empty()) toolchain_dir = cfg.toolchain_dir;
    if (toolchain_dir.empty()) toolchain_dir = (output_dir / "WixTools").string();

    std::shared_ptr<const bundler::IToolchainProvider> provider;
    if (offline) {
        provider = std::make_shared<bundler::FixedToolchainProvider>(
            bundler::ToolchainInstallation{.root = toolchain_dir, .tools = cfg.tools});
    } else {
        bundler::ToolchainAcquirer acquirer(std::make_shared<bundler::CurlHttpFetcher>(), cfg.tools);
        provider = std::make_shared<bundler::DownloadingToolchainProvider>(
            std::move(acquirer), cfg.toolchain, toolchain_dir);
    }

    bundler::ProcessStageRunner::Options runner_opt;
    runner_opt.capture_stderr = cfg.capture_stderr;

    bundler::BundlePipeline pipeline(provider,
                                     std::make_shared<bundler::ProcessStageRunner>(runner_opt));

    bundler::BundleRequest request;
    request.source_dir = source_dir;
    request.build_dir = build_dir;
    request.output_path = output_path;
    request.package = cfg.package;
    request.options = cfg.options;

    auto result = pipeline.Run(request);
    if (!result) {
        std::fprintf(stderr, "ERROR: %s failed: %s\n",
                     bundler::ToString(result.error().stage),
                     result.error().msg.c_str());
        return 1;
    }

    std::printf("%s\n", result->c_str());
    return 0;
}
