#include "bundle/pipeline.hpp"
#include "bundle/wix_stages.hpp"
#include "crypto/sha256.hpp"
#include "testing.hpp"

#include <filesystem>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace bundler {
namespace {

namespace fs = std::filesystem;

// Records every stage and fails the one named fail_at.
class RecordingRunner final : public IStageRunner {
  public:
    std::string fail_at;
    mutable std::vector<Stage> stages;

    std::expected<void, StageError> Run(const Stage& stage, ILineSink& sink) const override {
        stages.push_back(stage);
        sink.OnLine("ran " + stage.name);
        if (stage.name == fail_at) {
            return std::unexpected(StageError{.kind = StageError::Kind::NonZeroExit,
                                              .tool = stage.tool.filename().string(),
                                              .code = 1,
                                              .cause = {}});
        }
        return {};
    }
};

class FailingProvider final : public IToolchainProvider {
  public:
    std::expected<ToolchainInstallation, AcquireError> Provide() const override {
        return std::unexpected(AcquireError{.kind = AcquireError::Kind::Integrity,
                                            .msg = "digest mismatch"});
    }
};

class StateRecorder final : public IPipelineObserver {
  public:
    std::vector<PipelineState> states;
    void OnStateChanged(PipelineState state) override { states.push_back(state); }
};

class PipelineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        tools_dir_ = tmp_ / "WixTools";
        testutil::InstallFakeToolchain(tools_dir_);
        ASSERT_TRUE(testutil::WriteFile(tmp_ / "app" / "app.exe", "MZ-app"));
        ASSERT_TRUE(testutil::WriteFile(tmp_ / "app" / "data" / "readme.txt", "hello"));

        request_.source_dir = tmp_ / "app";
        request_.build_dir = tmp_ / "out" / "wix";
        request_.output_path = tmp_ / "out" / "app.msi";
        request_.package = PackageMetadata{.name = "App",
                                           .version = "1.2.3",
                                           .manufacturer = "Example Corp",
                                           .upgrade_code = "9B1C2B6E-7A51-4E5A-8E43-0F3A7C1D2E11",
                                           .main_binary = "app.exe"};
    }

    std::shared_ptr<const IToolchainProvider> Toolchain() const {
        return std::make_shared<FixedToolchainProvider>(ToolchainInstallation{.root = tools_dir_});
    }

    testutil::TemporaryDirectory tmp_;
    fs::path tools_dir_;
    BundleRequest request_;
};

TEST_F(PipelineTest, BuildsPackageWithFakeToolchain) {
    BundlePipeline pipeline(Toolchain(), std::make_shared<ProcessStageRunner>());
    StateRecorder recorder;
    CollectingLineSink lines;
    pipeline.SetObserver(&recorder);
    pipeline.SetLineSink(&lines);

    auto res = pipeline.Run(request_);
    ASSERT_TRUE(res.has_value()) << res.error().msg;
    EXPECT_EQ(res->string(), request_.output_path.string());
    EXPECT_TRUE(fs::is_regular_file(request_.output_path));
    EXPECT_EQ(pipeline.State(), PipelineState::Done);

    EXPECT_EQ(recorder.states, (std::vector<PipelineState>{PipelineState::Preparing,
                                                           PipelineState::Harvesting,
                                                           PipelineState::Compiling,
                                                           PipelineState::Linking,
                                                           PipelineState::Done}));

    // light.exe concatenates its objects: harvested fragment then the manifest.
    const std::string msi = testutil::ReadFile(request_.output_path);
    EXPECT_EQ(msi.find("<Wix><Fragment/></Wix>"), 0u);
    EXPECT_NE(msi.find("Name=\"App\""), std::string::npos);
    EXPECT_NE(msi.find("<ComponentGroupRef Id=\"AppFiles\" />"), std::string::npos);

    EXPECT_TRUE(fs::is_regular_file(request_.build_dir / "main.wxs"));
    EXPECT_TRUE(fs::is_regular_file(request_.build_dir / "appdir.wxs"));
    EXPECT_TRUE(fs::is_regular_file(request_.build_dir / "appdir.wixobj"));
    EXPECT_TRUE(fs::is_regular_file(request_.build_dir / "main.wixobj"));

    const auto out = lines.Lines();
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0].rfind("heat dir ", 0), 0u);
    EXPECT_EQ(out[1].rfind("candle -arch x64", 0), 0u);
    EXPECT_EQ(out[3].rfind("light -o ", 0), 0u);
}

TEST_F(PipelineTest, BuildsFromNameAndVersionOnly) {
    request_.package = PackageMetadata{.name = "App", .version = "1.0.0"};
    BundlePipeline pipeline(Toolchain(), std::make_shared<ProcessStageRunner>());

    auto res = pipeline.Run(request_);
    ASSERT_TRUE(res.has_value()) << res.error().msg;
    EXPECT_TRUE(fs::is_regular_file(request_.output_path));

    const std::string manifest = testutil::ReadFile(request_.build_dir / "main.wxs");
    EXPECT_NE(manifest.find("Manufacturer=\"App\""), std::string::npos);
    EXPECT_NE(manifest.find("UpgradeCode=\"F581800F-1F80-53C8-BD9D-0C76E2AD31B4\""),
              std::string::npos);
}

TEST_F(PipelineTest, StagesRunInOrderWithWixArguments) {
    auto runner = std::make_shared<RecordingRunner>();
    BundlePipeline pipeline(Toolchain(), runner);

    ASSERT_TRUE(pipeline.Run(request_).has_value());
    ASSERT_EQ(runner->stages.size(), 4u);

    const std::string src = request_.source_dir.string();
    const Stage& harvest = runner->stages[0];
    EXPECT_EQ(harvest.name, "harvest");
    EXPECT_EQ(harvest.tool.string(), (tools_dir_ / "heat.exe").string());
    EXPECT_EQ(harvest.working_dir.string(), request_.build_dir.string());
    EXPECT_EQ(harvest.args, (std::vector<std::string>{"dir", src, "-platform", "x64",
                                                      "-cg", "AppFiles", "-dr", "APPLICATIONFOLDER",
                                                      "-gg", "-srd", "-out", "appdir.wxs",
                                                      "-var", "var.SourceDir"}));

    EXPECT_EQ(runner->stages[1].args,
              (std::vector<std::string>{"-arch", "x64", "-dSourceDir=" + src, "appdir.wxs"}));
    EXPECT_EQ(runner->stages[2].args,
              (std::vector<std::string>{"-arch", "x64", "-dSourceDir=" + src, "main.wxs"}));
    EXPECT_EQ(runner->stages[2].tool.string(), (tools_dir_ / "candle.exe").string());

    const Stage& link = runner->stages[3];
    EXPECT_EQ(link.tool.string(), (tools_dir_ / "light.exe").string());
    EXPECT_EQ(link.args, (std::vector<std::string>{"-o", request_.output_path.string(),
                                                   "appdir.wixobj", "main.wixobj"}));
}

TEST_F(PipelineTest, LauncherWrapsEveryTool) {
    request_.options.tool_launcher = "wine";
    auto runner = std::make_shared<RecordingRunner>();
    BundlePipeline pipeline(Toolchain(), runner);

    ASSERT_TRUE(pipeline.Run(request_).has_value());
    ASSERT_EQ(runner->stages.size(), 4u);
    for (const Stage& stage : runner->stages) {
        EXPECT_EQ(stage.tool.string(), "wine");
        ASSERT_FALSE(stage.args.empty());
        EXPECT_EQ(fs::path(stage.args[0]).parent_path().string(), tools_dir_.string());
    }
    EXPECT_EQ(runner->stages[0].args[1], "dir");
}

TEST_F(PipelineTest, HarvestFailureStopsBeforeCompile) {
    auto runner = std::make_shared<RecordingRunner>();
    runner->fail_at = "harvest";
    BundlePipeline pipeline(Toolchain(), runner);
    StateRecorder recorder;
    pipeline.SetObserver(&recorder);

    auto res = pipeline.Run(request_);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().stage, PipelineState::Harvesting);
    ASSERT_NE(res.error().stage_error(), nullptr);
    EXPECT_EQ(res.error().stage_error()->tool, "heat.exe");
    EXPECT_EQ(runner->stages.size(), 1u);
    EXPECT_EQ(pipeline.State(), PipelineState::Failed);
    EXPECT_EQ(recorder.states.back(), PipelineState::Failed);
    EXPECT_FALSE(fs::exists(request_.output_path));
}

TEST_F(PipelineTest, MissingCompilerFailsInCompiling) {
    fs::remove(tools_dir_ / "candle.exe");
    BundlePipeline pipeline(Toolchain(), std::make_shared<ProcessStageRunner>());

    auto res = pipeline.Run(request_);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().stage, PipelineState::Compiling);
    ASSERT_NE(res.error().stage_error(), nullptr);
    EXPECT_EQ(res.error().stage_error()->kind, StageError::Kind::SpawnFailed);
    EXPECT_EQ(res.error().stage_error()->tool, "candle.exe");
    // Harvest already ran.
    EXPECT_TRUE(fs::is_regular_file(request_.build_dir / "appdir.wxs"));
    EXPECT_FALSE(fs::exists(request_.output_path));
}

TEST_F(PipelineTest, LinkFailureRemovesStaleArtifact) {
    ASSERT_TRUE(testutil::WriteFile(request_.output_path, "old package"));
    ASSERT_TRUE(testutil::WriteScript(tools_dir_ / "light.exe", "echo 'light: error LGHT0001'\nexit 1\n"));
    BundlePipeline pipeline(Toolchain(), std::make_shared<ProcessStageRunner>());

    auto res = pipeline.Run(request_);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().stage, PipelineState::Linking);
    ASSERT_NE(res.error().stage_error(), nullptr);
    EXPECT_EQ(res.error().stage_error()->kind, StageError::Kind::NonZeroExit);
    EXPECT_EQ(res.error().stage_error()->code, 1);
    EXPECT_NE(res.error().msg.find("light.exe exited with code 1"), std::string::npos);
    EXPECT_FALSE(fs::exists(request_.output_path));
}

TEST_F(PipelineTest, MissingTemplateKeyFailsBeforeWritingManifest) {
    ASSERT_TRUE(testutil::WriteFile(tmp_ / "main.wxs.tpl",
                                    "<Product Name=\"{{ product_name }}\" Icon=\"{{ file.icon.name }}\" />"));
    request_.options.manifest_template = (tmp_ / "main.wxs.tpl").string();
    auto runner = std::make_shared<RecordingRunner>();
    BundlePipeline pipeline(Toolchain(), runner);

    auto res = pipeline.Run(request_);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().stage, PipelineState::Preparing);
    ASSERT_NE(res.error().render_error(), nullptr);
    EXPECT_EQ(res.error().render_error()->kind, RenderError::Kind::MissingKey);
    EXPECT_EQ(res.error().render_error()->key, "file.icon.name");
    EXPECT_FALSE(fs::exists(request_.build_dir / "main.wxs"));
    EXPECT_TRUE(runner->stages.empty());
}

TEST_F(PipelineTest, CustomTemplateSeesFileEntries) {
    ASSERT_TRUE(testutil::WriteFile(tmp_ / "main.wxs.tpl",
                                    "<File Name=\"{{ file.icon.name }}\" Source=\"{{file.icon.source}}\" />"));
    request_.options.manifest_template = (tmp_ / "main.wxs.tpl").string();
    request_.files.push_back(ManifestFile{.key = "icon", .name = "app.ico", .source = "res/app & co.ico"});
    BundlePipeline pipeline(Toolchain(), std::make_shared<RecordingRunner>());

    ASSERT_TRUE(pipeline.Run(request_).has_value());
    EXPECT_EQ(testutil::ReadFile(request_.build_dir / "main.wxs"),
              "<File Name=\"app.ico\" Source=\"res/app &amp; co.ico\" />");
}

TEST_F(PipelineTest, MissingSourceDirectoryFailsInPreparing) {
    ASSERT_TRUE(testutil::WriteFile(request_.output_path, "old package"));
    request_.source_dir = tmp_ / "nope";
    auto runner = std::make_shared<RecordingRunner>();
    BundlePipeline pipeline(Toolchain(), runner);

    auto res = pipeline.Run(request_);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().stage, PipelineState::Preparing);
    EXPECT_NE(res.error().msg.find("source directory does not exist"), std::string::npos);
    EXPECT_TRUE(runner->stages.empty());
    EXPECT_FALSE(fs::exists(request_.output_path));
}

TEST_F(PipelineTest, ToolchainFailureFailsInPreparing) {
    ASSERT_TRUE(testutil::WriteFile(request_.output_path, "old package"));
    auto runner = std::make_shared<RecordingRunner>();
    BundlePipeline pipeline(std::make_shared<FailingProvider>(), runner);

    auto res = pipeline.Run(request_);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().stage, PipelineState::Preparing);
    ASSERT_NE(res.error().acquire_error(), nullptr);
    EXPECT_EQ(res.error().acquire_error()->kind, AcquireError::Kind::Integrity);
    EXPECT_TRUE(runner->stages.empty());
    EXPECT_FALSE(fs::exists(request_.build_dir));
    EXPECT_FALSE(fs::exists(request_.output_path));
}

TEST_F(PipelineTest, DownloadedToolchainFeedsStages) {
    auto fetcher = std::make_shared<testutil::FakeFetcher>();
    fetcher->body = testutil::BuildZip({
        {"heat.exe", std::string("#!/bin/sh\n") + testutil::kFakeHeat},
        {"candle.exe", std::string("#!/bin/sh\n") + testutil::kFakeCandle},
        {"light.exe", std::string("#!/bin/sh\n") + testutil::kFakeLight},
    });
    const ToolchainSource source{.url = "https://example.invalid/wix.zip",
                                 .sha256 = Sha256Hex(fetcher->body)};
    auto provider = std::make_shared<DownloadingToolchainProvider>(
        ToolchainAcquirer(fetcher), source, (tmp_ / "downloaded").string());

    BundlePipeline pipeline(provider, std::make_shared<ProcessStageRunner>());
    auto res = pipeline.Run(request_);
    ASSERT_TRUE(res.has_value()) << res.error().msg;
    EXPECT_TRUE(fs::is_regular_file(request_.output_path));
    EXPECT_EQ(fetcher->calls, 1);
}

} // namespace
} // namespace bundler
