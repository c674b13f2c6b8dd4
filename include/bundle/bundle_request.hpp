#pragma once

#include "bundle/manifest_context.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace bundler {

// Layout and naming knobs of one bundle run.
struct BundleOptions {
    std::string arch = "x64";
    std::string platform = "x64";
    std::string component_group = "AppFiles";
    std::string directory_ref = "APPLICATIONFOLDER";
    std::string source_dir_var = "SourceDir";

    // Empty: use the built-in main.wxs template.
    std::string manifest_template;
    std::string manifest_file = "main.wxs";
    std::string harvest_file = "appdir.wxs";

    // Optional program every tool is started through (e.g. "wine").
    std::string tool_launcher;
};

struct BundleRequest {
    std::filesystem::path source_dir;
    std::filesystem::path build_dir;
    std::filesystem::path output_path;
    PackageMetadata package;
    std::vector<ManifestFile> files;
    BundleOptions options;
};

} // namespace bundler
