#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace bundler {

// One external tool invocation of the pipeline.
struct Stage {
    std::string name;
    std::filesystem::path tool;
    std::vector<std::string> args;
    std::filesystem::path working_dir;
    std::vector<std::filesystem::path> outputs;
};

} // namespace bundler
