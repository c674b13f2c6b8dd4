#pragma once

#include <map>
#include <string>
#include <vector>

namespace bundler {

// Application metadata supplied by the caller.
struct PackageMetadata {
    std::string name;
    std::string version;
    std::string manufacturer;
    std::string upgrade_code;
    std::string main_binary;
};

struct ManifestFile {
    std::string key;     // exposed as file.<key>.name / file.<key>.source
    std::string name;
    std::string source;
};

// Everything the manifest template may reference.
struct ManifestContext {
    std::string source_dir;
    std::string component_group = "AppFiles";
    std::string directory_ref = "APPLICATIONFOLDER";
    std::string source_dir_var = "SourceDir";
    std::string arch = "x64";
    PackageMetadata package;
    std::vector<ManifestFile> files;

    // Flattened variable table used for substitution. An empty manufacturer
    // falls back to the product name and an empty upgrade code is derived
    // from it.
    std::map<std::string, std::string> ToVariables() const;
};

// WiX directory id of the Program Files folder matching a package arch.
std::string ProgramFilesFolderFor(const std::string& arch);

} // namespace bundler
