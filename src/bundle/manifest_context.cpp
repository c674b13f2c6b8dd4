#include "bundle/manifest_context.hpp"

#include "crypto/name_uuid.hpp"

namespace bundler {

std::string ProgramFilesFolderFor(const std::string& arch) {
    if (arch == "x86" || arch == "arm") return "ProgramFilesFolder";
    return "ProgramFiles64Folder";
}

std::map<std::string, std::string> ManifestContext::ToVariables() const {
    std::map<std::string, std::string> vars;
    vars["source_dir"] = source_dir;
    vars["component_group"] = component_group;
    vars["directory_ref"] = directory_ref;
    vars["source_dir_var"] = source_dir_var;
    vars["arch"] = arch;
    vars["program_files_folder"] = ProgramFilesFolderFor(arch);

    // Optional metadata is only exposed when set, so a template that uses it
    // without the caller providing it fails with a missing key.
    auto put_if_set = [&vars](const char* key, const std::string& value) {
        if (!value.empty()) vars[key] = value;
    };
    put_if_set("product_name", package.name);
    put_if_set("product_version", package.version);
    put_if_set("manufacturer", package.manufacturer.empty() ? package.name : package.manufacturer);
    // Stable across versions of the same product, so upgrades replace it.
    put_if_set("upgrade_code", package.upgrade_code.empty() && !package.name.empty()
                                   ? NameBasedUuid(package.name)
                                   : package.upgrade_code);
    put_if_set("main_binary", package.main_binary);

    for (const auto& file : files) {
        if (file.key.empty()) continue;
        vars["file." + file.key + ".name"] = file.name;
        vars["file." + file.key + ".source"] = file.source;
    }
    return vars;
}

} // namespace bundler
