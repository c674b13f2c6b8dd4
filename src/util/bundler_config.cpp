#include "util/bundler_config.hpp"

#include <fstream>
#include <utility>

namespace bundler {

namespace {

// Absent keys keep the default; present keys must have the right type.
Result GetString(const nlohmann::json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_string())
        return Result::Fail(-1, std::string("'") + key + "' must be a string");
    out = it->get<std::string>();
    return Result::Ok();
}

Result GetBool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end())
        return Result::Ok();
    if (!it->is_boolean())
        return Result::Fail(-1, std::string("'") + key + "' must be a boolean");
    out = it->get<bool>();
    return Result::Ok();
}

Result FillPackage(const nlohmann::json& j, PackageMetadata& pkg) {
    if (!j.is_object())
        return Result::Fail(-1, "'package' must be an object");

    const std::pair<const char*, std::string*> fields[] = {
        {"name", &pkg.name},
        {"version", &pkg.version},
        {"manufacturer", &pkg.manufacturer},
        {"upgrade_code", &pkg.upgrade_code},
        {"main_binary", &pkg.main_binary},
    };
    for (const auto& [key, field] : fields) {
        auto r = GetString(j, key, *field);
        if (!r.is_ok())
            return Result::Fail(-1, "package: " + r.message());
    }
    return Result::Ok();
}

} // namespace

Result BundlerConfig::FromJson(const nlohmann::json& j, BundlerConfig& out) {
    out = BundlerConfig{};

    if (!j.is_object())
        return Result::Fail(-1, "config root must be a JSON object");

    const std::pair<const char*, std::string*> strings[] = {
        {"toolchain_url", &out.toolchain.url},
        {"toolchain_sha256", &out.toolchain.sha256},
        {"toolchain_dir", &out.toolchain_dir},
        {"harvest_tool", &out.tools.harvest},
        {"compile_tool", &out.tools.compile},
        {"link_tool", &out.tools.link},
        {"tool_launcher", &out.options.tool_launcher},
        {"arch", &out.options.arch},
        {"platform", &out.options.platform},
        {"component_group", &out.options.component_group},
        {"directory_ref", &out.options.directory_ref},
        {"source_dir_var", &out.options.source_dir_var},
        {"manifest_template", &out.options.manifest_template},
    };
    for (const auto& [key, field] : strings) {
        auto r = GetString(j, key, *field);
        if (!r.is_ok())
            return r;
    }

    auto r = GetBool(j, "capture_stderr", out.capture_stderr);
    if (!r.is_ok())
        return r;

    std::string level;
    r = GetString(j, "log_level", level);
    if (!r.is_ok())
        return r;
    if (!level.empty()) {
        out.log_level = ParseLogLevel(level);
        if (!out.log_level)
            return Result::Fail(-1, "unknown log_level: " + level);
    }

    auto pkg = j.find("package");
    if (pkg == j.end())
        return Result::Fail(-1, "missing 'package' section");
    r = FillPackage(*pkg, out.package);
    if (!r.is_ok())
        return r;

    if (out.package.name.empty())
        return Result::Fail(-1, "package.name is required");
    if (out.package.version.empty())
        return Result::Fail(-1, "package.version is required");
    if (out.tools.harvest.empty() || out.tools.compile.empty() || out.tools.link.empty())
        return Result::Fail(-1, "tool names must not be empty");

    return Result::Ok();
}

Result BundlerConfig::LoadFromFile(const std::string& path, BundlerConfig& out) {
    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(-1, "cannot open config: " + path);
    }

    nlohmann::json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(-1, std::string("invalid JSON in ") + path + ": " + e.what());
    }

    auto r = FromJson(j, out);
    if (!r.is_ok())
        return Result::Fail(r.err, r.message() + " (" + path + ")");
    return Result::Ok();
}

} // namespace bundler
