#pragma once

#include "bundle/manifest_context.hpp"
#include "util/result.hpp"

#include <expected>
#include <map>
#include <string>
#include <string_view>

namespace bundler {

struct RenderError {
    enum class Kind {
        MissingKey,
        Malformed,
    };

    Kind kind = Kind::Malformed;
    std::string key;      // MissingKey only
    std::string msg;
    size_t offset = 0;  // byte offset of the offending placeholder
};

std::string Describe(const RenderError& e);

// Substitutes {{ name }} placeholders with XML-escaped values. There are no
// loops, conditionals or helpers.
class ManifestRenderer {
  public:
    std::expected<std::string, RenderError> Render(std::string_view template_source,
                                                   const ManifestContext& context) const;

    std::expected<std::string, RenderError> Render(std::string_view template_source,
                                                   const std::map<std::string, std::string>& vars) const;
};

// Built-in main.wxs used when no template file is configured.
std::string_view DefaultManifestTemplate();

Result LoadTemplateFile(const std::string& path, std::string& out);

std::string XmlEscape(std::string_view value);

} // namespace bundler
