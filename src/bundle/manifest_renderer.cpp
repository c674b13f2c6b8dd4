#include "bundle/manifest_renderer.hpp"

#include "util/file_utils.hpp"

#include <cctype>

namespace bundler {

namespace {

constexpr std::string_view kOpen = "{{";
constexpr std::string_view kClose = "}}";

bool IsValidName(std::string_view name) {
    if (name.empty()) return false;
    const unsigned char first = static_cast<unsigned char>(name.front());
    if (!std::isalpha(first) && first != '_') return false;
    for (const char c : name) {
        const unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '.' && c != '-') return false;
    }
    return true;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

RenderError Malformed(std::string msg, size_t offset) {
    return RenderError{.kind = RenderError::Kind::Malformed, .key = {}, .msg = std::move(msg), .offset = offset};
}

} // namespace

std::string Describe(const RenderError& e) {
    if (e.kind == RenderError::Kind::MissingKey) {
        return "missing template value '" + e.key + "' at offset " + std::to_string(e.offset);
    }
    return "malformed template at offset " + std::to_string(e.offset) + ": " + e.msg;
}

std::string XmlEscape(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

std::expected<std::string, RenderError>
ManifestRenderer::Render(std::string_view template_source, const ManifestContext& context) const {
    return Render(template_source, context.ToVariables());
}

std::expected<std::string, RenderError>
ManifestRenderer::Render(std::string_view template_source,
                         const std::map<std::string, std::string>& vars) const {
    std::string out;
    out.reserve(template_source.size());

    size_t pos = 0;
    while (pos < template_source.size()) {
        const size_t open = template_source.find(kOpen, pos);
        if (open == std::string_view::npos) {
            out.append(template_source.substr(pos));
            break;
        }
        out.append(template_source.substr(pos, open - pos));

        const size_t body_begin = open + kOpen.size();
        const size_t close = template_source.find(kClose, body_begin);
        if (close == std::string_view::npos) {
            return std::unexpected(Malformed("unterminated placeholder", open));
        }

        const std::string_view body = template_source.substr(body_begin, close - body_begin);
        if (body.find(kOpen) != std::string_view::npos) {
            return std::unexpected(Malformed("nested placeholder", open));
        }
        const std::string_view name = Trim(body);
        if (!IsValidName(name)) {
            return std::unexpected(Malformed("invalid placeholder name '" + std::string(body) + "'", open));
        }

        const auto it = vars.find(std::string(name));
        if (it == vars.end()) {
            return std::unexpected(RenderError{.kind = RenderError::Kind::MissingKey,
                                               .key = std::string(name),
                                               .msg = "no value for placeholder",
                                               .offset = open});
        }
        out += XmlEscape(it->second);
        pos = close + kClose.size();
    }

    return out;
}

Result LoadTemplateFile(const std::string& path, std::string& out) {
    auto res = ReadFileToString(path, out);
    if (!res.is_ok()) {
        return Result::Fail(res.err, "manifest template: " + res.message());
    }
    return Result::Ok();
}

} // namespace bundler
