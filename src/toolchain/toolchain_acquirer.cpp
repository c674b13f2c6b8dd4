#include "toolchain/toolchain_acquirer.hpp"

#include "crypto/integrity.hpp"
#include "util/logger.hpp"

#include <cstdint>
#include <vector>

namespace bundler {

const char* ToString(AcquireError::Kind kind) {
    switch (kind) {
        case AcquireError::Kind::Network:    return "network";
        case AcquireError::Kind::Integrity:  return "integrity";
        case AcquireError::Kind::Extraction: return "extraction";
    }
    return "acquire";
}

ToolchainAcquirer::ToolchainAcquirer()
    : ToolchainAcquirer(std::make_shared<CurlHttpFetcher>()) {}

ToolchainAcquirer::ToolchainAcquirer(std::shared_ptr<const IHttpFetcher> fetcher, ToolNames tools)
    : fetcher_(fetcher ? std::move(fetcher) : std::make_shared<CurlHttpFetcher>()),
      tools_(std::move(tools)) {}

std::expected<ToolchainInstallation, AcquireError>
ToolchainAcquirer::Acquire(const std::string& url,
                           const std::string& expected_sha256,
                           const std::string& dest_dir) const {
    LogInfo("Downloading toolchain: %s", url.c_str());

    std::vector<std::uint8_t> data;
    auto fetch_res = fetcher_->Fetch(url, data);
    if (!fetch_res.is_ok()) {
        return std::unexpected(AcquireError{AcquireError::Kind::Network, fetch_res.message()});
    }

    LogInfo("Validating toolchain digest (%zu bytes)", data.size());
    auto verified = VerifySha256(data, expected_sha256);
    if (!verified) {
        return std::unexpected(AcquireError{
            AcquireError::Kind::Integrity,
            std::string(ToString(verified.error().kind)) + ": " + verified.error().msg});
    }

    LogInfo("Extracting toolchain into %s", dest_dir.c_str());
    ArchiveExtractor::Stats stats{};
    auto extract_res = extractor_.ExtractToDir(data, dest_dir, &stats);
    if (!extract_res.is_ok()) {
        return std::unexpected(AcquireError{AcquireError::Kind::Extraction, extract_res.message()});
    }
    LogDebug("Extracted %zu entries (%llu bytes)",
             stats.entries,
             (unsigned long long)stats.bytes);

    ToolchainInstallation installation{.root = dest_dir, .tools = tools_};
    auto exec_res = installation.MarkToolsExecutable();
    if (!exec_res.is_ok()) {
        return std::unexpected(AcquireError{AcquireError::Kind::Extraction, exec_res.message()});
    }
    auto valid_res = installation.Validate();
    if (!valid_res.is_ok()) {
        return std::unexpected(AcquireError{AcquireError::Kind::Extraction,
                                            "incomplete toolchain: " + valid_res.message()});
    }
    return installation;
}

std::expected<ToolchainInstallation, AcquireError>
ToolchainAcquirer::EnsureInstalled(const ToolchainSource& source, const std::string& dest_dir) const {
    ToolchainInstallation existing{.root = dest_dir, .tools = tools_};
    auto valid_res = existing.Validate();
    if (valid_res.is_ok()) {
        LogInfo("Using installed toolchain at %s", dest_dir.c_str());
        return existing;
    }
    LogDebug("No usable toolchain at %s: %s", dest_dir.c_str(), valid_res.message().c_str());
    return Acquire(source.url, source.sha256, dest_dir);
}

} // namespace bundler
