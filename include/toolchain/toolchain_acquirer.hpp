#pragma once

#include "net/http_fetcher.hpp"
#include "toolchain/archive_extractor.hpp"
#include "toolchain/toolchain.hpp"

#include <expected>
#include <memory>
#include <string>

namespace bundler {

struct AcquireError {
    enum class Kind {
        Network,
        Integrity,
        Extraction,
    };

    Kind kind = Kind::Network;
    std::string msg;
};

const char* ToString(AcquireError::Kind kind);

class ToolchainAcquirer {
  public:
    ToolchainAcquirer();
    explicit ToolchainAcquirer(std::shared_ptr<const IHttpFetcher> fetcher, ToolNames tools = {});

    // Download, verify, then extract into dest_dir. Nothing touches the disk
    // before the digest check passes.
    std::expected<ToolchainInstallation, AcquireError> Acquire(const std::string& url,
                                                               const std::string& expected_sha256,
                                                               const std::string& dest_dir) const;

    // Reuses a valid installation already present in dest_dir.
    std::expected<ToolchainInstallation, AcquireError> EnsureInstalled(const ToolchainSource& source,
                                                                       const std::string& dest_dir) const;

  private:
    std::shared_ptr<const IHttpFetcher> fetcher_;
    ToolNames tools_;
    ArchiveExtractor extractor_;
};

class IToolchainProvider {
  public:
    virtual ~IToolchainProvider() = default;
    virtual std::expected<ToolchainInstallation, AcquireError> Provide() const = 0;
};

// Hands out an installation supplied by the caller, untouched.
class FixedToolchainProvider final : public IToolchainProvider {
  public:
    explicit FixedToolchainProvider(ToolchainInstallation installation)
        : installation_(std::move(installation)) {}

    std::expected<ToolchainInstallation, AcquireError> Provide() const override {
        return installation_;
    }

  private:
    ToolchainInstallation installation_;
};

class DownloadingToolchainProvider final : public IToolchainProvider {
  public:
    DownloadingToolchainProvider(ToolchainAcquirer acquirer, ToolchainSource source, std::string dir)
        : acquirer_(std::move(acquirer)), source_(std::move(source)), dir_(std::move(dir)) {}

    std::expected<ToolchainInstallation, AcquireError> Provide() const override {
        return acquirer_.EnsureInstalled(source_, dir_);
    }

  private:
    ToolchainAcquirer acquirer_;
    ToolchainSource source_;
    std::string dir_;
};

} // namespace bundler
