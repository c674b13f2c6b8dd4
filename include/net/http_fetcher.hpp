#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace bundler {

class IHttpFetcher {
  public:
    virtual ~IHttpFetcher() = default;
    // Reads the full response body of a GET. Fails on transport errors and on
    // any non-2xx HTTP status.
    virtual Result Fetch(const std::string& url, std::vector<std::uint8_t>& out) const = 0;
};

class CurlHttpFetcher final : public IHttpFetcher {
  public:
    struct Options {
        long connect_timeout_sec = 30;
        long max_redirects = 10;
        std::string user_agent = "msi-bundler/1.0";
    };

    CurlHttpFetcher();
    explicit CurlHttpFetcher(const Options& opt);

    Result Fetch(const std::string& url, std::vector<std::uint8_t>& out) const override;

  private:
    Options opt_{};
};

} // namespace bundler
