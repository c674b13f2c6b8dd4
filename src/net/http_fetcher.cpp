#include "net/http_fetcher.hpp"

#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace bundler {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t AppendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::vector<std::uint8_t>*>(userdata);
    const size_t n = size * nmemb;
    out->insert(out->end(), reinterpret_cast<const std::uint8_t*>(ptr),
                reinterpret_cast<const std::uint8_t*>(ptr) + n);
    return n;
}

bool IsHttpUrl(const std::string& url) {
    return url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0;
}

} // namespace

CurlHttpFetcher::CurlHttpFetcher() : CurlHttpFetcher(Options{}) {}

CurlHttpFetcher::CurlHttpFetcher(const Options& opt) : opt_(opt) { EnsureCurlGlobalInit(); }

Result CurlHttpFetcher::Fetch(const std::string& url, std::vector<std::uint8_t>& out) const {
    out.clear();

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) return Result::Fail(-1, "curl_easy_init failed");

    char errbuf[CURL_ERROR_SIZE]{};
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, AppendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, opt_.max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, opt_.connect_timeout_sec);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, opt_.user_agent.c_str());

    LogDebug("GET %s", url.c_str());
    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        out.clear();
        const std::string detail = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        return Result::Fail(static_cast<int>(rc), "download failed: " + url + ": " + detail);
    }

    if (IsHttpUrl(url)) {
        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status < 200 || status >= 300) {
            out.clear();
            return Result::Fail(-1, "download failed: " + url + ": HTTP status " +
                                        std::to_string(status));
        }
    }

    LogDebug("GET %s: %zu bytes", url.c_str(), out.size());
    return Result::Ok();
}

} // namespace bundler
