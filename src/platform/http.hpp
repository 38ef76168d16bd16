#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Download seam used by the extension installer.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    // Fetch url into dest. HTTP 404 fails with ErrorKind::NotFound so callers
    // can try another artifact; anything else fails with ErrorKind::Download.
    virtual Result<void> download(const std::string& url,
                                  const std::filesystem::path& dest) = 0;
};

// libcurl-backed fetcher: follows redirects, bounded timeouts, retries
// transient failures (connection errors, 5xx, 429).
class CurlFetcher : public Fetcher {
public:
    CurlFetcher(StatusCallback cb = nullptr);
    ~CurlFetcher() override;

    Result<void> download(const std::string& url,
                          const std::filesystem::path& dest) override;

private:
    StatusCallback status_;
};

} // namespace platform
