#include "http.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <curl/curl.h>
#include <fmt/format.h>
#include <cstdio>

namespace fs = std::filesystem;

namespace platform {

static size_t write_to_file(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* fp = static_cast<std::FILE*>(userdata);
    return std::fwrite(ptr, size, nmemb, fp);
}

CurlFetcher::CurlFetcher(StatusCallback cb) : status_(std::move(cb)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlFetcher::~CurlFetcher() {
    curl_global_cleanup();
}

namespace {

struct Attempt {
    bool ok = false;
    bool retryable = false;
    bool missing = false;   // file:// target absent
    long status = 0;
    std::string error;
};

Attempt fetch_once(const std::string& url, const fs::path& dest) {
    Attempt out;

    std::FILE* fp = std::fopen(dest.string().c_str(), "wb");
    if (!fp) {
        out.error = "Cannot write " + dest.string();
        return out;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        std::fclose(fp);
        out.error = "curl init failed";
        return out;
    }

    char errbuf[CURL_ERROR_SIZE] = {};
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, HTTP_CONNECT_TIMEOUT_SECS);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, HTTP_TOTAL_TIMEOUT_SECS);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, fmt::format("{}/{}", PM_TOOL_NAME, PM_VERSION).c_str());
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, fp);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    curl_easy_cleanup(curl);
    bool closed = std::fclose(fp) == 0;

    if (res != CURLE_OK) {
        out.missing = res == CURLE_FILE_COULDNT_READ_FILE || res == CURLE_REMOTE_FILE_NOT_FOUND;
        out.error = fmt::format("curl error: {}", errbuf[0] ? errbuf : curl_easy_strerror(res));
        out.retryable = res == CURLE_COULDNT_CONNECT || res == CURLE_OPERATION_TIMEDOUT ||
                        res == CURLE_COULDNT_RESOLVE_HOST || res == CURLE_RECV_ERROR ||
                        res == CURLE_SEND_ERROR || res == CURLE_PARTIAL_FILE ||
                        res == CURLE_GOT_NOTHING;
        return out;
    }
    if (out.status >= 400) {
        out.error = fmt::format("HTTP {}", out.status);
        out.retryable = out.status >= 500 || out.status == 429;
        return out;
    }
    if (!closed) {
        out.error = "Failed to write " + dest.string();
        return out;
    }
    out.ok = true;
    return out;
}

} // namespace

Result<void> CurlFetcher::download(const std::string& url, const fs::path& dest) {
    Attempt last;
    for (int attempt = 1; attempt <= HTTP_MAX_ATTEMPTS; ++attempt) {
        pm_log(fmt::format("GET {} (attempt {}/{})", url, attempt, HTTP_MAX_ATTEMPTS));
        last = fetch_once(url, dest);
        if (last.ok) return Result<void>::Ok();

        std::error_code ec;
        fs::remove(dest, ec);

        if (last.status == 404 || last.missing) {
            pm_log("GET " + url + ": not found");
            return Result<void>::Err(ErrorKind::NotFound, "Not found: " + url);
        }
        pm_log(fmt::format("GET {} failed: {}", url, last.error));
        if (!last.retryable || attempt == HTTP_MAX_ATTEMPTS) break;

        if (status_) status_(fmt::format("Retrying download ({}/{})...", attempt + 1, HTTP_MAX_ATTEMPTS));
        sleep_ms(HTTP_RETRY_DELAY_MS * attempt);
    }
    return Result<void>::Err(ErrorKind::Download,
        fmt::format("Failed to download {}: {}", url, last.error));
}

} // namespace platform
