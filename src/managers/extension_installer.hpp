#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <platform/http.hpp>

namespace fs = std::filesystem;

enum class AssetFormat { TarGz, Zip, Raw };

const char* asset_format_name(AssetFormat format);

struct AssetInfo {
    std::string url;
    std::string filename;
    AssetFormat format = AssetFormat::TarGz;
};

struct InstallRequest {
    std::string name;
    std::string version;      // release tag without the leading 'v'
    std::string repository;   // "<owner>/<repo>"; empty = default for name
    std::string source;       // local file/dir or URL; empty = release download
    std::string target;       // target triple; empty = running platform
};

// Installs extensions into one extensions directory. Every install is staged
// privately and published with a single rename of the <name> link, so a
// concurrent scan sees the old version or the new one, never a mix.
class ExtensionInstaller {
public:
    ExtensionInstaller(fs::path extensions_dir, platform::Fetcher& fetcher,
                       std::string github_username = "", StatusCallback cb = nullptr);

    // Release URL for pm-ext-<name>-<target>[.exe|.tar.gz|.zip].
    // host defaults to $PM_RELEASE_HOST or https://github.com.
    static Result<AssetInfo> resolve_asset(const std::string& name,
                                           const std::string& version,
                                           const std::string& target,
                                           AssetFormat format,
                                           const std::string& repository,
                                           const std::string& host = "");

    // "<github_username or pm-extensions>/pm-ext-<name>"
    std::string default_repository(const std::string& name) const;

    // Fetch, verify, stage and publish. On failure the previous install
    // (if any) is left exactly as it was.
    Result<InstalledExtension> install(const InstallRequest& request);

    Result<void> uninstall(const std::string& name);

    // Write <out_dir>/pm-ext-<name>-<target>.tar.gz (extension.yml + binary)
    // plus a .sha256 sidecar. Returns the archive path.
    static Result<fs::path> pack(const fs::path& extension_dir,
                                 const std::string& target,
                                 const fs::path& out_dir);

    const fs::path& extensions_dir() const { return extensions_dir_; }

private:
    Result<fs::path> fetch_release(const InstallRequest& request, const std::string& target,
                                   const fs::path& download_dir, AssetFormat& format,
                                   std::string& url);
    Result<fs::path> fetch_url(const std::string& url, const fs::path& download_dir);
    Result<void> verify_checksum(const std::string& url, const fs::path& file);
    Result<InstalledExtension> commit(const std::string& name, const std::string& version,
                                      const fs::path& staged);

    void status(const std::string& msg) const { if (status_) status_(msg); }

    fs::path extensions_dir_;
    platform::Fetcher& fetcher_;
    std::string github_username_;
    StatusCallback status_;
};

// Store entries are named <name>@<version>-<nonce>; returns <name>.
std::string store_entry_owner(const std::string& entry_name);

// Point <extensions_dir>/<name> at .store/<entry_name> with a single rename.
// A plain directory already at <name> is parked in the store first and moved
// back if the new link cannot be published.
Result<void> publish_extension_link(const fs::path& extensions_dir, const std::string& name,
                                    const std::string& entry_name);
