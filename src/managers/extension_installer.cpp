#include "extension_installer.hpp"
#include "manifest.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/schema.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/target.hpp>
#include <platform/archive.hpp>
#include <platform/file_lock.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;

const char* asset_format_name(AssetFormat format) {
    switch (format) {
        case AssetFormat::TarGz: return "tar.gz";
        case AssetFormat::Zip:   return "zip";
        case AssetFormat::Raw:   return "raw";
    }
    return "unknown";
}

std::string store_entry_owner(const std::string& entry_name) {
    auto at = entry_name.find('@');
    return at == std::string::npos ? "" : entry_name.substr(0, at);
}

static bool is_url(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0 || s.rfind("file://", 0) == 0;
}

static bool is_supported_target(const std::string& triple) {
    for (const auto& t : platform::supported_targets()) {
        if (triple == t.triple) return true;
    }
    return false;
}

// Removes a staging directory on every exit path.
struct StagingGuard {
    fs::path dir;
    ~StagingGuard() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

// Delete store entries of `name` other than `keep`.
static void prune_store(const fs::path& extensions_dir, const std::string& name,
                        const std::string& keep) {
    std::error_code ec;
    fs::path store = store_dir(extensions_dir);
    if (!fs::is_directory(store, ec)) return;
    for (const auto& entry : fs::directory_iterator(store, ec)) {
        std::string entry_name = entry.path().filename().string();
        if (store_entry_owner(entry_name) != name || entry_name == keep) continue;
        std::error_code rm_ec;
        fs::remove_all(entry.path(), rm_ec);
        if (rm_ec) {
            pm_log(fmt::format("install: could not remove {}: {}", entry.path().string(), rm_ec.message()));
        } else {
            pm_log("install: removed " + entry.path().string());
        }
    }
}

static std::optional<fs::path> locate_entry_point(const fs::path& root, const std::string& name,
                                                  const std::string& suffix) {
    std::string tool = EXTENSION_ASSET_PREFIX + name;
    for (const auto& rel : {fs::path(EXTENSION_ENTRY_POINT + suffix),
                            fs::path(tool + suffix),
                            fs::path("bin") / (tool + suffix)}) {
        std::error_code ec;
        if (fs::is_regular_file(root / rel, ec)) return root / rel;
    }
    return std::nullopt;
}

// Archives commonly wrap everything in one top-level directory.
static fs::path unwrap_single_directory(const fs::path& root, const std::string& name,
                                        const std::string& suffix) {
    std::error_code ec;
    if (fs::exists(root / EXTENSION_MANIFEST, ec) || locate_entry_point(root, name, suffix)) {
        return root;
    }
    fs::path only;
    int count = 0;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        ++count;
        only = entry.path();
    }
    if (count == 1 && fs::is_directory(only, ec)) return only;
    return root;
}

static std::string read_checksum(const fs::path& path) {
    std::ifstream in(path);
    std::string token;
    in >> token;
    std::transform(token.begin(), token.end(), token.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return token;
}

ExtensionInstaller::ExtensionInstaller(fs::path extensions_dir, platform::Fetcher& fetcher,
                                       std::string github_username, StatusCallback cb)
    : extensions_dir_(std::move(extensions_dir)),
      fetcher_(fetcher),
      github_username_(std::move(github_username)),
      status_(std::move(cb)) {}

Result<AssetInfo> ExtensionInstaller::resolve_asset(const std::string& name,
                                                    const std::string& version,
                                                    const std::string& target,
                                                    AssetFormat format,
                                                    const std::string& repository,
                                                    const std::string& host) {
    if (!is_valid_extension_name(name)) {
        return Result<AssetInfo>::Err(ErrorKind::Validation, "Invalid extension name: " + name);
    }
    std::string tag = (!version.empty() && version[0] == 'v') ? version.substr(1) : version;
    if (tag.empty()) {
        return Result<AssetInfo>::Err(ErrorKind::Validation, "A release version is required");
    }
    if (!is_supported_target(target)) {
        return Result<AssetInfo>::Err(ErrorKind::UnsupportedPlatform, "Unsupported target: " + target);
    }
    if (repository.empty()) {
        return Result<AssetInfo>::Err(ErrorKind::Validation, "No repository for " + name);
    }

    AssetInfo asset;
    asset.format = format;
    asset.filename = fmt::format("{}{}-{}", EXTENSION_ASSET_PREFIX, name, target);
    switch (format) {
        case AssetFormat::TarGz: asset.filename += ".tar.gz"; break;
        case AssetFormat::Zip:   asset.filename += ".zip"; break;
        case AssetFormat::Raw:   asset.filename += platform::executable_suffix(target); break;
    }

    std::string base = host.empty() ? env_or(ENV_RELEASE_HOST, DEFAULT_RELEASE_HOST) : host;
    while (!base.empty() && base.back() == '/') base.pop_back();

    asset.url = fmt::format("{}/{}/releases/download/v{}/{}", base, repository, tag, asset.filename);
    return Result<AssetInfo>::Ok(asset);
}

std::string ExtensionInstaller::default_repository(const std::string& name) const {
    std::string owner = github_username_.empty() ? DEFAULT_RELEASE_OWNER : github_username_;
    return fmt::format("{}/{}{}", owner, EXTENSION_ASSET_PREFIX, name);
}

Result<void> ExtensionInstaller::verify_checksum(const std::string& url, const fs::path& file) {
    fs::path sum_path = file;
    sum_path += ".sha256";

    auto fetched = fetcher_.download(url + ".sha256", sum_path);
    if (fetched.is_err()) {
        if (fetched.kind == ErrorKind::NotFound) {
            pm_log("install: no checksum published for " + url);
            return Result<void>::Ok();
        }
        return fetched;
    }

    std::string expected = read_checksum(sum_path);
    std::string actual = compute_file_sha256(file.string());
    if (expected.size() != 64 || actual != expected) {
        return Result<void>::Err(ErrorKind::ChecksumMismatch,
            fmt::format("Checksum mismatch for {}: expected {}, got {}",
                        url, expected.empty() ? "<empty>" : expected, actual));
    }
    pm_log("install: checksum ok for " + url);
    return Result<void>::Ok();
}

static Result<void> check_non_empty(const fs::path& file, const std::string& origin) {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    if (ec || size == 0) {
        return Result<void>::Err(ErrorKind::Download, "Downloaded artifact is empty: " + origin);
    }
    return Result<void>::Ok();
}

Result<fs::path> ExtensionInstaller::fetch_release(const InstallRequest& request,
                                                   const std::string& target,
                                                   const fs::path& download_dir,
                                                   AssetFormat& format,
                                                   std::string& url) {
    std::string repository = request.repository.empty()
        ? default_repository(request.name) : request.repository;

    std::vector<std::string> tried;
    for (AssetFormat f : {AssetFormat::TarGz, AssetFormat::Zip, AssetFormat::Raw}) {
        auto asset = resolve_asset(request.name, request.version, target, f, repository);
        if (asset.is_err()) return Result<fs::path>::Err(asset);

        fs::path dest = download_dir / asset.value.filename;
        status(fmt::format("Downloading {}...", asset.value.filename));
        auto fetched = fetcher_.download(asset.value.url, dest);
        if (fetched.is_err()) {
            if (fetched.kind == ErrorKind::NotFound) {
                tried.push_back(asset.value.url);
                continue;
            }
            return Result<fs::path>::Err(fetched);
        }

        auto non_empty = check_non_empty(dest, asset.value.url);
        if (non_empty.is_err()) return Result<fs::path>::Err(non_empty);

        auto verified = verify_checksum(asset.value.url, dest);
        if (verified.is_err()) return Result<fs::path>::Err(verified);

        pm_log(fmt::format("install: fetched {} asset {}", asset_format_name(f), asset.value.url));
        format = f;
        url = asset.value.url;
        return Result<fs::path>::Ok(dest);
    }

    std::string msg = fmt::format("No release artifact for {} v{} ({})", request.name,
                                  request.version, target);
    for (const auto& t : tried) msg += "\n  tried " + t;
    return Result<fs::path>::Err(ErrorKind::Download, msg);
}

Result<fs::path> ExtensionInstaller::fetch_url(const std::string& url, const fs::path& download_dir) {
    std::string filename = url.substr(0, url.find_first_of("?#"));
    auto slash = filename.find_last_of('/');
    if (slash != std::string::npos) filename = filename.substr(slash + 1);
    if (filename.empty()) filename = "artifact";

    fs::path dest = download_dir / filename;
    status(fmt::format("Downloading {}...", url));
    auto fetched = fetcher_.download(url, dest);
    if (fetched.is_err()) {
        // A missing explicit URL is a download failure, not a fallback signal
        return Result<fs::path>::Err(ErrorKind::Download, fetched.error);
    }

    auto non_empty = check_non_empty(dest, url);
    if (non_empty.is_err()) return Result<fs::path>::Err(non_empty);

    auto verified = verify_checksum(url, dest);
    if (verified.is_err()) return Result<fs::path>::Err(verified);
    return Result<fs::path>::Ok(dest);
}

Result<InstalledExtension> ExtensionInstaller::install(const InstallRequest& request) {
    const std::string& name = request.name;
    if (!is_valid_extension_name(name)) {
        return Result<InstalledExtension>::Err(ErrorKind::Validation, "Invalid extension name: " + name);
    }

    std::string target = request.target;
    if (target.empty()) {
        auto current = platform::current_target();
        if (current.is_err()) return Result<InstalledExtension>::Err(current);
        target = current.value;
    } else if (!is_supported_target(target)) {
        return Result<InstalledExtension>::Err(ErrorKind::UnsupportedPlatform,
            "Unsupported target: " + target);
    }
    std::string suffix = platform::executable_suffix(target);

    auto layout = ensure_extensions_directory_structure(extensions_dir_);
    if (layout.is_err()) return Result<InstalledExtension>::Err(layout);

    StagingGuard work{staging_dir(extensions_dir_) / platform::unique_name(name)};
    fs::path download_dir = work.dir / "download";
    fs::path root = work.dir / "root";
    std::error_code ec;
    fs::create_directories(download_dir, ec);
    fs::create_directories(root, ec);
    if (ec) {
        return Result<InstalledExtension>::Err(ErrorKind::IO,
            fmt::format("Failed to create staging directory {}: {}", work.dir.string(), ec.message()));
    }
    pm_log(fmt::format("install: {} staging in {}", name, work.dir.string()));

    // ── Acquire the artifact ──
    fs::path artifact;
    bool archive = false;
    std::string origin;

    if (request.source.empty()) {
        AssetFormat format = AssetFormat::TarGz;
        auto fetched = fetch_release(request, target, download_dir, format, origin);
        if (fetched.is_err()) return Result<InstalledExtension>::Err(fetched);
        artifact = fetched.value;
        archive = format != AssetFormat::Raw;
    } else if (is_url(request.source)) {
        auto fetched = fetch_url(request.source, download_dir);
        if (fetched.is_err()) return Result<InstalledExtension>::Err(fetched);
        artifact = fetched.value;
        archive = platform::is_archive_name(artifact.filename().string());
        origin = request.source;
    } else {
        fs::path src(request.source);
        origin = fs::absolute(src, ec).string();
        if (fs::is_directory(src, ec)) {
            fs::copy(src, root, fs::copy_options::recursive | fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return Result<InstalledExtension>::Err(ErrorKind::IO,
                    fmt::format("Failed to copy {}: {}", src.string(), ec.message()));
            }
        } else if (fs::is_regular_file(src, ec)) {
            auto non_empty = check_non_empty(src, src.string());
            if (non_empty.is_err()) return Result<InstalledExtension>::Err(non_empty);
            artifact = src;
            archive = platform::is_archive_name(src.filename().string());
        } else {
            return Result<InstalledExtension>::Err(ErrorKind::InvalidPath,
                "Source not found: " + request.source);
        }
    }

    // ── Unpack into the staging root ──
    if (!artifact.empty()) {
        if (archive) {
            status("Extracting...");
            auto extracted = platform::extract_archive(artifact, root);
            if (extracted.is_err()) return Result<InstalledExtension>::Err(extracted);
        } else {
            fs::copy_file(artifact, root / (EXTENSION_ENTRY_POINT + suffix),
                          fs::copy_options::overwrite_existing, ec);
            if (ec) {
                return Result<InstalledExtension>::Err(ErrorKind::IO,
                    fmt::format("Failed to stage {}: {}", artifact.string(), ec.message()));
            }
        }
    }

    fs::path staged = unwrap_single_directory(root, name, suffix);

    auto entry = locate_entry_point(staged, name, suffix);
    if (!entry) {
        return Result<InstalledExtension>::Err(ErrorKind::Extract,
            fmt::format("No entry point in artifact for {} (looked for {}{}, {}{}{}, bin/{}{}{})",
                        name, EXTENSION_ENTRY_POINT, suffix, EXTENSION_ASSET_PREFIX, name, suffix,
                        EXTENSION_ASSET_PREFIX, name, suffix));
    }
    fs::path binary = staged / (EXTENSION_ENTRY_POINT + suffix);
    if (*entry != binary) {
        fs::rename(*entry, binary, ec);
        if (ec) {
            return Result<InstalledExtension>::Err(ErrorKind::IO,
                fmt::format("Failed to normalize entry point {}: {}", entry->string(), ec.message()));
        }
    }

    // ── Manifest ──
    ExtensionManifest manifest;
    auto loaded = load_manifest(staged, name);
    if (loaded.is_ok()) {
        manifest = loaded.value;
        if (!request.version.empty() && manifest.version != request.version &&
            "v" + manifest.version != request.version) {
            pm_log(fmt::format("install: {} requested v{} but manifest says {}",
                               name, request.version, manifest.version));
        }
    } else if (loaded.kind == ErrorKind::NotFound) {
        manifest.name = name;
        std::string v = request.version;
        if (!v.empty() && v[0] == 'v') v = v.substr(1);
        manifest.version = is_valid_semver(v) ? v : "0.0.0";
        manifest.description = "Installed from " + origin;
        manifest.author = "unknown";
        auto saved = save_manifest(staged, manifest);
        if (saved.is_err()) return Result<InstalledExtension>::Err(saved);
    } else {
        return Result<InstalledExtension>::Err(ErrorKind::Validation, loaded.error);
    }

    auto perms = platform::make_executable(binary);
    if (perms.is_err()) return Result<InstalledExtension>::Err(perms);

    auto committed = commit(name, manifest.version, staged);
    if (committed.is_err()) return committed;
    committed.value.manifest = manifest;
    committed.value.binary_path =
        (fs::path(committed.value.directory) / (EXTENSION_ENTRY_POINT + suffix)).string();

    status(fmt::format("Installed {} v{}", name, manifest.version));
    return committed;
}

Result<InstalledExtension> ExtensionInstaller::commit(const std::string& name,
                                                      const std::string& version,
                                                      const fs::path& staged) {
    FileLock lock(extension_lock_path(extensions_dir_, name).string());
    if (!lock.held()) {
        return Result<InstalledExtension>::Err(ErrorKind::IO,
            "Could not lock " + extension_lock_path(extensions_dir_, name).string());
    }

    std::error_code ec;
    fs::path entry = store_dir(extensions_dir_) / platform::unique_name(name + "@" + version);
    fs::rename(staged, entry, ec);
    if (ec) {
        return Result<InstalledExtension>::Err(ErrorKind::IO,
            fmt::format("Failed to move {} into the store: {}", staged.string(), ec.message()));
    }

    auto published = publish_extension_link(extensions_dir_, name, entry.filename().string());
    if (published.is_err()) {
        std::error_code rm_ec;
        fs::remove_all(entry, rm_ec);
        return Result<InstalledExtension>::Err(published);
    }
    fs::path link = extensions_dir_ / name;
    pm_log(fmt::format("install: {} -> {}", link.string(), entry.string()));

    prune_store(extensions_dir_, name, entry.filename().string());

    InstalledExtension ext;
    ext.name = name;
    ext.directory = link.string();
    return Result<InstalledExtension>::Ok(ext);
}

Result<void> publish_extension_link(const fs::path& extensions_dir, const std::string& name,
                                    const std::string& entry_name) {
    std::error_code ec;
    fs::path link = extensions_dir / name;
    fs::path tmp_link = staging_dir(extensions_dir) / ("." + platform::unique_name(name) + ".link");
    // Relative to <name>'s final location, not to the staging directory
    fs::create_directory_symlink(fs::path(STORE_DIR_NAME) / entry_name, tmp_link, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Failed to create link {}: {}", tmp_link.string(), ec.message()));
    }

    std::error_code rm_ec;

    // Plain directory from an older layout: park it in the store so the
    // prune after publishing disposes of it, or move it back on failure.
    fs::path parked;
    auto st = fs::symlink_status(link, ec);
    if (fs::exists(st) && !fs::is_symlink(st)) {
        parked = store_dir(extensions_dir) / platform::unique_name(name + "@legacy");
        fs::rename(link, parked, ec);
        if (ec) {
            fs::remove(tmp_link, rm_ec);
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("Failed to move aside {}: {}", link.string(), ec.message()));
        }
    }

    fs::rename(tmp_link, link, ec);
    if (ec) {
        fs::remove(tmp_link, rm_ec);
        if (!parked.empty()) {
            std::error_code back_ec;
            fs::rename(parked, link, back_ec);
            if (back_ec) {
                pm_log(fmt::format("install: could not restore {}: {}", link.string(), back_ec.message()));
            }
        }
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Failed to publish {}: {}", link.string(), ec.message()));
    }
    return Result<void>::Ok();
}

Result<void> ExtensionInstaller::uninstall(const std::string& name) {
    if (!is_valid_extension_name(name)) {
        return Result<void>::Err(ErrorKind::Validation, "Invalid extension name: " + name);
    }

    FileLock lock(extension_lock_path(extensions_dir_, name).string());
    if (!lock.held()) {
        return Result<void>::Err(ErrorKind::IO,
            "Could not lock " + extension_lock_path(extensions_dir_, name).string());
    }

    std::error_code ec;
    fs::path link = extensions_dir_ / name;
    auto st = fs::symlink_status(link, ec);
    if (!fs::exists(st)) {
        return Result<void>::Err(ErrorKind::ExtensionNotFound, "Extension not installed: " + name);
    }

    if (fs::is_symlink(st)) {
        fs::remove(link, ec);
    } else {
        fs::remove_all(link, ec);
    }
    if (ec) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Failed to remove {}: {}", link.string(), ec.message()));
    }

    prune_store(extensions_dir_, name, "");
    pm_log("uninstall: removed " + name);
    return Result<void>::Ok();
}

Result<fs::path> ExtensionInstaller::pack(const fs::path& extension_dir,
                                          const std::string& target,
                                          const fs::path& out_dir) {
    if (!is_supported_target(target)) {
        return Result<fs::path>::Err(ErrorKind::UnsupportedPlatform, "Unsupported target: " + target);
    }

    auto manifest = load_manifest(extension_dir);
    if (manifest.is_err()) return Result<fs::path>::Err(manifest);

    std::string binary = EXTENSION_ENTRY_POINT + platform::executable_suffix(target);
    std::error_code ec;
    if (!fs::is_regular_file(extension_dir / binary, ec)) {
        return Result<fs::path>::Err(ErrorKind::NotFound,
            fmt::format("No {} in {}", binary, extension_dir.string()));
    }

    fs::create_directories(out_dir, ec);
    if (ec) {
        return Result<fs::path>::Err(ErrorKind::IO,
            fmt::format("Failed to create {}: {}", out_dir.string(), ec.message()));
    }

    std::string filename = fmt::format("{}{}-{}.tar.gz", EXTENSION_ASSET_PREFIX,
                                       manifest.value.name, target);
    fs::path archive = out_dir / filename;
    auto created = platform::create_tar_gz(archive, extension_dir, {EXTENSION_MANIFEST, binary});
    if (created.is_err()) return Result<fs::path>::Err(created);

    std::string sha = compute_file_sha256(archive.string());
    fs::path sum_path = archive;
    sum_path += ".sha256";
    auto written = platform::write_file_atomic(sum_path, sha + "  " + filename + "\n");
    if (written.is_err()) return Result<fs::path>::Err(written);

    pm_log(fmt::format("pack: {} ({})", archive.string(), sha));
    return Result<fs::path>::Ok(archive);
}
