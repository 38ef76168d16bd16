#include "extension_registry.hpp"
#include "manifest.hpp"
#include <core/constants.hpp>
#include <core/directory_structure.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/target.hpp>
#include <fmt/format.h>
#include <utility>

namespace fs = std::filesystem;

static std::string entry_point_name() {
    auto target = platform::current_target();
    return EXTENSION_ENTRY_POINT +
           (target.is_ok() ? platform::executable_suffix(target.value) : std::string());
}

ScanResult scan_extensions(const fs::path& extensions_dir) {
    ScanResult result;
    std::error_code ec;
    if (!fs::is_directory(extensions_dir, ec)) return result;

    auto warn = [&](const std::string& msg) {
        result.warnings.push_back(msg);
        pm_log("scan: " + msg);
    };

    for (const auto& entry : fs::directory_iterator(extensions_dir, ec)) {
        if (is_hidden_entry(entry.path())) continue;

        std::error_code st_ec;
        if (!fs::is_directory(entry.path(), st_ec)) continue;   // follows links

        std::string name = entry.path().filename().string();
        auto manifest = load_manifest(entry.path(), name);
        if (manifest.is_err()) {
            warn(fmt::format("skipping extension '{}': {}", name, manifest.error));
            continue;
        }

        fs::path binary = entry.path() / entry_point_name();
        if (!platform::is_executable(binary)) {
            warn(fmt::format("skipping extension '{}': missing or non-executable {}",
                             name, binary.string()));
            continue;
        }

        InstalledExtension ext;
        ext.name = name;
        ext.directory = entry.path().string();
        ext.binary_path = binary.string();
        ext.manifest = manifest.value;
        result.extensions[name] = ext;
    }
    if (ec) warn(fmt::format("could not read {}: {}", extensions_dir.string(), ec.message()));
    return result;
}

ExtensionRegistry::ExtensionRegistry(ScanResult scanned)
    : extensions_(std::move(scanned.extensions)),
      warnings_(std::move(scanned.warnings)) {}

ExtensionRegistry ExtensionRegistry::scan(const fs::path& extensions_dir) {
    return ExtensionRegistry(scan_extensions(extensions_dir));
}

Result<InstalledExtension> ExtensionRegistry::find(const std::string& name) const {
    auto it = extensions_.find(name);
    if (it == extensions_.end()) {
        return Result<InstalledExtension>::Err(ErrorKind::ExtensionNotFound,
            "Extension not installed: " + name);
    }
    return Result<InstalledExtension>::Ok(it->second);
}

Result<InstalledExtension> ExtensionRegistry::resolve_prefix(const std::string& input) const {
    auto exact = extensions_.find(input);
    if (exact != extensions_.end()) return Result<InstalledExtension>::Ok(exact->second);

    std::vector<const InstalledExtension*> matches;
    if (!input.empty()) {
        for (auto it = extensions_.lower_bound(input); it != extensions_.end(); ++it) {
            if (it->first.compare(0, input.size(), input) != 0) break;
            matches.push_back(&it->second);
        }
    }

    if (matches.size() == 1) return Result<InstalledExtension>::Ok(*matches[0]);

    if (matches.empty()) {
        return Result<InstalledExtension>::Err(ErrorKind::ExtensionNotFound,
            "Extension not installed: " + input);
    }

    std::string names;
    for (const auto* m : matches) {
        if (!names.empty()) names += ", ";
        names += m->name;
    }
    return Result<InstalledExtension>::Err(ErrorKind::ExtensionNotFound,
        fmt::format("'{}' is ambiguous: {}", input, names));
}

Result<std::string> ExtensionRegistry::resolve_command(const std::string& extension,
                                                       const std::string& command) const {
    auto ext = find(extension);
    if (ext.is_err()) return Result<std::string>::Err(ext);

    if (!ext.value.manifest.find_command(command)) {
        Result<std::string> r = Result<std::string>::Err(ErrorKind::CommandNotFound,
            fmt::format("Extension '{}' does not declare command '{}'", extension, command));
        r.value = ext.value.binary_path;
        return r;
    }
    return Result<std::string>::Ok(ext.value.binary_path);
}
