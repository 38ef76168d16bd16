#pragma once

#include <string>
#include <vector>
#include <map>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct ScanResult {
    std::map<std::string, InstalledExtension> extensions;
    std::vector<std::string> warnings;   // one per excluded extension
};

// Installed extensions, rebuilt from disk by scan(). A broken extension is
// reported and skipped; it never hides the others.
class ExtensionRegistry {
public:
    ExtensionRegistry() = default;
    explicit ExtensionRegistry(ScanResult scanned);

    // Scan extensions_dir. A missing directory yields an empty registry.
    static ExtensionRegistry scan(const fs::path& extensions_dir);

    const std::map<std::string, InstalledExtension>& extensions() const { return extensions_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    Result<InstalledExtension> find(const std::string& name) const;

    // Exact name, else a unique prefix. An ambiguous prefix fails with
    // ErrorKind::ExtensionNotFound listing the candidates.
    Result<InstalledExtension> resolve_prefix(const std::string& input) const;

    // Entry point for (extension, command). CommandNotFound still carries the
    // entry point in value so callers can fall back to a raw invocation.
    Result<std::string> resolve_command(const std::string& extension,
                                        const std::string& command) const;

private:
    std::map<std::string, InstalledExtension> extensions_;
    std::vector<std::string> warnings_;
};

ScanResult scan_extensions(const fs::path& extensions_dir);
