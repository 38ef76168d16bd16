#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include "types.hpp"
#include <platform/file_lock.hpp>

namespace fs = std::filesystem;

// Handle to one configuration file. Every operation re-reads the file;
// nothing is cached between calls.
class ConfigStore {
public:
    explicit ConfigStore(fs::path path);

    const fs::path& path() const { return path_; }
    fs::path lock_path() const;
    bool exists() const;

    // Parse, migrate, validate, convert. Does not synthesize defaults:
    // a missing file fails with ErrorKind::NotFound.
    Result<ConfigDocument> load() const;

    // Validate then write atomically (temp file, fsync, rename, fsync dir).
    Result<void> save(const ConfigDocument& config) const;

    // First-run initialization. Never overwrites an existing file.
    Result<ConfigDocument> create_default(const std::string& github_username,
                                          const std::string& projects_root_dir = "") const;

    // Value of one dotted key (see config_keys()) from the current file.
    Result<std::string> get(const std::string& key) const;

    // Load, assign, save under lock(). Returns the value it replaced.
    Result<std::string> set(const std::string& key, const std::string& value) const;

    // Loads the file (any load error is returned as is), then reports
    // non-fatal problems: empty username, missing root, editor not on PATH.
    Result<std::vector<std::string>> validate() const;

    // Under lock(): copy the current file to backup_path(), then write a
    // default document. Returns the backup path, or an empty path when
    // there was no file to back up.
    Result<fs::path> reset() const;
    fs::path backup_path() const;

    // Advisory exclusive lock held for a load-modify-save sequence.
    std::unique_ptr<FileLock> lock() const;

    // Bring an older document up to CONFIG_VERSION. Each step only adds
    // fields. Newer or unknown versions fail with UnsupportedVersion.
    static Result<YAML::Node> migrate(const YAML::Node& doc);

private:
    fs::path path_;
};

// Keys reachable through `pm config get/set`, in listing order
struct ConfigKey {
    const char* key;
    const char* type;   // "string", "path", "boolean", "integer"
    bool writable;
};
const std::vector<ConfigKey>& config_keys();

// Display form of one dotted key. Unknown keys fail with ErrorKind::NotFound.
Result<std::string> config_value(const ConfigDocument& config, const std::string& key);

// Parse value for key and assign it. Booleans accept true/false, 1/0,
// yes/no, on/off. Rejected values fail with ErrorKind::Validation.
Result<void> assign_config_value(ConfigDocument& config, const std::string& key,
                                 const std::string& value);

// Conversion between the typed document and its YAML form
std::string emit_config(const ConfigDocument& config);
Result<ConfigDocument> config_from_yaml(const YAML::Node& doc);

ConfigDocument make_default_config(const std::string& github_username,
                                   const std::string& projects_root_dir);

// "vim", or "notepad" on Windows
std::string default_editor();

// Get paths ($PM_CONFIG_DIR / $PM_EXTENSIONS_DIR override the defaults)
fs::path get_config_dir();
fs::path get_config_path();
fs::path get_extensions_dir();
