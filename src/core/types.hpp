#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Error categories surfaced by the registry and extension subsystems.
enum class ErrorKind {
    None,
    NotFound,
    AlreadyExists,
    InvalidPath,
    Validation,
    Schema,
    Parse,
    UnsupportedVersion,
    IO,
    Download,
    Extract,
    ChecksumMismatch,
    Permission,
    UnsupportedPlatform,
    ExtensionNotFound,
    CommandNotFound,
    Spawn,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::IO};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Re-wrap another result's failure under this value type.
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::IO};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Configuration document ──────────────────────────────────

struct Settings {
    bool auto_open_editor = true;
    bool show_git_status = true;
    int recent_projects_limit = 10;
};

struct ProjectEntry {
    std::string id;                                  // v4 UUID, equals its map key
    std::string name;
    std::string path;                                // absolute
    std::vector<std::string> tags;                   // unique, insertion order kept
    std::optional<std::string> language;
    std::optional<std::string> git_remote_url;
    std::optional<std::string> git_current_branch;
    std::optional<std::string> git_status;           // last snapshot only
    std::optional<std::string> last_git_commit_time;
    std::string created_at;                          // ISO 8601 UTC
    std::string updated_at;
};

struct MachineStats {
    std::map<std::string, std::string> last_accessed;   // project id -> timestamp
    std::map<std::string, int64_t> access_counts;       // project id -> count
};

struct ConfigDocument {
    std::string version;
    std::string github_username;
    std::string projects_root_dir;
    std::string editor;
    Settings settings;
    std::map<std::string, ProjectEntry> projects;
    std::map<std::string, MachineStats> machine_metadata;
};

// ── Extensions ──────────────────────────────────────────────

struct ExtensionCommand {
    std::string name;
    std::string help;
};

struct ExtensionManifest {
    std::string name;
    std::string version;
    std::string description;
    std::string author;
    std::vector<ExtensionCommand> commands;

    const ExtensionCommand* find_command(const std::string& command) const {
        for (const auto& c : commands) {
            if (c.name == command) return &c;
        }
        return nullptr;
    }
};

// Derived from the extensions directory on every scan; never persisted.
struct InstalledExtension {
    std::string name;
    std::string directory;     // <extensions_dir>/<name>
    std::string binary_path;   // <directory>/binary[.exe]
    ExtensionManifest manifest;
};

// Status callback for long-running operations (downloads, installs)
using StatusCallback = std::function<void(const std::string&)>;
