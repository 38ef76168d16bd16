#include "config.hpp"
#include "constants.hpp"
#include "schema.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <platform/file_lock.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    std::string dir = env_or(ENV_CONFIG_DIR);
    if (!dir.empty()) return fs::path(dir);
    return platform::home_dir() / CONFIG_DIR_NAME / CONFIG_SUBDIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILENAME;
}

fs::path get_extensions_dir() {
    std::string dir = env_or(ENV_EXTENSIONS_DIR);
    if (!dir.empty()) return fs::path(dir);
    return get_config_dir() / EXTENSIONS_DIR_NAME;
}

std::string default_editor() {
#ifdef _WIN32
    return "notepad";
#else
    return "vim";
#endif
}

ConfigDocument make_default_config(const std::string& github_username,
                                   const std::string& projects_root_dir) {
    ConfigDocument config;
    config.version = CONFIG_VERSION;
    config.github_username = github_username;
    config.projects_root_dir = projects_root_dir.empty()
        ? (platform::home_dir() / DEFAULT_WORKSPACE_DIR).string()
        : projects_root_dir;
    config.editor = default_editor();
    return config;
}

// ── Migration ─────────────────────────────────────────────────

static bool has_key(const YAML::Node& node, const char* key) {
    return node[key].IsDefined();
}

static bool parse_version(const std::string& v, int& major, int& minor) {
    auto dot = v.find('.');
    if (dot == std::string::npos) return false;
    major = safe_stoi(v.substr(0, dot), -1);
    minor = safe_stoi(v.substr(dot + 1), -1);
    return major >= 0 && minor >= 0;
}

// 1.0 -> 1.1: settings.show_git_status, settings.recent_projects_limit
static void migrate_1_0_to_1_1(YAML::Node& doc) {
    if (!has_key(doc, "settings") || !doc["settings"].IsMap()) {
        doc["settings"] = YAML::Node(YAML::NodeType::Map);
    }
    YAML::Node settings = doc["settings"];
    if (!has_key(settings, "show_git_status")) settings["show_git_status"] = true;
    if (!has_key(settings, "recent_projects_limit")) {
        settings["recent_projects_limit"] = DEFAULT_RECENT_PROJECTS;
    }
    doc["version"] = "1.1";
}

// 1.1 -> 1.2: settings.auto_open_editor, editor, machine_metadata
static void migrate_1_1_to_1_2(YAML::Node& doc) {
    YAML::Node settings = doc["settings"];
    if (settings.IsMap() && !has_key(settings, "auto_open_editor")) {
        settings["auto_open_editor"] = true;
    }
    if (!has_key(doc, "editor")) doc["editor"] = default_editor();
    if (!has_key(doc, "machine_metadata")) {
        doc["machine_metadata"] = YAML::Node(YAML::NodeType::Map);
    }
    doc["version"] = "1.2";
}

Result<YAML::Node> ConfigStore::migrate(const YAML::Node& input) {
    if (!input.IsMap()) {
        return Result<YAML::Node>::Err(ErrorKind::Schema, "<root>: type (document is not a map)");
    }
    if (!has_key(input, "version") || !input["version"].IsScalar()) {
        return Result<YAML::Node>::Err(ErrorKind::Schema, "version: required");
    }

    std::string version = input["version"].Scalar();
    int major = 0, minor = 0;
    if (!parse_version(version, major, minor)) {
        return Result<YAML::Node>::Err(ErrorKind::Schema,
            fmt::format("version: pattern ({})", version));
    }

    int cur_major = 0, cur_minor = 0;
    parse_version(CONFIG_VERSION, cur_major, cur_minor);
    if (major > cur_major || (major == cur_major && minor > cur_minor)) {
        return Result<YAML::Node>::Err(ErrorKind::UnsupportedVersion,
            fmt::format("Config version {} is newer than supported {}", version, CONFIG_VERSION));
    }

    YAML::Node doc = YAML::Clone(input);
    std::string v = fmt::format("{}.{}", major, minor);
    if (v == "1.0") {
        migrate_1_0_to_1_1(doc);
        v = "1.1";
    }
    if (v == "1.1") {
        migrate_1_1_to_1_2(doc);
        v = "1.2";
    }
    if (v != CONFIG_VERSION) {
        return Result<YAML::Node>::Err(ErrorKind::UnsupportedVersion,
            fmt::format("Unknown config version {}", version));
    }
    if (version != CONFIG_VERSION) {
        pm_log(fmt::format("config: migrated {} -> {}", version, CONFIG_VERSION));
    }
    return Result<YAML::Node>::Ok(doc);
}

// ── YAML <-> ConfigDocument ───────────────────────────────────

static std::optional<std::string> opt_string(const YAML::Node& node) {
    if (!node.IsDefined() || node.IsNull()) return std::nullopt;
    return node.as<std::string>();
}

static void emit_optional(YAML::Emitter& out, const char* key, const std::optional<std::string>& v) {
    out << YAML::Key << key << YAML::Value;
    if (v) out << *v;
    else out << YAML::Null;
}

Result<ConfigDocument> config_from_yaml(const YAML::Node& root) {
    try {
        ConfigDocument config;
        config.version = root["version"].as<std::string>("");
        config.github_username = root["github_username"].IsNull()
            ? "" : root["github_username"].as<std::string>("");
        config.projects_root_dir = root["projects_root_dir"].as<std::string>("");
        config.editor = root["editor"].as<std::string>(default_editor());

        const YAML::Node& settings = root["settings"];
        if (settings.IsMap()) {
            config.settings.auto_open_editor = settings["auto_open_editor"].as<bool>(true);
            config.settings.show_git_status = settings["show_git_status"].as<bool>(true);
            config.settings.recent_projects_limit =
                settings["recent_projects_limit"].as<int>(DEFAULT_RECENT_PROJECTS);
        }

        const YAML::Node& projects = root["projects"];
        if (projects.IsMap()) {
            for (const auto& kv : projects) {
                const YAML::Node& n = kv.second;
                ProjectEntry p;
                p.id = n["id"].as<std::string>("");
                p.name = n["name"].as<std::string>("");
                p.path = n["path"].as<std::string>("");
                if (n["tags"] && n["tags"].IsSequence()) {
                    for (const auto& t : n["tags"]) p.tags.push_back(t.as<std::string>());
                }
                p.language = opt_string(n["language"]);
                p.git_remote_url = opt_string(n["git_remote_url"]);
                p.git_current_branch = opt_string(n["git_current_branch"]);
                p.git_status = opt_string(n["git_status"]);
                p.last_git_commit_time = opt_string(n["last_git_commit_time"]);
                p.created_at = n["created_at"].as<std::string>("");
                p.updated_at = n["updated_at"].as<std::string>("");
                config.projects[kv.first.as<std::string>()] = p;
            }
        }

        const YAML::Node& machines = root["machine_metadata"];
        if (machines.IsMap()) {
            for (const auto& kv : machines) {
                MachineStats stats;
                const YAML::Node& n = kv.second;
                if (n["last_accessed"] && n["last_accessed"].IsMap()) {
                    for (const auto& a : n["last_accessed"]) {
                        stats.last_accessed[a.first.as<std::string>()] = a.second.as<std::string>();
                    }
                }
                if (n["access_counts"] && n["access_counts"].IsMap()) {
                    for (const auto& c : n["access_counts"]) {
                        stats.access_counts[c.first.as<std::string>()] = c.second.as<int64_t>(0);
                    }
                }
                config.machine_metadata[kv.first.as<std::string>()] = stats;
            }
        }
        return Result<ConfigDocument>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<ConfigDocument>::Err(ErrorKind::Schema,
            std::string("Failed to convert config: ") + e.what());
    }
}

std::string emit_config(const ConfigDocument& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << YAML::DoubleQuoted << config.version;
    out << YAML::Key << "github_username" << YAML::Value << YAML::DoubleQuoted << config.github_username;
    out << YAML::Key << "projects_root_dir" << YAML::Value << config.projects_root_dir;
    out << YAML::Key << "editor" << YAML::Value << config.editor;

    out << YAML::Key << "settings" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "auto_open_editor" << YAML::Value << config.settings.auto_open_editor;
    out << YAML::Key << "show_git_status" << YAML::Value << config.settings.show_git_status;
    out << YAML::Key << "recent_projects_limit" << YAML::Value << config.settings.recent_projects_limit;
    out << YAML::EndMap;

    out << YAML::Key << "projects" << YAML::Value << YAML::BeginMap;
    for (const auto& [id, p] : config.projects) {
        out << YAML::Key << id << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << p.id;
        out << YAML::Key << "name" << YAML::Value << p.name;
        out << YAML::Key << "path" << YAML::Value << p.path;
        out << YAML::Key << "tags" << YAML::Value << YAML::Flow << p.tags;
        emit_optional(out, "language", p.language);
        emit_optional(out, "git_remote_url", p.git_remote_url);
        emit_optional(out, "git_current_branch", p.git_current_branch);
        emit_optional(out, "git_status", p.git_status);
        emit_optional(out, "last_git_commit_time", p.last_git_commit_time);
        out << YAML::Key << "created_at" << YAML::Value << p.created_at;
        out << YAML::Key << "updated_at" << YAML::Value << p.updated_at;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "machine_metadata" << YAML::Value << YAML::BeginMap;
    for (const auto& [machine, stats] : config.machine_metadata) {
        out << YAML::Key << machine << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "last_accessed" << YAML::Value << YAML::BeginMap;
        for (const auto& [id, ts] : stats.last_accessed) {
            out << YAML::Key << id << YAML::Value << ts;
        }
        out << YAML::EndMap;
        out << YAML::Key << "access_counts" << YAML::Value << YAML::BeginMap;
        for (const auto& [id, count] : stats.access_counts) {
            out << YAML::Key << id << YAML::Value << count;
        }
        out << YAML::EndMap;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

// ── Dotted keys ───────────────────────────────────────────────

const std::vector<ConfigKey>& config_keys() {
    static const std::vector<ConfigKey> keys = {
        {"version",                         "string",  false},
        {"github_username",                 "string",  true},
        {"projects_root_dir",               "path",    true},
        {"editor",                          "string",  true},
        {"settings.auto_open_editor",       "boolean", true},
        {"settings.show_git_status",        "boolean", true},
        {"settings.recent_projects_limit",  "integer", true},
    };
    return keys;
}

static const ConfigKey* find_key(const std::string& key) {
    for (const auto& k : config_keys()) {
        if (key == k.key) return &k;
    }
    return nullptr;
}

static Result<bool> parse_bool(const std::string& key, std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (value == "true" || value == "1" || value == "yes" || value == "on") {
        return Result<bool>::Ok(true);
    }
    if (value == "false" || value == "0" || value == "no" || value == "off") {
        return Result<bool>::Ok(false);
    }
    return Result<bool>::Err(ErrorKind::Validation,
        fmt::format("{}: expected true, false, 1, 0, yes, no, on or off", key));
}

Result<std::string> config_value(const ConfigDocument& config, const std::string& key) {
    if (!find_key(key)) {
        return Result<std::string>::Err(ErrorKind::NotFound, "Unknown config key: " + key);
    }
    auto flag = [](bool b) { return std::string(b ? "true" : "false"); };
    if (key == "version")           return Result<std::string>::Ok(config.version);
    if (key == "github_username")   return Result<std::string>::Ok(config.github_username);
    if (key == "projects_root_dir") return Result<std::string>::Ok(config.projects_root_dir);
    if (key == "editor")            return Result<std::string>::Ok(config.editor);
    if (key == "settings.auto_open_editor") {
        return Result<std::string>::Ok(flag(config.settings.auto_open_editor));
    }
    if (key == "settings.show_git_status") {
        return Result<std::string>::Ok(flag(config.settings.show_git_status));
    }
    return Result<std::string>::Ok(std::to_string(config.settings.recent_projects_limit));
}

Result<void> assign_config_value(ConfigDocument& config, const std::string& key,
                                 const std::string& value) {
    const ConfigKey* k = find_key(key);
    if (!k) {
        return Result<void>::Err(ErrorKind::NotFound, "Unknown config key: " + key);
    }
    if (!k->writable) {
        return Result<void>::Err(ErrorKind::Validation, key + " is read-only");
    }

    if (key == "github_username") {
        if (!is_valid_github_username(value)) {
            return Result<void>::Err(ErrorKind::Validation, "Invalid GitHub username: " + value);
        }
        config.github_username = value;
    } else if (key == "projects_root_dir") {
        if (value.empty()) {
            return Result<void>::Err(ErrorKind::Validation, "projects_root_dir cannot be empty");
        }
        config.projects_root_dir = value;
    } else if (key == "editor") {
        if (value.empty()) {
            return Result<void>::Err(ErrorKind::Validation, "editor cannot be empty");
        }
        config.editor = value;
    } else if (key == "settings.recent_projects_limit") {
        int limit = safe_stoi(value, -1);
        if (limit < 1 || limit > MAX_RECENT_PROJECTS || std::to_string(limit) != value) {
            return Result<void>::Err(ErrorKind::Validation,
                fmt::format("{}: expected an integer from 1 to {}", key, MAX_RECENT_PROJECTS));
        }
        config.settings.recent_projects_limit = limit;
    } else {
        auto b = parse_bool(key, value);
        if (b.is_err()) return Result<void>::Err(b.kind, b.error);
        if (key == "settings.auto_open_editor") config.settings.auto_open_editor = b.value;
        else config.settings.show_git_status = b.value;
    }
    return Result<void>::Ok();
}

// ── ConfigStore ───────────────────────────────────────────────

ConfigStore::ConfigStore(fs::path path) : path_(std::move(path)) {}

fs::path ConfigStore::lock_path() const {
    return fs::path(path_.string() + ".lock");
}

bool ConfigStore::exists() const {
    std::error_code ec;
    return fs::exists(path_, ec);
}

std::unique_ptr<FileLock> ConfigStore::lock() const {
    auto lock = std::make_unique<FileLock>(lock_path().string());
    if (!lock->held()) {
        pm_log("config: could not acquire " + lock_path().string() + ", continuing unlocked");
    }
    return lock;
}

Result<ConfigDocument> ConfigStore::load() const {
    if (!exists()) {
        return Result<ConfigDocument>::Err(ErrorKind::NotFound,
            "Config not found at " + path_.string() + " (run 'pm init')");
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path_.string());
    } catch (const YAML::ParserException& e) {
        return Result<ConfigDocument>::Err(ErrorKind::Parse,
            fmt::format("Failed to parse {}: {}", path_.string(), e.what()));
    } catch (const YAML::BadFile& e) {
        return Result<ConfigDocument>::Err(ErrorKind::IO,
            fmt::format("Failed to read {}: {}", path_.string(), e.what()));
    } catch (const YAML::Exception& e) {
        return Result<ConfigDocument>::Err(ErrorKind::Parse,
            fmt::format("Failed to parse {}: {}", path_.string(), e.what()));
    }

    auto migrated = migrate(root);
    if (migrated.is_err()) {
        return Result<ConfigDocument>::Err(migrated.kind, path_.string() + ": " + migrated.error);
    }

    auto errors = validate_config(migrated.value);
    if (!errors.empty()) {
        return Result<ConfigDocument>::Err(ErrorKind::Schema,
            fmt::format("{} is invalid: {}", path_.string(), format_schema_errors(errors)));
    }

    return config_from_yaml(migrated.value);
}

Result<void> ConfigStore::save(const ConfigDocument& config) const {
    std::string body = emit_config(config);

    try {
        auto errors = validate_config(YAML::Load(body));
        if (!errors.empty()) {
            return Result<void>::Err(ErrorKind::Schema,
                "Refusing to save invalid config: " + format_schema_errors(errors));
        }
    } catch (const YAML::Exception& e) {
        return Result<void>::Err(ErrorKind::Schema,
            std::string("Refusing to save unparseable config: ") + e.what());
    }

    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::IO,
            fmt::format("Failed to create {}: {}", path_.parent_path().string(), ec.message()));
    }

    std::string header = fmt::format("# {} configuration, written by {} {}\n",
                                     PM_TOOL_NAME, PM_TOOL_NAME, PM_VERSION);
    return platform::write_file_atomic(path_, header + body);
}

Result<ConfigDocument> ConfigStore::create_default(const std::string& github_username,
                                                   const std::string& projects_root_dir) const {
    if (!github_username.empty() && !is_valid_github_username(github_username)) {
        return Result<ConfigDocument>::Err(ErrorKind::Validation,
            "Invalid GitHub username: " + github_username);
    }

    auto guard = lock();
    if (exists()) {
        return Result<ConfigDocument>::Err(ErrorKind::AlreadyExists,
            "Config already exists at " + path_.string());
    }

    ConfigDocument config = make_default_config(github_username, projects_root_dir);
    auto saved = save(config);
    if (saved.is_err()) return Result<ConfigDocument>::Err(saved);

    pm_log("config: created " + path_.string());
    return Result<ConfigDocument>::Ok(config);
}

Result<std::string> ConfigStore::get(const std::string& key) const {
    auto config = load();
    if (config.is_err()) return Result<std::string>::Err(config.kind, config.error);
    return config_value(config.value, key);
}

Result<std::string> ConfigStore::set(const std::string& key, const std::string& value) const {
    auto guard = lock();
    auto config = load();
    if (config.is_err()) return Result<std::string>::Err(config.kind, config.error);

    auto previous = config_value(config.value, key);
    if (previous.is_err()) return previous;

    auto assigned = assign_config_value(config.value, key, value);
    if (assigned.is_err()) return Result<std::string>::Err(assigned.kind, assigned.error);

    auto saved = save(config.value);
    if (saved.is_err()) return Result<std::string>::Err(saved.kind, saved.error);

    pm_log(fmt::format("config: {} {} -> {}", key, previous.value, value));
    return previous;
}

static bool on_path(const std::string& command) {
    if (command.find('/') != std::string::npos || command.find('\\') != std::string::npos) {
        return platform::is_executable(command);
    }
#ifdef _WIN32
    const char sep = ';';
    const char* suffix = ".exe";
#else
    const char sep = ':';
    const char* suffix = "";
#endif
    for (const auto& dir : split(env_or("PATH"), sep)) {
        if (platform::is_executable(fs::path(dir) / (command + suffix))) return true;
    }
    return false;
}

Result<std::vector<std::string>> ConfigStore::validate() const {
    auto config = load();
    if (config.is_err()) {
        return Result<std::vector<std::string>>::Err(config.kind, config.error);
    }

    std::vector<std::string> warnings;
    const ConfigDocument& c = config.value;
    if (c.github_username.empty()) {
        warnings.push_back("github_username is empty");
    }
    std::error_code ec;
    if (!fs::is_directory(c.projects_root_dir, ec)) {
        warnings.push_back("projects_root_dir does not exist: " + c.projects_root_dir);
    }
    // The editor string may carry flags ("code -w").
    std::string editor = c.editor.substr(0, c.editor.find(' '));
    if (!on_path(editor)) {
        warnings.push_back("editor not found on PATH: " + editor);
    }
    return Result<std::vector<std::string>>::Ok(warnings);
}

fs::path ConfigStore::backup_path() const {
    return fs::path(path_.string() + ".backup");
}

Result<fs::path> ConfigStore::reset() const {
    auto guard = lock();

    fs::path backup;
    if (exists()) {
        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            return Result<fs::path>::Err(ErrorKind::IO, "Failed to read " + path_.string());
        }
        std::stringstream ss;
        ss << in.rdbuf();
        auto copied = platform::write_file_atomic(backup_path(), ss.str());
        if (copied.is_err()) return Result<fs::path>::Err(copied.kind, copied.error);
        backup = backup_path();
    }

    auto saved = save(make_default_config("", ""));
    if (saved.is_err()) return Result<fs::path>::Err(saved.kind, saved.error);

    pm_log("config: reset " + path_.string() +
           (backup.empty() ? "" : ", previous copy at " + backup.string()));
    return Result<fs::path>::Ok(backup);
}
