#include "schema.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "uuid.hpp"
#include <fmt/format.h>
#include <filesystem>
#include <regex>
#include <set>
#include <cctype>
#include <cstdint>

namespace {

using Errors = std::vector<SchemaError>;

std::string join_path(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

std::string index_path(const std::string& parent, size_t i) {
    return fmt::format("{}[{}]", parent, i);
}

std::string describe(const YAML::Node& node) {
    if (!node.IsDefined()) return "<missing>";
    switch (node.Type()) {
        case YAML::NodeType::Null:     return "null";
        case YAML::NodeType::Scalar:   return node.Scalar();
        case YAML::NodeType::Sequence: return "<sequence>";
        case YAML::NodeType::Map:      return "<map>";
        default:                       return "<undefined>";
    }
}

void add(Errors& errors, const std::string& path, const std::string& rule, const YAML::Node& node) {
    errors.push_back({path, rule, describe(node)});
}

void add(Errors& errors, const std::string& path, const std::string& rule, const std::string& value) {
    errors.push_back({path, rule, value});
}

// Quoted scalars carry the "!" tag and are always strings.
bool is_plain_scalar(const YAML::Node& node) {
    return node.IsScalar() && node.Tag() != "!";
}

bool read_bool(const YAML::Node& node, bool& out) {
    return is_plain_scalar(node) && YAML::convert<bool>::decode(node, out);
}

bool read_int(const YAML::Node& node, int64_t& out) {
    return is_plain_scalar(node) && YAML::convert<int64_t>::decode(node, out);
}

void reject_unknown(Errors& errors, const YAML::Node& map, const std::string& path,
                    const std::set<std::string>& allowed) {
    for (const auto& kv : map) {
        std::string key = kv.first.as<std::string>("");
        if (allowed.count(key) == 0) {
            add(errors, join_path(path, key), "unknown_key", key);
        }
    }
}

bool require(Errors& errors, const YAML::Node& map, const std::string& key, const std::string& path) {
    if (map[key].IsDefined()) return true;
    add(errors, join_path(path, key), "required", std::string("<missing>"));
    return false;
}

// Scalar string field. Returns false (and records) if present but not a scalar.
bool check_string(Errors& errors, const YAML::Node& node, const std::string& path,
                  std::string& out) {
    if (!node.IsScalar()) {
        add(errors, path, "type", node);
        return false;
    }
    out = node.Scalar();
    return true;
}

void check_nullable_string(Errors& errors, const YAML::Node& node, const std::string& path) {
    if (!node.IsDefined() || node.IsNull()) return;
    if (!node.IsScalar()) add(errors, path, "type", node);
}

void check_timestamp(Errors& errors, const YAML::Node& node, const std::string& path) {
    std::string s;
    if (!check_string(errors, node, path, s)) return;
    if (!is_iso_timestamp(s)) add(errors, path, "pattern", s);
}

void check_tags(Errors& errors, const YAML::Node& node, const std::string& path) {
    if (!node.IsSequence()) {
        add(errors, path, "type", node);
        return;
    }
    std::set<std::string> seen;
    for (size_t i = 0; i < node.size(); ++i) {
        std::string p = index_path(path, i);
        std::string tag;
        if (!check_string(errors, node[i], p, tag)) continue;
        if (validate_tags({tag}).is_err()) {
            add(errors, p, "pattern", tag);
        } else if (!seen.insert(tag).second) {
            add(errors, p, "unique", tag);
        }
    }
}

void check_settings(Errors& errors, const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        add(errors, path, "type", node);
        return;
    }
    reject_unknown(errors, node, path, {"auto_open_editor", "show_git_status", "recent_projects_limit"});

    for (const char* key : {"auto_open_editor", "show_git_status"}) {
        if (!require(errors, node, key, path)) continue;
        bool b;
        if (!read_bool(node[key], b)) add(errors, join_path(path, key), "type", node[key]);
    }

    if (require(errors, node, "recent_projects_limit", path)) {
        std::string p = join_path(path, "recent_projects_limit");
        int64_t limit;
        if (!read_int(node["recent_projects_limit"], limit)) {
            add(errors, p, "type", node["recent_projects_limit"]);
        } else if (limit < 1 || limit > MAX_RECENT_PROJECTS) {
            add(errors, p, "range", std::to_string(limit));
        }
    }
}

void check_project(Errors& errors, const std::string& key, const YAML::Node& node,
                   const std::string& path) {
    if (!node.IsMap()) {
        add(errors, path, "type", node);
        return;
    }
    reject_unknown(errors, node, path,
        {"id", "name", "path", "tags", "language", "git_remote_url", "git_current_branch",
         "git_status", "last_git_commit_time", "created_at", "updated_at"});

    std::string s;
    if (require(errors, node, "id", path) &&
        check_string(errors, node["id"], join_path(path, "id"), s) && s != key) {
        add(errors, join_path(path, "id"), "match_key", s);
    }
    if (require(errors, node, "name", path) &&
        check_string(errors, node["name"], join_path(path, "name"), s) && s.empty()) {
        add(errors, join_path(path, "name"), "min_length", s);
    }
    if (require(errors, node, "path", path) &&
        check_string(errors, node["path"], join_path(path, "path"), s) &&
        !std::filesystem::path(s).is_absolute()) {
        add(errors, join_path(path, "path"), "absolute", s);
    }
    if (require(errors, node, "tags", path)) {
        check_tags(errors, node["tags"], join_path(path, "tags"));
    }

    for (const char* opt : {"language", "git_remote_url", "git_current_branch", "git_status"}) {
        check_nullable_string(errors, node[opt], join_path(path, opt));
    }
    if (node["last_git_commit_time"].IsDefined() && !node["last_git_commit_time"].IsNull()) {
        check_timestamp(errors, node["last_git_commit_time"], join_path(path, "last_git_commit_time"));
    }

    bool have_created = require(errors, node, "created_at", path);
    bool have_updated = require(errors, node, "updated_at", path);
    size_t before = errors.size();
    if (have_created) check_timestamp(errors, node["created_at"], join_path(path, "created_at"));
    if (have_updated) check_timestamp(errors, node["updated_at"], join_path(path, "updated_at"));
    if (have_created && have_updated && errors.size() == before) {
        std::string created = node["created_at"].Scalar();
        std::string updated = node["updated_at"].Scalar();
        if (iso_millis(updated) < iso_millis(created)) {
            add(errors, join_path(path, "updated_at"), "not_before_created", updated);
        }
    }
}

void check_machine(Errors& errors, const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        add(errors, path, "type", node);
        return;
    }
    reject_unknown(errors, node, path, {"last_accessed", "access_counts"});

    if (require(errors, node, "last_accessed", path)) {
        std::string p = join_path(path, "last_accessed");
        const YAML::Node& la = node["last_accessed"];
        if (!la.IsMap()) {
            add(errors, p, "type", la);
        } else {
            for (const auto& kv : la) {
                std::string id = kv.first.as<std::string>("");
                if (!is_valid_uuid(id)) add(errors, join_path(p, id), "uuid", id);
                check_timestamp(errors, kv.second, join_path(p, id));
            }
        }
    }

    if (require(errors, node, "access_counts", path)) {
        std::string p = join_path(path, "access_counts");
        const YAML::Node& ac = node["access_counts"];
        if (!ac.IsMap()) {
            add(errors, p, "type", ac);
        } else {
            for (const auto& kv : ac) {
                std::string id = kv.first.as<std::string>("");
                if (!is_valid_uuid(id)) add(errors, join_path(p, id), "uuid", id);
                int64_t count;
                if (!read_int(kv.second, count)) {
                    add(errors, join_path(p, id), "type", kv.second);
                } else if (count < 0) {
                    add(errors, join_path(p, id), "range", std::to_string(count));
                }
            }
        }
    }
}

} // namespace

std::string SchemaError::message() const {
    return fmt::format("{}: {} ({})", field_path, rule, value);
}

std::string format_schema_errors(const std::vector<SchemaError>& errors) {
    std::string out;
    for (const auto& e : errors) {
        if (!out.empty()) out += "; ";
        out += e.message();
    }
    return out;
}

bool is_valid_github_username(const std::string& s) {
    static const std::regex re("^[A-Za-z0-9](?:[A-Za-z0-9]|-(?=[A-Za-z0-9]))*$");
    return !s.empty() && s.size() <= static_cast<size_t>(MAX_GITHUB_USERNAME_LENGTH) &&
           std::regex_match(s, re);
}

bool is_valid_extension_name(const std::string& s) {
    static const std::regex re("^[a-z0-9][a-z0-9_-]*$");
    return std::regex_match(s, re);
}

bool is_valid_semver(const std::string& s) {
    static const std::regex re("^(0|[1-9][0-9]*)\\.(0|[1-9][0-9]*)\\.(0|[1-9][0-9]*)$");
    return std::regex_match(s, re);
}

bool is_valid_command_name(const std::string& s) {
    static const std::regex re("^[A-Za-z0-9_-]+$");
    return std::regex_match(s, re);
}

Result<void> validate_tags(const std::vector<std::string>& tags) {
    for (const auto& tag : tags) {
        if (tag.empty()) {
            return Result<void>::Err(ErrorKind::Validation, "Tag cannot be empty");
        }
        if (tag.size() > static_cast<size_t>(MAX_TAG_LENGTH)) {
            return Result<void>::Err(ErrorKind::Validation,
                fmt::format("Tag '{}' too long (max {} characters)", tag, MAX_TAG_LENGTH));
        }
        if (tag.find(',') != std::string::npos) {
            return Result<void>::Err(ErrorKind::Validation,
                fmt::format("Tag '{}' cannot contain commas", tag));
        }
        for (char c : tag) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                return Result<void>::Err(ErrorKind::Validation,
                    fmt::format("Tag '{}' cannot contain whitespace", tag));
            }
        }
    }
    return Result<void>::Ok();
}

std::vector<SchemaError> validate_config(const YAML::Node& doc) {
    Errors errors;
    if (!doc.IsMap()) {
        add(errors, "<root>", "type", doc);
        return errors;
    }

    reject_unknown(errors, doc, "",
        {"version", "github_username", "projects_root_dir", "editor", "settings",
         "projects", "machine_metadata"});

    std::string s;
    if (require(errors, doc, "version", "") && check_string(errors, doc["version"], "version", s)) {
        static const std::regex version_re("^[0-9]+\\.[0-9]+$");
        if (!std::regex_match(s, version_re)) add(errors, "version", "pattern", s);
    }

    // An empty username may round-trip as null.
    if (require(errors, doc, "github_username", "") && !doc["github_username"].IsNull() &&
        check_string(errors, doc["github_username"], "github_username", s) &&
        !s.empty() && !is_valid_github_username(s)) {
        add(errors, "github_username", "pattern", s);
    }

    if (require(errors, doc, "projects_root_dir", "")) {
        check_string(errors, doc["projects_root_dir"], "projects_root_dir", s);
    }

    if (require(errors, doc, "editor", "") &&
        check_string(errors, doc["editor"], "editor", s) && s.empty()) {
        add(errors, "editor", "min_length", s);
    }

    if (require(errors, doc, "settings", "")) {
        check_settings(errors, doc["settings"], "settings");
    }

    if (require(errors, doc, "projects", "")) {
        const YAML::Node& projects = doc["projects"];
        if (!projects.IsMap()) {
            add(errors, "projects", "type", projects);
        } else {
            for (const auto& kv : projects) {
                std::string key = kv.first.as<std::string>("");
                std::string path = join_path("projects", key);
                if (!is_valid_uuid(key)) add(errors, path, "uuid", key);
                check_project(errors, key, kv.second, path);
            }
        }
    }

    if (require(errors, doc, "machine_metadata", "")) {
        const YAML::Node& machines = doc["machine_metadata"];
        if (!machines.IsMap()) {
            add(errors, "machine_metadata", "type", machines);
        } else {
            for (const auto& kv : machines) {
                std::string machine = kv.first.as<std::string>("");
                check_machine(errors, kv.second, join_path("machine_metadata", machine));
            }
        }
    }

    return errors;
}

std::vector<SchemaError> validate_manifest(const YAML::Node& doc, const std::string& expected_name) {
    Errors errors;
    if (!doc.IsMap()) {
        add(errors, "<root>", "type", doc);
        return errors;
    }

    reject_unknown(errors, doc, "", {"name", "version", "description", "author", "commands"});

    std::string s;
    if (require(errors, doc, "name", "") && check_string(errors, doc["name"], "name", s)) {
        if (!is_valid_extension_name(s)) {
            add(errors, "name", "pattern", s);
        } else if (!expected_name.empty() && s != expected_name) {
            add(errors, "name", "match_directory", s);
        }
    }

    if (require(errors, doc, "version", "") && check_string(errors, doc["version"], "version", s) &&
        !is_valid_semver(s)) {
        add(errors, "version", "semver", s);
    }

    if (require(errors, doc, "description", "")) {
        check_string(errors, doc["description"], "description", s);
    }
    if (require(errors, doc, "author", "")) {
        check_string(errors, doc["author"], "author", s);
    }

    if (!require(errors, doc, "commands", "")) return errors;
    const YAML::Node& commands = doc["commands"];
    if (!commands.IsSequence()) {
        add(errors, "commands", "type", commands);
        return errors;
    }
    std::set<std::string> seen;
    for (size_t i = 0; i < commands.size(); ++i) {
        std::string path = index_path("commands", i);
        const YAML::Node& cmd = commands[i];
        if (!cmd.IsMap()) {
            add(errors, path, "type", cmd);
            continue;
        }
        reject_unknown(errors, cmd, path, {"name", "help"});
        if (require(errors, cmd, "name", path) &&
            check_string(errors, cmd["name"], join_path(path, "name"), s)) {
            if (!is_valid_command_name(s)) {
                add(errors, join_path(path, "name"), "pattern", s);
            } else if (!seen.insert(s).second) {
                add(errors, join_path(path, "name"), "unique", s);
            }
        }
        if (require(errors, cmd, "help", path)) {
            check_string(errors, cmd["help"], join_path(path, "help"), s);
        }
    }

    return errors;
}
