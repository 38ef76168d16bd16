#pragma once

#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>
#include <core/types.hpp>

struct SchemaError {
    std::string field_path;   // dotted, e.g. "projects.<uuid>.tags[1]"
    std::string rule;         // "required", "type", "pattern", "range", "unknown_key", ...
    std::string value;        // offending value (scalar text or node kind)

    std::string message() const;
};

// Strict structural validation of a configuration document (current version).
// Unknown keys are rejected at every level. Returns empty vector if valid.
std::vector<SchemaError> validate_config(const YAML::Node& doc);

// Strict validation of an extension.yml document. If expected_name is
// non-empty the manifest name must equal it.
std::vector<SchemaError> validate_manifest(const YAML::Node& doc,
                                           const std::string& expected_name = "");

// Join errors into one line for Result messages.
std::string format_schema_errors(const std::vector<SchemaError>& errors);

// Field-level rules shared with the registries
bool is_valid_github_username(const std::string& s);
bool is_valid_extension_name(const std::string& s);
bool is_valid_semver(const std::string& s);
bool is_valid_command_name(const std::string& s);

// Tags: non-empty, at most 50 chars, no comma, no whitespace.
// Fails with ErrorKind::Validation naming the first bad tag.
Result<void> validate_tags(const std::vector<std::string>& tags);
