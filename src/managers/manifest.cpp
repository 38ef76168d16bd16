#include "manifest.hpp"
#include <core/constants.hpp>
#include <core/schema.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

Result<ExtensionManifest> load_manifest(const fs::path& dir, const std::string& expected_name) {
    fs::path path = dir / EXTENSION_MANIFEST;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<ExtensionManifest>::Err(ErrorKind::NotFound,
            "No " + std::string(EXTENSION_MANIFEST) + " in " + dir.string());
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Result<ExtensionManifest>::Err(ErrorKind::Parse,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    auto errors = validate_manifest(root, expected_name);
    if (!errors.empty()) {
        return Result<ExtensionManifest>::Err(ErrorKind::Schema,
            fmt::format("{} is invalid: {}", path.string(), format_schema_errors(errors)));
    }

    ExtensionManifest m;
    m.name = root["name"].as<std::string>();
    m.version = root["version"].as<std::string>();
    m.description = root["description"].as<std::string>();
    m.author = root["author"].as<std::string>();
    for (const auto& c : root["commands"]) {
        ExtensionCommand cmd;
        cmd.name = c["name"].as<std::string>();
        cmd.help = c["help"].as<std::string>();
        m.commands.push_back(cmd);
    }
    return Result<ExtensionManifest>::Ok(m);
}

std::string emit_manifest(const ExtensionManifest& manifest) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "name" << YAML::Value << manifest.name;
    out << YAML::Key << "version" << YAML::Value << YAML::DoubleQuoted << manifest.version;
    out << YAML::Key << "description" << YAML::Value << manifest.description;
    out << YAML::Key << "author" << YAML::Value << manifest.author;
    out << YAML::Key << "commands" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : manifest.commands) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "help" << YAML::Value << c.help;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<void> save_manifest(const fs::path& dir, const ExtensionManifest& manifest) {
    return platform::write_file_atomic(dir / EXTENSION_MANIFEST, emit_manifest(manifest));
}
