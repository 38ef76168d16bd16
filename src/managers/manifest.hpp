#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Read and strictly validate <dir>/extension.yml. With a non-empty
// expected_name the manifest must name that extension.
// Fails with ErrorKind::NotFound, Parse or Schema.
Result<ExtensionManifest> load_manifest(const fs::path& dir, const std::string& expected_name = "");

// Write <dir>/extension.yml wholesale.
Result<void> save_manifest(const fs::path& dir, const ExtensionManifest& manifest);

std::string emit_manifest(const ExtensionManifest& manifest);
