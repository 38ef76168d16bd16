#pragma once

#include <filesystem>
#include <string>
#include "types.hpp"

namespace fs = std::filesystem;

// Layout of an extensions directory:
//   <root>/<name>                       link to the live store entry
//   <root>/.store/<name>@<ver>-<nonce>  immutable installed versions
//   <root>/.staging/                    in-progress installs
//   <root>/.locks/<name>.lock           per-extension commit lock
fs::path store_dir(const fs::path& extensions_root);
fs::path staging_dir(const fs::path& extensions_root);
fs::path locks_dir(const fs::path& extensions_root);
fs::path extension_lock_path(const fs::path& extensions_root, const std::string& name);

// Creates the directories above as needed; never touches files.
Result<void> ensure_extensions_directory_structure(const fs::path& extensions_root);

// True for entries the scanner must skip (".store", ".staging", ...)
bool is_hidden_entry(const fs::path& entry);
