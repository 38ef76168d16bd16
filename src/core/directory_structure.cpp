#include "directory_structure.hpp"
#include "constants.hpp"
#include <fmt/format.h>

fs::path store_dir(const fs::path& extensions_root) {
    return extensions_root / STORE_DIR_NAME;
}

fs::path staging_dir(const fs::path& extensions_root) {
    return extensions_root / STAGING_DIR_NAME;
}

fs::path locks_dir(const fs::path& extensions_root) {
    return extensions_root / LOCKS_DIR_NAME;
}

fs::path extension_lock_path(const fs::path& extensions_root, const std::string& name) {
    return locks_dir(extensions_root) / (name + ".lock");
}

Result<void> ensure_extensions_directory_structure(const fs::path& extensions_root) {
    std::error_code ec;
    for (const auto& dir : {extensions_root, store_dir(extensions_root),
                            staging_dir(extensions_root), locks_dir(extensions_root)}) {
        fs::create_directories(dir, ec);
        if (ec) {
            return Result<void>::Err(ErrorKind::IO,
                fmt::format("Failed to create {}: {}", dir.string(), ec.message()));
        }
    }
    return Result<void>::Ok();
}

bool is_hidden_entry(const fs::path& entry) {
    std::string name = entry.filename().string();
    return !name.empty() && name[0] == '.';
}
