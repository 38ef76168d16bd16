#include "target.hpp"
#include "platform.hpp"
#include <fmt/format.h>

namespace platform {

const std::vector<TargetEntry>& supported_targets() {
    static const std::vector<TargetEntry> table = {
        {"linux",  "x64",   "x86_64-unknown-linux-gnu"},
        {"linux",  "arm64", "aarch64-unknown-linux-gnu"},
        {"darwin", "x64",   "x86_64-apple-darwin"},
        {"darwin", "arm64", "aarch64-apple-darwin"},
        {"win32",  "x64",   "x86_64-pc-windows-msvc"},
        {"win32",  "arm64", "aarch64-pc-windows-msvc"},
    };
    return table;
}

Result<std::string> resolve_target(const std::string& os, const std::string& arch) {
    for (const auto& t : supported_targets()) {
        if (os == t.os && arch == t.arch) {
            return Result<std::string>::Ok(t.triple);
        }
    }
    return Result<std::string>::Err(ErrorKind::UnsupportedPlatform,
        fmt::format("Unsupported platform: {}/{}", os, arch));
}

Result<std::string> current_target() {
    return resolve_target(current_os(), current_arch());
}

std::string executable_suffix(const std::string& triple) {
    return triple.find("-windows-") != std::string::npos ? ".exe" : "";
}

} // namespace platform
