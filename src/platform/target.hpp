#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

struct TargetEntry {
    const char* os;       // "linux", "darwin", "win32"
    const char* arch;     // "x64", "arm64"
    const char* triple;
};

// The full set of supported release targets.
const std::vector<TargetEntry>& supported_targets();

// Map (os, arch) to a target triple. Unknown pairs fail with
// ErrorKind::UnsupportedPlatform; there is no fallback.
Result<std::string> resolve_target(const std::string& os, const std::string& arch);

// Target triple of the running build.
Result<std::string> current_target();

// ".exe" for windows triples, "" otherwise.
std::string executable_suffix(const std::string& triple);

} // namespace platform
