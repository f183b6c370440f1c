#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>
#include <system_error>

namespace mpc::util {

// Absolute form with "..", "." and existing symlinks resolved, no trailing separator.
inline std::filesystem::path resolvePath(const std::filesystem::path& path) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
    if (ec) resolved = path.lexically_normal();
    if (resolved.filename().empty() && resolved.has_parent_path() && resolved != resolved.root_path())
        resolved = resolved.parent_path();
    return resolved;
}

// FNV-1a, stable across runs and builds; used to name per-pair queue files.
inline uint64_t fnv1a64(const std::string_view data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (const unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

}
