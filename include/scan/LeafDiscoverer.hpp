#pragma once

#include "scan/PathFilter.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <utility>
#include <vector>

namespace mpc::log { class Registry; }

namespace mpc::scan {

struct DiscoveryStats {
    uint64_t leaves{};
    uint64_t directories{};
    uint64_t excluded{};
    uint64_t cyclesSkipped{};
    uint64_t unreadable{};
};

// Depth-first walk of a source tree producing every non-directory entry as a
// path relative to the root, in directory listing order.
class LeafDiscoverer {
public:
    LeafDiscoverer(PathFilter filter, std::shared_ptr<log::Registry> log);

    [[nodiscard]] std::vector<std::filesystem::path> discover(const std::filesystem::path& sourceRoot);

    [[nodiscard]] const DiscoveryStats& stats() const { return stats_; }

private:
    using DirId = std::pair<uint64_t, uint64_t>; // (st_dev, st_ino)

    PathFilter filter_;
    std::shared_ptr<log::Registry> log_;
    DiscoveryStats stats_;

    std::filesystem::path root_;
    std::set<DirId> ancestors_;
    std::vector<std::filesystem::path> leaves_;

    void walk(const std::filesystem::path& relPath);
    void walkDirectory(const std::filesystem::path& relPath, const std::filesystem::path& absPath);
};

}
