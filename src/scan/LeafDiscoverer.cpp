#include "scan/LeafDiscoverer.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <system_error>

#include <sys/stat.h>

using namespace mpc::scan;
namespace fs = std::filesystem;

LeafDiscoverer::LeafDiscoverer(PathFilter filter, std::shared_ptr<log::Registry> log)
    : filter_(std::move(filter)), log_(std::move(log)) {}

std::vector<fs::path> LeafDiscoverer::discover(const fs::path& sourceRoot) {
    std::error_code ec;
    if (!fs::is_directory(sourceRoot, ec))
        throw std::invalid_argument("Discovery root is not a directory: " + sourceRoot.string());

    root_ = sourceRoot;
    stats_ = {};
    ancestors_.clear();
    leaves_.clear();

    walk({});

    log_->fs()->info("[LeafDiscoverer] {} leaves in {} directories under {} ({} excluded, {} cycles skipped, {} unreadable)",
                     stats_.leaves, stats_.directories, root_.string(), stats_.excluded,
                     stats_.cyclesSkipped, stats_.unreadable);

    return std::move(leaves_);
}

void LeafDiscoverer::walk(const fs::path& relPath) {
    // The root (empty relative path) is never filtered.
    if (!relPath.empty() && filter_.isExcluded(relPath)) {
        log_->fs()->debug("[LeafDiscoverer] Excluding {}", relPath.string());
        ++stats_.excluded;
        return;
    }

    const auto absPath = relPath.empty() ? root_ : root_ / relPath;

    std::error_code ec;
    if (fs::is_directory(absPath, ec)) {
        walkDirectory(relPath, absPath);
        return;
    }

    log_->fs()->debug("[LeafDiscoverer] Adding leaf node: {}", relPath.string());
    leaves_.push_back(relPath);
    ++stats_.leaves;
}

void LeafDiscoverer::walkDirectory(const fs::path& relPath, const fs::path& absPath) {
    struct stat st {};
    if (::stat(absPath.c_str(), &st) != 0) {
        log_->fs()->warn("[LeafDiscoverer] Unable to stat directory {}, skipping", absPath.string());
        ++stats_.unreadable;
        return;
    }

    const DirId id{static_cast<uint64_t>(st.st_dev), static_cast<uint64_t>(st.st_ino)};
    if (ancestors_.contains(id)) {
        log_->fs()->warn("[LeafDiscoverer] Directory cycle detected at {}, not descending", absPath.string());
        ++stats_.cyclesSkipped;
        return;
    }

    std::vector<fs::path> children;
    try {
        for (const auto& entry : fs::directory_iterator(absPath))
            children.push_back(entry.path().filename());
    } catch (const fs::filesystem_error& e) {
        log_->fs()->warn("[LeafDiscoverer] Unable to list {}: {}", absPath.string(), e.what());
        ++stats_.unreadable;
        return;
    }

    ++stats_.directories;
    ancestors_.insert(id);
    for (const auto& child : children) walk(relPath.empty() ? child : relPath / child);
    ancestors_.erase(id);
}
