#include "queue/WorkQueue.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <unordered_set>

using namespace mpc::queue;
namespace fs = std::filesystem;

WorkQueue::WorkQueue(fs::path queuePath, std::shared_ptr<log::Registry> log, std::string origin)
    : queuePath_(std::move(queuePath)), log_(std::move(log)), origin_(std::move(origin)) {}

std::vector<fs::path> WorkQueue::loadOrInitialize(const DiscoverFn& discoverFn) {
    std::scoped_lock lock(mutex_);

    std::error_code ec;
    const bool leftover = fs::is_regular_file(queuePath_, ec) && fs::file_size(queuePath_, ec) > 0 && !ec;

    if (leftover) {
        const auto fileOrigin = readOrigin(queuePath_);
        if (!origin_.empty() && fileOrigin && *fileOrigin != origin_)
            throw QueueOriginError("Queue file " + queuePath_.string() + " belongs to another run (" + *fileOrigin +
                                   "); choose a different queue file or work directory");

        entries_ = sanitize(unique(load(queuePath_)));
        if (!entries_.empty()) {
            resumed_ = true;
            log_->queue()->info("[WorkQueue] Resuming {} pending entries from {}", entries_.size(), queuePath_.string());
            persist(queuePath_, entries_, origin_);
            return entries_;
        }
        log_->queue()->warn("[WorkQueue] Queue file {} holds no entries, starting fresh", queuePath_.string());
    }

    resumed_ = false;
    entries_ = unique(discoverFn());
    persist(queuePath_, entries_, origin_);
    log_->queue()->info("[WorkQueue] Initialized {} entries in {}", entries_.size(), queuePath_.string());
    return entries_;
}

void WorkQueue::persist() const {
    std::scoped_lock lock(mutex_);
    persist(queuePath_, entries_, origin_);
}

bool WorkQueue::remove(const fs::path& path) {
    std::scoped_lock lock(mutex_);

    const auto it = std::ranges::find(entries_, path);
    if (it == entries_.end()) {
        log_->queue()->warn("[WorkQueue] Attempted to remove unknown entry: {}", path.string());
        return false;
    }

    entries_.erase(it);
    persist(queuePath_, entries_, origin_);
    log_->queue()->debug("[WorkQueue] Retired {} ({} remaining)", path.string(), entries_.size());
    return true;
}

void WorkQueue::finalize() const {
    std::scoped_lock lock(mutex_);
    if (!entries_.empty()) return;

    std::error_code ec;
    fs::remove(queuePath_, ec);
    if (ec) log_->queue()->warn("[WorkQueue] Failed to remove drained queue file {}: {}", queuePath_.string(), ec.message());
    else log_->queue()->debug("[WorkQueue] Removed drained queue file {}", queuePath_.string());
}

std::vector<fs::path> WorkQueue::remaining() const {
    std::scoped_lock lock(mutex_);
    return entries_;
}

bool WorkQueue::contains(const fs::path& path) const {
    std::scoped_lock lock(mutex_);
    return std::ranges::find(entries_, path) != entries_.end();
}

size_t WorkQueue::size() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

bool WorkQueue::empty() const {
    std::scoped_lock lock(mutex_);
    return entries_.empty();
}

void WorkQueue::persist(const fs::path& queuePath, const std::vector<fs::path>& entries, const std::string& origin) {
    if (queuePath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(queuePath.parent_path(), ec);
        if (ec) throw QueuePersistError("Failed to create queue directory " + queuePath.parent_path().string() + ": " + ec.message());
    }

    auto tmpPath = queuePath;
    tmpPath += ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
        if (!out) throw QueuePersistError("Failed to open queue file for writing: " + tmpPath.string());
        if (!origin.empty()) out << HEADER_PREFIX << origin << '\n';
        for (const auto& entry : entries) out << entry.string() << '\n';
        out.flush();
        if (!out) throw QueuePersistError("Failed to write queue file: " + tmpPath.string());
    }

    std::error_code ec;
    fs::rename(tmpPath, queuePath, ec);
    if (ec) {
        fs::remove(tmpPath, ec);
        throw QueuePersistError("Failed to replace queue file " + queuePath.string());
    }
}

std::vector<fs::path> WorkQueue::load(const fs::path& queuePath) {
    std::ifstream in(queuePath);
    if (!in) throw QueuePersistError("Failed to open queue file: " + queuePath.string());

    std::vector<fs::path> entries;
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
        if (line.empty() || line.starts_with(HEADER_PREFIX)) continue;
        entries.emplace_back(line);
    }
    return entries;
}

std::optional<std::string> WorkQueue::readOrigin(const fs::path& queuePath) {
    std::ifstream in(queuePath);
    std::string line;
    if (!in || !std::getline(in, line)) return std::nullopt;
    while (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.starts_with(HEADER_PREFIX)) return std::nullopt;
    return line.substr(HEADER_PREFIX.size());
}

bool WorkQueue::isValidEntry(const fs::path& entry) {
    if (entry.empty() || entry.is_absolute() || entry.has_root_path()) return false;
    const auto normal = entry.lexically_normal();
    if (normal.empty()) return false;
    const auto& first = *normal.begin();
    return first != ".." && first != ".";
}

std::vector<fs::path> WorkQueue::sanitize(std::vector<fs::path> entries) const {
    std::vector<fs::path> out;
    out.reserve(entries.size());
    for (auto& entry : entries) {
        if (isValidEntry(entry)) out.push_back(std::move(entry));
        else log_->queue()->warn("[WorkQueue] Dropping queue entry outside the source tree: {}", entry.string());
    }
    return out;
}

std::vector<fs::path> WorkQueue::unique(std::vector<fs::path> entries) {
    std::unordered_set<std::string> seen;
    std::vector<fs::path> out;
    out.reserve(entries.size());
    for (auto& entry : entries)
        if (seen.insert(entry.string()).second) out.push_back(std::move(entry));
    return out;
}
