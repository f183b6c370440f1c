#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mpc::log { class Registry; }

namespace mpc::queue {

struct QueuePersistError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A leftover queue file belongs to a different source/destination pair.
struct QueueOriginError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Persisted FIFO of relative paths still waiting to be copied. The file holds
// an optional origin header followed by one path per line, and always mirrors
// the in-memory remaining set.
class WorkQueue {
public:
    using DiscoverFn = std::function<std::vector<std::filesystem::path>()>;

    // Header lines start with '/', which no valid entry can.
    static constexpr std::string_view HEADER_PREFIX = "//mpcopy-queue ";

    // origin identifies the run the queue belongs to; empty disables the check.
    WorkQueue(std::filesystem::path queuePath, std::shared_ptr<log::Registry> log, std::string origin = {});

    // Resumes from a non-empty queue file, otherwise discovers and persists.
    // Throws QueueOriginError when the leftover file records another origin.
    std::vector<std::filesystem::path> loadOrInitialize(const DiscoverFn& discoverFn);

    // Rewrites the file with the current remaining set.
    void persist() const;

    // Removes one occurrence of path and persists. Returns false if the path
    // was not pending.
    bool remove(const std::filesystem::path& path);

    // Deletes the queue file once nothing remains.
    void finalize() const;

    [[nodiscard]] std::vector<std::filesystem::path> remaining() const;
    [[nodiscard]] bool contains(const std::filesystem::path& path) const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;
    [[nodiscard]] bool resumed() const { return resumed_; }
    [[nodiscard]] const std::filesystem::path& path() const { return queuePath_; }
    [[nodiscard]] const std::string& origin() const { return origin_; }

    static void persist(const std::filesystem::path& queuePath,
                        const std::vector<std::filesystem::path>& entries,
                        const std::string& origin = {});

    // Entries only; the header line is skipped.
    [[nodiscard]] static std::vector<std::filesystem::path> load(const std::filesystem::path& queuePath);

    [[nodiscard]] static std::optional<std::string> readOrigin(const std::filesystem::path& queuePath);

    // Relative, non-empty, and stays below the root once normalized.
    [[nodiscard]] static bool isValidEntry(const std::filesystem::path& entry);

private:
    std::filesystem::path queuePath_;
    std::shared_ptr<log::Registry> log_;
    std::string origin_;

    mutable std::mutex mutex_;
    std::vector<std::filesystem::path> entries_;
    bool resumed_ = false;

    std::vector<std::filesystem::path> sanitize(std::vector<std::filesystem::path> entries) const;

    static std::vector<std::filesystem::path> unique(std::vector<std::filesystem::path> entries);
};

}
