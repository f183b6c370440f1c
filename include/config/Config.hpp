#pragma once

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace mpc::config {

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/mpcopy/config.yaml";

// Upper bound on concurrent copies, shared with the dispatcher's slot semaphore.
constexpr unsigned int MAX_WORKERS = 4096;

struct ConfigError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct RunConfig {
    std::filesystem::path source;
    std::filesystem::path destination;
    unsigned int workers = 1;
    bool create_destination = false;
    std::filesystem::path work_dir = "/tmp/mpcopy";
    std::string queue_file;     // empty: derived from the source/destination pair
    std::chrono::milliseconds poll_interval{250};
    bool fail_on_copy_errors = true;

    // "<resolved source>\t<resolved destination>", recorded in the queue header.
    [[nodiscard]] std::string origin() const;

    // work_dir/queue_file, or work_dir/mpcopy-<hash of origin>.queue so different
    // source/destination pairs never share a queue.
    [[nodiscard]] std::filesystem::path queuePath() const;
    [[nodiscard]] std::filesystem::path failedPath() const;
    [[nodiscard]] std::filesystem::path logDir() const { return work_dir / "logs"; }
    [[nodiscard]] std::filesystem::path reportDir() const { return work_dir / "reports"; }
};

std::vector<std::string> defaultExcludePatterns();
std::vector<std::string> defaultExcludedNames();

struct CopyConfig {
    std::string rsync_binary = "rsync";
    bool dry_run = false;
    bool move = false;
    bool checksum = true;
    unsigned int max_attempts = 1;
    std::string backup_suffix = ".backup";
    std::string include_filter_file = ".rsync.include";
    std::string exclude_filter_file = ".rsync.exclude";
    std::vector<std::string> exclude_patterns = defaultExcludePatterns();
    std::vector<std::string> extra_args;
};

struct FilterConfig {
    std::vector<std::string> excluded_names = defaultExcludedNames();
    std::vector<std::string> extra_excluded_names;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum mpcopy   = spdlog::level::info;   // Run start/end, preconditions
    spdlog::level::level_enum fs       = spdlog::level::info;   // Discovery, skipped entries
    spdlog::level::level_enum queue    = spdlog::level::info;   // Resume, persist failures
    spdlog::level::level_enum dispatch = spdlog::level::info;   // Slot accounting, retirement
    spdlog::level::level_enum copy     = spdlog::level::info;   // rsync invocations and output
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    LogLevelsConfig levels;

    // Applies a single verbosity to the console and every subsystem.
    void setVerbosity(spdlog::level::level_enum lvl);
};

struct Config {
    RunConfig run;
    CopyConfig copy;
    FilterConfig filter;
    LoggingConfig logging;

    void validate() const;
};

Config loadConfig(const std::filesystem::path& path);

// Loads DEFAULT_CONFIG_PATH if it exists, built-in defaults otherwise.
Config loadDefaultConfig();

std::string dump(const Config& cfg);

} // namespace mpc::config
