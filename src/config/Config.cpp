#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "util/fsPath.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

namespace mpc::config {

std::vector<std::string> defaultExcludePatterns() {
    return {
        ".DS_Store", ".Trashes", ".Trash", "._.Trashes", ".localized", ".DocumentRevisions-*",
        ".Spotlight*", ".fseventsd", ".apdisk", ".com.apple.timemachine.donotpresent", ".fcplock",
        ".fcpuser", ".cache", "._.TemporaryItems", "._.apdisk", ".TemporaryItems"
    };
}

std::vector<std::string> defaultExcludedNames() {
    return {
        ".DS_Store", ".Trashes", ".Trash", "._.Trashes", ".localized", ".fseventsd", ".apdisk",
        ".com.apple.timemachine.donotpresent", ".fcplock", ".fcpuser", ".cache", "._.TemporaryItems",
        "._.apdisk", ".TemporaryItems", ".Spotlight-V100", ".DocumentRevisions-V100", "Thumbs.db",
        "desktop.ini", "$RECYCLE.BIN"
    };
}

std::string RunConfig::origin() const {
    return util::resolvePath(source).string() + '\t' + util::resolvePath(destination).string();
}

std::filesystem::path RunConfig::queuePath() const {
    if (!queue_file.empty()) return work_dir / queue_file;
    return work_dir / fmt::format("mpcopy-{:016x}.queue", util::fnv1a64(origin()));
}

std::filesystem::path RunConfig::failedPath() const {
    auto path = queuePath();
    path += ".failed";
    return path;
}

void LoggingConfig::setVerbosity(const spdlog::level::level_enum lvl) {
    levels.console_log_level = lvl;
    auto& sub = levels.subsystem_levels;
    sub.mpcopy = sub.fs = sub.queue = sub.dispatch = sub.copy = lvl;
    if (levels.file_log_level > lvl) levels.file_log_level = lvl;
}

void Config::validate() const {
    if (run.workers < 1) throw ConfigError("run.workers must be at least 1");
    if (run.workers > MAX_WORKERS)
        throw ConfigError(fmt::format("run.workers must be at most {}, got {}", MAX_WORKERS, run.workers));
    if (copy.max_attempts < 1) throw ConfigError("copy.max_attempts must be at least 1");
    if (run.poll_interval.count() < 1) throw ConfigError("run.poll_interval_ms must be at least 1");
    if (run.queue_file == "." || run.queue_file == ".." || run.queue_file.find('/') != std::string::npos)
        throw ConfigError(fmt::format("run.queue_file must be a file name, got '{}'", run.queue_file));
    if (copy.rsync_binary.empty()) throw ConfigError("copy.rsync_binary must not be empty");
    if (run.work_dir.empty()) throw ConfigError("run.work_dir must not be empty");
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Failed to load config file '{}': {}", path.string(), e.what()));
    }

    try {
        const auto section = [&]<typename T>(const char* name, T& out) {
            const auto node = root[name];
            if (node && !YAML::convert<T>::decode(node, out))
                throw ConfigError(fmt::format("Config section '{}' in '{}' must be a map", name, path.string()));
        };

        section("run", cfg.run);
        section("copy", cfg.copy);
        section("filter", cfg.filter);
        section("logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ConfigError(fmt::format("Invalid value in config file '{}': {}", path.string(), e.what()));
    }

    cfg.validate();
    return cfg;
}

Config loadDefaultConfig() {
    std::error_code ec;
    if (std::filesystem::is_regular_file(DEFAULT_CONFIG_PATH, ec)) return loadConfig(DEFAULT_CONFIG_PATH);
    return {};
}

std::string dump(const Config& cfg) {
    YAML::Node root;
    root["run"] = cfg.run;
    root["copy"] = cfg.copy;
    root["filter"] = cfg.filter;
    root["logging"] = cfg.logging;

    YAML::Emitter out;
    out << root;
    return {out.c_str()};
}

} // namespace mpc::config
