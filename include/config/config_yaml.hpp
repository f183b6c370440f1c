#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace mpc::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<RunConfig> {
    static Node encode(const RunConfig& rhs) {
        Node node;
        node["workers"] = rhs.workers;
        node["create_destination"] = rhs.create_destination;
        node["work_dir"] = rhs.work_dir.string();
        if (!rhs.queue_file.empty()) node["queue_file"] = rhs.queue_file;
        node["poll_interval_ms"] = static_cast<long long>(rhs.poll_interval.count());
        node["fail_on_copy_errors"] = rhs.fail_on_copy_errors;
        return node;
    }

    static bool decode(const Node& node, RunConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.workers = node["workers"].as<unsigned int>(1);
        rhs.create_destination = node["create_destination"].as<bool>(false);
        rhs.work_dir = node["work_dir"].as<std::string>("/tmp/mpcopy");
        rhs.queue_file = node["queue_file"].as<std::string>("");
        rhs.poll_interval = std::chrono::milliseconds(node["poll_interval_ms"].as<long long>(250));
        rhs.fail_on_copy_errors = node["fail_on_copy_errors"].as<bool>(true);
        return true;
    }
};

template<>
struct convert<CopyConfig> {
    static Node encode(const CopyConfig& rhs) {
        Node node;
        node["rsync_binary"] = rhs.rsync_binary;
        node["dry_run"] = rhs.dry_run;
        node["move"] = rhs.move;
        node["checksum"] = rhs.checksum;
        node["max_attempts"] = rhs.max_attempts;
        node["backup_suffix"] = rhs.backup_suffix;
        node["include_filter_file"] = rhs.include_filter_file;
        node["exclude_filter_file"] = rhs.exclude_filter_file;
        node["exclude_patterns"] = rhs.exclude_patterns;
        node["extra_args"] = rhs.extra_args;
        return node;
    }

    static bool decode(const Node& node, CopyConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.rsync_binary = node["rsync_binary"].as<std::string>("rsync");
        rhs.dry_run = node["dry_run"].as<bool>(false);
        rhs.move = node["move"].as<bool>(false);
        rhs.checksum = node["checksum"].as<bool>(true);
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(1);
        rhs.backup_suffix = node["backup_suffix"].as<std::string>(".backup");
        rhs.include_filter_file = node["include_filter_file"].as<std::string>(".rsync.include");
        rhs.exclude_filter_file = node["exclude_filter_file"].as<std::string>(".rsync.exclude");
        if (node["exclude_patterns"]) rhs.exclude_patterns = node["exclude_patterns"].as<std::vector<std::string>>();
        if (node["extra_args"]) rhs.extra_args = node["extra_args"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<FilterConfig> {
    static Node encode(const FilterConfig& rhs) {
        Node node;
        node["excluded_names"] = rhs.excluded_names;
        node["extra_excluded_names"] = rhs.extra_excluded_names;
        return node;
    }

    static bool decode(const Node& node, FilterConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["excluded_names"]) rhs.excluded_names = node["excluded_names"].as<std::vector<std::string>>();
        if (node["extra_excluded_names"])
            rhs.extra_excluded_names = node["extra_excluded_names"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["mpcopy"]   = to_std_string(spdlog::level::to_string_view(rhs.mpcopy));
        node["fs"]       = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["queue"]    = to_std_string(spdlog::level::to_string_view(rhs.queue));
        node["dispatch"] = to_std_string(spdlog::level::to_string_view(rhs.dispatch));
        node["copy"]     = to_std_string(spdlog::level::to_string_view(rhs.copy));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.mpcopy = spdlog::level::from_str(node["mpcopy"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("info"));
        rhs.queue = spdlog::level::from_str(node["queue"].as<std::string>("info"));
        rhs.dispatch = spdlog::level::from_str(node["dispatch"].as<std::string>("info"));
        rhs.copy = spdlog::level::from_str(node["copy"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"])
            rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        // Accept the level keys either nested under "levels" or directly in "logging".
        if (node["levels"]) return convert<LogLevelsConfig>::decode(node["levels"], rhs.levels);
        return convert<LogLevelsConfig>::decode(node, rhs.levels);
    }
};

}
