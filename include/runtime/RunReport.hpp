#pragma once

#include "runtime/RunStatus.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace mpc::runtime {

struct RunReport {
    std::string run_id;
    RunStatus status{RunStatus::Success};
    std::string message;

    std::filesystem::path source;
    std::filesystem::path destination;
    std::filesystem::path queue_file;
    bool resumed = false;
    bool dry_run = false;
    unsigned int workers = 1;

    uint64_t queued{};       // entries in the queue when dispatch began
    uint64_t dispatched{};
    uint64_t succeeded{};
    uint64_t failed{};
    uint64_t remaining{};    // entries still queued at the end
    uintmax_t bytes{};
    unsigned int peak_in_flight{};
    std::vector<std::filesystem::path> failed_paths;

    std::chrono::system_clock::time_point started;
    std::chrono::system_clock::time_point finished;

    void save(const std::filesystem::path& path) const;
};

void to_json(nlohmann::json& j, const RunReport& r);

}
