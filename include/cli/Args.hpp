#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace mpc::cli {

struct ArgsError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Args {
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> source;
    std::optional<std::filesystem::path> target;
    std::optional<unsigned int> threads;
    std::optional<unsigned int> maxAttempts;
    std::optional<std::filesystem::path> workDir;
    std::optional<std::string> queueName;
    std::optional<spdlog::level::level_enum> logLevel;
    bool dryRun = false;
    bool move = false;
    bool fast = false;
    bool create = false;
    bool help = false;

    // Overlays the command line on top of file or default configuration.
    void applyTo(config::Config& cnf) const;
};

Args parse(const std::vector<std::string>& argv);

Args parse(int argc, char** argv);

std::string usage(const std::string& program);

std::optional<unsigned int> parseUInt(const std::string& s);

spdlog::level::level_enum parseLevel(const std::string& s);

}
