#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace mpc::copy {

struct CopyRequest {
    std::filesystem::path relativePath;
    std::filesystem::path source;            // absolute source file
    std::filesystem::path destinationDir;    // parent directory of the copy
};

struct CopyOutcome {
    int exitCode = -1;
    std::vector<std::string> outputLines;
    std::vector<std::string> errorLines;

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

struct CopyResult {
    std::filesystem::path relativePath;
    int exitCode = -1;
    unsigned int attempts = 0;
    std::chrono::system_clock::time_point started;
    std::chrono::system_clock::time_point finished;
    std::chrono::milliseconds duration{};
    uintmax_t bytes = 0;
    double bytesPerSecond = 0.0;     // observability only
    std::vector<std::string> outputLines;
    std::vector<std::string> errorLines;

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

}
