#pragma once

#include "config/Config.hpp"
#include "runtime/RunReport.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mpc::log { class Registry; }
namespace mpc::copy { class Copier; }

namespace mpc::runtime {

// Top-level control flow of a copy run: preconditions, queue initialization
// (resume or fresh discovery), dispatch, and the final report.
class Orchestrator {
public:
    Orchestrator(config::Config cnf,
                 std::shared_ptr<log::Registry> log,
                 std::shared_ptr<copy::Copier> copier = nullptr,
                 std::shared_ptr<std::atomic<bool>> interruptFlag = nullptr,
                 std::string runId = {});

    RunReport run();

    void requestStop() const { interruptFlag_->store(true); }

    [[nodiscard]] const std::string& runId() const { return runId_; }
    [[nodiscard]] const config::Config& config() const { return cnf_; }
    [[nodiscard]] std::filesystem::path reportPath() const;

    static std::string newRunId();

    // Final path segment after resolving symlinks and dot segments.
    static std::filesystem::path finalSegment(const std::filesystem::path& path);

private:
    config::Config cnf_;
    std::shared_ptr<log::Registry> log_;
    std::shared_ptr<copy::Copier> copier_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
    std::string runId_;

    void checkNameIdentity() const;
    void checkSource() const;
    void checkDestination() const;
    void prepareWorkDir() const;

    std::vector<std::filesystem::path> discover() const;
    void execute(RunReport& report);
    void writeReport(const RunReport& report) const;
};

}
