// CLI
#include "cli/Args.hpp"

// Config
#include "config/Config.hpp"

// Runtime
#include "runtime/Orchestrator.hpp"
#include "runtime/RunStatus.hpp"

// Logging
#include "log/Registry.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>

using namespace mpc;
using namespace mpc::runtime;

namespace {
const auto interruptFlag = std::make_shared<std::atomic<bool>>(false);

void signalHandler(const int) {
    interruptFlag->store(true);
}
}

int main(const int argc, char** argv) {
    cli::Args args;
    try {
        args = cli::parse(argc, argv);
    } catch (const cli::ArgsError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << cli::usage(argv[0]);
        return exitCode(RunStatus::InvalidArguments);
    }

    if (args.help) {
        std::cout << cli::usage(argv[0]);
        return EXIT_SUCCESS;
    }

    config::Config cnf;
    try {
        cnf = args.configPath ? config::loadConfig(*args.configPath) : config::loadDefaultConfig();
        args.applyTo(cnf);
        cnf.validate();
    } catch (const config::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return exitCode(RunStatus::InvalidArguments);
    }

    const auto runId = Orchestrator::newRunId();

    std::shared_ptr<mpc::log::Registry> logs;
    try {
        logs = std::make_shared<mpc::log::Registry>(cnf.logging, mpc::log::Registry::Options{
            .console = true,
            .logFile = mpc::log::Registry::runLogPath(cnf.run.logDir(), runId)
        });
    } catch (const std::exception& e) {
        std::cerr << "Error: unable to open log file under " << cnf.run.logDir() << ": " << e.what() << std::endl;
        return exitCode(RunStatus::PermissionDenied);
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    Orchestrator orchestrator(cnf, logs, nullptr, interruptFlag, runId);
    const auto report = orchestrator.run();

    if (report.status == RunStatus::Interrupted)
        logs->mpcopy()->info("[!] Stopped early. Run again with the same --work-dir to resume.");

    return exitCode(report.status);
}
