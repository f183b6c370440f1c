#include "copy/RsyncCopier.hpp"
#include "process/Subprocess.hpp"
#include "log/Registry.hpp"

using namespace mpc::copy;

RsyncCopier::RsyncCopier(config::CopyConfig cnf, std::shared_ptr<log::Registry> log)
    : cnf_(std::move(cnf)), log_(std::move(log)) {}

std::vector<std::string> RsyncCopier::buildArgs(const CopyRequest& request) const {
    std::vector<std::string> args = {
        cnf_.rsync_binary,
        "-v", "-v",
        "--progress",
        "--perms",
        "--links",
        "--times",
        "--itemize-changes",
        "--stats",
        "--backup",
        "--suffix=" + cnf_.backup_suffix
    };

    if (cnf_.dry_run) args.emplace_back("--dry-run");
    if (cnf_.move) args.emplace_back("--remove-source-files");
    if (cnf_.checksum) args.emplace_back("--checksum");

    for (const auto& pattern : cnf_.exclude_patterns) args.push_back("--exclude=" + pattern);

    if (!cnf_.include_filter_file.empty()) args.push_back("--filter=dir-merge /" + cnf_.include_filter_file);
    if (!cnf_.exclude_filter_file.empty()) args.push_back("--filter=dir-merge /" + cnf_.exclude_filter_file);

    args.insert(args.end(), cnf_.extra_args.begin(), cnf_.extra_args.end());

    args.push_back(request.source.string());
    args.push_back(request.destinationDir.string());
    return args;
}

CopyOutcome RsyncCopier::copy(const CopyRequest& request) {
    const auto args = buildArgs(request);
    log_->copy()->info("[RsyncCopier] ========== {}", process::joinCommand(args));

    CopyOutcome outcome;
    try {
        const auto res = process::run(args);
        outcome.exitCode = res.exitCode;
        outcome.outputLines = process::splitLines(res.stdoutText);
        outcome.errorLines = process::splitLines(res.stderrText);
    } catch (const process::SpawnError& e) {
        outcome.exitCode = process::EXIT_EXEC_FAILED;
        outcome.errorLines = {e.what()};
    }

    return outcome;
}
