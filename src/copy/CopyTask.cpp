#include "copy/CopyTask.hpp"
#include "copy/Copier.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <system_error>

using namespace mpc::copy;
using namespace std::chrono;
namespace fs = std::filesystem;

CopyTask::CopyTask(std::shared_ptr<const CopyContext> context, fs::path relPath, Callback done)
    : ctx(std::move(context)), relativePath(std::move(relPath)), onComplete(std::move(done)) {}

void CopyTask::operator()() {
    CopyResult result;
    try {
        result = execute();
    } catch (const std::exception& e) {
        result.relativePath = relativePath;
        result.exitCode = -1;
        result.errorLines = {e.what()};
        result.finished = system_clock::now();
        ctx->log->copy()->error("[CopyTask] Unexpected failure copying {}: {}", relativePath.string(), e.what());
    }

    if (onComplete) onComplete(std::move(result));
}

CopyResult CopyTask::execute() const {
    CopyResult result;
    result.relativePath = relativePath;
    result.started = system_clock::now();

    const CopyRequest request{
        .relativePath = relativePath,
        .source = ctx->sourceRoot / relativePath,
        .destinationDir = (ctx->destinationRoot / relativePath).parent_path()
    };

    ctx->log->copy()->debug("[CopyTask] Copying src={}\n\ttrg={}", request.source.string(), request.destinationDir.string());

    std::error_code ec;
    if (!fs::is_directory(request.destinationDir, ec)) {
        fs::create_directories(request.destinationDir, ec);
        if (!ec) {
            fs::permissions(request.destinationDir, fs::perms::owner_all | fs::perms::group_all |
                            fs::perms::others_read | fs::perms::others_exec, ec);
            ec.clear(); // mode is best effort
        }
    }

    if (ec || !fs::is_directory(request.destinationDir, ec)) {
        result.exitCode = EXIT_DESTINATION_UNAVAILABLE;
        result.attempts = 1;
        result.errorLines = {"Failed to create destination directory " + request.destinationDir.string() +
                             (ec ? ": " + ec.message() : std::string{})};
    } else {
        const auto size = fs::file_size(request.source, ec);
        result.bytes = ec ? 0 : size;

        const unsigned int maxAttempts = std::max(1u, ctx->maxAttempts);
        while (result.attempts < maxAttempts) {
            ++result.attempts;
            auto outcome = ctx->copier->copy(request);
            result.exitCode = outcome.exitCode;
            result.outputLines = std::move(outcome.outputLines);
            result.errorLines = std::move(outcome.errorLines);
            if (result.ok()) break;

            if (result.attempts < maxAttempts)
                ctx->log->copy()->warn("[CopyTask] Attempt {}/{} for {} exited with {}, retrying",
                                       result.attempts, maxAttempts, relativePath.string(), result.exitCode);
        }
    }

    result.finished = system_clock::now();
    result.duration = duration_cast<milliseconds>(result.finished - result.started);
    if (result.duration.count() > 0)
        result.bytesPerSecond = static_cast<double>(result.bytes) / (static_cast<double>(result.duration.count()) / 1000.0);

    logOutcome(result);
    return result;
}

void CopyTask::logOutcome(const CopyResult& result) const {
    const auto& log = ctx->log->copy();

    if (!result.ok()) {
        log->error("[CopyTask] Copy of {} failed with exit code {} after {} attempt(s)",
                   result.relativePath.string(), result.exitCode, result.attempts);
        for (const auto& line : result.errorLines) log->error("{}", line);
        for (const auto& line : result.outputLines) log->error("{}", line);
        return;
    }

    for (const auto& line : result.outputLines) log->info("{}", line);
    for (const auto& line : result.errorLines) log->warn("{}", line);
    log->info("[CopyTask] Copied {} ({} bytes in {} ms, {:.1f} KiB/s)", result.relativePath.string(),
              result.bytes, result.duration.count(), result.bytesPerSecond / 1024.0);
}
