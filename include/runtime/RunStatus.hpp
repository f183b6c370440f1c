#pragma once

#include <stdexcept>
#include <string>

namespace mpc::runtime {

// Terminal status of a run, usable directly as the process exit code.
enum class RunStatus : int {
    Success = 0,
    SourcePathMissing = 1,
    TargetPathMissing = 2,
    SourceTargetNameMismatch = 3,
    PermissionDenied = 4,
    CopyFailures = 5,
    Interrupted = 6,
    InvalidArguments = 64,
    InternalError = 70
};

std::string to_string(RunStatus status);

[[nodiscard]] inline int exitCode(const RunStatus status) { return static_cast<int>(status); }

struct PreconditionError : std::runtime_error {
    RunStatus status;

    PreconditionError(const RunStatus s, const std::string& what) : std::runtime_error(what), status(s) {}
};

}
