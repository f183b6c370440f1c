#include "runtime/RunStatus.hpp"

namespace mpc::runtime {

std::string to_string(const RunStatus status) {
    switch (status) {
        case RunStatus::Success: return "success";
        case RunStatus::SourcePathMissing: return "source_path_missing";
        case RunStatus::TargetPathMissing: return "target_path_missing";
        case RunStatus::SourceTargetNameMismatch: return "source_target_name_mismatch";
        case RunStatus::PermissionDenied: return "permission_denied";
        case RunStatus::CopyFailures: return "copy_failures";
        case RunStatus::Interrupted: return "interrupted";
        case RunStatus::InvalidArguments: return "invalid_arguments";
        case RunStatus::InternalError: return "internal_error";
    }
    return "unknown";
}

}
