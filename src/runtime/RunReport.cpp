#include "runtime/RunReport.hpp"
#include "util/timestamp.hpp"

#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace mpc::runtime {

void RunReport::save(const std::filesystem::path& path) const {
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to write run report: " + path.string());
    out << nlohmann::json(*this).dump(2) << '\n';
}

void to_json(nlohmann::json& j, const RunReport& r) {
    std::vector<std::string> failed;
    failed.reserve(r.failed_paths.size());
    for (const auto& p : r.failed_paths) failed.push_back(p.string());

    j = {
        {"run_id", r.run_id},
        {"status", to_string(r.status)},
        {"exit_code", exitCode(r.status)},
        {"message", r.message},
        {"source", r.source.string()},
        {"destination", r.destination.string()},
        {"queue_file", r.queue_file.string()},
        {"resumed", r.resumed},
        {"dry_run", r.dry_run},
        {"workers", r.workers},
        {"queued", r.queued},
        {"dispatched", r.dispatched},
        {"succeeded", r.succeeded},
        {"failed", r.failed},
        {"remaining", r.remaining},
        {"bytes", r.bytes},
        {"peak_in_flight", r.peak_in_flight},
        {"failed_paths", failed},
        {"started", util::timestampToString(r.started)},
        {"finished", util::timestampToString(r.finished)},
        {"elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(r.finished - r.started).count()}
    };
}

}
