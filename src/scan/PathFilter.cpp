#include "scan/PathFilter.hpp"

using namespace mpc::scan;

PathFilter::PathFilter(const std::vector<std::string>& names) : names_(names.begin(), names.end()) {}

void PathFilter::add(const std::string& name) {
    if (!name.empty()) names_.insert(name);
}

bool PathFilter::isExcluded(const std::string_view segment) const {
    if (segment.empty()) return false;
    return names_.contains(std::string(segment));
}

bool PathFilter::isExcluded(const std::filesystem::path& path) const {
    return isExcluded(std::string_view(path.filename().native()));
}
