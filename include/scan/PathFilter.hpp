#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
#include <filesystem>

namespace mpc::scan {

// Exact-name exclusion of OS and filesystem metadata entries (".DS_Store",
// ".Trashes", ...). Only the final path segment is consulted.
class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(const std::vector<std::string>& names);

    void add(const std::string& name);

    [[nodiscard]] bool isExcluded(std::string_view segment) const;
    [[nodiscard]] bool isExcluded(const std::filesystem::path& path) const;

    [[nodiscard]] size_t size() const { return names_.size(); }

private:
    std::unordered_set<std::string> names_;
};

}
