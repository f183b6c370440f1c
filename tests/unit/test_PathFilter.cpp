#include <gtest/gtest.h>
#include "scan/PathFilter.hpp"
#include "config/Config.hpp"

using namespace mpc::scan;

TEST(PathFilterTest, ExcludesExactNames) {
    PathFilter filter({".DS_Store", ".Trashes"});
    EXPECT_TRUE(filter.isExcluded(std::string_view(".DS_Store")));
    EXPECT_TRUE(filter.isExcluded(std::string_view(".Trashes")));
    EXPECT_FALSE(filter.isExcluded(std::string_view("notes.txt")));
}

TEST(PathFilterTest, NoPrefixOrCaseMatching) {
    PathFilter filter({".DS_Store"});
    EXPECT_FALSE(filter.isExcluded(std::string_view(".DS_Store.bak")));
    EXPECT_FALSE(filter.isExcluded(std::string_view("x.DS_Store")));
    EXPECT_FALSE(filter.isExcluded(std::string_view(".ds_store")));
}

TEST(PathFilterTest, EmptySegmentIsNeverExcluded) {
    PathFilter filter({".DS_Store"});
    EXPECT_FALSE(filter.isExcluded(std::string_view("")));

    PathFilter empty;
    EXPECT_FALSE(empty.isExcluded(std::string_view("")));
    EXPECT_FALSE(empty.isExcluded(std::string_view(".DS_Store")));
}

TEST(PathFilterTest, PathOnlyConsultsFinalSegment) {
    PathFilter filter({".Trashes"});
    EXPECT_TRUE(filter.isExcluded(std::filesystem::path("vol/.Trashes")));
    EXPECT_FALSE(filter.isExcluded(std::filesystem::path(".Trashes/file.txt")));
}

TEST(PathFilterTest, AddIgnoresEmptyNames) {
    PathFilter filter;
    filter.add("");
    filter.add("Thumbs.db");
    EXPECT_EQ(filter.size(), 1u);
    EXPECT_TRUE(filter.isExcluded(std::string_view("Thumbs.db")));
}

TEST(PathFilterTest, DefaultNamesCoverMacMetadata) {
    PathFilter filter(mpc::config::defaultExcludedNames());
    for (const auto* name : {".DS_Store", ".Trashes", ".fseventsd", ".TemporaryItems", ".Spotlight-V100"})
        EXPECT_TRUE(filter.isExcluded(std::string_view(name))) << name;
    EXPECT_FALSE(filter.isExcluded(std::string_view("Documents")));
}
