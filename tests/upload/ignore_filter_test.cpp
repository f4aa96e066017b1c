#include "scansync/upload/ignore_filter.hpp"

#include <gtest/gtest.h>

using scansync::upload::IgnoreFilter;

TEST(IgnoreFilterTest, IgnoresPlatformMetadataByDefault) {
    IgnoreFilter filter;
    EXPECT_TRUE(filter.should_ignore("/share/Scans/.DS_Store"));
    EXPECT_FALSE(filter.should_ignore("/share/Scans/scan_001.pdf"));
}

TEST(IgnoreFilterTest, IgnoresHiddenFiles) {
    IgnoreFilter filter;
    EXPECT_TRUE(filter.should_ignore("/share/Scans/.scan_001.pdf.tmp"));
    EXPECT_TRUE(filter.should_ignore(".hidden"));
}

TEST(IgnoreFilterTest, OnlyBasenameMatters) {
    IgnoreFilter filter;
    EXPECT_FALSE(filter.should_ignore("/share/.hidden_dir/scan.pdf"));
    EXPECT_FALSE(filter.should_ignore("/share/Scans/DS_Store"));
}

TEST(IgnoreFilterTest, CustomNames) {
    IgnoreFilter filter({"Thumbs.db", "desktop.ini"});
    EXPECT_TRUE(filter.should_ignore("/share/Scans/Thumbs.db"));
    EXPECT_TRUE(filter.should_ignore("/share/Scans/desktop.ini"));
    EXPECT_TRUE(filter.should_ignore("/share/Scans/.partial"));
    // Still hidden without the default list.
    EXPECT_TRUE(filter.should_ignore("/share/Scans/.DS_Store"));
    EXPECT_FALSE(filter.should_ignore("/share/Scans/thumbs.db"));
    EXPECT_EQ(filter.ignored_names().size(), 2u);
}
