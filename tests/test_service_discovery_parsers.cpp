#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "service_browser.h"
#include "service_resolver.h"

using namespace netlaunch;

TEST(ServiceBrowserParserTest, DefaultServiceTypesTest) {
    const auto& types = default_service_types();
    ASSERT_EQ(types.size(), 4u);
    EXPECT_EQ(types[0].service_type, "_smb._tcp");
    EXPECT_EQ(types[0].share_type, ShareType::SMB);
    EXPECT_EQ(types[1].service_type, "_afpovertcp._tcp");
    EXPECT_EQ(types[1].share_type, ShareType::AFP);
    EXPECT_EQ(types[2].service_type, "_nfs._tcp");
    EXPECT_EQ(types[2].share_type, ShareType::NFS);
    EXPECT_EQ(types[3].service_type, "_device-info._tcp");
    EXPECT_EQ(types[3].share_type, ShareType::OTHER);
}

TEST(ServiceBrowserParserTest, ParsesAddLinesTest) {
    auto name = parse_browse_line(
        "12:01:02.345  Add        3   4 local.               _smb._tcp.           Office NAS",
        "_smb._tcp");
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "Office NAS");

    auto trimmed = parse_browse_line(
        "12:01:02.345  Add        2   4 local.               _afpovertcp._tcp.    Time Capsule   \r",
        "_afpovertcp._tcp");
    ASSERT_TRUE(trimmed.has_value());
    EXPECT_EQ(*trimmed, "Time Capsule");
}

TEST(ServiceBrowserParserTest, IgnoresOtherLinesTest) {
    // Header, removals and other service types carry no new instance
    EXPECT_FALSE(parse_browse_line("Browsing for _smb._tcp.local", "_smb._tcp").has_value());
    EXPECT_FALSE(parse_browse_line(
        "Timestamp     A/R    Flags  if Domain               Service Type         Instance Name",
        "_smb._tcp").has_value());
    EXPECT_FALSE(parse_browse_line(
        "12:01:02.345  Rmv        0   4 local.               _smb._tcp.           Office NAS",
        "_smb._tcp").has_value());
    EXPECT_FALSE(parse_browse_line(
        "12:01:02.345  Add        3   4 local.               _nfs._tcp.           Office NAS",
        "_smb._tcp").has_value());
    EXPECT_FALSE(parse_browse_line(
        "12:01:02.345  Add        3   4 local.               _smb._tcp.           ",
        "_smb._tcp").has_value());
    EXPECT_FALSE(parse_browse_line("", "_smb._tcp").has_value());
}

TEST(ServiceResolverParserTest, ParsesReachedAtLineTest) {
    auto resolved = parse_resolve_line(
        "12:01:03.001  Office NAS._smb._tcp.local. can be reached at office-nas.local.:445 (interface 4)",
        "Office NAS");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->host, "office-nas.local");
    EXPECT_EQ(resolved->port, 445);
}

// The reached-at form does not need the instance name on the line
TEST(ServiceResolverParserTest, ReachedAtWithoutInstanceNameTest) {
    auto resolved = parse_resolve_line("can be reached at nas.local.:548", "Other");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->host, "nas.local");
    EXPECT_EQ(resolved->port, 548);
}

TEST(ServiceResolverParserTest, ParsesColumnarLineTest) {
    auto resolved = parse_resolve_line(
        "12:01:03.001  4  Office NAS 2049 office-nas.local.",
        "Office NAS");
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->host, "office-nas.local");
    EXPECT_EQ(resolved->port, 2049);
}

TEST(ServiceResolverParserTest, RejectsUnrelatedLinesTest) {
    EXPECT_FALSE(parse_resolve_line("Lookup Office NAS._smb._tcp.local", "Office NAS").has_value());
    EXPECT_FALSE(parse_resolve_line("12:01:03.001  4  Office NAS 2049 office-nas.local.", "Printer").has_value());
    EXPECT_FALSE(parse_resolve_line("Office NAS 2049 hostwithoutdot", "Office NAS").has_value());
    EXPECT_FALSE(parse_resolve_line("Office NAS port nas.local", "Office NAS").has_value());
    EXPECT_FALSE(parse_resolve_line("", "Office NAS").has_value());
}
