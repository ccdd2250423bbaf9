#include <gtest/gtest.h>
#include <sftp/file_types.hpp>
#include <sftp/result.hpp>
#include <core/utils.hpp>

TEST(FileInfo, ProjectsOwnerBits) {
    RawAttributes attrs;
    attrs.has_permissions = true;

    attrs.permissions = 0100644;
    EXPECT_EQ(to_file_info(attrs).access, FileAccess::ReadWrite);

    attrs.permissions = 0100444;
    EXPECT_EQ(to_file_info(attrs).access, FileAccess::Read);

    attrs.permissions = 0100200;
    EXPECT_EQ(to_file_info(attrs).access, FileAccess::Write);

    // Group/other bits don't count
    attrs.permissions = 0100077;
    EXPECT_EQ(to_file_info(attrs).access, FileAccess::None);
}

TEST(FileInfo, CopiesSizeAndTimes) {
    RawAttributes attrs;
    attrs.has_size = true;
    attrs.size = 70000;
    attrs.has_times = true;
    attrs.atime = 1700000000;
    attrs.mtime = 1600000000;

    auto info = to_file_info(attrs);
    EXPECT_EQ(info.size, 70000u);
    EXPECT_EQ(info.last_read, 1700000000u);
    EXPECT_EQ(info.last_write, 1600000000u);
}

TEST(FileInfo, MissingAttributesAreZero) {
    RawAttributes attrs;
    attrs.size = 99;          // ignored without has_size
    attrs.permissions = 0600; // ignored without has_permissions

    auto info = to_file_info(attrs);
    EXPECT_EQ(info.size, 0u);
    EXPECT_EQ(info.access, FileAccess::None);
    EXPECT_EQ(info.last_read, 0u);
    EXPECT_EQ(info.last_write, 0u);
}

TEST(OpenModeSet, DescribesFlags) {
    EXPECT_EQ(describe_mode(OpenMode::Read), "read");
    EXPECT_EQ(describe_mode(OpenMode::Read | OpenMode::Binary), "read|binary");
    EXPECT_EQ(describe_mode(OpenMode::Write | OpenMode::Create | OpenMode::Truncate),
              "write|create|truncate");
    EXPECT_TRUE(has_mode(OpenMode::Read | OpenMode::Binary, OpenMode::Binary));
    EXPECT_FALSE(has_mode(OpenMode::Read, OpenMode::Write));
}

TEST(SftpResultTags, CarriesCodeAcrossTypes) {
    auto err = SftpResult<int>::Err(SftpErrc::ChannelClosed, "gone");
    EXPECT_TRUE(err.channel_closed());

    auto moved = err.error_as<std::string>();
    EXPECT_EQ(moved.code, SftpErrc::ChannelClosed);
    EXPECT_EQ(moved.error, "gone");
    EXPECT_STREQ(errc_name(moved.code), "channel_closed");

    EXPECT_TRUE(SftpResult<void>::Ok().is_ok());
}

TEST(Utils, FormatBytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(1023), "1023 B");
    EXPECT_EQ(format_bytes(32768), "32.0 KiB");
    EXPECT_EQ(format_bytes(3 * 1024 * 1024), "3.0 MiB");
}

TEST(Utils, FormatEpochZero) {
    EXPECT_EQ(format_epoch(0), "-");
    EXPECT_EQ(format_epoch(1600000000).size(), 19u);
}
