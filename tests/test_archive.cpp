#include <gtest/gtest.h>
#include "../main/src/archive.hpp"
#include "../main/src/config.hpp"
#include "../main/src/exception.hpp"
#include "../main/src/localization.hpp"
#include "archive_test_utils.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

TEST(ArchiveFormatTest, ParsesKnownFormatsCaseInsensitively) {
    EXPECT_EQ(parse_archive_format("zip"), ArchiveFormat::ZIP);
    EXPECT_EQ(parse_archive_format("ZIP"), ArchiveFormat::ZIP);
    EXPECT_EQ(parse_archive_format("Zip"), ArchiveFormat::ZIP);
    EXPECT_EQ(parse_archive_format("tar"), ArchiveFormat::TAR_GZ);
    EXPECT_EQ(parse_archive_format("Tar"), ArchiveFormat::TAR_GZ);
    EXPECT_EQ(parse_archive_format("TAR"), ArchiveFormat::TAR_GZ);
}

TEST(ArchiveFormatTest, RejectsEverythingElse) {
    EXPECT_FALSE(parse_archive_format("rar").has_value());
    EXPECT_FALSE(parse_archive_format("").has_value());
    EXPECT_FALSE(parse_archive_format("tgz").has_value());
    EXPECT_FALSE(parse_archive_format("tar.gz").has_value());
    EXPECT_FALSE(parse_archive_format("zipx").has_value());
    EXPECT_FALSE(parse_archive_format(" zip").has_value());
}

TEST(ArchiveFormatTest, ExtensionIsFixedByFormat) {
    EXPECT_EQ(archive_extension(ArchiveFormat::ZIP), ".zip");
    EXPECT_EQ(archive_extension(ArchiveFormat::TAR_GZ), ".tar.gz");
}

TEST(ArchiveFormatTest, ExtensionOfUnknownFormatThrows) {
    EXPECT_THROW(archive_extension(static_cast<ArchiveFormat>(42)), ArcpackException);
}

class ArchiveWriterTest : public ::testing::Test {
protected:
    fs::path suite_work_dir;

    void SetUp() override {
        setenv("LANG", "C", 1);
        set_l10n_dir(ARCPACK_TEST_L10N_DIR);
        init_localization();

        suite_work_dir = fs::absolute("tmp_archive_writer_test");
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
        fs::create_directories(suite_work_dir);
    }

    void TearDown() override {
        reset_config();
        if (fs::exists(suite_work_dir)) fs::remove_all(suite_work_dir);
    }
};

TEST_F(ArchiveWriterTest, OpenFailsForUnwritableLocation) {
    fs::path target = suite_work_dir / "no/such/dir/out.zip";
    EXPECT_THROW(open_archive_writer(ArchiveFormat::ZIP, target), ArcpackException);
    EXPECT_THROW(open_archive_writer(ArchiveFormat::TAR_GZ, target), ArcpackException);
}

TEST_F(ArchiveWriterTest, ExplicitCloseReleasesHandle) {
    fs::path target = suite_work_dir / "empty.tar.gz";
    ArchiveWriteHandle handle = open_archive_writer(ArchiveFormat::TAR_GZ, target);
    ASSERT_TRUE(handle);

    close_archive_writer(handle, target);
    EXPECT_FALSE(handle);
    EXPECT_TRUE(fs::exists(target));
    EXPECT_TRUE(read_archive_entries(target).empty());
}

TEST_F(ArchiveWriterTest, HandleFlushesWhenLeavingScope) {
    fs::path target = suite_work_dir / "scoped.tar.gz";
    {
        ArchiveWriteHandle handle = open_archive_writer(ArchiveFormat::TAR_GZ, target);
        ASSERT_TRUE(handle);
    }

    std::string bytes = read_file(target);
    ASSERT_GE(bytes.size(), 2u);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0x1f);
    EXPECT_EQ(static_cast<unsigned char>(bytes[1]), 0x8b);
    EXPECT_TRUE(read_archive_entries(target).empty());
}

TEST_F(ArchiveWriterTest, ZipWriterCreatesFile) {
    fs::path target = suite_work_dir / "empty.zip";
    ArchiveWriteHandle handle = open_archive_writer(ArchiveFormat::ZIP, target);
    close_archive_writer(handle, target);

    std::string bytes = read_file(target);
    // End of central directory record only
    ASSERT_GE(bytes.size(), 22u);
    EXPECT_EQ(bytes.substr(0, 4), std::string("PK\x05\x06", 4));
}
