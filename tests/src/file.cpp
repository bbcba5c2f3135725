#include "unit-tests.hpp"

#include <fstream>

using namespace pst;
using namespace pst::tests;

TEST_F(UnitTest, File_WriteAtomic_ReplacesContentAndRemovesTemporary)
{
    const auto dir = makeTempPath("file_atomic");
    const auto path = dir / "artifact.bin";

    const std::vector<std::uint8_t> first{1, 2, 3};
    ASSERT_TRUE(file::writeFileAtomic(path, first).has_value());

    const std::vector<std::uint8_t> second{9, 8};
    ASSERT_TRUE(file::writeFileAtomic(path, second).has_value());

    const auto content = file::loadBinaryFile(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, second);
    EXPECT_FALSE(std::filesystem::exists(file::temporaryPath(path)));
}

TEST_F(UnitTest, File_WriteAtomic_FailureKeepsCanonicalFile)
{
    const auto dir = makeTempPath("file_atomic_fail");
    const auto path = dir / "missing_dir" / "artifact.bin";

    const auto res = file::writeFileAtomic(path, std::string("data"));
    EXPECT_FALSE(res.has_value());
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_FALSE(std::filesystem::exists(file::temporaryPath(path)));
}

TEST_F(UnitTest, File_LoadBinaryFile_AllowsEmptyFile)
{
    const auto dir = makeTempPath("file_empty");
    const auto path = dir / "empty.bin";
    {
        std::ofstream output(path, std::ios::binary);
    }

    const auto content = file::loadBinaryFile(path);
    ASSERT_TRUE(content.has_value());
    EXPECT_TRUE(content->empty());

    EXPECT_FALSE(file::loadBinaryFile(dir / "nope.bin").has_value());
}

TEST_F(UnitTest, File_LoadListFile_SkipsCommentsAndBlankLines)
{
    const auto dir = makeTempPath("file_list");
    const auto path = dir / "wallets.txt";
    ASSERT_TRUE(file::writeFileAtomic(path, std::string(
        "# wallets\n"
        "0x0000000000000000000000000000000000000001\n"
        "\n"
        "   0x0000000000000000000000000000000000000002   \r\n"
        "  # indented comment\n"
        "0x0000000000000000000000000000000000000003")).has_value());

    const auto lines = file::loadListFile(path);
    ASSERT_TRUE(lines.has_value());
    EXPECT_EQ(*lines, (std::vector<std::string>{
        "0x0000000000000000000000000000000000000001",
        "0x0000000000000000000000000000000000000002",
        "0x0000000000000000000000000000000000000003"
    }));
}

TEST_F(UnitTest, Utils_HexQuantity_RoundTrip)
{
    EXPECT_EQ(utils::toHexQuantity(0), "0x0");
    EXPECT_EQ(utils::toHexQuantity(255), "0xff");

    EXPECT_EQ(utils::parseHexQuantity("0xff"), 255);
    EXPECT_EQ(utils::parseHexQuantity("0X10"), 16);
    EXPECT_EQ(utils::parseHexQuantity("0x"), 0);
    EXPECT_EQ(utils::parseHexQuantity("42"), 42);
    EXPECT_FALSE(utils::parseHexQuantity("").has_value());
    EXPECT_FALSE(utils::parseHexQuantity("0xzz").has_value());
    EXPECT_FALSE(utils::parseHexQuantity("0x1ffffffffffffffff").has_value());
}

TEST_F(UnitTest, File_WriteFilesAtomic_CommitsAllOrNothing)
{
    const auto dir = makeTempPath("file_atomic_group");
    const auto first_path = dir / "first.bin";
    const auto second_path = dir / "second.bin";

    const std::vector<std::uint8_t> old_content{1};
    ASSERT_TRUE(file::writeFileAtomic(first_path, old_content).has_value());

    // second target is a directory, the group must fail before touching first.bin
    std::filesystem::create_directories(second_path / "child");

    const std::vector<std::uint8_t> new_content{2, 2};
    const std::vector<file::PendingFile> group{
        file::PendingFile{.path = first_path, .content = new_content},
        file::PendingFile{.path = second_path, .content = new_content}
    };
    EXPECT_FALSE(file::writeFilesAtomic(group).has_value());
    EXPECT_EQ(file::loadBinaryFile(first_path), old_content);

    std::filesystem::remove_all(second_path);
    ASSERT_TRUE(file::writeFilesAtomic(group).has_value());
    EXPECT_EQ(file::loadBinaryFile(first_path), new_content);
    EXPECT_EQ(file::loadBinaryFile(second_path), new_content);

    std::size_t files = 0;
    for(const auto & item : std::filesystem::directory_iterator(dir))
    {
        EXPECT_TRUE(item.path() == first_path || item.path() == second_path) << item.path().string();
        ++files;
    }
    EXPECT_EQ(files, 2);
}

TEST_F(UnitTest, File_TemporaryPath_IsPerProcess)
{
    const std::filesystem::path path = "out/state.bin";
    const std::string pid = std::to_string(native::processId());

    EXPECT_EQ(file::temporaryPath(path).string(), "out/state.bin." + pid + ".tmp");
    EXPECT_EQ(file::backupPath(path).string(), "out/state.bin." + pid + ".bak");
}
