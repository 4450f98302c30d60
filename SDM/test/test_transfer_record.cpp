#include "io/TransferRecord.h"
#include "TempDir.h"
#include <gtest/gtest.h>

class TransferRecordTest : public ::testing::Test {
protected:
    TempDir tmp_;
};

TEST_F(TransferRecordTest, MissingFileMeansNoRecord)
{
    TransferRecord record(tmp_.file("last_file.txt"));
    EXPECT_FALSE(record.exists());
    EXPECT_FALSE(record.load());
}

TEST_F(TransferRecordTest, BlankFileMeansNoRecord)
{
    writeFile(tmp_.file("last_file.txt"), "  \n");
    TransferRecord record(tmp_.file("last_file.txt"));
    EXPECT_TRUE(record.exists());
    EXPECT_FALSE(record.load());
}

TEST_F(TransferRecordTest, LoadTrimsWhitespace)
{
    writeFile(tmp_.file("last_file.txt"), "  20250101.IPI \r\n");
    TransferRecord record(tmp_.file("last_file.txt"));
    EXPECT_EQ(record.load().value_or(""), "20250101.IPI");
}

TEST_F(TransferRecordTest, SaveReplacesPreviousRecord)
{
    TransferRecord record(tmp_.file("state/last_file.txt"));
    ASSERT_TRUE(record.save("20250101.IPI")) << record.lastError();
    ASSERT_TRUE(record.save("20250102.IPI")) << record.lastError();

    EXPECT_EQ(readFile(tmp_.file("state/last_file.txt")), "20250102.IPI");
    EXPECT_EQ(record.load().value_or(""), "20250102.IPI");
    EXPECT_FALSE(std::filesystem::exists(tmp_.file("state/last_file.txt.tmp")));
}

TEST_F(TransferRecordTest, UnwritableLocationReportsError)
{
    writeFile(tmp_.file("blocker"), "not a directory");
    TransferRecord record(tmp_.file("blocker/last_file.txt"));

    EXPECT_FALSE(record.save("20250101.IPI"));
    EXPECT_FALSE(record.lastError().empty());
}
