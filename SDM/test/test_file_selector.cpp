#include "core/FileSelector.h"
#include "core/errors.h"
#include "FakeRemoteChannel.h"
#include <gtest/gtest.h>

namespace {
std::vector<std::string> names(const std::vector<RemoteFileDescriptor>& files)
{
    std::vector<std::string> out;
    for (const auto& f : files)
        out.push_back(f.name);
    return out;
}
}

class FileSelectorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        channel_ = std::make_unique<FakeRemoteChannel>(server_);
        ASSERT_TRUE(channel_->open());
    }

    FakeServer server_;
    std::unique_ptr<FakeRemoteChannel> channel_;
};

TEST(DateTokenTest, ExtractsExactlyEightDigits)
{
    EXPECT_EQ(FileSelector::extractDateToken("20250102.IPI").value_or(""), "20250102");
    EXPECT_EQ(FileSelector::extractDateToken("IPI_2025-01-02.dat").value_or(""), "20250102");
    EXPECT_FALSE(FileSelector::extractDateToken("bad.IPI"));
    EXPECT_FALSE(FileSelector::extractDateToken("2025010.IPI"));
    EXPECT_FALSE(FileSelector::extractDateToken("202501021.IPI"));
}

TEST(SelectionTest, PicksNextFileAfterLastRecorded)
{
    std::vector<RemoteFileDescriptor> candidates = {
        { "20250101.IPI", "20250101" },
        { "20250102.IPI", "20250102" },
    };

    auto selected = FileSelector::select(candidates, std::string("20250101.IPI"));
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected->name, "20250102.IPI");
}

TEST(SelectionTest, PicksEarliestWithoutRecord)
{
    std::vector<RemoteFileDescriptor> candidates = {
        { "20250103.IPI", "20250103" },
        { "20250101.IPI", "20250101" },
    };

    auto selected = FileSelector::select(candidates, std::nullopt);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected->name, "20250101.IPI");
}

TEST(SelectionTest, SkipsEverythingUpToTheRecord)
{
    std::vector<RemoteFileDescriptor> candidates = {
        { "20250101.IPI", "20250101" },
        { "20250104.IPI", "20250104" },
        { "20250102.IPI", "20250102" },
        { "20250103.IPI", "20250103" },
    };

    auto selected = FileSelector::select(candidates, std::string("20250102.IPI"));
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected->name, "20250103.IPI");
}

TEST(SelectionTest, NothingNewerThanRecord)
{
    std::vector<RemoteFileDescriptor> candidates = {
        { "20250101.IPI", "20250101" },
        { "20250102.IPI", "20250102" },
    };

    EXPECT_FALSE(FileSelector::select(candidates, std::string("20250102.IPI")));
    EXPECT_FALSE(FileSelector::select({}, std::nullopt));
}

TEST(SelectionTest, EqualDatesResolveToSmallestName)
{
    std::vector<RemoteFileDescriptor> candidates = {
        { "IPI_20250105_b.dat", "20250105" },
        { "IPI_20250105_a.dat", "20250105" },
    };

    auto selected = FileSelector::select(candidates, std::nullopt);
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected->name, "IPI_20250105_a.dat");
}

TEST(SelectionTest, RecordWithoutDigitsBehavesLikeNoRecord)
{
    std::vector<RemoteFileDescriptor> candidates = {
        { "20250102.IPI", "20250102" },
        { "20250101.IPI", "20250101" },
    };

    auto selected = FileSelector::select(candidates, std::string("none.IPI"));
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected->name, "20250101.IPI");
}

TEST_F(FileSelectorTest, ListingKeepsMarkedDatedFilesOnly)
{
    server_.listings["/data"] = {
        "20250101.IPI", "20250102.IPI", "bad.IPI", "20250103.ipi", "20250104.csv", "IPI-20250105-final"
    };

    FileSelector selector(*channel_, "/data", "IPI");
    auto candidates = selector.listCandidates();

    ASSERT_EQ(names(candidates), (std::vector<std::string>{ "20250101.IPI", "20250102.IPI", "IPI-20250105-final" }));
    EXPECT_EQ(candidates[2].dateToken, "20250105");

    auto selected = FileSelector::select(candidates, std::string("20250101.IPI"));
    ASSERT_TRUE(selected);
    EXPECT_EQ(selected->name, "20250102.IPI");
}

TEST_F(FileSelectorTest, EmptyDirectoryGivesNoCandidates)
{
    server_.listings["/data"] = {};

    FileSelector selector(*channel_, "/data", "IPI");
    EXPECT_TRUE(selector.listCandidates().empty());
}

TEST_F(FileSelectorTest, ListingFailureIsTransferError)
{
    server_.listings["/data"] = { "20250101.IPI" };
    server_.failList = true;

    FileSelector selector(*channel_, "/data", "IPI");
    EXPECT_THROW(selector.listCandidates(), TransferError);
}
