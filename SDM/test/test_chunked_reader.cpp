#include "core/ChunkedReader.h"
#include "core/errors.h"
#include "FakeRemoteChannel.h"
#include <gtest/gtest.h>

class ChunkedReaderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        payload_ = makePayload(5 * 1024 * 1024 + 123);
        server_.files["/data/20250101.IPI"] = payload_;
        channel_ = std::make_unique<FakeRemoteChannel>(server_);
        ASSERT_TRUE(channel_->open());
    }

    std::string readAll(ChunkedReader& reader, std::vector<std::size_t>* sizes = nullptr)
    {
        std::string out;
        std::vector<char> chunk;
        while (reader.next(chunk)) {
            if (sizes)
                sizes->push_back(chunk.size());
            out.append(chunk.data(), chunk.size());
        }
        return out;
    }

    const std::string path_ = "/data/20250101.IPI";
    std::string payload_;
    FakeServer server_;
    std::unique_ptr<FakeRemoteChannel> channel_;
};

TEST_F(ChunkedReaderTest, ReadsFileInFixedSizeChunks)
{
    const std::size_t chunk = 2 * 1024 * 1024;
    ChunkedReader reader(*channel_, path_, 0, payload_.size(), chunk);

    std::vector<std::size_t> sizes;
    EXPECT_EQ(readAll(reader, &sizes), payload_);
    ASSERT_EQ(sizes.size(), 3u);
    EXPECT_EQ(sizes[0], chunk);
    EXPECT_EQ(sizes[1], chunk);
    EXPECT_EQ(sizes[2], payload_.size() - 2 * chunk);
    EXPECT_TRUE(reader.finished());
    EXPECT_EQ(reader.position(), payload_.size());
}

TEST_F(ChunkedReaderTest, StartsAtRequestedOffset)
{
    const std::uint64_t offset = 1000003;
    ChunkedReader reader(*channel_, path_, offset, payload_.size(), 512 * 1024);

    EXPECT_EQ(readAll(reader), payload_.substr(offset));
}

TEST_F(ChunkedReaderTest, NeverReadsPastKnownTotal)
{
    const std::uint64_t total = 3 * 1024 * 1024;
    ChunkedReader reader(*channel_, path_, 0, total, 2 * 1024 * 1024);

    std::string data = readAll(reader);
    EXPECT_EQ(data.size(), total);
    EXPECT_EQ(data, payload_.substr(0, total));
}

TEST_F(ChunkedReaderTest, ZeroByteReadEndsTheStream)
{
    server_.streamLimit = 1024 * 1024;
    ChunkedReader reader(*channel_, path_, 0, payload_.size(), 700 * 1024);

    std::string data = readAll(reader);
    EXPECT_EQ(data, payload_.substr(0, 1024 * 1024));
    EXPECT_TRUE(reader.finished());
    EXPECT_EQ(reader.position(), 1024u * 1024u);
}

TEST_F(ChunkedReaderTest, FailedReadThrowsAndReaderCannotBeReused)
{
    server_.failReadAt = 3 * 1024 * 1024;
    ChunkedReader reader(*channel_, path_, 0, payload_.size(), 2 * 1024 * 1024);

    std::vector<char> chunk;
    ASSERT_TRUE(reader.next(chunk));
    EXPECT_THROW(reader.next(chunk), TransferError);
    EXPECT_TRUE(chunk.empty());
    EXPECT_EQ(reader.position(), 2u * 1024u * 1024u);

    // the failure is sticky even though the fake would now serve data again
    EXPECT_THROW(reader.next(chunk), TransferError);
}

TEST_F(ChunkedReaderTest, RejectsZeroChunkSize)
{
    EXPECT_THROW(ChunkedReader(*channel_, path_, 0, payload_.size(), 0), TransferError);
}
