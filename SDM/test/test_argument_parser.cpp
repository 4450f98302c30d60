#include "cli/ArgumentParser.h"
#include "TempDir.h"
#include <gtest/gtest.h>

using namespace std::chrono_literals;

class ArgumentParserTest : public ::testing::Test {
protected:
    bool parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "sdm");
        std::vector<char*> argv;
        for (auto& a : args)
            argv.push_back(&a[0]);
        return parser_.parse(static_cast<int>(argv.size()), argv.data(), cfg_);
    }

    std::vector<std::string> required()
    {
        return { "-h", "sftp.example.net", "-u", "ops", "-r", "/data", "-l", tmp_.file("in"), "-s", tmp_.file("last.txt") };
    }

    TempDir tmp_;
    ArgumentParser parser_;
    SessionConfig cfg_;
};

TEST_F(ArgumentParserTest, AppliesFlagsOverDefaults)
{
    auto args = required();
    args.insert(args.end(), { "-p", "2222", "-w", "s3cret", "-d", "/srv/in", "-c", "1048576", "-a", "3", "-b", "2,4,8", "-k", "20", "-v" });

    ASSERT_TRUE(parse(args)) << parser_.error();
    EXPECT_EQ(cfg_.host, "sftp.example.net");
    EXPECT_EQ(cfg_.port, 2222);
    EXPECT_EQ(cfg_.username, "ops");
    EXPECT_EQ(cfg_.password, "s3cret");
    EXPECT_EQ(cfg_.remoteDir, "/data");
    EXPECT_EQ(cfg_.distributionDir, "/srv/in");
    EXPECT_EQ(cfg_.chunkSize, 1048576u);
    EXPECT_EQ(cfg_.maxAttempts, 3u);
    EXPECT_EQ(cfg_.backoff, (std::vector<std::chrono::seconds>{ 2s, 4s, 8s }));
    EXPECT_EQ(cfg_.keepaliveInterval, 20s);
    EXPECT_TRUE(cfg_.verbose);
}

TEST_F(ArgumentParserTest, KeepsDefaultsWhenNotGiven)
{
    ASSERT_TRUE(parse(required())) << parser_.error();
    EXPECT_EQ(cfg_.port, 22);
    EXPECT_EQ(cfg_.fileMarker, "IPI");
    EXPECT_EQ(cfg_.chunkSize, 2u * 1024u * 1024u);
    EXPECT_EQ(cfg_.maxAttempts, 7u);
    EXPECT_EQ(cfg_.backoff.size(), 7u);
    EXPECT_EQ(cfg_.keepaliveInterval, 15s);
    EXPECT_FALSE(cfg_.verbose);
}

TEST_F(ArgumentParserTest, ReadsConfigFileAndFlagsOverrideIt)
{
    const std::string path = tmp_.file("sdm.env");
    writeFile(path,
        "# connection\n"
        "SFTP_HOST=files.example.org\n"
        "export SFTP_USER=\"ingest\"\n"
        "SFTP_PASS='p=ss word'\n"
        "SFTP_DIR=/outbound\n"
        "\n"
        "LOCAL_DIR=/var/spool/in\n"
        "LAST_FILE_RECORD=/var/lib/sdm/last.txt\n"
        "SFTP_PORT=2200\n");

    ASSERT_TRUE(parse({ "--config", path, "-h", "override.example.org" })) << parser_.error();
    EXPECT_EQ(cfg_.host, "override.example.org");
    EXPECT_EQ(cfg_.username, "ingest");
    EXPECT_EQ(cfg_.password, "p=ss word");
    EXPECT_EQ(cfg_.remoteDir, "/outbound");
    EXPECT_EQ(cfg_.localDir, "/var/spool/in");
    EXPECT_EQ(cfg_.recordPath, "/var/lib/sdm/last.txt");
    EXPECT_EQ(cfg_.port, 2200);
}

TEST_F(ArgumentParserTest, RejectsMalformedConfigLine)
{
    const std::string path = tmp_.file("sdm.env");
    writeFile(path, "SFTP_HOST\n");

    EXPECT_FALSE(parse({ "--config", path }));
    EXPECT_NE(parser_.error().find("KEY=VALUE"), std::string::npos);
}

TEST_F(ArgumentParserTest, RejectsMissingConfigFile)
{
    EXPECT_FALSE(parse({ "--config", tmp_.file("absent.env") }));
}

TEST_F(ArgumentParserTest, RequiresHost)
{
    EXPECT_FALSE(parse({ "-u", "ops", "-r", "/data", "-l", "/in", "-s", "/last.txt" }));
    EXPECT_EQ(parser_.error(), "host is required");
}

TEST_F(ArgumentParserTest, RejectsUnknownOption)
{
    auto args = required();
    args.push_back("--turbo");
    EXPECT_FALSE(parse(args));
}

TEST_F(ArgumentParserTest, RejectsBadNumbers)
{
    auto args = required();
    args.insert(args.end(), { "-p", "70000" });
    EXPECT_FALSE(parse(args));

    args = required();
    args.insert(args.end(), { "-c", "0" });
    EXPECT_FALSE(parse(args));

    args = required();
    args.insert(args.end(), { "-a", "two" });
    EXPECT_FALSE(parse(args));
}

TEST_F(ArgumentParserTest, BackoffMustIncrease)
{
    auto args = required();
    args.insert(args.end(), { "-b", "5,5,10" });
    EXPECT_FALSE(parse(args));
    EXPECT_EQ(parser_.error(), "backoff schedule must be strictly increasing");
}

TEST_F(ArgumentParserTest, KeepaliveIntervalIsBounded)
{
    auto args = required();
    args.insert(args.end(), { "-k", "3600" });
    ASSERT_TRUE(parse(args)) << parser_.error();
    EXPECT_EQ(cfg_.keepaliveInterval, 3600s);

    args = required();
    args.insert(args.end(), { "-k", "3601" });
    EXPECT_FALSE(parse(args));

    args = required();
    args.insert(args.end(), { "-k", "18446744073709551615" });
    EXPECT_FALSE(parse(args));

    args = required();
    args.insert(args.end(), { "-k", "0" });
    EXPECT_FALSE(parse(args));
}
