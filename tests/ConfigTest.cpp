// ------------------------------------------------------------------------
#include "Config.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
// ------------------------------------------------------------------------
using namespace wtftp;
// ------------------------------------------------------------------------
namespace
{
   Config parse(std::vector<const char*> args)
   {
      args.insert(args.begin(), "wtftp");
      return parse_args(static_cast<int>(args.size()), args.data());
   }
}// namespace
// ------------------------------------------------------------------------
TEST(ConfigTest, ServerDefaults)
{
   auto config = parse({"-s"});

   EXPECT_TRUE(config.isServer);
   EXPECT_FALSE(config.isClient);
   EXPECT_EQ(config.port, DEFAULT_PORT);
   EXPECT_EQ(config.address, ip::make_address("127.0.0.1"));
   EXPECT_EQ(config.sendDirectory, std::filesystem::path("."));
   EXPECT_EQ(config.receiveDirectory, std::filesystem::path("."));
   EXPECT_EQ(config.transfer.timeout, DEFAULT_TIMEOUT);
   EXPECT_EQ(config.transfer.blockSize, DEFAULT_BLOCK_SIZE);
   EXPECT_EQ(config.transfer.windowSize, DEFAULT_WINDOW_SIZE);
   EXPECT_EQ(config.transfer.duplicatePackets, 0);
   EXPECT_EQ(config.p, 0);
   EXPECT_EQ(config.q, 1);
}
// ------------------------------------------------------------------------
TEST(ConfigTest, ServerOptions)
{
   auto config = parse({"-s", "-t", "6969", "--ip", "0.0.0.0", "-d", "/srv/tftp", "--receive-directory", "/srv/in", "--read-only", "--overwrite"});

   EXPECT_EQ(config.port, 6969);
   EXPECT_EQ(config.address, ip::make_address("0.0.0.0"));
   EXPECT_EQ(config.sendDirectory, std::filesystem::path("/srv/tftp"));
   EXPECT_EQ(config.receiveDirectory, std::filesystem::path("/srv/in"));
   EXPECT_TRUE(config.readOnly);
   EXPECT_TRUE(config.overwrite);
}
// ------------------------------------------------------------------------
TEST(ConfigTest, ClientOptions)
{
   auto config = parse({"tftp.example.org", "a.bin", "b.bin", "--put", "--blksize", "1428", "--windowsize", "16", "--timeout", "250", "--duplicate-packets", "1", "-v"});

   EXPECT_TRUE(config.isClient);
   EXPECT_EQ(config.host, "tftp.example.org");
   EXPECT_EQ(config.files, (std::vector<std::string>{"a.bin", "b.bin"}));
   EXPECT_TRUE(config.put);
   EXPECT_TRUE(config.verbose);
   EXPECT_EQ(config.transfer.blockSize, 1428u);
   EXPECT_EQ(config.transfer.windowSize, 16);
   EXPECT_EQ(config.transfer.timeout, millis(250));
   EXPECT_EQ(config.transfer.duplicatePackets, 1);
}
// ------------------------------------------------------------------------
TEST(ConfigTest, SingleLossProbabilityAppliesToBoth)
{
   auto config = parse({"-s", "-p", "0.2"});
   EXPECT_DOUBLE_EQ(config.p, 0.2);
   EXPECT_DOUBLE_EQ(config.q, 0.2);

   config = parse({"-s", "-p", "0.1", "-q", "0.5"});
   EXPECT_DOUBLE_EQ(config.p, 0.1);
   EXPECT_DOUBLE_EQ(config.q, 0.5);
}
// ------------------------------------------------------------------------
TEST(ConfigTest, HelpCarriesUsage)
{
   auto config = parse({"--help"});
   EXPECT_TRUE(config.showHelp);
   EXPECT_NE(config.usage.find("windowsize"), std::string::npos);
}
// ------------------------------------------------------------------------
TEST(ConfigTest, RejectsContradictions)
{
   EXPECT_THROW(parse({"-s", "host"}), std::logic_error);
   EXPECT_THROW(parse({"host"}), std::logic_error);
   EXPECT_THROW(parse({"-s", "--timeout", "0"}), std::logic_error);
   EXPECT_THROW(parse({"host", "f", "--blksize", "7"}), std::logic_error);
   EXPECT_THROW(parse({"host", "f", "--blksize", "65465"}), std::logic_error);
   EXPECT_THROW(parse({"host", "f", "--windowsize", "0"}), std::logic_error);
   EXPECT_THROW(parse({"host", "f", "--windowsize", "65536"}), std::logic_error);
   EXPECT_THROW(parse({"host", "f", "--duplicate-packets", "256"}), std::logic_error);
   EXPECT_THROW(parse({"-s", "-p", "1.5"}), std::logic_error);
}
// ------------------------------------------------------------------------
