// ------------------------------------------------------------------------
#include "Packet.hpp"
#include <gtest/gtest.h>
// ------------------------------------------------------------------------
using namespace wtftp;
// ------------------------------------------------------------------------
namespace
{
   Packet decode_bytes(const std::vector<unsigned char>& bytes, size_t maxPayload = MAX_BLOCK_SIZE)
   {
      return decode(bytes.data(), bytes.size(), maxPayload);
   }

   std::vector<unsigned char> bytes_of(const std::string& text)
   {
      return {text.begin(), text.end()};
   }
}// namespace
// ------------------------------------------------------------------------
TEST(PacketTest, EncodesReadRequestWithOptions)
{
   ReadRequest rrq;
   rrq.filename = "a.bin";
   rrq.options = {{OptionType::BLOCK_SIZE, 1024}, {OptionType::WINDOW_SIZE, 8}};

   auto msg = encode(rrq);
   std::vector<unsigned char> expected = {0, 1};
   auto text = bytes_of(std::string("a.bin\0octet\0blksize\0" "1024\0windowsize\0" "8\0", 38));
   expected.insert(expected.end(), text.begin(), text.end());
   EXPECT_EQ(msg.packet, expected);
}
// ------------------------------------------------------------------------
TEST(PacketTest, EncodesDataAndAckInNetworkOrder)
{
   EXPECT_EQ(encode(Data{0x0102, {0xAA, 0xBB}}).packet, (std::vector<unsigned char>{0, 3, 1, 2, 0xAA, 0xBB}));
   EXPECT_EQ(encode(Ack{65535}).packet, (std::vector<unsigned char>{0, 4, 0xFF, 0xFF}));
   EXPECT_EQ(encode(Error{ErrorCode::DISK_FULL, "x"}).packet, (std::vector<unsigned char>{0, 5, 0, 3, 'x', 0}));
}
// ------------------------------------------------------------------------
TEST(PacketTest, DecodesWriteRequest)
{
   std::vector<unsigned char> bytes = {0, 2};
   auto text = bytes_of(std::string("dir/f\0OCTET\0TSize\0" "77\0", 21));
   bytes.insert(bytes.end(), text.begin(), text.end());

   auto packet = decode_bytes(bytes);
   auto* wrq = std::get_if<WriteRequest>(&packet);
   ASSERT_NE(wrq, nullptr);
   EXPECT_EQ(wrq->filename, "dir/f");
   EXPECT_EQ(wrq->mode, "OCTET");
   ASSERT_EQ(wrq->options.size(), 1u);
   EXPECT_EQ(wrq->options[0], (TransferOption{OptionType::TRANSFER_SIZE, 77}));
}
// ------------------------------------------------------------------------
TEST(PacketTest, DropsUnknownAndInvalidOptions)
{
   std::vector<unsigned char> bytes = {0, 6};
   auto text = bytes_of(std::string("multicast\0\0blksize\0" "abc\0windowsize\0" "4\0", 36));
   bytes.insert(bytes.end(), text.begin(), text.end());

   auto packet = decode_bytes(bytes);
   auto* oack = std::get_if<OptionAck>(&packet);
   ASSERT_NE(oack, nullptr);
   ASSERT_EQ(oack->options.size(), 1u);
   EXPECT_EQ(oack->options[0], (TransferOption{OptionType::WINDOW_SIZE, 4}));
}
// ------------------------------------------------------------------------
TEST(PacketTest, DecodesEmptyDataBlock)
{
   auto packet = decode_bytes({0, 3, 0, 7});
   auto* data = std::get_if<Data>(&packet);
   ASSERT_NE(data, nullptr);
   EXPECT_EQ(data->blockNumber, 7);
   EXPECT_TRUE(data->data.empty());
}
// ------------------------------------------------------------------------
TEST(PacketTest, RejectsDataLargerThanBlockSize)
{
   std::vector<unsigned char> bytes = {0, 3, 0, 1};
   bytes.resize(bytes.size() + 9, 0x55);

   EXPECT_THROW(decode_bytes(bytes, 8), MalformedPacket);
   EXPECT_NO_THROW(decode_bytes(bytes, 9));
}
// ------------------------------------------------------------------------
TEST(PacketTest, ErrorMessageMayBeMissing)
{
   auto packet = decode_bytes({0, 5, 0, 1});
   auto* error = std::get_if<Error>(&packet);
   ASSERT_NE(error, nullptr);
   EXPECT_EQ(error->code, ErrorCode::FILE_NOT_FOUND);
   EXPECT_TRUE(error->message.empty());
}
// ------------------------------------------------------------------------
TEST(PacketTest, RejectsMalformedDatagrams)
{
   EXPECT_THROW(decode_bytes({}), MalformedPacket);
   EXPECT_THROW(decode_bytes({0}), MalformedPacket);
   EXPECT_THROW(decode_bytes({0, 4, 1}), MalformedPacket);
   EXPECT_THROW(decode_bytes({0, 9, 0, 1}), MalformedPacket);
   EXPECT_THROW(decode_bytes({0, 1, 'f', 'i', 'l', 'e'}), MalformedPacket);
   EXPECT_THROW(decode_bytes({0, 5, 0, 1, 'n', 'o'}), MalformedPacket);
}
// ------------------------------------------------------------------------
TEST(PacketTest, OptionNamesAreCaseInsensitive)
{
   EXPECT_EQ(option_type("BlkSize"), OptionType::BLOCK_SIZE);
   EXPECT_EQ(option_type("WINDOWSIZE"), OptionType::WINDOW_SIZE);
   EXPECT_EQ(option_type("timeout"), OptionType::TIMEOUT);
   EXPECT_FALSE(option_type("blocksize").has_value());
   EXPECT_EQ(option_name(OptionType::TRANSFER_SIZE), "tsize");
}
// ------------------------------------------------------------------------
TEST(PacketTest, FindOptionReturnsFirstMatch)
{
   std::vector<TransferOption> options = {{OptionType::TIMEOUT, 3}, {OptionType::TIMEOUT, 9}};
   EXPECT_EQ(find_option(options, OptionType::TIMEOUT), 3u);
   EXPECT_FALSE(find_option(options, OptionType::BLOCK_SIZE).has_value());
}
// ------------------------------------------------------------------------
TEST(PacketTest, DescribesPacketsForLogs)
{
   EXPECT_EQ(describe(Data{5, {1, 2, 3}}), "DATA 5 (3B)");
   EXPECT_EQ(describe(Ack{0}), "ACK 0");
   EXPECT_EQ(describe(Error{ErrorCode::FILE_EXISTS, "exists"}), "ERROR 6: exists");
}
// ------------------------------------------------------------------------
