// ------------------------------------------------------------------------
#include "UdpSocket.hpp"
#include <gtest/gtest.h>
// ------------------------------------------------------------------------
using namespace wtftp;
// ------------------------------------------------------------------------
namespace
{
   ip::udp::endpoint loopback()
   {
      return {ip::make_address("127.0.0.1"), 0};
   }
}// namespace
// ------------------------------------------------------------------------
TEST(UdpSocketTest, ReceiveTimesOut)
{
   UdpSocket socket(loopback(), millis(20));
   socket.connect(ip::udp::endpoint(ip::make_address("127.0.0.1"), 9));

   const auto start = NOW;
   EXPECT_FALSE(socket.recv().has_value());
   EXPECT_GE(NOW - start, millis(15));
}
// ------------------------------------------------------------------------
TEST(UdpSocketTest, ConnectedSocketsExchangePackets)
{
   UdpSocket a(loopback(), millis(500));
   UdpSocket b(loopback(), millis(500));
   a.connect(b.local_endpoint());
   b.connect(a.local_endpoint());

   a.send(Data{3, {1, 2, 3}});
   auto packet = b.recv();
   ASSERT_TRUE(packet.has_value());
   EXPECT_EQ(*packet, (Packet{Data{3, {1, 2, 3}}}));

   b.send(Ack{3});
   packet = a.recv();
   ASSERT_TRUE(packet.has_value());
   EXPECT_EQ(*packet, Packet{Ack{3}});
}
// ------------------------------------------------------------------------
TEST(UdpSocketTest, ReceiveFromReportsSender)
{
   UdpSocket a(loopback(), millis(500));
   UdpSocket b(loopback(), millis(500));

   a.send_to(Ack{0}, b.local_endpoint());
   auto reply = b.receive_from();
   ASSERT_TRUE(reply.has_value());
   EXPECT_EQ(reply->first, Packet{Ack{0}});
   EXPECT_EQ(reply->second, a.local_endpoint());
}
// ------------------------------------------------------------------------
TEST(UdpSocketTest, OversizedDataIsDiscarded)
{
   UdpSocket a(loopback(), millis(200));
   UdpSocket b(loopback(), millis(200));
   a.connect(b.local_endpoint());
   b.connect(a.local_endpoint());

   a.send(Data{1, std::vector<unsigned char>(16, 0)});
   EXPECT_FALSE(b.recv_with_size(8).has_value());

   a.send(Data{1, std::vector<unsigned char>(8, 0)});
   EXPECT_TRUE(b.recv_with_size(8).has_value());
}
// ------------------------------------------------------------------------
TEST(UdpSocketTest, PacketLossDropsOutgoingPackets)
{
   UdpSocket a(loopback(), millis(100));
   UdpSocket b(loopback(), millis(100));
   a.connect(b.local_endpoint());
   b.connect(a.local_endpoint());
   a.set_packet_loss(PacketLoss(1, 1, 1));

   a.send(Ack{1});
   EXPECT_FALSE(b.recv().has_value());
}
// ------------------------------------------------------------------------
