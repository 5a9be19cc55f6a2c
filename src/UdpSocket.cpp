// ------------------------------------------------------------------------
#include "UdpSocket.hpp"
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   UdpSocket::UdpSocket(const ip::udp::endpoint& local, const timeunit readTimeout)
       : socket(io_context, local), timer(io_context), readTimeout(readTimeout), receiveBuffer(MAX_PACKET_SIZE) {}
   // ------------------------------------------------------------------------
   void UdpSocket::connect(const ip::udp::endpoint& peer)
   {
      socket.connect(peer);
      remote = peer;
   }
   // ------------------------------------------------------------------------
   bool UdpSocket::should_drop(const Packet& packet)
   {
      if (packetLoss && packetLoss->is_lost()) {
         PLOG_VERBOSE << "[Socket] Simulated loss of " << describe(packet);
         return true;
      }
      return false;
   }
   // ------------------------------------------------------------------------
   void UdpSocket::send_to(const Packet& packet, const ip::udp::endpoint& destination)
   {
      if (should_drop(packet)) return;

      auto msg = encode(packet);
      socket.send_to(buffer(msg.packet), destination);
   }
   // ------------------------------------------------------------------------
   void UdpSocket::send(const Packet& packet)
   {
      if (should_drop(packet)) return;

      auto msg = encode(packet);
      socket.send(buffer(msg.packet));
   }
   // ------------------------------------------------------------------------
   std::optional<size_t> UdpSocket::receive_datagram(ip::udp::endpoint* sender)
   {
      boost::system::error_code error = boost::asio::error::would_block;
      size_t bytesTransferred = 0;
      auto handle_receive = [this, &error, &bytesTransferred](const boost::system::error_code& ec, size_t n) {
         error = ec;
         bytesTransferred = n;
         timer.cancel();
      };

      if (sender) {
         socket.async_receive_from(buffer(receiveBuffer), *sender, handle_receive);
      } else {
         socket.async_receive(buffer(receiveBuffer), handle_receive);
      }
      timer.setTimeout(readTimeout, [this](const boost::system::error_code& ec) {
         if (!ec) {
            socket.cancel();
         }
      });

      // Returns once the receive and the timer have both completed
      io_context.restart();
      io_context.run();

      if (error == boost::asio::error::operation_aborted) {
         PLOG_VERBOSE << "[Socket] Receive timed out after " << readTimeout.count() << "ms";
         return std::nullopt;
      }
      if (error) {
         PLOG_WARNING << "[Socket] Error on Receive: " + error.message();
         return std::nullopt;
      }
      return bytesTransferred;
   }
   // ------------------------------------------------------------------------
   std::optional<std::pair<Packet, ip::udp::endpoint>> UdpSocket::receive_from(const size_t maxPayload)
   {
      ip::udp::endpoint sender;
      auto bytesTransferred = receive_datagram(&sender);
      if (!bytesTransferred) {
         return std::nullopt;
      }

      try {
         return std::make_pair(decode(receiveBuffer.data(), *bytesTransferred, maxPayload), sender);
      } catch (const MalformedPacket& e) {
         PLOG_WARNING << "[Socket] Malformed packet from " << sender << ": " << e.what();
         return std::nullopt;
      }
   }
   // ------------------------------------------------------------------------
   std::optional<Packet> UdpSocket::recv()
   {
      return recv_with_size(MAX_BLOCK_SIZE);
   }
   // ------------------------------------------------------------------------
   std::optional<Packet> UdpSocket::recv_with_size(const size_t maxPayload)
   {
      auto bytesTransferred = receive_datagram(nullptr);
      if (!bytesTransferred) {
         return std::nullopt;
      }

      try {
         return decode(receiveBuffer.data(), *bytesTransferred, maxPayload);
      } catch (const MalformedPacket& e) {
         PLOG_WARNING << "[Socket] Malformed packet from " << remote << ": " << e.what();
         return std::nullopt;
      }
   }
   // ------------------------------------------------------------------------
}// namespace wtftp
// ------------------------------------------------------------------------
