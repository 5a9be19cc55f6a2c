// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_UDPSOCKET_HPP
#define WINDOWED_TFTP_UDPSOCKET_HPP
// ------------------------------------------------------------------------
#include "Socket.hpp"
#include "Timer.hpp"
#include "common.hpp"
#include "util.hpp"
#include <optional>
#include <utility>
#include <vector>
// ------------------------------------------------------------------------
namespace wtftp
{
   /// UDP socket with its own io_context, so that every transfer can block on it independently.
   /// Receives are bounded by the read timeout, the timer cancels a receive that takes longer.
   class UdpSocket : public Socket
   {
      boost::asio::io_context io_context;
      boost::asio::ip::udp::socket socket;
      Timer timer;
      boost::asio::ip::udp::endpoint remote;
      timeunit readTimeout;
      std::optional<PacketLoss> packetLoss;
      std::vector<unsigned char> receiveBuffer;

      std::optional<size_t> receive_datagram(boost::asio::ip::udp::endpoint* sender);
      bool should_drop(const Packet& packet);

    public:
      explicit UdpSocket(const boost::asio::ip::udp::endpoint& local, timeunit readTimeout = DEFAULT_TIMEOUT);
      UdpSocket(const UdpSocket& other) = delete;
      UdpSocket(const UdpSocket&& other) = delete;

      /// Restricts the socket to a single peer (the transfer ID of RFC 1350)
      void connect(const boost::asio::ip::udp::endpoint& peer);
      void set_read_timeout(timeunit timeout) { readTimeout = timeout; }
      void set_packet_loss(PacketLoss loss) { packetLoss = loss; }
      boost::asio::ip::udp::endpoint local_endpoint() const { return socket.local_endpoint(); }

      // Unconnected use, needed before the peer's transfer ID is known
      void send_to(const Packet& packet, const boost::asio::ip::udp::endpoint& destination);
      std::optional<std::pair<Packet, boost::asio::ip::udp::endpoint>> receive_from(size_t maxPayload = MAX_BLOCK_SIZE);

      void send(const Packet& packet) override;
      std::optional<Packet> recv() override;
      std::optional<Packet> recv_with_size(size_t maxPayload) override;
      boost::asio::ip::udp::endpoint remote_endpoint() const override { return remote; }
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_UDPSOCKET_HPP
// ------------------------------------------------------------------------
