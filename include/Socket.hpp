// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_SOCKET_HPP
#define WINDOWED_TFTP_SOCKET_HPP
// ------------------------------------------------------------------------
#include "Packet.hpp"
#include "common.hpp"
#include <optional>
// ------------------------------------------------------------------------
namespace wtftp
{
   /// Endpoint connected to a single peer for the lifetime of one transfer
   class Socket
   {
    public:
      virtual ~Socket() = default;

      /// Throws boost::system::system_error
      virtual void send(const Packet& packet) = 0;

      /// Nothing if no valid packet arrived within the read timeout
      virtual std::optional<Packet> recv() = 0;

      /// Like recv(), but Data packets with more than maxPayload bytes are rejected
      virtual std::optional<Packet> recv_with_size(size_t maxPayload) = 0;

      virtual ip::udp::endpoint remote_endpoint() const = 0;
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_SOCKET_HPP
// ------------------------------------------------------------------------
