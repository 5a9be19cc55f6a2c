// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_MESSAGE_HPP
#define WINDOWED_TFTP_MESSAGE_HPP
// ------------------------------------------------------------------------
#include "Errors.hpp"
#include "common.hpp"
#include "util.hpp"
#include <algorithm>
#include <concepts>
#include <cstring>
#include <string>
#include <vector>
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   struct MessageHeader {
      boost::asio::ip::udp::endpoint remote;
   };
   // ------------------------------------------------------------------------
   /// Raw datagram with network-order stream operators
   struct Message {
      MessageHeader header;
      std::vector<unsigned char> packet;
      /// Read position of the >> operators
      size_t offset = 0;

      Message() = default;
      Message(const unsigned char* bytes, size_t size) : packet(bytes, bytes + size) {}

      size_t size() const { return packet.size(); }
      size_t remaining() const { return packet.size() - offset; }

      /// Appends T in network byte order
      template<std::integral T>
      friend Message& operator<<(Message& msg, T data)
      {
         data = hton(data);
         const auto* bytes = reinterpret_cast<const unsigned char*>(&data);
         msg.packet.insert(msg.packet.end(), bytes, bytes + sizeof(data));
         return msg;
      }

      // Special overload for std::string (null terminated on the wire)
      friend Message& operator<<(Message& msg, const std::string& data)
      {
         msg.packet.insert(msg.packet.end(), data.begin(), data.end());
         msg.packet.push_back('\0');
         return msg;
      }

      // Special overload for std::vector<unsigned char>
      friend Message& operator<<(Message& msg, const std::vector<unsigned char>& chunk)
      {
         msg.packet.insert(msg.packet.end(), chunk.begin(), chunk.end());
         return msg;
      }
      // ------------------------------------------------------------------------
      /// Reads T in network byte order from the current position
      template<std::integral T>
      friend Message& operator>>(Message& msg, T& data)
      {
         if (msg.remaining() < sizeof(data)) {
            throw MalformedPacket("Packet too short");
         }
         std::memcpy(&data, &msg.packet[msg.offset], sizeof(data));
         data = ntoh(data);
         msg.offset += sizeof(data);
         return msg;
      }

      // Special overload for std::string
      friend Message& operator>>(Message& msg, std::string& data)
      {
         auto begin = msg.packet.begin() + msg.offset;
         auto end = std::find(begin, msg.packet.end(), '\0');
         if (end == msg.packet.end()) {
            throw MalformedPacket("Missing string terminator");
         }
         data.assign(begin, end);
         msg.offset += data.size() + 1;
         return msg;
      }

      // Special overload for std::vector<unsigned char>, consumes the rest of the packet
      friend Message& operator>>(Message& msg, std::vector<unsigned char>& chunk)
      {
         chunk.assign(msg.packet.begin() + msg.offset, msg.packet.end());
         msg.offset = msg.packet.size();
         return msg;
      }
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_MESSAGE_HPP
// ------------------------------------------------------------------------
