// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_PACKET_HPP
#define WINDOWED_TFTP_PACKET_HPP
// ------------------------------------------------------------------------
#include "Errors.hpp"
#include "Message.hpp"
#include "common.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   enum class Opcode : uint16_t
   {
      RRQ = 1,
      WRQ = 2,
      DATA = 3,
      ACK = 4,
      ERROR = 5,
      // RFC 2347
      OACK = 6
   };
   // ------------------------------------------------------------------------
   enum class OptionType
   {
      BLOCK_SIZE,   // blksize, RFC 2348
      TRANSFER_SIZE,// tsize, RFC 2349
      TIMEOUT,      // timeout, RFC 2349
      WINDOW_SIZE   // windowsize, RFC 7440
   };
   // ------------------------------------------------------------------------
   struct TransferOption {
      OptionType type;
      uint64_t value;

      bool operator==(const TransferOption& other) const = default;
   };

   std::string option_name(OptionType type);
   std::optional<OptionType> option_type(const std::string& name);
   std::optional<uint64_t> find_option(const std::vector<TransferOption>& options, OptionType type);
   // ------------------------------------------------------------------------
   struct Request {
      std::string filename;
      std::string mode = "octet";
      std::vector<TransferOption> options;

      bool operator==(const Request& other) const = default;
   };

   struct ReadRequest : Request {
   };

   struct WriteRequest : Request {
   };

   struct Data {
      BlockNumber blockNumber = 0;
      std::vector<unsigned char> data;

      bool operator==(const Data& other) const = default;
   };

   struct Ack {
      BlockNumber blockNumber = 0;

      bool operator==(const Ack& other) const = default;
   };

   struct Error {
      ErrorCode code = ErrorCode::NOT_DEFINED;
      std::string message;

      bool operator==(const Error& other) const = default;
   };

   struct OptionAck {
      std::vector<TransferOption> options;

      bool operator==(const OptionAck& other) const = default;
   };

   using Packet = std::variant<ReadRequest, WriteRequest, Data, Ack, Error, OptionAck>;
   // ------------------------------------------------------------------------
   Message encode(const Packet& packet);

   /// Throws MalformedPacket. Data payloads larger than maxPayload are rejected.
   Packet decode(Message& msg, size_t maxPayload = MAX_BLOCK_SIZE);
   Packet decode(const unsigned char* bytes, size_t size, size_t maxPayload = MAX_BLOCK_SIZE);

   /// Short description for log output
   std::string describe(const Packet& packet);
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_PACKET_HPP
// ------------------------------------------------------------------------
