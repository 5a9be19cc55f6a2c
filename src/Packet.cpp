// ------------------------------------------------------------------------
#include "Packet.hpp"
#include <boost/algorithm/string.hpp>
#include <charconv>
// ------------------------------------------------------------------------
namespace wtftp
{
   namespace
   {
      // ------------------------------------------------------------------------
      void encode_options(Message& msg, const std::vector<TransferOption>& options)
      {
         for (const auto& option: options) {
            msg << option_name(option.type);
            msg << std::to_string(option.value);
         }
      }
      // ------------------------------------------------------------------------
      void encode_packet(Message& msg, const ReadRequest& rrq)
      {
         msg << static_cast<uint16_t>(Opcode::RRQ);
         msg << rrq.filename;
         msg << rrq.mode;
         encode_options(msg, rrq.options);
      }

      void encode_packet(Message& msg, const WriteRequest& wrq)
      {
         msg << static_cast<uint16_t>(Opcode::WRQ);
         msg << wrq.filename;
         msg << wrq.mode;
         encode_options(msg, wrq.options);
      }

      void encode_packet(Message& msg, const Data& data)
      {
         msg << static_cast<uint16_t>(Opcode::DATA);
         msg << data.blockNumber;
         msg << data.data;
      }

      void encode_packet(Message& msg, const Ack& ack)
      {
         msg << static_cast<uint16_t>(Opcode::ACK);
         msg << ack.blockNumber;
      }

      void encode_packet(Message& msg, const Error& error)
      {
         msg << static_cast<uint16_t>(Opcode::ERROR);
         msg << static_cast<uint16_t>(error.code);
         msg << error.message;
      }

      void encode_packet(Message& msg, const OptionAck& oack)
      {
         msg << static_cast<uint16_t>(Opcode::OACK);
         encode_options(msg, oack.options);
      }
      // ------------------------------------------------------------------------
      /// Unknown options and non-numeric values are dropped (RFC 2347)
      std::vector<TransferOption> decode_options(Message& msg)
      {
         std::vector<TransferOption> options;
         while (msg.remaining() > 0) {
            std::string name;
            std::string value;
            msg >> name;
            msg >> value;

            auto type = option_type(name);
            if (!type) {
               PLOG_VERBOSE << "[Packet] Ignoring unknown option " << name;
               continue;
            }

            uint64_t number = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), number);
            if (ec != std::errc() || end != value.data() + value.size() || value.empty()) {
               PLOG_VERBOSE << "[Packet] Ignoring option " << name << " with invalid value " << value;
               continue;
            }

            options.push_back({*type, number});
         }
         return options;
      }
      // ------------------------------------------------------------------------
      Request decode_request(Message& msg)
      {
         Request request;
         msg >> request.filename;
         msg >> request.mode;
         request.options = decode_options(msg);
         return request;
      }
   }// namespace
   // ------------------------------------------------------------------------
   std::string option_name(OptionType type)
   {
      switch (type) {
         case OptionType::BLOCK_SIZE:
            return "blksize";
         case OptionType::TRANSFER_SIZE:
            return "tsize";
         case OptionType::TIMEOUT:
            return "timeout";
         case OptionType::WINDOW_SIZE:
            return "windowsize";
      }
      return "";
   }
   // ------------------------------------------------------------------------
   std::optional<OptionType> option_type(const std::string& name)
   {
      auto lower = boost::algorithm::to_lower_copy(name);
      if (lower == "blksize") return OptionType::BLOCK_SIZE;
      if (lower == "tsize") return OptionType::TRANSFER_SIZE;
      if (lower == "timeout") return OptionType::TIMEOUT;
      if (lower == "windowsize") return OptionType::WINDOW_SIZE;
      return std::nullopt;
   }
   // ------------------------------------------------------------------------
   std::optional<uint64_t> find_option(const std::vector<TransferOption>& options, OptionType type)
   {
      for (const auto& option: options) {
         if (option.type == type) {
            return option.value;
         }
      }
      return std::nullopt;
   }
   // ------------------------------------------------------------------------
   Message encode(const Packet& packet)
   {
      Message msg;
      std::visit([&msg](const auto& p) { encode_packet(msg, p); }, packet);
      return msg;
   }
   // ------------------------------------------------------------------------
   Packet decode(Message& msg, const size_t maxPayload)
   {
      uint16_t opcode;
      msg >> opcode;

      switch (static_cast<Opcode>(opcode)) {
         case Opcode::RRQ:
            return ReadRequest{decode_request(msg)};
         case Opcode::WRQ:
            return WriteRequest{decode_request(msg)};
         case Opcode::DATA: {
            Data data;
            msg >> data.blockNumber;
            if (msg.remaining() > maxPayload) {
               throw MalformedPacket("Data payload of " + std::to_string(msg.remaining()) + " bytes exceeds block size " + std::to_string(maxPayload));
            }
            msg >> data.data;
            return data;
         }
         case Opcode::ACK: {
            Ack ack;
            msg >> ack.blockNumber;
            return ack;
         }
         case Opcode::ERROR: {
            uint16_t code;
            Error error;
            msg >> code;
            error.code = static_cast<ErrorCode>(code);
            // Some peers omit the message entirely
            if (msg.remaining() > 0) {
               msg >> error.message;
            }
            return error;
         }
         case Opcode::OACK:
            return OptionAck{decode_options(msg)};
      }

      throw MalformedPacket("Unknown opcode " + std::to_string(opcode));
   }
   // ------------------------------------------------------------------------
   Packet decode(const unsigned char* bytes, const size_t size, const size_t maxPayload)
   {
      Message msg(bytes, size);
      return decode(msg, maxPayload);
   }
   // ------------------------------------------------------------------------
   std::string describe(const Packet& packet)
   {
      if (auto* rrq = std::get_if<ReadRequest>(&packet)) return "RRQ " + rrq->filename;
      if (auto* wrq = std::get_if<WriteRequest>(&packet)) return "WRQ " + wrq->filename;
      if (auto* data = std::get_if<Data>(&packet)) return "DATA " + std::to_string(data->blockNumber) + " (" + std::to_string(data->data.size()) + "B)";
      if (auto* ack = std::get_if<Ack>(&packet)) return "ACK " + std::to_string(ack->blockNumber);
      if (auto* error = std::get_if<Error>(&packet)) return "ERROR " + std::to_string(static_cast<uint16_t>(error->code)) + ": " + error->message;
      return "OACK";
   }
}// namespace wtftp
// ------------------------------------------------------------------------
