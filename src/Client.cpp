// ------------------------------------------------------------------------
#include "Client.hpp"
#include "util.hpp"
#include <algorithm>
#include <future>
// ------------------------------------------------------------------------
namespace wtftp
{
   namespace
   {
      // ------------------------------------------------------------------------
      bool await_transfers(std::vector<std::pair<std::string, std::future<void>>>& transfers)
      {
         bool success = true;
         for (auto& [filename, transfer]: transfers) {
            try {
               transfer.get();
               PLOG_INFO << "[Client] Transferred file " << filename << " successfully";
            } catch (const std::exception& e) {
               PLOG_ERROR << "[Client] File " << filename << " was not transferred: " << e.what();
               success = false;
            }
         }
         return success;
      }
   }// namespace
   // ------------------------------------------------------------------------
   Client::Client(std::string host, const uint16_t port, TransferParameters params, const double p, const double q)
       : host(std::move(host)), port(port), params(params), p(p), q(q)
   {
      resolve_server();
   }
   // ------------------------------------------------------------------------
   void Client::resolve_server()
   {
      try {
         ip::udp::resolver resolver(io_context);
         server_endpoint = *resolver.resolve(ip::udp::v4(), host, std::to_string(port)).begin();

         PLOG_INFO << "[Client] Resolved server at " + server_endpoint.address().to_string() + ":" + std::to_string(server_endpoint.port());
      } catch (const std::exception& e) {
         PLOG_ERROR << "[Client] Error while trying to resolve server " << host << ": " << e.what();
         throw;
      }
   }
   // ------------------------------------------------------------------------
   bool Client::get_files(const std::vector<std::string>& files, const std::filesystem::path& dest)
   {
      std::vector<std::pair<std::string, std::future<void>>> transfers;
      for (const auto& file: files) {
         transfers.emplace_back(file, std::async(std::launch::async, [this, file, dest]() { get(file, dest); }));
      }
      return await_transfers(transfers);
   }
   // ------------------------------------------------------------------------
   bool Client::put_files(const std::vector<std::string>& files)
   {
      std::vector<std::pair<std::string, std::future<void>>> transfers;
      for (const auto& file: files) {
         transfers.emplace_back(file, std::async(std::launch::async, [this, file]() { put(file); }));
      }
      return await_transfers(transfers);
   }
   // ------------------------------------------------------------------------
   void Client::get(const std::string& filename, const std::filesystem::path& dest)
   {
      auto target = dest / std::filesystem::path(filename).filename();
      auto socket = open_socket();

      ReadRequest rrq;
      rrq.filename = filename;
      rrq.options = requested_options(0);

      PLOG_INFO << "[Client] Requesting file: " << filename;
      auto [reply, tid] = send_request(*socket, rrq);
      socket->connect(tid);

      if (auto* error = std::get_if<Error>(&reply)) {
         throw PeerError(error->code, error->message);
      }

      if (auto* oack = std::get_if<OptionAck>(&reply)) {
         auto transfer = acknowledge_options(*socket, oack->options);
         if (auto fileSize = find_option(oack->options, OptionType::TRANSFER_SIZE)) {
            PLOG_INFO << "[Client] Receiving " << *fileSize << "B for " << filename;
         }
         socket->set_read_timeout(transfer.timeout);

         Worker worker(std::move(socket), target, transfer, Packet{Ack{0}});
         worker.receive_file();
         return;
      }

      auto* data = std::get_if<Data>(&reply);
      if (data && data->blockNumber == 1) {
         // The server ignored our options. Block 1 stays unacknowledged, so the server repeats it after its timeout.
         PLOG_INFO << "[Client] Server does not negotiate options, falling back to defaults for " << filename;
         Worker worker(std::move(socket), target, default_parameters());
         worker.receive_file();
         return;
      }

      socket->send(Error{ErrorCode::ILLEGAL_OPERATION, "Unexpected " + describe(reply)});
      throw TransferError("Unexpected reply to read request: " + describe(reply));
   }
   // ------------------------------------------------------------------------
   void Client::put(const std::filesystem::path& file)
   {
      // Throws if the file does not exist, before anything is sent
      const auto fileSize = std::filesystem::file_size(file);
      auto socket = open_socket();

      WriteRequest wrq;
      wrq.filename = file.filename().string();
      wrq.options = requested_options(fileSize);

      PLOG_INFO << "[Client] Uploading file: " << file.string();
      auto [reply, tid] = send_request(*socket, wrq);
      socket->connect(tid);

      TransferParameters transfer;
      if (auto* error = std::get_if<Error>(&reply)) {
         throw PeerError(error->code, error->message);
      } else if (auto* oack = std::get_if<OptionAck>(&reply)) {
         transfer = acknowledge_options(*socket, oack->options);
      } else if (auto* ack = std::get_if<Ack>(&reply); ack && ack->blockNumber == 0) {
         transfer = default_parameters();
      } else {
         socket->send(Error{ErrorCode::ILLEGAL_OPERATION, "Unexpected " + describe(reply)});
         throw TransferError("Unexpected reply to write request: " + describe(reply));
      }
      socket->set_read_timeout(transfer.timeout);

      Worker worker(std::move(socket), file, transfer);
      worker.send_file();
   }
   // ------------------------------------------------------------------------
   std::unique_ptr<UdpSocket> Client::open_socket()
   {
      auto socket = std::make_unique<UdpSocket>(ip::udp::endpoint(server_endpoint.protocol(), 0), params.timeout);
      if (p > 0) {
         socket->set_packet_loss(PacketLoss(p, q));
      }
      return socket;
   }
   // ------------------------------------------------------------------------
   std::pair<Packet, ip::udp::endpoint> Client::send_request(UdpSocket& socket, const Packet& request)
   {
      for (uint8_t retryCounter = 0; retryCounter < MAX_RETRIES; ++retryCounter) {
         socket.send_to(request, server_endpoint);

         auto reply = socket.receive_from();
         if (!reply) {
            PLOG_INFO << "[Client] Repeating " << describe(request);
            continue;
         }

         // The server answers from a new port, but it has to be the same host
         if (reply->second.address() != server_endpoint.address()) {
            PLOG_WARNING << "[Client] Ignoring " << describe(reply->first) << " from unknown host " << reply->second;
            continue;
         }

         return *reply;
      }

      throw TimeoutError(MAX_RETRIES);
   }
   // ------------------------------------------------------------------------
   std::vector<TransferOption> Client::requested_options(const uint64_t transferSize) const
   {
      // The option carries whole seconds
      const uint64_t timeoutSeconds = std::clamp<uint64_t>((params.timeout.count() + 999) / 1000, MIN_TIMEOUT_SECONDS, MAX_TIMEOUT_SECONDS);

      return {
          {OptionType::BLOCK_SIZE, params.blockSize},
          {OptionType::WINDOW_SIZE, params.windowSize},
          {OptionType::TIMEOUT, timeoutSeconds},
          {OptionType::TRANSFER_SIZE, transferSize},
      };
   }
   // ------------------------------------------------------------------------
   TransferParameters Client::acknowledged_parameters(const std::vector<TransferOption>& acknowledged) const
   {
      TransferParameters transfer = default_parameters();

      for (const auto& option: acknowledged) {
         switch (option.type) {
            case OptionType::BLOCK_SIZE:
               if (option.value < MIN_BLOCK_SIZE || option.value > params.blockSize) {
                  throw TransferError("Server acknowledged invalid blksize " + std::to_string(option.value));
               }
               transfer.blockSize = option.value;
               break;
            case OptionType::WINDOW_SIZE:
               if (option.value < 1 || option.value > params.windowSize) {
                  throw TransferError("Server acknowledged invalid windowsize " + std::to_string(option.value));
               }
               transfer.windowSize = static_cast<uint16_t>(option.value);
               break;
            // Our own timeout is more precise than the acknowledged seconds
            case OptionType::TIMEOUT:
            case OptionType::TRANSFER_SIZE:
               break;
         }
      }

      return transfer;
   }
   // ------------------------------------------------------------------------
   TransferParameters Client::acknowledge_options(UdpSocket& socket, const std::vector<TransferOption>& acknowledged) const
   {
      try {
         return acknowledged_parameters(acknowledged);
      } catch (const TransferError& e) {
         socket.send(Error{ErrorCode::OPTION_NEGOTIATION, e.what()});
         throw;
      }
   }
   // ------------------------------------------------------------------------
   TransferParameters Client::default_parameters() const
   {
      TransferParameters transfer;
      transfer.timeout = params.timeout;
      transfer.duplicatePackets = params.duplicatePackets;
      return transfer;
   }
   // ------------------------------------------------------------------------
}// namespace wtftp
// ------------------------------------------------------------------------
