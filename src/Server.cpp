// ------------------------------------------------------------------------
#include "Server.hpp"
#include "util.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/bind/bind.hpp>
#include <csignal>
#include <filesystem>
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   std::vector<TransferOption> negotiate_options(const std::vector<TransferOption>& requested, TransferParameters& params, const std::optional<uint64_t> fileSize)
   {
      std::vector<TransferOption> accepted;

      for (const auto& option: requested) {
         // Only the first occurrence of an option counts
         if (find_option(accepted, option.type)) {
            continue;
         }

         switch (option.type) {
            case OptionType::BLOCK_SIZE:
               if (option.value < MIN_BLOCK_SIZE) {
                  break;
               }
               params.blockSize = std::min<uint64_t>(option.value, MAX_BLOCK_SIZE);
               accepted.push_back({OptionType::BLOCK_SIZE, params.blockSize});
               break;
            case OptionType::TRANSFER_SIZE:
               accepted.push_back({OptionType::TRANSFER_SIZE, fileSize.value_or(option.value)});
               break;
            case OptionType::TIMEOUT:
               if (option.value < MIN_TIMEOUT_SECONDS || option.value > MAX_TIMEOUT_SECONDS) {
                  break;
               }
               params.timeout = seconds(option.value);
               accepted.push_back(option);
               break;
            case OptionType::WINDOW_SIZE:
               if (option.value < 1 || option.value > UINT16_MAX) {
                  break;
               }
               params.windowSize = static_cast<uint16_t>(option.value);
               accepted.push_back(option);
               break;
         }
      }

      return accepted;
   }
   // ------------------------------------------------------------------------
   Server::Server(const Config& config)
       : config(config), socket(io_context, ip::udp::endpoint(config.address, config.port)), signals(io_context, SIGINT, SIGTERM) {}
   // ------------------------------------------------------------------------
   Server::~Server() { stop(); }
   // ------------------------------------------------------------------------
   void Server::start()
   {
      signals.async_wait([this](const boost::system::error_code& error, int signum) {
         if (!error) {
            PLOG_WARNING << "[Server] Received signal " << signum << ", waiting for running transfers";
            running = false;
            msgQueue.wake();
         }
      });

      receive_msg();
      thread_context = std::thread([this]() { io_context.run(); });
      PLOG_INFO << "[Server] Started on " << socket.local_endpoint() << ", serving " << config.sendDirectory.string()
                << (config.readOnly ? " (read-only)" : ", receiving into " + config.receiveDirectory.string());

      process_msgs();
   }
   // ------------------------------------------------------------------------
   void Server::stop()
   {
      running = false;
      msgQueue.wake();
      io_context.stop();
      if (thread_context.joinable()) thread_context.join();
      PLOG_INFO << "[Server] Stopped!";
   }
   // ------------------------------------------------------------------------
   void Server::receive_msg()
   {
      socket.async_receive_from(
          buffer(receiveBuffer), remote_endpoint,
          boost::bind(&Server::handle_receive, this,
                      boost::asio::placeholders::error,
                      boost::asio::placeholders::bytes_transferred));
   }
   // ------------------------------------------------------------------------
   void Server::handle_receive(const boost::system::error_code& error, size_t bytes_transferred)
   {
      if (error == boost::asio::error::operation_aborted) {
         return;
      }

      if (!error) {
         Message msg(receiveBuffer.data(), bytes_transferred);
         msg.header.remote = remote_endpoint;
         msgQueue.push_back(std::move(msg));
      } else {
         PLOG_WARNING << "[Server] Error on Receive: " + error.message();
      }

      receive_msg();
   }
   // ------------------------------------------------------------------------
   void Server::send_msg_to_client(const Packet& packet, const ip::udp::endpoint& client)
   {
      auto msg = std::make_shared<Message>(encode(packet));
      msg->header.remote = client;

      // The listening socket belongs to the network thread
      post(io_context, [this, msg]() {
         socket.async_send_to(buffer(msg->packet), msg->header.remote,
                              boost::bind(&Server::handle_send, this, msg,
                                          boost::asio::placeholders::error,
                                          boost::asio::placeholders::bytes_transferred));
      });
   }
   // ------------------------------------------------------------------------
   void Server::handle_send(std::shared_ptr<Message> msg, const boost::system::error_code& error, size_t bytes_transferred)
   {
      if (error) {
         PLOG_WARNING << "[Server] Error on Send to " << msg->header.remote << ": " + error.message();
      }
   }
   // ------------------------------------------------------------------------
   void Server::process_msgs()
   {
      while (running) {
         msgQueue.wait_for(POLL_INTERVAL);

         while (running && !msgQueue.empty()) {
            auto msg = msgQueue.pop_front();
            dispatch_msg(msg);
         }

         reap_transfers(false);
      }

      reap_transfers(true);
   }
   // ------------------------------------------------------------------------
   void Server::dispatch_msg(Message& msg)
   {
      const auto client = msg.header.remote;

      Packet packet;
      try {
         packet = decode(msg);
      } catch (const MalformedPacket& e) {
         PLOG_WARNING << "[Server] Malformed request from " << client << ": " << e.what();
         return;
      }

      try {
         if (auto* rrq = std::get_if<ReadRequest>(&packet)) {
            handle_read_request(*rrq, client);
         } else if (auto* wrq = std::get_if<WriteRequest>(&packet)) {
            handle_write_request(*wrq, client);
         } else if (std::holds_alternative<Error>(packet)) {
            // Never answer an error with an error
            PLOG_WARNING << "[Server] Ignoring " << describe(packet) << " from " << client;
         } else {
            PLOG_WARNING << "[Server] Unexpected " << describe(packet) << " from " << client;
            send_msg_to_client(Error{ErrorCode::ILLEGAL_OPERATION, "Illegal TFTP operation"}, client);
         }
      } catch (const std::exception& e) {
         PLOG_ERROR << "[Server] Could not start transfer for " << client << ": " << e.what();
         send_msg_to_client(Error{ErrorCode::NOT_DEFINED, "Could not start transfer"}, client);
      }
   }
   // ------------------------------------------------------------------------
   void Server::handle_read_request(const ReadRequest& rrq, const ip::udp::endpoint& client)
   {
      if (is_transferring(client, rrq.filename)) {
         PLOG_VERBOSE << "[Server] Ignoring repeated request for " << rrq.filename << " from " << client;
         return;
      }

      PLOG_INFO << "[Server] Client " << client << " requesting file: " << rrq.filename;

      if (!boost::algorithm::iequals(rrq.mode, "octet")) {
         send_msg_to_client(Error{ErrorCode::ILLEGAL_OPERATION, "Unsupported mode " + rrq.mode}, client);
         return;
      }

      auto path = resolve_below(config.sendDirectory, rrq.filename);
      if (!path) {
         PLOG_WARNING << "[Server] Refusing path outside of " << config.sendDirectory.string() << ": " << rrq.filename;
         send_msg_to_client(Error{ErrorCode::ACCESS_VIOLATION, "Access violation"}, client);
         return;
      }

      if (!std::filesystem::is_regular_file(*path)) {
         PLOG_WARNING << "[Server] File: " << path->string() << " does not exist!";
         send_msg_to_client(Error{ErrorCode::FILE_NOT_FOUND, "File not found"}, client);
         return;
      }

      TransferParameters params = config.transfer;
      params.blockSize = DEFAULT_BLOCK_SIZE;
      params.windowSize = DEFAULT_WINDOW_SIZE;
      auto options = negotiate_options(rrq.options, params, std::filesystem::file_size(*path));

      std::optional<Packet> reply;
      if (!options.empty()) {
         reply = OptionAck{options};
      }

      auto worker = std::make_shared<Worker>(open_transfer_socket(client, params.timeout), *path, params, std::move(reply));
      transfers.push_back({client, rrq.filename, worker->send()});
   }
   // ------------------------------------------------------------------------
   void Server::handle_write_request(const WriteRequest& wrq, const ip::udp::endpoint& client)
   {
      if (is_transferring(client, wrq.filename)) {
         PLOG_VERBOSE << "[Server] Ignoring repeated request for " << wrq.filename << " from " << client;
         return;
      }

      PLOG_INFO << "[Server] Client " << client << " uploading file: " << wrq.filename;

      if (config.readOnly) {
         send_msg_to_client(Error{ErrorCode::ACCESS_VIOLATION, "Server is read-only"}, client);
         return;
      }

      if (!boost::algorithm::iequals(wrq.mode, "octet")) {
         send_msg_to_client(Error{ErrorCode::ILLEGAL_OPERATION, "Unsupported mode " + wrq.mode}, client);
         return;
      }

      auto path = resolve_below(config.receiveDirectory, wrq.filename);
      if (!path) {
         PLOG_WARNING << "[Server] Refusing path outside of " << config.receiveDirectory.string() << ": " << wrq.filename;
         send_msg_to_client(Error{ErrorCode::ACCESS_VIOLATION, "Access violation"}, client);
         return;
      }

      if (std::filesystem::exists(*path) && !config.overwrite) {
         PLOG_WARNING << "[Server] File: " << path->string() << " already exists!";
         send_msg_to_client(Error{ErrorCode::FILE_EXISTS, "File already exists"}, client);
         return;
      }

      TransferParameters params = config.transfer;
      params.blockSize = DEFAULT_BLOCK_SIZE;
      params.windowSize = DEFAULT_WINDOW_SIZE;
      auto options = negotiate_options(wrq.options, params, std::nullopt);

      Packet reply = Ack{0};
      if (!options.empty()) {
         reply = OptionAck{options};
      }

      auto worker = std::make_shared<Worker>(open_transfer_socket(client, params.timeout), *path, params, std::move(reply));
      transfers.push_back({client, wrq.filename, worker->receive()});
   }
   // ------------------------------------------------------------------------
   std::unique_ptr<UdpSocket> Server::open_transfer_socket(const ip::udp::endpoint& client, const timeunit timeout)
   {
      // A fresh port per transfer is the server's transfer ID
      auto transferSocket = std::make_unique<UdpSocket>(ip::udp::endpoint(config.address, 0), timeout);
      transferSocket->connect(client);

      if (config.p > 0) {
         transferSocket->set_packet_loss(PacketLoss(config.p, config.q));
      }

      return transferSocket;
   }
   // ------------------------------------------------------------------------
   void Server::reap_transfers(const bool wait)
   {
      for (auto it = transfers.begin(); it != transfers.end();) {
         if (!wait && it->done.wait_for(millis(0)) != std::future_status::ready) {
            ++it;
            continue;
         }

         try {
            it->done.get();
         } catch (const std::exception& e) {
            // The worker has logged the failure already, a failed transfer is not retried
            PLOG_VERBOSE << "[Server] Transfer finished with error: " << e.what();
         }
         it = transfers.erase(it);
      }
   }
   // ------------------------------------------------------------------------
   bool Server::is_transferring(const ip::udp::endpoint& client, const std::string& filename) const
   {
      return std::ranges::any_of(transfers, [&](const Transfer& transfer) {
         return transfer.client == client && transfer.filename == filename
                && transfer.done.wait_for(millis(0)) != std::future_status::ready;
      });
   }
   // ------------------------------------------------------------------------
}// namespace wtftp
// ------------------------------------------------------------------------
