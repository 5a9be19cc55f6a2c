#ifndef WINDOWED_TFTP_SERVER_HPP
#define WINDOWED_TFTP_SERVER_HPP
// ------------------------------------------------------------------------
#include "Config.hpp"
#include "MessageQueue.hpp"
#include "Packet.hpp"
#include "UdpSocket.hpp"
#include "Worker.hpp"
#include "common.hpp"
#include <array>
#include <atomic>
#include <future>
#include <list>
#include <memory>
#include <string>
#include <thread>
// ------------------------------------------------------------------------
namespace wtftp
// ------------------------------------------------------------------------
{
   /// Applies the requested options to params and returns the ones to acknowledge.
   /// fileSize answers tsize for read requests, write requests echo the client's value.
   std::vector<TransferOption> negotiate_options(const std::vector<TransferOption>& requested, TransferParameters& params, std::optional<uint64_t> fileSize);
   // ------------------------------------------------------------------------
   class Server
   {
    public:
      explicit Server(const Config& config);
      Server(const Server& other) = delete;
      Server(const Server&& other) = delete;
      ~Server();

      /// Blocks until stop() is called or SIGINT/SIGTERM arrives
      void start();
      void stop();

      uint16_t local_port() const { return socket.local_endpoint().port(); }

    private:
      void process_msgs();

      void dispatch_msg(Message& msg);

      void receive_msg();
      void send_msg_to_client(const Packet& packet, const boost::asio::ip::udp::endpoint& client);

      void handle_receive(const boost::system::error_code& error, size_t bytes_transferred);
      void handle_send(std::shared_ptr<Message> msg, const boost::system::error_code& error, size_t bytes_transferred);

      void handle_read_request(const ReadRequest& rrq, const boost::asio::ip::udp::endpoint& client);
      void handle_write_request(const WriteRequest& wrq, const boost::asio::ip::udp::endpoint& client);

      std::unique_ptr<UdpSocket> open_transfer_socket(const boost::asio::ip::udp::endpoint& client, timeunit timeout);
      void reap_transfers(bool wait);

      /// A client repeats its request while the answer is underway, the running transfer answers it
      bool is_transferring(const boost::asio::ip::udp::endpoint& client, const std::string& filename) const;

      Config config;

      boost::asio::io_context io_context;
      boost::asio::ip::udp::socket socket;
      boost::asio::signal_set signals;
      std::thread thread_context;
      boost::asio::ip::udp::endpoint remote_endpoint;
      std::atomic<bool> running = true;

      std::array<unsigned char, MAX_PACKET_SIZE> receiveBuffer{};
      MessageQueue<Message> msgQueue;

      struct Transfer
      {
         boost::asio::ip::udp::endpoint client;
         std::string filename;
         std::future<void> done;
      };
      std::list<Transfer> transfers;

      /// How long the dispatcher sleeps before it looks for finished transfers
      const millis POLL_INTERVAL = millis(100);
   };
}// namespace wtftp
// ------------------------------------------------------------------------

#endif//WINDOWED_TFTP_SERVER_HPP
// ------------------------------------------------------------------------
