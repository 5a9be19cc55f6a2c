// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_WORKER_HPP
#define WINDOWED_TFTP_WORKER_HPP
// ------------------------------------------------------------------------
#include "Packet.hpp"
#include "Socket.hpp"
#include "Window.hpp"
#include "common.hpp"
#include <filesystem>
#include <future>
#include <memory>
#include <optional>
// ------------------------------------------------------------------------
namespace wtftp
{
   struct TransferParameters {
      size_t blockSize = DEFAULT_BLOCK_SIZE;
      /// Time after which an unacknowledged window is sent again
      timeunit timeout = DEFAULT_TIMEOUT;
      uint16_t windowSize = DEFAULT_WINDOW_SIZE;
      /// Extra copies of every Data packet, for links that drop bursts
      uint8_t duplicatePackets = 0;
   };
   // ------------------------------------------------------------------------
   /// Runs one file transfer over a socket that is connected to the peer.
   ///
   /// The reply is the packet that answers the peer's request (OACK or ACK 0). It is sent before
   /// the transfer starts and repeated until the peer reacts to it: on the send path the peer must
   /// confirm an OACK with ACK 0, on the receive path the first Data packet confirms it.
   ///
   /// send() and receive() require the worker to be owned by a std::shared_ptr.
   class Worker : public std::enable_shared_from_this<Worker>
   {
    public:
      Worker(std::unique_ptr<Socket> socket, std::filesystem::path fileName, TransferParameters params, std::optional<Packet> reply = std::nullopt);
      Worker(const Worker& other) = delete;
      Worker(const Worker&& other) = delete;

      /// Sends the file on a separate task, the future carries the outcome
      std::future<void> send();
      /// Receives the file on a separate task, the future carries the outcome
      std::future<void> receive();

      void send_file();
      /// Removes the file again if the transfer fails
      void receive_file();

    private:
      void await_reply_confirmation();
      void transmit(Window& window);
      void collect(Window& window);

      void send_window(const Window& window, BlockNumber blockNumber);
      void send_error(ErrorCode code, const std::string& message);
      void remove_incomplete_file();

      std::unique_ptr<Socket> socket;
      std::filesystem::path fileName;
      TransferParameters params;
      std::optional<Packet> reply;
      boost::asio::ip::udp::endpoint remote;
      /// The peer has been told why the transfer ends
      bool errorSent = false;
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_WORKER_HPP
// ------------------------------------------------------------------------
