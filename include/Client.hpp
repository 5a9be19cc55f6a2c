#ifndef WINDOWED_TFTP_CLIENT_HPP
#define WINDOWED_TFTP_CLIENT_HPP
// ------------------------------------------------------------------------
#include "Packet.hpp"
#include "UdpSocket.hpp"
#include "Worker.hpp"
#include "common.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>
// ------------------------------------------------------------------------
namespace wtftp
// ------------------------------------------------------------------------
{
   class Client
   {
    public:
      Client(std::string host, uint16_t port, TransferParameters params, double p = 0, double q = 1);
      Client(const Client& other) = delete;
      Client(const Client&& other) = delete;

      /// Transfers all files concurrently, returns whether every transfer succeeded
      bool get_files(const std::vector<std::string>& files, const std::filesystem::path& dest);
      bool put_files(const std::vector<std::string>& files);

      /// Downloads filename into dest/<filename without directories>
      void get(const std::string& filename, const std::filesystem::path& dest);
      /// Uploads file under its filename
      void put(const std::filesystem::path& file);

    private:
      void resolve_server();

      std::unique_ptr<UdpSocket> open_socket();
      std::pair<Packet, boost::asio::ip::udp::endpoint> send_request(UdpSocket& socket, const Packet& request);

      std::vector<TransferOption> requested_options(uint64_t transferSize) const;
      TransferParameters acknowledged_parameters(const std::vector<TransferOption>& acknowledged) const;
      /// Like acknowledged_parameters(), but tells the server when its OACK is unacceptable
      TransferParameters acknowledge_options(UdpSocket& socket, const std::vector<TransferOption>& acknowledged) const;
      TransferParameters default_parameters() const;

      boost::asio::io_context io_context;
      std::string host;
      uint16_t port;
      boost::asio::ip::udp::endpoint server_endpoint;

      TransferParameters params;

      double p;
      double q;
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_CLIENT_HPP
// ------------------------------------------------------------------------
