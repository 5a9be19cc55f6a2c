// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_CONFIG_HPP
#define WINDOWED_TFTP_CONFIG_HPP
// ------------------------------------------------------------------------
#include "Worker.hpp"
#include "common.hpp"
#include <filesystem>
#include <string>
#include <vector>
// ------------------------------------------------------------------------
namespace wtftp
{
   struct Config {
      bool isServer = false;
      bool isClient = false;
      bool showHelp = false;
      std::string usage;

      boost::asio::ip::address address = boost::asio::ip::make_address("127.0.0.1");
      uint16_t port = DEFAULT_PORT;

      // Server mode
      std::filesystem::path directory = ".";
      std::filesystem::path receiveDirectory;
      std::filesystem::path sendDirectory;
      bool readOnly = false;
      bool overwrite = false;

      // Client mode
      std::string host;
      std::vector<std::string> files;
      bool put = false;
      std::filesystem::path dest = ".";

      /// Timeout and duplicates apply to both modes, block and window size are requested by the client
      TransferParameters transfer;

      /// Packet loss probability
      double p = 0;
      /// Packets remain lost probability
      double q = 1;

      bool verbose = false;
   };

   /// Throws std::logic_error for contradicting options and boost::program_options::error for unparsable ones
   Config parse_args(int argc, const char* const argv[]);
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_CONFIG_HPP
// ------------------------------------------------------------------------
