// ------------------------------------------------------------------------
#include "Config.hpp"
#include <boost/program_options.hpp>
#include <sstream>
#include <stdexcept>
// ------------------------------------------------------------------------
namespace po = boost::program_options;
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   Config parse_args(const int argc, const char* const argv[])
   {
      Config config;

      std::string ip;
      size_t timeoutMs;
      unsigned blockSize;
      unsigned windowSize;
      unsigned duplicatePackets;

      po::options_description desc{"Usage"};
      // clang-format off
      desc.add_options()
         ("help,h", "produce help message")
         ("s", "operate in server mode")
         ("host", po::value(&config.host), "the hostname to request from (hostname or IPv4 address)")
         ("files", po::value<std::vector<std::string>>()->multitoken(), "files to transfer")
         ("t", po::value(&config.port)->default_value(DEFAULT_PORT), "the port number to use")
         ("ip", po::value(&ip)->default_value("127.0.0.1"), "the address to listen on (server mode)")
         ("directory,d", po::value(&config.directory)->default_value("."), "the directory to serve (server mode)")
         ("receive-directory", po::value(&config.receiveDirectory), "the directory to store uploads in (server mode, default: directory)")
         ("send-directory", po::value(&config.sendDirectory), "the directory to serve downloads from (server mode, default: directory)")
         ("read-only", po::bool_switch(&config.readOnly), "refuse write requests (server mode)")
         ("overwrite", po::bool_switch(&config.overwrite), "allow uploads to replace existing files (server mode)")
         ("put", po::bool_switch(&config.put), "upload the files instead of downloading them (client mode)")
         ("dest", po::value(&config.dest)->default_value("."), "the destination of the transferred files (client mode)")
         ("timeout", po::value(&timeoutMs)->default_value(DEFAULT_TIMEOUT.count()), "retransmission timeout in milliseconds")
         ("blksize", po::value(&blockSize)->default_value(DEFAULT_BLOCK_SIZE), "block size to request (client mode)")
         ("windowsize", po::value(&windowSize)->default_value(DEFAULT_WINDOW_SIZE), "window size to request (client mode)")
         ("duplicate-packets", po::value(&duplicatePackets)->default_value(0), "additional copies of every data packet")
         ("p", po::value(&config.p), "packet loss probability")
         ("q", po::value(&config.q), "packets remain lost probability")
         ("verbose,v", po::bool_switch(&config.verbose), "log every window and retransmission");
      // clang-format on

      po::positional_options_description positionals;
      positionals.add("host", 1);
      positionals.add("files", -1);

      po::variables_map vm;
      int style = po::command_line_style::allow_short |
                  po::command_line_style::short_allow_adjacent |
                  po::command_line_style::short_allow_next |
                  po::command_line_style::allow_long |
                  po::command_line_style::long_allow_adjacent |
                  po::command_line_style::long_allow_next |
                  po::command_line_style::allow_dash_for_short |
                  po::command_line_style::allow_long_disguise;
      po::store(po::command_line_parser(argc, argv)
                    .options(desc)
                    .positional(positionals)
                    .style(style)
                    .run(),
                vm);
      po::notify(vm);

      if (vm.count("help")) {
         std::ostringstream usage;
         usage << desc;
         config.usage = usage.str();
         config.showHelp = true;
         return config;
      }

      if (vm.count("s") && vm.count("host")) {
         throw std::logic_error{"Cannot be server and host at the same time"};
      }

      if (vm.count("s")) {
         if (vm.count("files")) {
            throw std::logic_error{"Cannot specify files in server mode"};
         }
         config.isServer = true;
      }

      if (vm.count("host")) {
         if (!vm.count("files")) {
            throw std::logic_error{"Must specify files in client mode"};
         }
         config.files = vm["files"].as<std::vector<std::string>>();
         config.isClient = true;
      }

      config.address = boost::asio::ip::make_address(ip);

      if (config.receiveDirectory.empty()) {
         config.receiveDirectory = config.directory;
      }
      if (config.sendDirectory.empty()) {
         config.sendDirectory = config.directory;
      }

      if (timeoutMs == 0) {
         throw std::logic_error{"Timeout must be at least 1ms"};
      }
      if (blockSize < MIN_BLOCK_SIZE || blockSize > MAX_BLOCK_SIZE) {
         throw std::logic_error{"Block size must be between " + std::to_string(MIN_BLOCK_SIZE) + " and " + std::to_string(MAX_BLOCK_SIZE)};
      }
      if (windowSize < 1 || windowSize > UINT16_MAX) {
         throw std::logic_error{"Window size must be between 1 and " + std::to_string(UINT16_MAX)};
      }
      if (duplicatePackets > UINT8_MAX) {
         throw std::logic_error{"Too many duplicate packets"};
      }

      config.transfer.timeout = timeunit(timeoutMs);
      config.transfer.blockSize = blockSize;
      config.transfer.windowSize = static_cast<uint16_t>(windowSize);
      config.transfer.duplicatePackets = static_cast<uint8_t>(duplicatePackets);

      if (vm.count("p") && !vm.count("q")) {
         config.q = vm["p"].as<double>();
      }

      if (vm.count("q") && !vm.count("p")) {
         config.p = vm["q"].as<double>();
      }

      if (config.p < 0 || config.p > 1 || config.q < 0 || config.q > 1) {
         throw std::logic_error{"Probabilities must be between 0 and 1"};
      }

      return config;
   }
   // ------------------------------------------------------------------------
}// namespace wtftp
// ------------------------------------------------------------------------
