#include "Client.hpp"
#include "Config.hpp"
#include "Server.hpp"
#include <iostream>
#include <plog/Appenders/ColorConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

using namespace std;

int main(int argc, char* argv[])
{
   // plog config
   static plog::ColorConsoleAppender<plog::TxtFormatter> consoleAppender;
   plog::init(plog::info, &consoleAppender);

   wtftp::Config config;
   try {
      config = wtftp::parse_args(argc, argv);
   } catch (const exception& ex) {
      cerr << ex.what() << endl;
      return 2;
   }

   if (config.showHelp) {
      cout << config.usage << endl;
      return 0;
   }

   if (config.verbose) {
      plog::get()->setMaxSeverity(plog::verbose);
   }

   if (config.isServer) {
      try {
         wtftp::Server server(config);
         server.start();
      } catch (std::exception& e) {
         PLOG_ERROR << e.what();
         return 1;
      }
   } else if (config.isClient) {
      try {
         wtftp::Client client(config.host, config.port, config.transfer, config.p, config.q);
         bool success = config.put ? client.put_files(config.files) : client.get_files(config.files, config.dest);
         return success ? 0 : 1;
      } catch (std::exception& e) {
         PLOG_ERROR << e.what();
         return 1;
      }
   } else {
      PLOG_ERROR << "ERROR: Program neither run in server nor in client mode!";
      return 2;
   }

   return 0;
}
