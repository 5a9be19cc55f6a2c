#ifndef WINDOWED_TFTP_COMMON_HPP
#define WINDOWED_TFTP_COMMON_HPP
// ------------------------------------------------------------------------
#include "plog/Log.h"
#include <utility>
#include <boost/asio.hpp>
#include <cstdint>
// ------------------------------------------------------------------------
#define NOW boost::asio::chrono::steady_clock::now()
// ------------------------------------------------------------------------
namespace wtftp
{
   using namespace boost::asio;

   using BlockNumber = uint16_t;

   using timepoint = chrono::time_point<boost::asio::chrono::steady_clock>;
   using micros = chrono::microseconds;
   using millis = chrono::milliseconds;
   using seconds = chrono::seconds;
   using timeunit = millis;

   /// Size of a data block if the blksize option is not negotiated (RFC 1350)
   const uint16_t DEFAULT_BLOCK_SIZE = 512;
   /// Bounds of the blksize option (RFC 2348)
   const uint16_t MIN_BLOCK_SIZE = 8;
   const uint16_t MAX_BLOCK_SIZE = 65464;
   /// Number of blocks in flight if the windowsize option is not negotiated (RFC 7440)
   const uint16_t DEFAULT_WINDOW_SIZE = 1;
   /// Bounds of the timeout option in seconds (RFC 2349)
   const uint16_t MIN_TIMEOUT_SECONDS = 1;
   const uint16_t MAX_TIMEOUT_SECONDS = 255;
   const timeunit DEFAULT_TIMEOUT = seconds(5);
   /// Added to the timeout to force the first transmission of a window
   const timeunit TIMEOUT_BUFFER = seconds(1);
   /// Consecutive unproductive polls before a transfer is given up
   const uint8_t MAX_RETRIES = 6;
   /// Opcode + block number
   const uint16_t DATA_HEADER_SIZE = sizeof(uint16_t) + sizeof(BlockNumber);
   /// Largest datagram a peer may send us (Data packet with the maximum blksize)
   const uint16_t MAX_PACKET_SIZE = MAX_BLOCK_SIZE + DATA_HEADER_SIZE;
   const uint16_t DEFAULT_PORT = 69;
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_COMMON_HPP
// ------------------------------------------------------------------------
