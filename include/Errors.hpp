#ifndef WINDOWED_TFTP_ERRORS_HPP
#define WINDOWED_TFTP_ERRORS_HPP
// ------------------------------------------------------------------------
#include <cstdint>
#include <stdexcept>
#include <string>
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   enum class ErrorCode : uint16_t
   {
      NOT_DEFINED = 0,
      FILE_NOT_FOUND = 1,
      ACCESS_VIOLATION = 2,
      DISK_FULL = 3,
      ILLEGAL_OPERATION = 4,
      UNKNOWN_TRANSFER_ID = 5,
      FILE_EXISTS = 6,
      NO_SUCH_USER = 7,
      // RFC 2347
      OPTION_NEGOTIATION = 8
   };
   // ------------------------------------------------------------------------
   /// A transfer ended for a protocol reason (as opposed to a local I/O failure)
   class TransferError : public std::runtime_error
   {
    public:
      using std::runtime_error::runtime_error;
   };
   // ------------------------------------------------------------------------
   /// The peer sent an Error packet
   class PeerError : public TransferError
   {
    public:
      PeerError(ErrorCode code, const std::string& message)
          : TransferError("Received error code " + std::to_string(static_cast<uint16_t>(code)) + ": " + message), code(code), message(message)
      {}

      ErrorCode code;
      std::string message;
   };
   // ------------------------------------------------------------------------
   /// The retry budget was exhausted
   class TimeoutError : public TransferError
   {
    public:
      explicit TimeoutError(uint8_t retries)
          : TransferError("Transfer timed out after " + std::to_string(retries) + " tries")
      {}
   };
   // ------------------------------------------------------------------------
   /// A datagram that could not be decoded as a TFTP packet
   class MalformedPacket : public std::runtime_error
   {
    public:
      using std::runtime_error::runtime_error;
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_ERRORS_HPP
// ------------------------------------------------------------------------
