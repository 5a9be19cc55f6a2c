// ------------------------------------------------------------------------
#include "Worker.hpp"
#include <cerrno>
#include <system_error>
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   Worker::Worker(std::unique_ptr<Socket> socket, std::filesystem::path fileName, TransferParameters params, std::optional<Packet> reply)
       : socket(std::move(socket)), fileName(std::move(fileName)), params(params), reply(std::move(reply))
   {
      remote = this->socket->remote_endpoint();
   }
   // ------------------------------------------------------------------------
   std::future<void> Worker::send()
   {
      return std::async(std::launch::async, [self = shared_from_this()]() {
         const auto name = self->fileName.filename().string();
         PLOG_INFO << "[Worker] Sending " << name << " to " << self->remote;

         try {
            self->send_file();
         } catch (const std::exception& e) {
            PLOG_ERROR << "[Worker] Sending " << name << " to " << self->remote << " failed: " << e.what();
            throw;
         }

         PLOG_INFO << "[Worker] Sent " << name << " to " << self->remote;
      });
   }
   // ------------------------------------------------------------------------
   std::future<void> Worker::receive()
   {
      return std::async(std::launch::async, [self = shared_from_this()]() {
         const auto name = self->fileName.filename().string();
         PLOG_INFO << "[Worker] Receiving " << name << " from " << self->remote;

         try {
            self->receive_file();
         } catch (const std::exception& e) {
            PLOG_ERROR << "[Worker] Receiving " << name << " from " << self->remote << " failed: " << e.what();
            throw;
         }

         PLOG_INFO << "[Worker] Received " << name << " from " << self->remote;
      });
   }
   // ------------------------------------------------------------------------
   void Worker::send_file()
   {
      std::fstream file(fileName, std::ios::in | std::ios::binary);
      if (!file) {
         const int error = errno;
         send_error(ErrorCode::ACCESS_VIOLATION, "Could not open file");
         throw std::system_error(error, std::generic_category(), "Could not open " + fileName.string());
      }

      Window window(params.windowSize, params.blockSize, std::move(file));
      try {
         if (reply) {
            await_reply_confirmation();
         }
         transmit(window);
      } catch (const TransferError&) {
         throw;
      } catch (const std::exception& e) {
         send_error(ErrorCode::NOT_DEFINED, e.what());
         throw;
      }
   }
   // ------------------------------------------------------------------------
   void Worker::receive_file()
   {
      std::fstream file(fileName, std::ios::out | std::ios::binary | std::ios::trunc);
      if (!file) {
         const int error = errno;
         send_error(ErrorCode::ACCESS_VIOLATION, "Could not create file");
         throw std::system_error(error, std::generic_category(), "Could not create " + fileName.string());
      }

      // The window owns the file, it is closed before an incomplete file is removed
      try {
         Window window(params.windowSize, params.blockSize, std::move(file));
         if (reply) {
            socket->send(*reply);
         }
         collect(window);
      } catch (const TransferError&) {
         remove_incomplete_file();
         throw;
      } catch (const std::exception& e) {
         if (!errorSent) {
            send_error(ErrorCode::NOT_DEFINED, e.what());
         }
         remove_incomplete_file();
         throw;
      }
   }
   // ------------------------------------------------------------------------
   void Worker::await_reply_confirmation()
   {
      uint8_t retryCounter = 0;

      while (true) {
         socket->send(*reply);

         auto packet = socket->recv();
         if (packet) {
            if (auto* ack = std::get_if<Ack>(&*packet)) {
               if (ack->blockNumber == 0) {
                  return;
               }
               send_error(ErrorCode::ILLEGAL_OPERATION, "Expected ACK 0 for option acknowledgement");
               throw TransferError("Option acknowledgement answered with ACK " + std::to_string(ack->blockNumber));
            }
            if (auto* error = std::get_if<Error>(&*packet)) {
               throw PeerError(error->code, error->message);
            }
         }

         if (++retryCounter == MAX_RETRIES) {
            throw TimeoutError(MAX_RETRIES);
         }
      }
   }
   // ------------------------------------------------------------------------
   void Worker::transmit(Window& window)
   {
      BlockNumber blockNumber = 1;

      while (true) {
         const bool endOfFile = window.fill();

         uint8_t retryCounter = 0;
         // Backdate the last transmission so that the window goes out right away
         timepoint lastSent = NOW - (params.timeout + TIMEOUT_BUFFER);
         while (true) {
            if (NOW - lastSent >= params.timeout) {
               send_window(window, blockNumber);
               lastSent = NOW;
            }

            auto packet = socket->recv();
            if (packet) {
               if (auto* ack = std::get_if<Ack>(&*packet)) {
                  // Cumulative: acknowledges every block of the window up to and including this one
                  // Bounded by the blocks still held, not the window size: only those have a chunk to remove
                  const auto diff = static_cast<BlockNumber>(ack->blockNumber - blockNumber);
                  if (diff < window.size()) {
                     blockNumber = static_cast<BlockNumber>(ack->blockNumber + 1);
                     window.remove(diff + 1);
                     break;
                  }

                  PLOG_VERBOSE << "[Worker] Ignoring ACK " << ack->blockNumber << " outside of window starting at " << blockNumber;
                  continue;
               }
               if (auto* error = std::get_if<Error>(&*packet)) {
                  throw PeerError(error->code, error->message);
               }
            }

            if (++retryCounter == MAX_RETRIES) {
               throw TimeoutError(MAX_RETRIES);
            }
         }

         if (endOfFile && window.is_empty()) {
            break;
         }
      }
   }
   // ------------------------------------------------------------------------
   void Worker::collect(Window& window)
   {
      BlockNumber blockNumber = 0;
      bool acknowledged = false;

      while (true) {
         size_t size = 0;
         uint8_t retryCounter = 0;

         while (true) {
            auto packet = socket->recv_with_size(params.blockSize);
            if (packet) {
               if (auto* data = std::get_if<Data>(&*packet)) {
                  if (data->blockNumber == static_cast<BlockNumber>(blockNumber + 1)) {
                     blockNumber = data->blockNumber;
                     size = data->data.size();
                     window.add(std::move(data->data));
                     retryCounter = 0;

                     if (size < params.blockSize || window.is_full()) {
                        break;
                     }
                  } else if (acknowledged && window.is_empty() && static_cast<BlockNumber>(blockNumber - data->blockNumber) < params.windowSize) {
                     // The sender repeats the window we acknowledged last, so our ACK got lost
                     PLOG_VERBOSE << "[Worker] Repeating ACK " << blockNumber << " for " << remote;
                     socket->send(Ack{blockNumber});
                  }
                  continue;
               }
               if (auto* error = std::get_if<Error>(&*packet)) {
                  throw PeerError(error->code, error->message);
               }
            }

            if (++retryCounter == MAX_RETRIES) {
               throw TimeoutError(MAX_RETRIES);
            }

            // Nothing arrived yet, the answer to the request may have been lost
            if (reply && blockNumber == 0) {
               socket->send(*reply);
            }
         }

         try {
            window.empty();
         } catch (const std::system_error& e) {
            send_error(ErrorCode::DISK_FULL, e.what());
            throw;
         }
         socket->send(Ack{blockNumber});
         acknowledged = true;

         if (size < params.blockSize) {
            break;
         }
      }
   }
   // ------------------------------------------------------------------------
   void Worker::send_window(const Window& window, BlockNumber blockNumber)
   {
      PLOG_VERBOSE << "[Worker] Sending " << window.size() << " block" << ((window.size() != 1) ? "s" : "")
                   << " from block " << blockNumber << " to " << remote;

      for (const auto& chunk: window.get_elements()) {
         Data data{blockNumber, chunk};
         for (uint16_t copy = 0; copy <= params.duplicatePackets; ++copy) {
            socket->send(data);
         }
         ++blockNumber;
      }
   }
   // ------------------------------------------------------------------------
   void Worker::send_error(ErrorCode code, const std::string& message)
   {
      errorSent = true;
      try {
         socket->send(Error{code, message});
      } catch (const std::exception& e) {
         PLOG_WARNING << "[Worker] Could not send error to " << remote << ": " << e.what();
      }
   }
   // ------------------------------------------------------------------------
   void Worker::remove_incomplete_file()
   {
      std::error_code ec;
      std::filesystem::remove(fileName, ec);
      if (ec) {
         PLOG_ERROR << "[Worker] Error while cleaning " << fileName.string() << ": " << ec.message();
      } else {
         PLOG_WARNING << "[Worker] Deleted incomplete file " << fileName.string();
      }
   }
   // ------------------------------------------------------------------------
}// namespace wtftp
// ------------------------------------------------------------------------
