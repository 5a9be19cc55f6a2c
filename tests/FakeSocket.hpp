// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_FAKESOCKET_HPP
#define WINDOWED_TFTP_FAKESOCKET_HPP
// ------------------------------------------------------------------------
#include "Packet.hpp"
#include "Socket.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>
// ------------------------------------------------------------------------
namespace wtftp::test
{
   /// Scripted socket: recv() hands out the queued packets in order and nothing once the queue is drained.
   /// A queued std::nullopt stands for one read timeout.
   class FakeSocket : public Socket
   {
    public:
      std::deque<std::optional<Packet>> incoming;
      std::vector<Packet> sent;
      /// Called after every send, may queue the peer's reaction
      std::function<void(const Packet&, FakeSocket&)> peer;
      size_t polls = 0;
      size_t lastMaxPayload = 0;

      void send(const Packet& packet) override
      {
         sent.push_back(packet);
         if (peer) peer(packet, *this);
      }

      std::optional<Packet> recv() override { return next(); }

      std::optional<Packet> recv_with_size(size_t maxPayload) override
      {
         lastMaxPayload = maxPayload;
         auto packet = next();
         // Same as a datagram that fails to decode
         if (packet) {
            if (auto* data = std::get_if<Data>(&*packet); data && data->data.size() > maxPayload) {
               return std::nullopt;
            }
         }
         return packet;
      }

      ip::udp::endpoint remote_endpoint() const override { return {ip::make_address("127.0.0.1"), 6969}; }

      template<typename T>
      std::vector<T> sent_of() const
      {
         std::vector<T> result;
         for (const auto& packet: sent) {
            if (auto* p = std::get_if<T>(&packet)) result.push_back(*p);
         }
         return result;
      }

    private:
      std::optional<Packet> next()
      {
         ++polls;
         if (incoming.empty()) return std::nullopt;
         auto packet = std::move(incoming.front());
         incoming.pop_front();
         return packet;
      }
   };
   // ------------------------------------------------------------------------
   /// One direction of an in-memory link
   struct Channel {
      std::mutex mux;
      std::condition_variable cv;
      std::deque<Packet> queue;
   };
   // ------------------------------------------------------------------------
   /// Socket that delivers into the channel of its partner, with a read timeout like UdpSocket
   class LinkedSocket : public Socket
   {
    public:
      /// Number of copies of a packet that reach the peer, 0 drops it
      std::function<int(const Packet&)> fate;

      LinkedSocket(std::shared_ptr<Channel> in, std::shared_ptr<Channel> out, millis readTimeout, uint16_t port)
          : in(std::move(in)), out(std::move(out)), readTimeout(readTimeout), port(port) {}

      void send(const Packet& packet) override
      {
         const int copies = fate ? fate(packet) : 1;
         {
            std::scoped_lock lock(out->mux);
            for (int i = 0; i < copies; ++i) {
               out->queue.push_back(packet);
            }
         }
         out->cv.notify_one();
      }

      std::optional<Packet> recv() override { return recv_with_size(MAX_BLOCK_SIZE); }

      std::optional<Packet> recv_with_size(size_t maxPayload) override
      {
         std::unique_lock lock(in->mux);
         if (!in->cv.wait_for(lock, readTimeout, [this]() { return !in->queue.empty(); })) {
            return std::nullopt;
         }
         auto packet = std::move(in->queue.front());
         in->queue.pop_front();
         if (auto* data = std::get_if<Data>(&packet); data && data->data.size() > maxPayload) {
            return std::nullopt;
         }
         return packet;
      }

      ip::udp::endpoint remote_endpoint() const override { return {ip::make_address("127.0.0.1"), port}; }

    private:
      std::shared_ptr<Channel> in;
      std::shared_ptr<Channel> out;
      millis readTimeout;
      uint16_t port;
   };

   inline std::pair<std::unique_ptr<LinkedSocket>, std::unique_ptr<LinkedSocket>> make_link(millis readTimeout)
   {
      auto forward = std::make_shared<Channel>();
      auto backward = std::make_shared<Channel>();
      return {std::make_unique<LinkedSocket>(backward, forward, readTimeout, 1001),
              std::make_unique<LinkedSocket>(forward, backward, readTimeout, 1000)};
   }
}// namespace wtftp::test
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_FAKESOCKET_HPP
// ------------------------------------------------------------------------
