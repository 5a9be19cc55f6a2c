#ifndef WINDOWED_TFTP_MESSAGEQUEUE_HPP
#define WINDOWED_TFTP_MESSAGEQUEUE_HPP
// ------------------------------------------------------------------------
#include "Message.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
// ------------------------------------------------------------------------
namespace wtftp
{
   /// Hands datagrams from the network thread to the thread that dispatches them
   template<typename Message>
   struct MessageQueue {
      MessageQueue() = default;
      MessageQueue(const MessageQueue<Message>& other) = delete;
      MessageQueue(const MessageQueue<Message>&& other) = delete;
      ~MessageQueue() { clear(); }

      Message pop_front()
      {
         std::unique_lock lock(mux_queue);
         Message msg = std::move(deque.front());
         deque.pop_front();
         return msg;
      }

      void push_back(Message msg)
      {
         {
            std::unique_lock lock(mux_queue);
            deque.emplace_back(std::move(msg));
         }
         cv.notify_one();
      }

      bool empty()
      {
         std::unique_lock lock(mux_queue);
         return deque.empty();
      }

      void clear()
      {
         std::unique_lock lock(mux_queue);
         deque.clear();
      }

      /// Blocks until a message arrives, wake() is called or the timeout expires
      template<typename Timeunit>
      void wait_for(Timeunit timeout)
      {
         std::unique_lock lock(mux_queue);
         cv.wait_for(lock, timeout, [this]() { return !deque.empty() || woken; });
         woken = false;
      }

      void wake()
      {
         {
            std::unique_lock lock(mux_queue);
            woken = true;
         }
         cv.notify_all();
      }

    private:
      std::mutex mux_queue;
      std::deque<Message> deque;
      std::condition_variable cv;
      bool woken = false;
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_MESSAGEQUEUE_HPP
// ------------------------------------------------------------------------
