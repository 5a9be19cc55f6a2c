#ifndef WINDOWED_TFTP_TIMER_HPP
#define WINDOWED_TFTP_TIMER_HPP
// ------------------------------------------------------------------------
#include "common.hpp"
#include <functional>
// ------------------------------------------------------------------------
namespace wtftp
{
   class Timer
   {
      boost::asio::steady_timer t;

    public:
      explicit Timer(boost::asio::io_context& io_context) : t(io_context) {}

      template<typename Timeunit>
      void setTimeout(Timeunit timeout, std::function<void(const boost::system::error_code& error_code)> callback)
      {
         t.expires_after(timeunit(timeout));
         t.async_wait(callback);
      }

      void cancel()
      {
         t.cancel();
      }
   };
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_TIMER_HPP
