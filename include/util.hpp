// ------------------------------------------------------------------------
#ifndef WINDOWED_TFTP_UTIL_HPP
#define WINDOWED_TFTP_UTIL_HPP
// ------------------------------------------------------------------------
#include "common.hpp"
#include <bit>
#include <concepts>
#include <filesystem>
#include <optional>
#include <random>
#include <string>
// ------------------------------------------------------------------------
namespace wtftp
{
   enum class PacketLossState
   {
      LOST,
      NOT_LOST,
   };

   /// Gilbert-Elliott loss model: a packet is lost with probability p after a delivered packet
   /// and stays lost with probability q after a lost one
   class PacketLoss
   {
      PacketLossState state = PacketLossState::NOT_LOST;
      double p;
      double q;
      std::mt19937 generator;
      std::uniform_real_distribution<double> distribution{0.0, 1.0};

      double random();

    public:
      PacketLoss(double p, double q);
      PacketLoss(double p, double q, std::mt19937::result_type seed);

      bool is_lost();
   };

   template<std::integral T>
   T hton(T i)
   {
      if constexpr (std::endian::native == std::endian::little) {
         return std::byteswap(i);
      }
      return i;
   }

   template<std::integral T>
   T ntoh(T i)
   {
      return hton(i);
   }

   /// Resolves a requested filename below root.
   /// Returns nothing for absolute paths and paths that climb out of root.
   std::optional<std::filesystem::path> resolve_below(const std::filesystem::path& root, const std::string& filename);
}// namespace wtftp
// ------------------------------------------------------------------------
#endif//WINDOWED_TFTP_UTIL_HPP
// ------------------------------------------------------------------------
