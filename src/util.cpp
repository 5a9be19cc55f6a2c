// ------------------------------------------------------------------------
#include "util.hpp"
// ------------------------------------------------------------------------
namespace wtftp
{
   // ------------------------------------------------------------------------
   PacketLoss::PacketLoss(const double p, const double q) : PacketLoss(p, q, std::random_device{}()) {}
   // ------------------------------------------------------------------------
   PacketLoss::PacketLoss(const double p, const double q, const std::mt19937::result_type seed)
       : p(p), q(q), generator(seed) {}
   // ------------------------------------------------------------------------
   double PacketLoss::random()
   {
      return distribution(generator);
   }
   // ------------------------------------------------------------------------
   bool PacketLoss::is_lost()
   {
      switch (state) {
         case PacketLossState::NOT_LOST:
            if (random() < p) {
               state = PacketLossState::LOST;
            }
            break;
         case PacketLossState::LOST:
            if (random() >= q) {
               state = PacketLossState::NOT_LOST;
            }
            break;
      }
      return state == PacketLossState::LOST;
   }
   // ------------------------------------------------------------------------
   std::optional<std::filesystem::path> resolve_below(const std::filesystem::path& root, const std::string& filename)
   {
      std::filesystem::path requested(filename);
      if (filename.empty() || requested.has_root_path()) {
         return std::nullopt;
      }

      for (const auto& part: requested.lexically_normal()) {
         if (part == "..") {
            return std::nullopt;
         }
      }

      return root / requested.lexically_normal();
   }
   // ------------------------------------------------------------------------
}// namespace wtftp
// ------------------------------------------------------------------------
