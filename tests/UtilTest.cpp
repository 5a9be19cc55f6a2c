// ------------------------------------------------------------------------
#include "util.hpp"
#include <gtest/gtest.h>
// ------------------------------------------------------------------------
using namespace wtftp;
// ------------------------------------------------------------------------
TEST(PacketLossTest, NeverLosesWithoutProbability)
{
   PacketLoss loss(0, 1, 42);
   for (int i = 0; i < 1000; ++i) {
      EXPECT_FALSE(loss.is_lost());
   }
}
// ------------------------------------------------------------------------
TEST(PacketLossTest, StaysLost)
{
   PacketLoss loss(1, 1, 42);
   for (int i = 0; i < 1000; ++i) {
      EXPECT_TRUE(loss.is_lost());
   }
}
// ------------------------------------------------------------------------
TEST(PacketLossTest, AlternatesWhenLossNeverPersists)
{
   PacketLoss loss(1, 0, 42);
   for (int i = 0; i < 10; ++i) {
      EXPECT_TRUE(loss.is_lost());
      EXPECT_FALSE(loss.is_lost());
   }
}
// ------------------------------------------------------------------------
TEST(PacketLossTest, LossRateFollowsModel)
{
   // Stationary loss rate of the two state chain is p / (p + 1 - q)
   PacketLoss loss(0.1, 0.5, 7);
   int lost = 0;
   const int n = 100000;
   for (int i = 0; i < n; ++i) {
      lost += loss.is_lost();
   }
   EXPECT_NEAR(static_cast<double>(lost) / n, 0.1 / 0.6, 0.02);
}
// ------------------------------------------------------------------------
TEST(ResolveBelowTest, KeepsRelativePathsBelowRoot)
{
   EXPECT_EQ(resolve_below("/srv", "a/b.txt"), std::filesystem::path("/srv/a/b.txt"));
   EXPECT_EQ(resolve_below("/srv", "./x"), std::filesystem::path("/srv/x"));
   EXPECT_EQ(resolve_below("/srv", "a/../b"), std::filesystem::path("/srv/b"));
}
// ------------------------------------------------------------------------
TEST(ResolveBelowTest, RejectsEscapes)
{
   EXPECT_FALSE(resolve_below("/srv", "").has_value());
   EXPECT_FALSE(resolve_below("/srv", "/etc/passwd").has_value());
   EXPECT_FALSE(resolve_below("/srv", "../etc/passwd").has_value());
   EXPECT_FALSE(resolve_below("/srv", "a/../../etc/passwd").has_value());
}
// ------------------------------------------------------------------------
