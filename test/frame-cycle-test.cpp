#include "oit/frame-cycle.hpp"

#include <gtest/gtest.h>

TEST(Frame_cycle, FirstFrameStartsAtZeroWithoutFlip)
{
	oit::Frame_cycle cycle;
	cycle.advance();

	EXPECT_TRUE(cycle.is_started());
	EXPECT_EQ(cycle.current(), 0u);
	EXPECT_EQ(cycle.previous(), 1u);
	EXPECT_FALSE(cycle.is_history_valid());
}

TEST(Frame_cycle, FlipsExactlyOncePerFrame)
{
	oit::Frame_cycle cycle;

	for (uint32_t frame = 0; frame < 6; frame++)
	{
		cycle.advance();
		EXPECT_EQ(cycle.current(), frame % 2);
		EXPECT_EQ(cycle.previous(), 1 - frame % 2);
	}
}

TEST(Frame_cycle, HistoryFollowsWrites)
{
	oit::Frame_cycle cycle;

	cycle.advance();
	cycle.mark_written();

	// Frame N reads the slot written during frame N-1
	cycle.advance();
	EXPECT_TRUE(cycle.is_history_valid());
	EXPECT_EQ(cycle.previous(), 0u);

	// Frame without accumulation work
	cycle.advance();
	EXPECT_FALSE(cycle.is_history_valid());

	cycle.mark_written();
	cycle.advance();
	EXPECT_TRUE(cycle.is_history_valid());
}

TEST(Frame_cycle, InvalidateDropsHistory)
{
	oit::Frame_cycle cycle;

	cycle.advance();
	cycle.mark_written();
	cycle.invalidate_history();
	cycle.advance();

	EXPECT_FALSE(cycle.is_history_valid());
	EXPECT_EQ(cycle.current(), 1u);
}
