#include "oit/schedule.hpp"

#include <gtest/gtest.h>

namespace
{
	using State = oit::Pass_schedule::View_state;

	constexpr State naive_frame{
		.prepared = true,
		.has_work = true,
		.has_histogram = false,
		.histogram_needs_reset = false,
		.history_valid = true,
		.cdf_has_data = false
	};

	// Histogram view in a steady state
	constexpr State histogram_frame{
		.prepared = true,
		.has_work = true,
		.has_histogram = true,
		.histogram_needs_reset = false,
		.history_valid = true,
		.cdf_has_data = true
	};

	bool is_empty(const oit::Pass_schedule& schedule)
	{
		return !schedule.reset_histogram && !schedule.clear_previous_revealage && !schedule.accumulate
			&& !schedule.build_cdf && !schedule.composite;
	}
}

TEST(Pass_schedule, UnpreparedViewRecordsNothing)
{
	for (auto state : {naive_frame, histogram_frame})
	{
		state.prepared = false;
		state.histogram_needs_reset = true;
		EXPECT_TRUE(is_empty(oit::Pass_schedule::from(state)));
	}
}

TEST(Pass_schedule, NaiveViewAccumulatesAndComposites)
{
	const auto schedule = oit::Pass_schedule::from(naive_frame);

	EXPECT_FALSE(schedule.reset_histogram);
	EXPECT_FALSE(schedule.clear_previous_revealage);
	EXPECT_TRUE(schedule.accumulate);
	EXPECT_FALSE(schedule.build_cdf);
	EXPECT_TRUE(schedule.composite);
}

TEST(Pass_schedule, NaiveViewWithoutHistoryNeedsNoClear)
{
	auto state = naive_frame;
	state.history_valid = false;

	EXPECT_FALSE(oit::Pass_schedule::from(state).clear_previous_revealage);
}

TEST(Pass_schedule, IdleNaiveViewRecordsNothing)
{
	auto state = naive_frame;
	state.has_work = false;

	EXPECT_TRUE(is_empty(oit::Pass_schedule::from(state)));
}

TEST(Pass_schedule, FirstHistogramFrameRunsEveryPass)
{
	auto state = histogram_frame;
	state.histogram_needs_reset = true;
	state.history_valid = false;
	state.cdf_has_data = false;

	const auto schedule = oit::Pass_schedule::from(state);
	EXPECT_TRUE(schedule.reset_histogram);
	EXPECT_TRUE(schedule.clear_previous_revealage);
	EXPECT_TRUE(schedule.accumulate);
	EXPECT_TRUE(schedule.build_cdf);
	EXPECT_TRUE(schedule.composite);
}

TEST(Pass_schedule, SteadyHistogramFrameKeepsHistory)
{
	const auto schedule = oit::Pass_schedule::from(histogram_frame);

	EXPECT_FALSE(schedule.reset_histogram);
	EXPECT_FALSE(schedule.clear_previous_revealage);
	EXPECT_TRUE(schedule.accumulate);
	EXPECT_TRUE(schedule.build_cdf);
	EXPECT_TRUE(schedule.composite);
}

TEST(Pass_schedule, IdleHistogramViewFlushesStaleCdf)
{
	auto state = histogram_frame;
	state.has_work = false;

	const auto schedule = oit::Pass_schedule::from(state);
	EXPECT_TRUE(schedule.build_cdf);
	EXPECT_FALSE(schedule.accumulate);
	EXPECT_FALSE(schedule.composite);
	EXPECT_FALSE(schedule.clear_previous_revealage);
}

TEST(Pass_schedule, IdleHistogramViewWithZeroCdfRecordsNothing)
{
	auto state = histogram_frame;
	state.has_work = false;
	state.cdf_has_data = false;

	EXPECT_TRUE(is_empty(oit::Pass_schedule::from(state)));
}

TEST(Pass_schedule, ResetReplacesBuildOnIdleView)
{
	auto state = histogram_frame;
	state.has_work = false;
	state.histogram_needs_reset = true;

	const auto schedule = oit::Pass_schedule::from(state);
	EXPECT_TRUE(schedule.reset_histogram);
	EXPECT_FALSE(schedule.build_cdf);
	EXPECT_FALSE(schedule.accumulate);
}
