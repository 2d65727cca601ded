#include "oit/target/histogram.hpp"

#include <cstddef>
#include <gtest/gtest.h>

TEST(Histogram_layout, TileCountRoundsUp)
{
	const auto layout = oit::target::Histogram_layout::from({800, 600}, {.tile_size = 32, .num_bins = 64});

	EXPECT_EQ(layout.tile_count_x, 25u);
	EXPECT_EQ(layout.tile_count_y, 19u);
	EXPECT_EQ(layout.num_bins, 64u);
	EXPECT_EQ(layout.get_counter_count(), 25u * 19u * 64u);
}

TEST(Histogram_layout, SinglePixelViewport)
{
	const auto layout = oit::target::Histogram_layout::from({1, 1}, {.tile_size = 32, .num_bins = 8});

	EXPECT_EQ(layout.tile_count_x, 1u);
	EXPECT_EQ(layout.tile_count_y, 1u);
	EXPECT_EQ(layout.get_counter_count(), 8u);
}

TEST(Histogram_layout, ResizeChangesLayout)
{
	const oit::Histogram_params params;

	const auto small = oit::target::Histogram_layout::from({800, 600}, params);
	const auto large = oit::target::Histogram_layout::from({1600, 1200}, params);

	EXPECT_NE(small, large);
	EXPECT_EQ(large.tile_count_x, 50u);
	EXPECT_EQ(large.tile_count_y, 38u);
}

TEST(Histogram_layout, ResizeWithinSameTilesKeepsLayout)
{
	const oit::Histogram_params params;

	// Both round up to 25x19 tiles, no recreation needed
	EXPECT_EQ(
		oit::target::Histogram_layout::from({800, 600}, params),
		oit::target::Histogram_layout::from({790, 590}, params)
	);
}

TEST(Histogram_layout, BinCountChangesLayout)
{
	EXPECT_NE(
		oit::target::Histogram_layout::from({800, 600}, {.num_bins = 64}),
		oit::target::Histogram_layout::from({800, 600}, {.num_bins = 32})
	);
}

TEST(Histogram_layout, MaxDepthDoesNotChangeLayout)
{
	EXPECT_EQ(
		oit::target::Histogram_layout::from({800, 600}, {.max_depth = 100.0f}),
		oit::target::Histogram_layout::from({800, 600}, {.max_depth = 10.0f})
	);
}

TEST(Histogram_params_gpu, Layout)
{
	static_assert(sizeof(oit::target::Histogram_params_gpu) == 32);
	static_assert(offsetof(oit::target::Histogram_params_gpu, tile_count_x) == 0);
	static_assert(offsetof(oit::target::Histogram_params_gpu, tile_count_y) == 4);
	static_assert(offsetof(oit::target::Histogram_params_gpu, num_bins) == 8);
	static_assert(offsetof(oit::target::Histogram_params_gpu, tile_size) == 12);
	static_assert(offsetof(oit::target::Histogram_params_gpu, max_depth) == 16);

	const oit::Histogram_params params{.tile_size = 16, .num_bins = 128, .max_depth = 42.0f};
	const auto layout = oit::target::Histogram_layout::from({1600, 1200}, params);
	const auto gpu_params = oit::target::Histogram_params_gpu::from(layout, params);

	EXPECT_EQ(gpu_params.tile_count_x, 100u);
	EXPECT_EQ(gpu_params.tile_count_y, 75u);
	EXPECT_EQ(gpu_params.num_bins, 128u);
	EXPECT_EQ(gpu_params.tile_size, 16u);
	EXPECT_FLOAT_EQ(gpu_params.max_depth, 42.0f);
}
