#include "oit/mode.hpp"

#include <gtest/gtest.h>
#include <limits>

TEST(Mode, ActiveVariants)
{
	EXPECT_FALSE(oit::is_active(oit::mode::Inactive{}));
	EXPECT_TRUE(oit::is_active(oit::mode::Naive{}));
	EXPECT_TRUE(oit::is_active(oit::mode::Histogram{}));

	EXPECT_EQ(oit::get_variant(oit::mode::Inactive{}), std::nullopt);
	EXPECT_EQ(oit::get_variant(oit::mode::Naive{}), oit::Variant::Naive);
	EXPECT_EQ(oit::get_variant(oit::mode::Histogram{}), oit::Variant::Histogram);
}

TEST(Mode, AttachingOneModeDetachesTheOther)
{
	oit::Mode mode = oit::mode::Naive{};
	mode = oit::mode::Histogram{};

	EXPECT_FALSE(std::holds_alternative<oit::mode::Naive>(mode));
	EXPECT_EQ(oit::get_variant(mode), oit::Variant::Histogram);
}

TEST(Mode, DefaultHistogramParamsAreValid)
{
	const oit::Histogram_params params;
	EXPECT_EQ(params.tile_size, 32u);
	EXPECT_EQ(params.num_bins, 64u);
	EXPECT_FLOAT_EQ(params.max_depth, 100.0f);
	EXPECT_TRUE(oit::validate(params).has_value());
}

TEST(Mode, RejectsInvalidHistogramParams)
{
	EXPECT_FALSE(oit::validate({.tile_size = 0, .num_bins = 64, .max_depth = 100.0f}).has_value());
	EXPECT_FALSE(oit::validate({.tile_size = 32, .num_bins = 0, .max_depth = 100.0f}).has_value());
	EXPECT_FALSE(oit::validate({.tile_size = 32, .num_bins = 257, .max_depth = 100.0f}).has_value());
	EXPECT_FALSE(oit::validate({.tile_size = 32, .num_bins = 64, .max_depth = 0.0f}).has_value());
	EXPECT_FALSE(oit::validate({.tile_size = 32, .num_bins = 64, .max_depth = -1.0f}).has_value());
	EXPECT_FALSE(
		oit::validate({.tile_size = 32, .num_bins = 64, .max_depth = std::numeric_limits<float>::infinity()})
			.has_value()
	);
	EXPECT_FALSE(
		oit::validate({.tile_size = 32, .num_bins = 64, .max_depth = std::numeric_limits<float>::quiet_NaN()})
			.has_value()
	);
}

TEST(Mode, AcceptsBinCountBounds)
{
	EXPECT_TRUE(oit::validate({.tile_size = 1, .num_bins = 1, .max_depth = 1.0f}).has_value());
	EXPECT_TRUE(oit::validate({.tile_size = 1, .num_bins = 256, .max_depth = 1.0f}).has_value());
}
