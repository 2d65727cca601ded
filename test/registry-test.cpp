#include "oit/registry.hpp"

#include <algorithm>
#include <gtest/gtest.h>

namespace
{
	const auto vulkan = oit::Device_support::from("vulkan", SDL_GPU_SHADERFORMAT_SPIRV);
	const auto d3d12 = oit::Device_support::from("direct3d12", SDL_GPU_SHADERFORMAT_SPIRV | SDL_GPU_SHADERFORMAT_DXIL);
}

TEST(View_registry, MultisampledActiveViewIsFatal)
{
	oit::View_registry registry(vulkan);
	std::map<oit::View_id, oit::Camera> cameras{
		{1, {.mode = oit::mode::Naive{}, .sample_count = SDL_GPU_SAMPLECOUNT_4}}
	};

	const auto result = registry.configure(cameras);
	ASSERT_FALSE(result.has_value());
	EXPECT_EQ(registry.get_active_count(), 0u);
}

TEST(View_registry, MultisampledInactiveViewIsIgnored)
{
	oit::View_registry registry(vulkan);
	std::map<oit::View_id, oit::Camera> cameras{
		{1, {.mode = oit::mode::Inactive{}, .sample_count = SDL_GPU_SAMPLECOUNT_4}}
	};

	EXPECT_TRUE(registry.configure(cameras).has_value());
	EXPECT_FALSE(cameras[1].depth_usage.sampler);
}

TEST(View_registry, InvalidConfigurationAppliesNothing)
{
	oit::View_registry registry(vulkan);
	std::map<oit::View_id, oit::Camera> cameras{
		{1, {.mode = oit::mode::Naive{}}},
		{2, {.mode = oit::mode::Histogram{{.tile_size = 0}}}}
	};

	ASSERT_FALSE(registry.configure(cameras).has_value());
	EXPECT_TRUE(std::holds_alternative<oit::mode::Inactive>(registry.get_mode(1)));
	EXPECT_FALSE(cameras[1].depth_usage.sampler);
}

TEST(View_registry, DepthSamplerUsageAddedOnActivation)
{
	oit::View_registry registry(vulkan);
	std::map<oit::View_id, oit::Camera> cameras{{7, {.mode = oit::mode::Naive{}}}};

	ASSERT_TRUE(registry.configure(cameras).has_value());
	EXPECT_TRUE(cameras[7].depth_usage.sampler);
	EXPECT_TRUE(cameras[7].depth_usage.depth_stencil_target);

	// Arranged once, a host reset of the flag is not re-checked while the view stays active
	cameras[7].depth_usage.sampler = false;
	ASSERT_TRUE(registry.configure(cameras).has_value());
	EXPECT_FALSE(cameras[7].depth_usage.sampler);
}

TEST(View_registry, ModeChangeIsRecorded)
{
	oit::View_registry registry(vulkan);
	std::map<oit::View_id, oit::Camera> cameras{{1, {.mode = oit::mode::Naive{}}}};

	ASSERT_TRUE(registry.configure(cameras).has_value());
	EXPECT_TRUE(std::holds_alternative<oit::mode::Naive>(registry.get_mode(1)));

	cameras[1].mode = oit::mode::Histogram{{.tile_size = 16, .num_bins = 32, .max_depth = 50.0f}};
	const auto released = registry.configure(cameras);
	ASSERT_TRUE(released.has_value());
	EXPECT_TRUE(released->empty());

	const auto mode = registry.get_mode(1);
	const auto* histogram = std::get_if<oit::mode::Histogram>(&mode);
	ASSERT_NE(histogram, nullptr);
	EXPECT_EQ(histogram->params.tile_size, 16u);
	EXPECT_EQ(histogram->params.num_bins, 32u);
}

TEST(View_registry, DeactivatedAndVanishedViewsAreReleased)
{
	oit::View_registry registry(vulkan);
	std::map<oit::View_id, oit::Camera> cameras{
		{1, {.mode = oit::mode::Naive{}}},
		{2, {.mode = oit::mode::Histogram{}}},
		{3, {.mode = oit::mode::Naive{}}}
	};
	ASSERT_TRUE(registry.configure(cameras).has_value());
	EXPECT_EQ(registry.get_active_count(), 3u);

	cameras[1].mode = oit::mode::Inactive{};
	cameras.erase(3);

	auto released = registry.configure(cameras);
	ASSERT_TRUE(released.has_value());
	std::ranges::sort(*released);
	EXPECT_EQ(*released, (std::vector<oit::View_id>{1, 3}));
	EXPECT_EQ(registry.get_active_count(), 1u);
	EXPECT_TRUE(std::holds_alternative<oit::mode::Inactive>(registry.get_mode(3)));
}

TEST(View_registry, ReactivatedViewGetsDepthUsageAgain)
{
	oit::View_registry registry(vulkan);
	std::map<oit::View_id, oit::Camera> cameras{{1, {.mode = oit::mode::Naive{}}}};
	ASSERT_TRUE(registry.configure(cameras).has_value());

	cameras[1] = oit::Camera{};
	ASSERT_TRUE(registry.configure(cameras).has_value());
	EXPECT_FALSE(cameras[1].depth_usage.sampler);

	cameras[1].mode = oit::mode::Naive{};
	ASSERT_TRUE(registry.configure(cameras).has_value());
	EXPECT_TRUE(cameras[1].depth_usage.sampler);
}

TEST(View_registry, HistogramViewWithoutFragmentAtomicsIsFatal)
{
	oit::View_registry registry(d3d12);
	std::map<oit::View_id, oit::Camera> cameras{
		{1, {.mode = oit::mode::Naive{}}},
		{2, {.mode = oit::mode::Histogram{}}}
	};

	ASSERT_FALSE(registry.configure(cameras).has_value());
	EXPECT_EQ(registry.get_active_count(), 0u);
	EXPECT_FALSE(cameras[1].depth_usage.sampler);
	EXPECT_FALSE(cameras[2].depth_usage.sampler);
}

TEST(View_registry, NaiveViewWithoutFragmentAtomicsIsAccepted)
{
	oit::View_registry registry(d3d12);
	std::map<oit::View_id, oit::Camera> cameras{{1, {.mode = oit::mode::Naive{}}}};

	ASSERT_TRUE(registry.configure(cameras).has_value());
	EXPECT_EQ(registry.get_active_count(), 1u);
	EXPECT_TRUE(cameras[1].depth_usage.sampler);
}
