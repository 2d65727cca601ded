#include "oit/device.hpp"

#include <gtest/gtest.h>
#include <string>

TEST(Device_support, VulkanRunsBothVariants)
{
	const auto support = oit::Device_support::from("vulkan", SDL_GPU_SHADERFORMAT_SPIRV);

	EXPECT_TRUE(support.spirv);
	EXPECT_TRUE(support.fragment_storage_atomics);
	EXPECT_TRUE(support.check(oit::Variant::Naive).has_value());
	EXPECT_TRUE(support.check(oit::Variant::Histogram).has_value());
}

TEST(Device_support, OtherBackendsRunNaiveOnly)
{
	for (const auto* driver : {"direct3d12", "metal"})
	{
		const auto support =
			oit::Device_support::from(driver, SDL_GPU_SHADERFORMAT_SPIRV | SDL_GPU_SHADERFORMAT_MSL);

		EXPECT_FALSE(support.fragment_storage_atomics) << driver;
		EXPECT_TRUE(support.check(oit::Variant::Naive).has_value()) << driver;
		EXPECT_FALSE(support.check(oit::Variant::Histogram).has_value()) << driver;
	}
}

TEST(Device_support, NoSpirvRunsNothing)
{
	const auto support = oit::Device_support::from("vulkan", SDL_GPU_SHADERFORMAT_DXIL);

	EXPECT_FALSE(support.spirv);
	EXPECT_FALSE(support.fragment_storage_atomics);
	EXPECT_FALSE(support.check(oit::Variant::Naive).has_value());
	EXPECT_FALSE(support.check(oit::Variant::Histogram).has_value());
}

TEST(Device_support, ErrorNamesTheBackendLimit)
{
	const auto result = oit::Device_support::from("metal", SDL_GPU_SHADERFORMAT_MSL | SDL_GPU_SHADERFORMAT_SPIRV)
							.check(oit::Variant::Histogram);

	ASSERT_FALSE(result.has_value());
	EXPECT_NE(result.error()->front().message.find("Vulkan"), std::string::npos);
}
