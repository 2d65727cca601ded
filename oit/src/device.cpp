#include "oit/device.hpp"

#include <cassert>

namespace oit
{
	Device_support Device_support::from(std::string_view driver, SDL_GPUShaderFormat formats) noexcept
	{
		const bool spirv = (formats & SDL_GPU_SHADERFORMAT_SPIRV) != 0;

		return {.spirv = spirv, .fragment_storage_atomics = spirv && driver == "vulkan"};
	}

	Device_support Device_support::query(SDL_GPUDevice* device) noexcept
	{
		assert(device != nullptr);

		const char* const driver = SDL_GetGPUDeviceDriver(device);
		return from(driver != nullptr ? driver : "", SDL_GetGPUShaderFormats(device));
	}

	std::expected<void, util::Error> Device_support::check(Variant variant) const noexcept
	{
		if (!spirv) return util::Error("GPU device does not accept SPIR-V shaders");

		if (variant == Variant::Histogram && !fragment_storage_atomics)
			return util::Error("Histogram-equalized WBOIT needs fragment storage atomics, only on the Vulkan backend");

		return {};
	}
}
