#pragma once

#include "oit/mode.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <expected>
#include <string_view>

namespace oit
{
	///
	/// @brief What the GPU device can run of the WBOIT pipelines
	/// @details All shaders ship as SPIR-V. The histogram variant increments a storage buffer from the
	/// fragment stage, which SDL exposes as read-only; only the Vulkan backend passes the atomic through
	/// and makes it visible to the following compute pass.
	///
	struct Device_support
	{
		bool spirv = false;
		bool fragment_storage_atomics = false;

		///
		/// @brief Derive the support from the device's driver name and shader formats
		///
		/// @param driver Driver name as returned by `SDL_GetGPUDeviceDriver`
		///
		static Device_support from(std::string_view driver, SDL_GPUShaderFormat formats) noexcept;

		static Device_support query(SDL_GPUDevice* device) noexcept;

		///
		/// @brief Check that @p variant can run on the device
		///
		/// @return Error if not, which is a fatal configuration error
		///
		std::expected<void, util::Error> check(Variant variant) const noexcept;
	};
}
