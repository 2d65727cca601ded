#pragma once

#include "gpu/texture.hpp"
#include "oit/mode.hpp"

#include <SDL3/SDL_gpu.h>
#include <cstdint>
#include <glm/glm.hpp>
#include <optional>

namespace oit
{
	using View_id = uint64_t;

	///
	/// @brief Host-side configuration of a view
	///
	struct Camera
	{
		Mode mode = mode::Inactive{};
		SDL_GPUSampleCount sample_count = SDL_GPU_SAMPLECOUNT_1;

		// Usage of the view's depth texture. Gains `sampler` when the view becomes active, the host creates
		// its depth texture with these flags.
		gpu::Texture::Usage depth_usage = {.depth_stencil_target = true};
	};

	///
	/// @brief Per-frame render target of a view
	///
	struct View
	{
		View_id id;
		std::optional<glm::u32vec2> viewport_size;  // `std::nullopt` if not known yet this frame
		SDL_GPUTexture* color_texture;              // Opaque scene color, composited onto
		SDL_GPUTexture* depth_texture;              // Opaque scene depth, reversed-Z
	};
}
