#pragma once

#include "gpu/buffer.hpp"
#include "gpu/texture.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <expected>
#include <glm/glm.hpp>
#include <string>

namespace graphics
{
	///
	/// @brief Creates textures and buffers on a GPU device
	/// @details Render targets take the allocator as a template parameter. Any type with the same
	/// `Texture`/`Buffer` member types and `create_texture`/`create_buffer` functions can stand in for it.
	///
	class Device_allocator
	{
	  public:

		using Texture = gpu::Texture;
		using Buffer = gpu::Buffer;

		explicit Device_allocator(SDL_GPUDevice* device) noexcept :
			device(device)
		{}

		///
		/// @brief Create a single-level texture
		///
		/// @param size Extent, (width, height, depth-or-layers)
		///
		std::expected<gpu::Texture, util::Error> create_texture(
			const gpu::Texture::Format& format,
			glm::u32vec3 size,
			const std::string& name
		) const noexcept;

		std::expected<gpu::Buffer, util::Error> create_buffer(
			gpu::Buffer::Usage usage,
			uint32_t size,
			const std::string& name
		) const noexcept;

	  private:

		SDL_GPUDevice* device;
	};
}
