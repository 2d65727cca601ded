#pragma once

#include "resource-box.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <expected>
#include <string>

namespace gpu
{
	///
	/// @brief GPU Texture
	///
	///
	class Texture : public Resource_box<SDL_GPUTexture>
	{
	  public:

		///
		/// @brief Texture usage flags, bit-compatible with `SDL_GPUTextureUsageFlags`
		///
		struct Usage
		{
			bool sampler : 1 = false;
			bool color_target : 1 = false;
			bool depth_stencil_target : 1 = false;
			bool graphic_storage_read : 1 = false;
			bool compute_storage_read : 1 = false;
			bool compute_storage_write : 1 = false;
			bool compute_simultaneous_read_write : 1 = false;
			bool _reserved : 1 = false;

			operator SDL_GPUTextureUsageFlags(this Usage self) noexcept;
		};

		static_assert(sizeof(Usage) == 1);

		///
		/// @brief Texture format description, shared by all textures of a render target
		///
		struct Format
		{
			SDL_GPUTextureType type;
			SDL_GPUTextureFormat format;
			Usage usage;

			///
			/// @brief Get creation info for a texture of this format
			///
			/// @param depth Layer count for array textures, or depth for 3D textures
			///
			SDL_GPUTextureCreateInfo create(
				uint32_t width,
				uint32_t height,
				uint32_t depth = 1,
				uint32_t mip_levels = 1,
				SDL_GPUSampleCount sample_count = SDL_GPU_SAMPLECOUNT_1
			) const noexcept;

			///
			/// @brief Check if the format, type and usage combination is supported on the device
			///
			bool supported_on(SDL_GPUDevice* device) const noexcept;
		};

		Texture(const Texture&) = delete;
		Texture(Texture&&) = default;
		Texture& operator=(const Texture&) = delete;
		Texture& operator=(Texture&&) = default;
		~Texture() noexcept = default;

		static std::expected<Texture, util::Error> create(
			SDL_GPUDevice* device,
			const SDL_GPUTextureCreateInfo& create_info,
			const std::string& name
		) noexcept;

		///
		/// @brief Create a sampler binding of this texture
		///
		/// @param sampler Sampler to bind with
		/// @return Texture-sampler binding
		///
		SDL_GPUTextureSamplerBinding bind_with_sampler(SDL_GPUSampler* sampler) const noexcept;

	  private:

		using Resource_box<SDL_GPUTexture>::Resource_box;
	};
}
