#pragma once

#include "resource-box.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <expected>

namespace gpu
{
	///
	/// @brief GPU Sampler
	///
	///
	class Sampler : public Resource_box<SDL_GPUSampler>
	{
	  public:

		enum class Filter
		{
			Nearest = SDL_GPU_FILTER_NEAREST,
			Linear = SDL_GPU_FILTER_LINEAR
		};

		enum class Mipmap_mode
		{
			Nearest = SDL_GPU_SAMPLERMIPMAPMODE_NEAREST,
			Linear = SDL_GPU_SAMPLERMIPMAPMODE_LINEAR
		};

		enum class Address_mode
		{
			Repeat = SDL_GPU_SAMPLERADDRESSMODE_REPEAT,
			Mirrored_repeat = SDL_GPU_SAMPLERADDRESSMODE_MIRRORED_REPEAT,
			Clamp_to_edge = SDL_GPU_SAMPLERADDRESSMODE_CLAMP_TO_EDGE
		};

		struct Create_info
		{
			Filter min_filter = Filter::Nearest;
			Filter mag_filter = Filter::Nearest;
			Mipmap_mode mipmap_mode = Mipmap_mode::Nearest;
			Address_mode address_mode_u = Address_mode::Repeat;
			Address_mode address_mode_v = Address_mode::Repeat;
			Address_mode address_mode_w = Address_mode::Repeat;
			float mip_lod_bias = 0.0f;
			float min_lod = 0.0f;
			float max_lod = 1000.0f;
		};

		Sampler(const Sampler&) = delete;
		Sampler(Sampler&&) = default;
		Sampler& operator=(const Sampler&) = delete;
		Sampler& operator=(Sampler&&) = default;
		~Sampler() noexcept = default;

		static std::expected<Sampler, util::Error> create(
			SDL_GPUDevice* device,
			const Create_info& create_info
		) noexcept;

	  private:

		using Resource_box<SDL_GPUSampler>::Resource_box;
	};
}
