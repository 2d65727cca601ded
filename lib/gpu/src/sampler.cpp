#include "gpu/sampler.hpp"
#include "gpu/util.hpp"

namespace gpu
{
	std::expected<Sampler, util::Error> Sampler::create(
		SDL_GPUDevice* device,
		const Create_info& create_info
	) noexcept
	{
		assert(device != nullptr);

		const SDL_GPUSamplerCreateInfo sdl_create_info{
			.min_filter = static_cast<SDL_GPUFilter>(create_info.min_filter),
			.mag_filter = static_cast<SDL_GPUFilter>(create_info.mag_filter),
			.mipmap_mode = static_cast<SDL_GPUSamplerMipmapMode>(create_info.mipmap_mode),
			.address_mode_u = static_cast<SDL_GPUSamplerAddressMode>(create_info.address_mode_u),
			.address_mode_v = static_cast<SDL_GPUSamplerAddressMode>(create_info.address_mode_v),
			.address_mode_w = static_cast<SDL_GPUSamplerAddressMode>(create_info.address_mode_w),
			.mip_lod_bias = create_info.mip_lod_bias,
			.max_anisotropy = 1.0f,
			.compare_op = SDL_GPU_COMPAREOP_INVALID,
			.min_lod = create_info.min_lod,
			.max_lod = create_info.max_lod,
			.enable_anisotropy = false,
			.enable_compare = false,
			.padding1 = 0,
			.padding2 = 0,
			.props = 0
		};

		auto* const sampler = SDL_CreateGPUSampler(device, &sdl_create_info);
		if (sampler == nullptr) RETURN_SDL_ERROR;

		return Sampler(device, sampler);
	}
}
