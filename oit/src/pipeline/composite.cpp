#include "oit/pipeline/composite.hpp"

#include "asset/shader/wboit-composite.frag.hpp"

#include <array>

namespace oit::pipeline
{
	std::expected<Composite, util::Error> Composite::create(
		SDL_GPUDevice* device,
		SDL_GPUTextureFormat target_format
	) noexcept
	{
		auto nearest_sampler = gpu::Sampler::create(
			device,
			gpu::Sampler::Create_info{
				.min_filter = gpu::Sampler::Filter::Nearest,
				.mag_filter = gpu::Sampler::Filter::Nearest,
				.mipmap_mode = gpu::Sampler::Mipmap_mode::Nearest,
				.address_mode_u = gpu::Sampler::Address_mode::Clamp_to_edge,
				.address_mode_v = gpu::Sampler::Address_mode::Clamp_to_edge,
				.max_lod = 0.0f
			}
		);
		if (!nearest_sampler) return nearest_sampler.error().forward("Create composite sampler failed");

		auto fragment_shader = gpu::Graphics_shader::create(
			device,
			shader_asset::wboit_composite_frag,
			gpu::Graphics_shader::Stage::Fragment,
			2,
			0,
			0,
			0
		);
		if (!fragment_shader) return fragment_shader.error().forward("Create composite fragment shader failed");

		auto fullscreen_pass = graphics::Fullscreen_pass::create(
			device,
			*fragment_shader,
			{.type = SDL_GPU_TEXTURETYPE_2D, .format = target_format, .usage = {.color_target = true}},
			{.clear_before_render = false,
			 .do_cycle = false,
			 .blend_mode = graphics::Fullscreen_blend_mode::Premultiplied_alpha},
			"WBOIT Composite Pipeline"
		);
		if (!fullscreen_pass) return fullscreen_pass.error().forward("Create composite fullscreen pass failed");

		return Composite(std::move(*fullscreen_pass), std::move(*nearest_sampler));
	}

	std::expected<void, util::Error> Composite::render(
		const gpu::Command_buffer& command_buffer,
		const target::Wboit& wboit,
		SDL_GPUTexture* target_texture
	) const noexcept
	{
		const auto sampler_bindings = std::array{
			wboit.accum_texture->bind_with_sampler(nearest_sampler),
			wboit.current_revealage().bind_with_sampler(nearest_sampler)
		};

		return fullscreen_pass.render(command_buffer, target_texture, sampler_bindings)
			.transform_error(util::Error::forward_fn("Render composite pass failed"));
	}
}
