#include "graphics/util/fullscreen-pass.hpp"

#include "asset/shader/fullscreen.vert.hpp"

#include <array>

namespace graphics
{
	namespace
	{
		SDL_GPUColorTargetBlendState get_blend_state(Fullscreen_blend_mode mode) noexcept
		{
			switch (mode)
			{
			case Fullscreen_blend_mode::Premultiplied_alpha:
				return {
					.src_color_blendfactor = SDL_GPU_BLENDFACTOR_ONE,
					.dst_color_blendfactor = SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA,
					.color_blend_op = SDL_GPU_BLENDOP_ADD,
					.src_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE,
					.dst_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA,
					.alpha_blend_op = SDL_GPU_BLENDOP_ADD,
					.color_write_mask = 0,
					.enable_blend = true,
					.enable_color_write_mask = false,
					.padding1 = 0,
					.padding2 = 0
				};

			case Fullscreen_blend_mode::Overwrite:
			default:
				return {
					.src_color_blendfactor = SDL_GPU_BLENDFACTOR_ONE,
					.dst_color_blendfactor = SDL_GPU_BLENDFACTOR_ZERO,
					.color_blend_op = SDL_GPU_BLENDOP_ADD,
					.src_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE,
					.dst_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ZERO,
					.alpha_blend_op = SDL_GPU_BLENDOP_ADD,
					.color_write_mask = 0,
					.enable_blend = false,
					.enable_color_write_mask = false,
					.padding1 = 0,
					.padding2 = 0
				};
			}
		}
	}

	std::expected<Fullscreen_pass, util::Error> Fullscreen_pass::create(
		SDL_GPUDevice* device,
		const gpu::Graphics_shader& fragment_shader,
		const gpu::Texture::Format& target_format,
		const Options& options,
		const std::string& name
	) noexcept
	{
		auto vertex_shader = gpu::Graphics_shader::create(
			device,
			shader_asset::fullscreen_vert,
			gpu::Graphics_shader::Stage::Vertex,
			0,
			0,
			0,
			0
		);
		if (!vertex_shader) return vertex_shader.error().forward("Create fullscreen vertex shader failed");

		const SDL_GPURasterizerState rasterizer_state{
			.fill_mode = SDL_GPU_FILLMODE_FILL,
			.cull_mode = SDL_GPU_CULLMODE_NONE,
			.front_face = SDL_GPU_FRONTFACE_COUNTER_CLOCKWISE,
			.depth_bias_constant_factor = 0,
			.depth_bias_clamp = 0,
			.depth_bias_slope_factor = 0,
			.enable_depth_bias = false,
			.enable_depth_clip = false,
			.padding1 = 0,
			.padding2 = 0
		};

		const auto color_target_desc = std::to_array<SDL_GPUColorTargetDescription>({
			{.format = target_format.format, .blend_state = get_blend_state(options.blend_mode)}
		});

		auto pipeline = gpu::Graphics_pipeline::create(
			device,
			*vertex_shader,
			fragment_shader,
			SDL_GPU_PRIMITIVETYPE_TRIANGLELIST,
			SDL_GPU_SAMPLECOUNT_1,
			rasterizer_state,
			{},
			{},
			color_target_desc,
			std::nullopt,
			name
		);
		if (!pipeline) return pipeline.error().forward("Create fullscreen pipeline failed");

		return Fullscreen_pass(std::move(*vertex_shader), std::move(*pipeline), options);
	}

	std::expected<void, util::Error> Fullscreen_pass::render(
		const gpu::Command_buffer& command_buffer,
		SDL_GPUTexture* target_texture,
		std::span<const SDL_GPUTextureSamplerBinding> sampler_bindings
	) const noexcept
	{
		const SDL_GPUColorTargetInfo color_target_info{
			.texture = target_texture,
			.mip_level = 0,
			.layer_or_depth_plane = 0,
			.clear_color = {.r = 0, .g = 0, .b = 0, .a = 0},
			.load_op = options.clear_before_render ? SDL_GPU_LOADOP_CLEAR : SDL_GPU_LOADOP_LOAD,
			.store_op = SDL_GPU_STOREOP_STORE,
			.resolve_texture = nullptr,
			.resolve_mip_level = 0,
			.resolve_layer = 0,
			.cycle = options.do_cycle,
			.cycle_resolve_texture = false,
			.padding1 = 0,
			.padding2 = 0
		};

		return command_buffer.run_render_pass(
			std::span(&color_target_info, 1),
			std::nullopt,
			[this, sampler_bindings](const gpu::Render_pass& render_pass) {
				render_to_renderpass(render_pass, sampler_bindings);
			}
		);
	}

	void Fullscreen_pass::render_to_renderpass(
		const gpu::Render_pass& render_pass,
		std::span<const SDL_GPUTextureSamplerBinding> sampler_bindings
	) const noexcept
	{
		render_pass.bind_pipeline(pipeline);
		if (!sampler_bindings.empty()) render_pass.bind_fragment_samplers(0, sampler_bindings);
		render_pass.draw(3, 0, 1, 0);
	}
}
