#include "oit/pass.hpp"

#include <SDL3/SDL_gpu.h>
#include <array>

namespace oit
{
	std::expected<gpu::Render_pass, util::Error> acquire_accumulation_pass(
		const gpu::Command_buffer& command_buffer,
		const target::Wboit& wboit,
		SDL_GPUTexture* depth_texture
	) noexcept
	{
		const auto accum_target_info = SDL_GPUColorTargetInfo{
			.texture = *wboit.accum_texture,
			.mip_level = 0,
			.layer_or_depth_plane = 0,
			.clear_color = {.r = 0, .g = 0, .b = 0, .a = 0},
			.load_op = SDL_GPU_LOADOP_CLEAR,
			.store_op = SDL_GPU_STOREOP_STORE,
			.resolve_texture = nullptr,
			.resolve_mip_level = 0,
			.resolve_layer = 0,
			.cycle = true,
			.cycle_resolve_texture = false,
			.padding1 = 0,
			.padding2 = 0
		};

		const auto revealage_target_info = SDL_GPUColorTargetInfo{
			.texture = wboit.current_revealage(),
			.mip_level = 0,
			.layer_or_depth_plane = 0,
			.clear_color = {.r = 1, .g = 1, .b = 1, .a = 1},
			.load_op = SDL_GPU_LOADOP_CLEAR,
			.store_op = SDL_GPU_STOREOP_STORE,
			.resolve_texture = nullptr,
			.resolve_mip_level = 0,
			.resolve_layer = 0,
			.cycle = true,
			.cycle_resolve_texture = false,
			.padding1 = 0,
			.padding2 = 0
		};

		const auto depth_stencil_target_info = SDL_GPUDepthStencilTargetInfo{
			.texture = depth_texture,
			.clear_depth = 0.0f,
			.load_op = SDL_GPU_LOADOP_LOAD,
			.store_op = SDL_GPU_STOREOP_STORE,
			.stencil_load_op = SDL_GPU_LOADOP_LOAD,
			.stencil_store_op = SDL_GPU_STOREOP_STORE,
			.cycle = false,
			.clear_stencil = 0,
			.mip_level = 0,
			.layer = 0
		};

		const std::array color_targets = {accum_target_info, revealage_target_info};

		return command_buffer.begin_render_pass(color_targets, depth_stencil_target_info);
	}

	std::expected<void, util::Error> clear_previous_revealage(
		const gpu::Command_buffer& command_buffer,
		const target::Wboit& wboit
	) noexcept
	{
		const auto revealage_target_info = SDL_GPUColorTargetInfo{
			.texture = wboit.previous_revealage(),
			.mip_level = 0,
			.layer_or_depth_plane = 0,
			.clear_color = {.r = 1, .g = 1, .b = 1, .a = 1},
			.load_op = SDL_GPU_LOADOP_CLEAR,
			.store_op = SDL_GPU_STOREOP_STORE,
			.resolve_texture = nullptr,
			.resolve_mip_level = 0,
			.resolve_layer = 0,
			.cycle = true,
			.cycle_resolve_texture = false,
			.padding1 = 0,
			.padding2 = 0
		};

		return command_buffer.run_render_pass(
			std::span(&revealage_target_info, 1),
			std::nullopt,
			[](const gpu::Render_pass&) {}
		);
	}
}
