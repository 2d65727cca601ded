#include "gpu/graphics-pipeline.hpp"
#include "gpu/util.hpp"

#include <SDL3/SDL_properties.h>

namespace gpu
{
	std::expected<Graphics_pipeline, util::Error> Graphics_pipeline::create(
		SDL_GPUDevice* device,
		const Graphics_shader& vertex_shader,
		const Graphics_shader& fragment_shader,
		SDL_GPUPrimitiveType primitive_type,
		SDL_GPUSampleCount sample_count,
		const SDL_GPURasterizerState& rasterizer_state,
		std::span<const SDL_GPUVertexAttribute> vertex_attributes,
		std::span<const SDL_GPUVertexBufferDescription> vertex_buffer_descs,
		std::span<const SDL_GPUColorTargetDescription> color_target_descs,
		const std::optional<Depth_stencil_state>& depth_stencil_state,
		const std::string& name
	) noexcept
	{
		assert(device != nullptr);

		const SDL_GPUVertexInputState vertex_input_state{
			.vertex_buffer_descriptions = vertex_buffer_descs.data(),
			.num_vertex_buffers = static_cast<Uint32>(vertex_buffer_descs.size()),
			.vertex_attributes = vertex_attributes.data(),
			.num_vertex_attributes = static_cast<Uint32>(vertex_attributes.size())
		};

		SDL_GPUDepthStencilState sdl_depth_stencil_state{};
		if (depth_stencil_state.has_value())
		{
			sdl_depth_stencil_state = SDL_GPUDepthStencilState{
				.compare_op = depth_stencil_state->compare_op,
				.back_stencil_state = depth_stencil_state->back_stencil_state,
				.front_stencil_state = depth_stencil_state->front_stencil_state,
				.compare_mask = depth_stencil_state->compare_mask,
				.write_mask = depth_stencil_state->write_mask,
				.enable_depth_test = depth_stencil_state->enable_depth_test,
				.enable_depth_write = depth_stencil_state->enable_depth_write,
				.enable_stencil_test = depth_stencil_state->enable_stencil_test,
				.padding1 = 0,
				.padding2 = 0,
				.padding3 = 0
			};
		}

		const SDL_GPUGraphicsPipelineTargetInfo target_info{
			.color_target_descriptions = color_target_descs.data(),
			.num_color_targets = static_cast<Uint32>(color_target_descs.size()),
			.depth_stencil_format = depth_stencil_state.has_value() ? depth_stencil_state->format
																	: SDL_GPU_TEXTUREFORMAT_INVALID,
			.has_depth_stencil_target = depth_stencil_state.has_value(),
			.padding1 = 0,
			.padding2 = 0,
			.padding3 = 0
		};

		const auto props = SDL_CreateProperties();
		if (props == 0) RETURN_SDL_ERROR;
		SDL_SetStringProperty(props, SDL_PROP_GPU_GRAPHICSPIPELINE_CREATE_NAME_STRING, name.c_str());

		const SDL_GPUGraphicsPipelineCreateInfo create_info{
			.vertex_shader = vertex_shader,
			.fragment_shader = fragment_shader,
			.vertex_input_state = vertex_input_state,
			.primitive_type = primitive_type,
			.rasterizer_state = rasterizer_state,
			.multisample_state = {.sample_count = sample_count, .sample_mask = 0, .enable_mask = false},
			.depth_stencil_state = sdl_depth_stencil_state,
			.target_info = target_info,
			.props = props
		};

		auto* const pipeline = SDL_CreateGPUGraphicsPipeline(device, &create_info);
		SDL_DestroyProperties(props);
		if (pipeline == nullptr) RETURN_SDL_ERROR;

		return Graphics_pipeline(device, pipeline);
	}
}
