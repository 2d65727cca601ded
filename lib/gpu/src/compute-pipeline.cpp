#include "gpu/compute-pipeline.hpp"
#include "gpu/util.hpp"

#include <SDL3/SDL_properties.h>

namespace gpu
{
	std::expected<Compute_pipeline, util::Error> Compute_pipeline::create(
		SDL_GPUDevice* device,
		const Create_info& create_info,
		const std::string& name
	) noexcept
	{
		assert(device != nullptr);

		if (create_info.shader_data.empty()) return util::Error("Empty compute shader code");

		const auto props = SDL_CreateProperties();
		if (props == 0) RETURN_SDL_ERROR;
		SDL_SetStringProperty(props, SDL_PROP_GPU_COMPUTEPIPELINE_CREATE_NAME_STRING, name.c_str());

		const SDL_GPUComputePipelineCreateInfo sdl_create_info{
			.code_size = create_info.shader_data.size(),
			.code = reinterpret_cast<const Uint8*>(create_info.shader_data.data()),
			.entrypoint = "main",
			.format = SDL_GPU_SHADERFORMAT_SPIRV,
			.num_samplers = create_info.num_samplers,
			.num_readonly_storage_textures = create_info.num_readonly_storage_textures,
			.num_readonly_storage_buffers = create_info.num_readonly_storage_buffers,
			.num_readwrite_storage_textures = create_info.num_readwrite_storage_textures,
			.num_readwrite_storage_buffers = create_info.num_readwrite_storage_buffers,
			.num_uniform_buffers = create_info.num_uniform_buffers,
			.threadcount_x = create_info.threadcount_x,
			.threadcount_y = create_info.threadcount_y,
			.threadcount_z = create_info.threadcount_z,
			.props = props
		};

		auto* const pipeline = SDL_CreateGPUComputePipeline(device, &sdl_create_info);
		SDL_DestroyProperties(props);
		if (pipeline == nullptr) RETURN_SDL_ERROR;

		return Compute_pipeline(device, pipeline);
	}
}
