#include "gpu/graphics-shader.hpp"
#include "gpu/util.hpp"

namespace gpu
{
	std::expected<Graphics_shader, util::Error> Graphics_shader::create(
		SDL_GPUDevice* device,
		std::span<const std::byte> shader_data,
		Stage stage,
		uint32_t num_samplers,
		uint32_t num_storage_textures,
		uint32_t num_storage_buffers,
		uint32_t num_uniform_buffers
	) noexcept
	{
		assert(device != nullptr);

		if (shader_data.empty()) return util::Error("Empty shader code");

		const SDL_GPUShaderCreateInfo create_info{
			.code_size = shader_data.size(),
			.code = reinterpret_cast<const Uint8*>(shader_data.data()),
			.entrypoint = "main",
			.format = SDL_GPU_SHADERFORMAT_SPIRV,
			.stage = static_cast<SDL_GPUShaderStage>(stage),
			.num_samplers = num_samplers,
			.num_storage_textures = num_storage_textures,
			.num_storage_buffers = num_storage_buffers,
			.num_uniform_buffers = num_uniform_buffers,
			.props = 0
		};

		auto* const shader = SDL_CreateGPUShader(device, &create_info);
		if (shader == nullptr) RETURN_SDL_ERROR;

		return Graphics_shader(device, shader);
	}
}
