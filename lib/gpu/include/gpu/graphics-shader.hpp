#pragma once

#include "resource-box.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <cstddef>
#include <expected>
#include <span>

namespace gpu
{
	///
	/// @brief Graphics shader (vertex or fragment), from SPIR-V code
	///
	///
	class Graphics_shader : public Resource_box<SDL_GPUShader>
	{
	  public:

		enum class Stage
		{
			Vertex = SDL_GPU_SHADERSTAGE_VERTEX,
			Fragment = SDL_GPU_SHADERSTAGE_FRAGMENT
		};

		Graphics_shader(const Graphics_shader&) = delete;
		Graphics_shader(Graphics_shader&&) = default;
		Graphics_shader& operator=(const Graphics_shader&) = delete;
		Graphics_shader& operator=(Graphics_shader&&) = default;
		~Graphics_shader() noexcept = default;

		///
		/// @brief Create a graphics shader
		///
		/// @param shader_data SPIR-V code, entry point `main`
		/// @param stage Shader stage
		/// @param num_samplers Number of sampled textures
		/// @param num_storage_textures Number of storage textures
		/// @param num_storage_buffers Number of storage buffers
		/// @param num_uniform_buffers Number of uniform buffers
		/// @return Created shader, or error
		///
		static std::expected<Graphics_shader, util::Error> create(
			SDL_GPUDevice* device,
			std::span<const std::byte> shader_data,
			Stage stage,
			uint32_t num_samplers,
			uint32_t num_storage_textures,
			uint32_t num_storage_buffers,
			uint32_t num_uniform_buffers
		) noexcept;

	  private:

		using Resource_box<SDL_GPUShader>::Resource_box;
	};
}
