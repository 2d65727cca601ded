#pragma once

#include "resource-box.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <cstddef>
#include <expected>
#include <span>
#include <string>

namespace gpu
{
	///
	/// @brief Compute Pipeline
	///
	///
	class Compute_pipeline : public Resource_box<SDL_GPUComputePipeline>
	{
	  public:

		struct Create_info
		{
			std::span<const std::byte> shader_data;
			uint32_t num_samplers = 0;
			uint32_t num_readonly_storage_textures = 0;
			uint32_t num_readonly_storage_buffers = 0;
			uint32_t num_readwrite_storage_textures = 0;
			uint32_t num_readwrite_storage_buffers = 0;
			uint32_t num_uniform_buffers = 0;
			uint32_t threadcount_x = 1;
			uint32_t threadcount_y = 1;
			uint32_t threadcount_z = 1;
		};

		Compute_pipeline(const Compute_pipeline&) = delete;
		Compute_pipeline(Compute_pipeline&&) = default;
		Compute_pipeline& operator=(const Compute_pipeline&) = delete;
		Compute_pipeline& operator=(Compute_pipeline&&) = default;
		~Compute_pipeline() noexcept = default;

		///
		/// @brief Create a compute pipeline from SPIR-V code
		///
		/// @param create_info Resource layout and workgroup size
		/// @param name Debug name
		/// @return Created pipeline, or error
		///
		static std::expected<Compute_pipeline, util::Error> create(
			SDL_GPUDevice* device,
			const Create_info& create_info,
			const std::string& name
		) noexcept;

	  private:

		using Resource_box<SDL_GPUComputePipeline>::Resource_box;
	};
}
