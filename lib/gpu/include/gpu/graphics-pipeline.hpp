#pragma once

#include "graphics-shader.hpp"
#include "resource-box.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace gpu
{
	///
	/// @brief Graphics Pipeline
	///
	///
	class Graphics_pipeline : public Resource_box<SDL_GPUGraphicsPipeline>
	{
	  public:

		struct Depth_stencil_state
		{
			SDL_GPUTextureFormat format;
			SDL_GPUCompareOp compare_op;
			SDL_GPUStencilOpState back_stencil_state;
			SDL_GPUStencilOpState front_stencil_state;
			uint8_t compare_mask;
			uint8_t write_mask;
			bool enable_depth_test;
			bool enable_depth_write;
			bool enable_stencil_test;
		};

		Graphics_pipeline(const Graphics_pipeline&) = delete;
		Graphics_pipeline(Graphics_pipeline&&) = default;
		Graphics_pipeline& operator=(const Graphics_pipeline&) = delete;
		Graphics_pipeline& operator=(Graphics_pipeline&&) = default;
		~Graphics_pipeline() noexcept = default;

		///
		/// @brief Create a graphics pipeline
		///
		/// @param depth_stencil_state Depth-stencil state, `std::nullopt` if no depth-stencil target
		/// @param name Debug name
		/// @return Created pipeline, or error
		///
		static std::expected<Graphics_pipeline, util::Error> create(
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
		) noexcept;

	  private:

		using Resource_box<SDL_GPUGraphicsPipeline>::Resource_box;
	};
}
