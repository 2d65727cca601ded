#pragma once

#include "gpu/command-buffer.hpp"
#include "gpu/graphics-pipeline.hpp"
#include "gpu/graphics-shader.hpp"
#include "gpu/render-pass.hpp"
#include "gpu/texture.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <expected>
#include <span>
#include <string>

namespace graphics
{
	enum class Fullscreen_blend_mode
	{
		Overwrite,
		Premultiplied_alpha
	};

	///
	/// @brief Fullscreen pass, draws a single triangle covering the whole target with a given fragment
	/// shader
	/// @details The vertex shader outputs `uv` at location 0, ranging from (0,0) at the top-left corner
	/// to (1,1) at the bottom-right corner
	///
	class Fullscreen_pass
	{
	  public:

		struct Options
		{
			bool clear_before_render = true;
			bool do_cycle = true;
			Fullscreen_blend_mode blend_mode = Fullscreen_blend_mode::Overwrite;
		};

		///
		/// @brief Create a fullscreen pass
		///
		/// @param fragment_shader Fragment shader, reads `uv` from location 0
		/// @param target_format Format of the target texture
		/// @param options Load and blend options
		/// @param name Debug name of the pipeline
		/// @return Created fullscreen pass, or error
		///
		static std::expected<Fullscreen_pass, util::Error> create(
			SDL_GPUDevice* device,
			const gpu::Graphics_shader& fragment_shader,
			const gpu::Texture::Format& target_format,
			const Options& options,
			const std::string& name
		) noexcept;

		///
		/// @brief Begin a render pass on @p target_texture and draw the fullscreen triangle
		///
		/// @param sampler_bindings Fragment sampler bindings, starting from slot 0
		///
		std::expected<void, util::Error> render(
			const gpu::Command_buffer& command_buffer,
			SDL_GPUTexture* target_texture,
			std::span<const SDL_GPUTextureSamplerBinding> sampler_bindings
		) const noexcept;

		///
		/// @brief Draw the fullscreen triangle into an existing render pass
		///
		void render_to_renderpass(
			const gpu::Render_pass& render_pass,
			std::span<const SDL_GPUTextureSamplerBinding> sampler_bindings
		) const noexcept;

	  private:

		gpu::Graphics_shader vertex_shader;
		gpu::Graphics_pipeline pipeline;
		Options options;

		Fullscreen_pass(
			gpu::Graphics_shader vertex_shader,
			gpu::Graphics_pipeline pipeline,
			const Options& options
		) noexcept :
			vertex_shader(std::move(vertex_shader)),
			pipeline(std::move(pipeline)),
			options(options)
		{}

	  public:

		Fullscreen_pass(const Fullscreen_pass&) = delete;
		Fullscreen_pass(Fullscreen_pass&&) = default;
		Fullscreen_pass& operator=(const Fullscreen_pass&) = delete;
		Fullscreen_pass& operator=(Fullscreen_pass&&) = default;
	};
}
