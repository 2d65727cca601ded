#pragma once

#include "gpu/command-buffer.hpp"
#include "gpu/sampler.hpp"
#include "graphics/util/fullscreen-pass.hpp"
#include "oit/target/wboit.hpp"

#include <expected>

namespace oit::pipeline
{
	///
	/// @brief Resolves accumulation and revealage onto the view's color target
	/// @details Outputs `(accum.rgb / accum.a * (1 - revealage), 1 - revealage)` with premultiplied-alpha
	/// blending, leaving the target untouched where revealage is 1
	///
	class Composite
	{
	  public:

		static std::expected<Composite, util::Error> create(
			SDL_GPUDevice* device,
			SDL_GPUTextureFormat target_format
		) noexcept;

		std::expected<void, util::Error> render(
			const gpu::Command_buffer& command_buffer,
			const target::Wboit& wboit,
			SDL_GPUTexture* target_texture
		) const noexcept;

	  private:

		graphics::Fullscreen_pass fullscreen_pass;
		gpu::Sampler nearest_sampler;

		Composite(graphics::Fullscreen_pass fullscreen_pass, gpu::Sampler nearest_sampler) noexcept :
			fullscreen_pass(std::move(fullscreen_pass)),
			nearest_sampler(std::move(nearest_sampler))
		{}

	  public:

		Composite(const Composite&) = delete;
		Composite(Composite&&) = default;
		Composite& operator=(const Composite&) = delete;
		Composite& operator=(Composite&&) = default;
	};
}
