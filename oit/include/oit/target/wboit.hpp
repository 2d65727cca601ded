#pragma once

#include "graphics/util/allocator.hpp"
#include "graphics/util/smart-texture.hpp"
#include "oit/frame-cycle.hpp"

#include <SDL3/SDL_gpu.h>
#include <array>
#include <glm/glm.hpp>

namespace oit::target
{
	///
	/// @brief WBOIT accumulation targets of a view
	/// @details
	/// - `accum_texture`: weighted premultiplied color sum, cleared to 0 every frame
	/// - `revealage_textures`: product of `(1 - alpha)`, double-buffered through `frame_cycle`
	///
	template <typename Allocator>
	struct Basic_wboit
	{
		using Texture = typename Allocator::Texture;

		static constexpr gpu::Texture::Format accum_format{
			.type = SDL_GPU_TEXTURETYPE_2D,
			.format = SDL_GPU_TEXTUREFORMAT_R16G16B16A16_FLOAT,
			.usage = {.sampler = true, .color_target = true}
		};

		static constexpr gpu::Texture::Format revealage_format{
			.type = SDL_GPU_TEXTURETYPE_2D,
			.format = SDL_GPU_TEXTUREFORMAT_R8_UNORM,
			.usage = {.sampler = true, .color_target = true}
		};

		graphics::Basic_auto_texture<Allocator> accum_texture{accum_format, "WBOIT Accumulation Texture"};
		std::array<graphics::Basic_auto_texture<Allocator>, 2> revealage_textures{
			graphics::Basic_auto_texture<Allocator>{revealage_format, "WBOIT Revealage Texture [Index 0]"},
			graphics::Basic_auto_texture<Allocator>{revealage_format, "WBOIT Revealage Texture [Index 1]"}
		};

		Frame_cycle frame_cycle;

		///
		/// @brief Resize the textures to @p size and advance the frame cycle
		/// @note Called exactly once per frame, before any pass of this view
		///
		std::expected<void, util::Error> prepare(const Allocator& allocator, glm::u32vec2 size) noexcept
		{
			auto accum_result = accum_texture.resize(allocator, size);
			if (!accum_result) return accum_result.error().forward("Resize accumulation texture failed");

			bool recreated = *accum_result;
			for (auto& texture : revealage_textures)
			{
				auto revealage_result = texture.resize(allocator, size);
				if (!revealage_result) return revealage_result.error().forward("Resize revealage texture failed");
				recreated = recreated || *revealage_result;
			}

			if (recreated) frame_cycle.invalidate_history();
			frame_cycle.advance();

			return {};
		}

		const Texture& current_revealage() const noexcept { return *revealage_textures[frame_cycle.current()]; }

		const Texture& previous_revealage() const noexcept { return *revealage_textures[frame_cycle.previous()]; }
	};

	using Wboit = Basic_wboit<graphics::Device_allocator>;
}
