#pragma once

#include "gpu/command-buffer.hpp"
#include "gpu/render-pass.hpp"
#include "oit/target/wboit.hpp"

namespace oit
{
	///
	/// @brief Acquire and begin WBOIT Accumulation Render Pass
	/// @note This doesn't prepare the render targets. Prepare before use.
	/// @details
	/// #### Layout
	/// Color Attachments:
	/// 1. (`location=0`) Accumulation Texture, cleared to 0
	/// 2. (`location=1`) Current Revealage Texture, cleared to 1
	///
	/// Depth-Stencil Attachment:
	/// 1. Opaque Depth Texture of the view, loaded and kept
	///
	/// @param command_buffer Command Buffer
	/// @param wboit WBOIT Target
	/// @param depth_texture Opaque depth texture of the view
	/// @return Acquired Render Pass
	///
	std::expected<gpu::Render_pass, util::Error> acquire_accumulation_pass(
		const gpu::Command_buffer& command_buffer,
		const target::Wboit& wboit,
		SDL_GPUTexture* depth_texture
	) noexcept;

	///
	/// @brief Clear the previous revealage texture to 1, for frames without a valid history
	///
	std::expected<void, util::Error> clear_previous_revealage(
		const gpu::Command_buffer& command_buffer,
		const target::Wboit& wboit
	) noexcept;
}
