#pragma once

#include "compute-pass.hpp"
#include "render-pass.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <span>

namespace gpu
{
	///
	/// @brief GPU Command Buffer
	/// @note Must be submitted exactly once
	///
	class Command_buffer
	{
	  public:

		Command_buffer(const Command_buffer&) = delete;
		Command_buffer(Command_buffer&& other) noexcept;
		Command_buffer& operator=(const Command_buffer&) = delete;
		Command_buffer& operator=(Command_buffer&& other) noexcept;
		~Command_buffer() noexcept = default;

		///
		/// @brief Acquire a command buffer from the device
		///
		/// @return Acquired command buffer, or error
		///
		static std::expected<Command_buffer, util::Error> acquire_from(SDL_GPUDevice* device) noexcept;

		///
		/// @brief Begin a render pass
		///
		/// @param color_targets Color target infos
		/// @param depth_stencil_target Depth-stencil target info, `std::nullopt` if none
		/// @return Render pass, or error
		///
		std::expected<Render_pass, util::Error> begin_render_pass(
			std::span<const SDL_GPUColorTargetInfo> color_targets,
			const std::optional<SDL_GPUDepthStencilTargetInfo>& depth_stencil_target
		) const noexcept;

		///
		/// @brief Begin a render pass, run @p task in it, then end it
		///
		std::expected<void, util::Error> run_render_pass(
			std::span<const SDL_GPUColorTargetInfo> color_targets,
			const std::optional<SDL_GPUDepthStencilTargetInfo>& depth_stencil_target,
			const std::function<void(const Render_pass&)>& task
		) const noexcept;

		///
		/// @brief Begin a compute pass
		///
		/// @param storage_textures Read-write storage texture bindings
		/// @param storage_buffers Read-write storage buffer bindings
		/// @return Compute pass, or error
		///
		std::expected<Compute_pass, util::Error> begin_compute_pass(
			std::span<const SDL_GPUStorageTextureReadWriteBinding> storage_textures,
			std::span<const SDL_GPUStorageBufferReadWriteBinding> storage_buffers
		) const noexcept;

		///
		/// @brief Begin a compute pass, run @p task in it, then end it
		///
		std::expected<void, util::Error> run_compute_pass(
			std::span<const SDL_GPUStorageTextureReadWriteBinding> storage_textures,
			std::span<const SDL_GPUStorageBufferReadWriteBinding> storage_buffers,
			const std::function<void(const Compute_pass&)>& task
		) const noexcept;

		void push_uniform_to_vertex(uint32_t slot, std::span<const std::byte> data) const noexcept;
		void push_uniform_to_fragment(uint32_t slot, std::span<const std::byte> data) const noexcept;
		void push_uniform_to_compute(uint32_t slot, std::span<const std::byte> data) const noexcept;

		void push_debug_group(const char* name) const noexcept;
		void pop_debug_group() const noexcept;

		///
		/// @brief Submit the command buffer
		/// @note The command buffer is invalid after submission, regardless of the result
		///
		std::expected<void, util::Error> submit() noexcept;

		operator SDL_GPUCommandBuffer*() const noexcept;

	  private:

		SDL_GPUDevice* device = nullptr;
		SDL_GPUCommandBuffer* cmd_buffer = nullptr;

		Command_buffer(SDL_GPUDevice* device, SDL_GPUCommandBuffer* resource) noexcept;
	};
}
