#pragma once

#include "graphics-pipeline.hpp"

#include <SDL3/SDL_gpu.h>
#include <array>
#include <span>

namespace gpu
{
	///
	/// @brief Render pass, begun from a `Command_buffer`
	/// @note Call `end()` before beginning another pass on the same command buffer
	///
	class Render_pass
	{
	  public:

		Render_pass(const Render_pass&) = delete;
		Render_pass(Render_pass&& other) noexcept;
		Render_pass& operator=(const Render_pass&) = delete;
		Render_pass& operator=(Render_pass&& other) noexcept;
		~Render_pass() noexcept = default;

		void bind_pipeline(const Graphics_pipeline& pipeline) const noexcept;

		void bind_vertex_buffers(
			uint32_t first_slot,
			std::span<const SDL_GPUBufferBinding> bindings
		) const noexcept;

		void bind_index_buffer(
			const SDL_GPUBufferBinding& binding,
			SDL_GPUIndexElementSize index_size
		) const noexcept;

		void bind_fragment_samplers(
			uint32_t first_slot,
			std::span<const SDL_GPUTextureSamplerBinding> bindings
		) const noexcept;

		void bind_fragment_storage_buffers(
			uint32_t first_slot,
			std::span<SDL_GPUBuffer* const> buffers
		) const noexcept;

		template <typename... T>
		void bind_fragment_samplers(uint32_t first_slot, const T&... bindings) const noexcept
		{
			const std::array<SDL_GPUTextureSamplerBinding, sizeof...(T)> arr = {bindings...};
			bind_fragment_samplers(first_slot, std::span<const SDL_GPUTextureSamplerBinding>(arr));
		}

		template <typename... T>
		void bind_fragment_storage_buffers(uint32_t first_slot, const T&... buffers) const noexcept
		{
			const std::array<SDL_GPUBuffer*, sizeof...(T)> arr = {static_cast<SDL_GPUBuffer*>(buffers)...};
			bind_fragment_storage_buffers(first_slot, std::span<SDL_GPUBuffer* const>(arr));
		}

		void draw(
			uint32_t num_vertices,
			uint32_t first_vertex,
			uint32_t num_instances,
			uint32_t first_instance
		) const noexcept;

		void draw_indexed(
			uint32_t num_indices,
			uint32_t first_index,
			uint32_t num_instances,
			int32_t vertex_offset,
			uint32_t first_instance
		) const noexcept;

		void end() noexcept;

		operator SDL_GPURenderPass*() const noexcept;

	  private:

		friend class Command_buffer;

		SDL_GPURenderPass* render_pass = nullptr;

		explicit Render_pass(SDL_GPURenderPass* render_pass) noexcept :
			render_pass(render_pass)
		{}
	};
}
