#include "gpu/render-pass.hpp"

#include <cassert>
#include <utility>

namespace gpu
{
	Render_pass::Render_pass(Render_pass&& other) noexcept :
		render_pass(std::exchange(other.render_pass, nullptr))
	{}

	Render_pass& Render_pass::operator=(Render_pass&& other) noexcept
	{
		if (&other != this) std::swap(render_pass, other.render_pass);
		return *this;
	}

	void Render_pass::bind_pipeline(const Graphics_pipeline& pipeline) const noexcept
	{
		assert(render_pass != nullptr);
		SDL_BindGPUGraphicsPipeline(render_pass, pipeline);
	}

	void Render_pass::bind_vertex_buffers(
		uint32_t first_slot,
		std::span<const SDL_GPUBufferBinding> bindings
	) const noexcept
	{
		assert(render_pass != nullptr);
		SDL_BindGPUVertexBuffers(render_pass, first_slot, bindings.data(), bindings.size());
	}

	void Render_pass::bind_index_buffer(
		const SDL_GPUBufferBinding& binding,
		SDL_GPUIndexElementSize index_size
	) const noexcept
	{
		assert(render_pass != nullptr);
		SDL_BindGPUIndexBuffer(render_pass, &binding, index_size);
	}

	void Render_pass::bind_fragment_samplers(
		uint32_t first_slot,
		std::span<const SDL_GPUTextureSamplerBinding> bindings
	) const noexcept
	{
		assert(render_pass != nullptr);
		SDL_BindGPUFragmentSamplers(render_pass, first_slot, bindings.data(), bindings.size());
	}

	void Render_pass::bind_fragment_storage_buffers(
		uint32_t first_slot,
		std::span<SDL_GPUBuffer* const> buffers
	) const noexcept
	{
		assert(render_pass != nullptr);
		SDL_BindGPUFragmentStorageBuffers(render_pass, first_slot, buffers.data(), buffers.size());
	}

	void Render_pass::draw(
		uint32_t num_vertices,
		uint32_t first_vertex,
		uint32_t num_instances,
		uint32_t first_instance
	) const noexcept
	{
		assert(render_pass != nullptr);
		SDL_DrawGPUPrimitives(render_pass, num_vertices, num_instances, first_vertex, first_instance);
	}

	void Render_pass::draw_indexed(
		uint32_t num_indices,
		uint32_t first_index,
		uint32_t num_instances,
		int32_t vertex_offset,
		uint32_t first_instance
	) const noexcept
	{
		assert(render_pass != nullptr);
		SDL_DrawGPUIndexedPrimitives(
			render_pass,
			num_indices,
			num_instances,
			first_index,
			vertex_offset,
			first_instance
		);
	}

	void Render_pass::end() noexcept
	{
		assert(render_pass != nullptr);
		SDL_EndGPURenderPass(render_pass);
		render_pass = nullptr;
	}

	Render_pass::operator SDL_GPURenderPass*() const noexcept
	{
		return render_pass;
	}
}
