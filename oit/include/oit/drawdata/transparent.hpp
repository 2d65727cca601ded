#pragma once

#include "gpu/command-buffer.hpp"
#include "gpu/graphics-shader.hpp"
#include "gpu/render-pass.hpp"
#include "oit/mode.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace oit::drawdata
{
	///
	/// @brief One transparent draw of the host's standard transparent phase
	///
	struct Transparent_item
	{
		float distance;        // Distance to the camera
		uint32_t mesh_index;   // Host mesh reference, resolved through `Mesh_source`
		uint32_t batch_index;  // Host draw-call reference within the mesh
		bool indexed;
	};

	///
	/// @brief Vertex layout of a host mesh, enough to specialize an accumulation pipeline
	/// @details The vertex shader must output the premultiplied color (coverage in alpha) at `location=0`
	/// and the positive linear view depth at `location=1`.
	///
	struct Mesh_layout
	{
		const gpu::Graphics_shader* vertex_shader;
		std::span<const SDL_GPUVertexAttribute> vertex_attributes;
		std::span<const SDL_GPUVertexBufferDescription> vertex_buffers;
		SDL_GPUPrimitiveType primitive_type = SDL_GPU_PRIMITIVETYPE_TRIANGLELIST;
		SDL_GPUCullMode cull_mode = SDL_GPU_CULLMODE_NONE;
		uint64_t key;  // Equal keys imply equal layouts
	};

	///
	/// @brief Host collaborator resolving transparent items into layouts and draw calls
	///
	class Mesh_source
	{
	  public:

		virtual ~Mesh_source() = default;

		virtual std::expected<Mesh_layout, util::Error> get_layout(const Transparent_item& item) const noexcept = 0;

		///
		/// @brief Bind the item's vertex and index buffers and vertex-stage resources, then issue the draw
		/// @note Must not bind fragment-stage resources, they belong to the accumulation pipeline
		///
		virtual void draw(
			const gpu::Command_buffer& command_buffer,
			const gpu::Render_pass& render_pass,
			const Transparent_item& item
		) const noexcept = 0;
	};

	using Pipeline_id = size_t;

	///
	/// @brief Resolves a mesh layout into an accumulation pipeline
	///
	class Specializer
	{
	  public:

		virtual ~Specializer() = default;

		virtual std::expected<Pipeline_id, util::Error> specialize(
			const Mesh_layout& layout,
			Variant variant
		) noexcept = 0;
	};

	///
	/// @brief Check the vertex input of a mesh layout for consistency before creating a pipeline from it
	/// @details Requires distinct attribute locations and buffer slots, non-zero pitches, and every
	/// attribute reading from a described buffer slot.
	///
	std::expected<void, util::Error> validate_layout(const Mesh_layout& layout) noexcept;

	///
	/// @brief Transparent draws re-specialized for the accumulation pass of one view
	///
	struct Oit
	{
		struct Drawcall
		{
			Transparent_item item;
			Pipeline_id pipeline;
		};

		std::vector<Drawcall> drawcalls;  // Sorted back to front
		size_t dropped_count = 0;

		bool empty() const noexcept { return drawcalls.empty(); }

		///
		/// @brief Re-specialize the standard transparent phase of a view, then drain it
		/// @details The phase is only read while specializing, and cleared once the whole list has been
		/// processed. Items whose specialization fails are logged and dropped.
		///
		/// @param transparent_phase Standard transparent phase of the view, empty on return
		///
		static Oit queue(
			std::vector<Transparent_item>& transparent_phase,
			const Mesh_source& mesh_source,
			Specializer& specializer,
			Variant variant
		) noexcept;

		///
		/// @brief Sort drawcalls back to front, largest distance first
		///
		void sort() noexcept;
	};
}
