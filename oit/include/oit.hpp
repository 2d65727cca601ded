#pragma once

#include "gpu/command-buffer.hpp"
#include "graphics/util/allocator.hpp"
#include "oit/device.hpp"
#include "oit/drawdata/transparent.hpp"
#include "oit/pipeline.hpp"
#include "oit/registry.hpp"
#include "oit/target.hpp"
#include "oit/view.hpp"

#include <expected>
#include <map>
#include <vector>

namespace oit
{
	///
	/// @brief Weighted blended order-independent transparency renderer
	/// @details #### Per frame:
	/// 1. `configure` with all live cameras
	/// 2. `prepare` every view, before recording any pass for it
	/// 3. `render` every view, after its opaque geometry and before any post-processing
	///
	class Renderer
	{
	  public:

		static std::expected<Renderer, util::Error> create(
			SDL_GPUDevice* device,
			const Format_info& format_info
		) noexcept;

		///
		/// @brief Validate the camera set and record the mode of every view
		/// @note Histogram mode is a fatal configuration error on devices without fragment storage atomics
		/// @details Resources of views that turned inactive or disappeared are released. Depth usage of
		/// newly activated cameras gains `sampler`.
		///
		/// @return Error on invalid configuration, which is not recoverable
		///
		std::expected<void, util::Error> configure(std::map<View_id, Camera>& cameras) noexcept;

		///
		/// @brief Prepare the resources of a view and flip its revealage double buffer
		/// @note Does nothing for inactive views or views without a known viewport size
		///
		std::expected<void, util::Error> prepare(const View& view) noexcept;

		///
		/// @brief Render the transparent phase of a view with WBOIT, and composite onto its color target
		/// @details The phase is drained for every active view. A view not prepared this frame records no
		/// pass, its transparent draws are dropped for the frame.
		///
		/// @param transparent_phase Standard transparent phase of the view
		/// @param mesh_source Host mesh collaborator
		///
		std::expected<void, util::Error> render(
			const gpu::Command_buffer& command_buffer,
			const View& view,
			std::vector<drawdata::Transparent_item>& transparent_phase,
			const drawdata::Mesh_source& mesh_source
		) noexcept;

	  private:

		graphics::Device_allocator allocator;
		Pipeline pipeline;
		View_registry registry;
		Resource_manager resources;

		std::expected<void, util::Error> render_accumulation(
			const gpu::Command_buffer& command_buffer,
			const View& view,
			View_resource& resource,
			const drawdata::Oit& oit_drawdata,
			const drawdata::Mesh_source& mesh_source
		) const noexcept;

		Renderer(SDL_GPUDevice* device, Device_support support, Pipeline pipeline) noexcept :
			allocator(device),
			pipeline(std::move(pipeline)),
			registry(support)
		{}

	  public:

		Renderer(const Renderer&) = delete;
		Renderer(Renderer&&) = default;
		Renderer& operator=(const Renderer&) = delete;
		Renderer& operator=(Renderer&&) = default;
	};
}
