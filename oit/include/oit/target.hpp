#pragma once

#include "graphics/util/allocator.hpp"
#include "oit/mode.hpp"
#include "oit/target/histogram.hpp"
#include "oit/target/wboit.hpp"
#include "oit/view.hpp"

#include <cassert>
#include <format>
#include <optional>
#include <ranges>
#include <unordered_map>

namespace oit
{
	///
	/// @brief Resource bundle owned by one active view
	///
	template <typename Allocator>
	struct Basic_view_resource
	{
		target::Basic_wboit<Allocator> wboit;
		std::optional<target::Basic_histogram<Allocator>> histogram;  // Present in histogram mode only
		bool ready = false;                                           // Prepared this frame
	};

	///
	/// @brief Owns the resource bundle of every active view, keyed by view id
	///
	template <typename Allocator>
	class Basic_resource_manager
	{
	  public:

		using Resource = Basic_view_resource<Allocator>;

		///
		/// @brief Make sure the view's resources exist and match its size and mode, then flip its revealage
		/// double buffer
		/// @details Does nothing if @p viewport_size is unknown, the view is retried next frame. Switching
		/// from histogram to naive mode drops the histogram resources. On failure the view's bundle is
		/// released.
		///
		/// @param mode Active mode of the view
		///
		std::expected<void, util::Error> prepare(
			const Allocator& allocator,
			View_id id,
			const std::optional<glm::u32vec2>& viewport_size,
			const Mode& mode
		) noexcept
		{
			assert(is_active(mode));

			if (!viewport_size.has_value() || viewport_size->x == 0 || viewport_size->y == 0) return {};

			auto& resource = resources[id];
			resource.ready = false;

			if (const auto wboit_result = resource.wboit.prepare(allocator, *viewport_size); !wboit_result)
			{
				resources.erase(id);
				return wboit_result.error().forward(std::format("Prepare WBOIT targets of view {} failed", id));
			}

			if (const auto* histogram_mode = std::get_if<mode::Histogram>(&mode))
			{
				if (!resource.histogram.has_value()) resource.histogram.emplace();

				const auto histogram_result =
					resource.histogram->prepare(allocator, *viewport_size, histogram_mode->params);
				if (!histogram_result)
				{
					resources.erase(id);
					return histogram_result.error().forward(
						std::format("Prepare histogram targets of view {} failed", id)
					);
				}
			}
			else
				resource.histogram.reset();

			resource.ready = true;
			return {};
		}

		///
		/// @brief Start a new frame, marking every view as not prepared
		///
		void begin_frame() noexcept
		{
			for (auto& resource : resources | std::views::values) resource.ready = false;
		}

		///
		/// @brief Release all resources of a view
		///
		void release(View_id id) noexcept { resources.erase(id); }

		///
		/// @brief Find the resources of a view
		///
		/// @return Pointer to the resources, or `nullptr` if the view was not prepared this frame
		///
		Resource* find(View_id id) noexcept
		{
			const auto it = resources.find(id);
			if (it == resources.end() || !it->second.ready) return nullptr;
			return &it->second;
		}

		///
		/// @brief Get the number of views holding resources, prepared this frame or not
		///
		size_t size() const noexcept { return resources.size(); }

	  private:

		std::unordered_map<View_id, Resource> resources;
	};

	using View_resource = Basic_view_resource<graphics::Device_allocator>;
	using Resource_manager = Basic_resource_manager<graphics::Device_allocator>;
}
