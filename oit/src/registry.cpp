#include "oit/registry.hpp"

#include <format>
#include <ranges>

namespace oit
{
	std::expected<std::vector<View_id>, util::Error> View_registry::configure(
		std::map<View_id, Camera>& cameras
	) noexcept
	{
		for (const auto& [id, camera] : cameras)
		{
			if (!is_active(camera.mode)) continue;

			if (camera.sample_count != SDL_GPU_SAMPLECOUNT_1)
				return util::Error(std::format("Multisampling must be disabled on OIT view {}", id));

			if (const auto result = support.check(*get_variant(camera.mode)); !result)
				return result.error().forward(std::format("OIT view {} is not supported on this device", id));

			if (const auto* histogram = std::get_if<mode::Histogram>(&camera.mode))
			{
				if (const auto result = validate(histogram->params); !result)
					return result.error().forward(std::format("Invalid histogram parameters on view {}", id));
			}
		}

		std::map<View_id, Mode> new_active_views;
		for (auto& [id, camera] : cameras)
		{
			if (!is_active(camera.mode)) continue;

			if (!active_views.contains(id)) camera.depth_usage.sampler = true;
			new_active_views.emplace(id, camera.mode);
		}

		std::vector<View_id> released;
		for (const auto& id : active_views | std::views::keys)
			if (!new_active_views.contains(id)) released.push_back(id);

		active_views = std::move(new_active_views);
		return released;
	}

	Mode View_registry::get_mode(View_id id) const noexcept
	{
		const auto it = active_views.find(id);
		if (it == active_views.end()) return mode::Inactive{};
		return it->second;
	}
}
