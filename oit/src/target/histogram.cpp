#include "oit/target/histogram.hpp"

#include <cassert>

namespace oit::target
{
	namespace
	{
		uint32_t div_ceil(uint32_t a, uint32_t b) noexcept
		{
			return a / b + (a % b != 0 ? 1 : 0);
		}
	}

	Histogram_layout Histogram_layout::from(glm::u32vec2 viewport_size, const Histogram_params& params) noexcept
	{
		assert(params.tile_size > 0);

		return {
			.tile_count_x = div_ceil(viewport_size.x, params.tile_size),
			.tile_count_y = div_ceil(viewport_size.y, params.tile_size),
			.num_bins = params.num_bins
		};
	}

	uint64_t Histogram_layout::get_counter_count() const noexcept
	{
		return uint64_t(tile_count_x) * tile_count_y * num_bins;
	}

	Histogram_params_gpu Histogram_params_gpu::from(
		const Histogram_layout& layout,
		const Histogram_params& params
	) noexcept
	{
		return {
			.tile_count_x = layout.tile_count_x,
			.tile_count_y = layout.tile_count_y,
			.num_bins = layout.num_bins,
			.tile_size = params.tile_size,
			.max_depth = params.max_depth,
			.padding = {0, 0, 0}
		};
	}
}
