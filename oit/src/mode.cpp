#include "oit/mode.hpp"

#include <cmath>
#include <format>

namespace oit
{
	bool is_active(const Mode& mode) noexcept
	{
		return !std::holds_alternative<mode::Inactive>(mode);
	}

	std::optional<Variant> get_variant(const Mode& mode) noexcept
	{
		if (std::holds_alternative<mode::Naive>(mode)) return Variant::Naive;
		if (std::holds_alternative<mode::Histogram>(mode)) return Variant::Histogram;
		return std::nullopt;
	}

	std::expected<void, util::Error> validate(const Histogram_params& params) noexcept
	{
		if (params.tile_size == 0) return util::Error("Histogram tile size must be at least 1");

		if (params.num_bins == 0 || params.num_bins > max_histogram_bins)
			return util::Error(
				std::format(
					"Histogram bin count must be within [1, {}], got {}",
					max_histogram_bins,
					params.num_bins
				)
			);

		if (!std::isfinite(params.max_depth) || params.max_depth <= 0.0f)
			return util::Error(std::format("Histogram max depth must be positive, got {}", params.max_depth));

		return {};
	}
}
