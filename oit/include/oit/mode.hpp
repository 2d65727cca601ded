#pragma once

#include "util/error.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <variant>

namespace oit
{
	///
	/// @brief Tuning parameters of histogram-equalized WBOIT
	///
	struct Histogram_params
	{
		uint32_t tile_size = 32;   // Tile edge length in pixels
		uint32_t num_bins = 64;    // Depth bins per tile
		float max_depth = 100.0f;  // View depth mapped to the last bin
	};

	// Upper bound of `Histogram_params::num_bins`
	inline constexpr uint32_t max_histogram_bins = 256;

	namespace mode
	{
		struct Inactive
		{};

		struct Naive
		{};

		struct Histogram
		{
			Histogram_params params;
		};
	}

	///
	/// @brief OIT mode of a view, the opt-in marker attached by the host
	/// @note Naive and histogram modes are mutually exclusive by construction
	///
	using Mode = std::variant<mode::Inactive, mode::Naive, mode::Histogram>;

	///
	/// @brief Accumulation pipeline variant
	///
	enum class Variant
	{
		Naive,
		Histogram
	};

	bool is_active(const Mode& mode) noexcept;

	///
	/// @brief Get the accumulation variant of a mode
	///
	/// @return Variant, or `std::nullopt` if @p mode is inactive
	///
	std::optional<Variant> get_variant(const Mode& mode) noexcept;

	///
	/// @brief Validate histogram tuning parameters
	/// @details Requires `tile_size >= 1`, `1 <= num_bins <= 256` and a finite positive `max_depth`
	///
	std::expected<void, util::Error> validate(const Histogram_params& params) noexcept;
}
