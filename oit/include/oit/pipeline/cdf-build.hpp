#pragma once

#include "gpu/command-buffer.hpp"
#include "gpu/compute-pipeline.hpp"
#include "oit/target/histogram.hpp"

#include <expected>

namespace oit::pipeline
{
	///
	/// @brief Builds the per-tile CDF from the histogram, and clears the histogram
	/// @details One workgroup per tile, 64 lanes. The result is read by next frame's accumulation pass.
	/// A tile with no samples gets an all-zero CDF.
	///
	class Cdf_build
	{
	  public:

		static constexpr uint32_t workgroup_size = 64;

		static std::expected<Cdf_build, util::Error> create(SDL_GPUDevice* device) noexcept;

		///
		/// @brief Build the CDF of every tile
		///
		/// @param reset Ignore the histogram content and write a zero CDF and zero histogram, for freshly
		/// created resources
		///
		std::expected<void, util::Error> compute(
			const gpu::Command_buffer& command_buffer,
			const target::Histogram& histogram,
			bool reset
		) const noexcept;

	  private:

		struct Internal_param
		{
			uint32_t tile_count_x;
			uint32_t tile_count_y;
			uint32_t num_bins;
			uint32_t reset;

			static Internal_param from(const target::Histogram_layout& layout, bool reset) noexcept;
		};

		gpu::Compute_pipeline pipeline;

		Cdf_build(gpu::Compute_pipeline pipeline) noexcept :
			pipeline(std::move(pipeline))
		{}

	  public:

		Cdf_build(const Cdf_build&) = delete;
		Cdf_build(Cdf_build&&) = default;
		Cdf_build& operator=(const Cdf_build&) = delete;
		Cdf_build& operator=(Cdf_build&&) = default;
	};
}
