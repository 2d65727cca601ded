#include "oit/reference.hpp"
#include "oit/pipeline/cdf-build.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <cmath>
#include <ranges>
#include <utility>

namespace oit::reference
{
	float naive_weight(float alpha, float depth) noexcept
	{
		const float z = std::max(depth, 0.0f);
		const float w = 10.0f / (1e-5f + std::pow(z / 5.0f, 2.0f) + std::pow(z / 200.0f, 6.0f));
		return alpha * std::clamp(w, 1e-2f, 3e3f);
	}

	float histogram_weight(float alpha, float previous_revealage, float cdf) noexcept
	{
		return alpha * std::clamp(std::pow(std::max(previous_revealage, 1e-4f), cdf), 1e-4f, 1.0f);
	}

	void accumulate(Pixel& pixel, const glm::vec4& color, float weight) noexcept
	{
		// One, One
		pixel.accum += color * weight;

		// Zero, OneMinusSrcColor
		pixel.revealage *= 1.0f - color.a;
	}

	glm::vec4 composite(const Pixel& pixel, const glm::vec4& destination) noexcept
	{
		const float alpha = 1.0f - pixel.revealage;
		const glm::vec3 color = glm::vec3(pixel.accum) / std::max(pixel.accum.a, 1e-5f);
		const glm::vec4 source(color * alpha, alpha);

		// One, OneMinusSrcAlpha
		return source + destination * (1.0f - source.a);
	}

	uint32_t get_bin(float depth, const target::Histogram_params_gpu& params) noexcept
	{
		const float norm_depth = std::clamp(depth / params.max_depth, 0.0f, 1.0f);
		return std::min(static_cast<uint32_t>(norm_depth * float(params.num_bins)), params.num_bins - 1);
	}

	uint32_t get_counter_index(
		glm::u32vec2 pixel,
		float depth,
		const target::Histogram_params_gpu& params
	) noexcept
	{
		const glm::u32vec2 tile = glm::min(
			pixel / params.tile_size,
			glm::u32vec2(params.tile_count_x - 1, params.tile_count_y - 1)
		);

		return (tile.y * params.tile_count_x + tile.x) * params.num_bins + get_bin(depth, params);
	}

	void build_cdf(
		std::span<uint32_t> counts,
		std::span<float> cdf,
		const target::Histogram_layout& layout,
		bool reset
	) noexcept
	{
		assert(counts.size() == layout.get_counter_count());
		assert(cdf.size() == counts.size());

		constexpr uint32_t lane_count = pipeline::Cdf_build::workgroup_size;

		const auto tile_count = size_t(layout.tile_count_x) * layout.tile_count_y;
		const uint32_t bins_per_lane = (layout.num_bins + lane_count - 1) / lane_count;

		for (const auto tile : std::views::iota(0zu, tile_count))
		{
			const auto tile_counts = counts.subspan(tile * layout.num_bins, layout.num_bins);
			const auto tile_cdf = cdf.subspan(tile * layout.num_bins, layout.num_bins);

			const auto get_run = [&](uint32_t lane) {
				const uint32_t first = std::min(lane * bins_per_lane, layout.num_bins);
				const uint32_t last = std::min(first + bins_per_lane, layout.num_bins);
				return std::pair(first, last);
			};

			std::array<uint32_t, lane_count> lane_sums{};
			if (!reset)
				for (const auto lane : std::views::iota(0u, lane_count))
				{
					const auto [first, last] = get_run(lane);
					for (auto bin = first; bin < last; bin++) lane_sums[lane] += tile_counts[bin];
				}

			// Inclusive scan, every lane reads before any lane writes
			for (uint32_t offset = 1; offset < lane_count; offset <<= 1)
			{
				std::array<uint32_t, lane_count> addends{};
				for (const auto lane : std::views::iota(offset, lane_count)) addends[lane] = lane_sums[lane - offset];
				for (const auto lane : std::views::iota(0u, lane_count)) lane_sums[lane] += addends[lane];
			}

			const uint32_t total = lane_sums[lane_count - 1];

			for (const auto lane : std::views::iota(0u, lane_count))
			{
				uint32_t running = lane > 0 ? lane_sums[lane - 1] : 0;

				const auto [first, last] = get_run(lane);
				for (auto bin = first; bin < last; bin++)
				{
					if (!reset) running += tile_counts[bin];
					tile_cdf[bin] = total > 0 ? float(running) / float(total) : 0.0f;
					tile_counts[bin] = 0;
				}
			}
		}
	}
}
