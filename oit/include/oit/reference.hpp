#pragma once

#include "oit/target/histogram.hpp"

#include <cstdint>
#include <glm/glm.hpp>
#include <span>

///
/// @brief CPU model of the WBOIT shaders and blend states, one pixel at a time
/// @details Mirrors `wboit.glsl`, `cdf-build.comp` and `wboit-composite.frag` together with the blend
/// states set up by `pipeline::Wboit_accum` and `pipeline::Composite`
///
namespace oit::reference
{
	///
	/// @brief Accumulation targets of one pixel, in their cleared state
	///
	struct Pixel
	{
		glm::vec4 accum = glm::vec4(0.0f);
		float revealage = 1.0f;
	};

	///
	/// @brief McGuire & Bavoil weight
	///
	/// @param alpha Coverage
	/// @param depth Positive linear view depth
	///
	float naive_weight(float alpha, float depth) noexcept;

	///
	/// @brief Histogram-equalized weight
	///
	/// @param previous_revealage Revealage of last frame at this pixel
	/// @param cdf CDF of last frame at the fragment's tile and depth
	///
	float histogram_weight(float alpha, float previous_revealage, float cdf) noexcept;

	///
	/// @brief Blend one fragment into a pixel
	///
	/// @param color Premultiplied color, coverage in alpha
	///
	void accumulate(Pixel& pixel, const glm::vec4& color, float weight) noexcept;

	///
	/// @brief Composite a pixel over a premultiplied destination color
	///
	/// @return Blended destination
	///
	glm::vec4 composite(const Pixel& pixel, const glm::vec4& destination) noexcept;

	///
	/// @brief Get the depth bin of a fragment
	///
	uint32_t get_bin(float depth, const target::Histogram_params_gpu& params) noexcept;

	///
	/// @brief Get the histogram counter index of a fragment
	///
	/// @param pixel Integer fragment coordinate
	///
	uint32_t get_counter_index(
		glm::u32vec2 pixel,
		float depth,
		const target::Histogram_params_gpu& params
	) noexcept;

	///
	/// @brief Build the CDF of every tile and clear the histogram, lane by lane like `cdf-build.comp`
	/// @details Each of the `pipeline::Cdf_build::workgroup_size` lanes of a tile owns a contiguous run of
	/// `ceil(num_bins / lanes)` bins. Lane sums go through an inclusive Hillis-Steele scan, then every lane
	/// adds its own run onto the sum of the lanes before it.
	///
	/// @param counts Histogram counters, cleared on return
	/// @param cdf Output CDF, laid out like @p counts
	/// @param reset Ignore @p counts, as for freshly created resources
	///
	void build_cdf(
		std::span<uint32_t> counts,
		std::span<float> cdf,
		const target::Histogram_layout& layout,
		bool reset = false
	) noexcept;
}
