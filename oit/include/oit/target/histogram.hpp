#pragma once

#include "gpu/buffer.hpp"
#include "graphics/util/allocator.hpp"
#include "graphics/util/smart-texture.hpp"
#include "oit/mode.hpp"

#include <SDL3/SDL_gpu.h>
#include <cassert>
#include <cstdint>
#include <format>
#include <glm/glm.hpp>
#include <limits>
#include <memory>

namespace oit::target
{
	///
	/// @brief Tile geometry of a histogram, derived from the viewport size and tuning parameters
	///
	struct Histogram_layout
	{
		uint32_t tile_count_x = 0;
		uint32_t tile_count_y = 0;
		uint32_t num_bins = 0;

		static Histogram_layout from(glm::u32vec2 viewport_size, const Histogram_params& params) noexcept;

		///
		/// @brief Get the number of counters, one per (tile, bin)
		///
		uint64_t get_counter_count() const noexcept;

		bool operator==(const Histogram_layout&) const noexcept = default;
	};

	///
	/// @brief GPU layout of the histogram parameters, shared by the accumulation and CDF build shaders
	///
	struct Histogram_params_gpu
	{
		uint32_t tile_count_x;
		uint32_t tile_count_y;
		uint32_t num_bins;
		uint32_t tile_size;
		float max_depth;
		uint32_t padding[3];

		static Histogram_params_gpu from(const Histogram_layout& layout, const Histogram_params& params) noexcept;
	};

	static_assert(sizeof(Histogram_params_gpu) == 32);

	///
	/// @brief Per-tile depth histogram and CDF of a view
	/// @details
	/// - `histogram_buffer`: `uint` counters, indexed `(tile_y * tile_count_x + tile_x) * num_bins + bin`
	/// - `cdf_texture`: 3D texture of extent (`tile_count_x`, `tile_count_y`, `num_bins`), CDF in red
	///
	/// #### Ordering
	/// The accumulation pass increments the counters from the fragment stage, then the CDF build pass
	/// reads them in a later compute pass of the same command buffer. SDL only declares fragment storage
	/// buffers as readable, so the increments reach the compute pass only on devices accepted by
	/// `Device_support::check(Variant::Histogram)`.
	///
	template <typename Allocator>
	class Basic_histogram
	{
	  public:

		using Buffer = typename Allocator::Buffer;
		using Texture = typename Allocator::Texture;

		static constexpr gpu::Texture::Format cdf_format{
			.type = SDL_GPU_TEXTURETYPE_3D,
			.format = SDL_GPU_TEXTUREFORMAT_R16G16B16A16_FLOAT,
			.usage = {.sampler = true, .compute_storage_write = true}
		};

		static constexpr gpu::Buffer::Usage histogram_usage{
			.graphic_storage_read = true,
			.compute_storage_read = true,
			.compute_storage_write = true
		};

		///
		/// @brief Make sure the buffer and texture match the tile geometry, and update the parameters
		/// @details Resources are recreated only when (`tile_count_x`, `tile_count_y`, `num_bins`) change.
		/// After recreation `needs_reset()` is set until `mark_reset()`.
		///
		std::expected<void, util::Error> prepare(
			const Allocator& allocator,
			glm::u32vec2 viewport_size,
			const Histogram_params& params
		) noexcept
		{
			const auto new_layout = Histogram_layout::from(viewport_size, params);

			if (histogram_buffer == nullptr || new_layout != layout)
			{
				const auto buffer_size = new_layout.get_counter_count() * sizeof(uint32_t);
				if (buffer_size == 0 || buffer_size > std::numeric_limits<uint32_t>::max())
					return util::Error(
						std::format(
							"Histogram of {}x{} tiles with {} bins does not fit in a buffer",
							new_layout.tile_count_x,
							new_layout.tile_count_y,
							new_layout.num_bins
						)
					);

				histogram_buffer.reset();

				auto buffer = allocator.create_buffer(
					histogram_usage,
					static_cast<uint32_t>(buffer_size),
					"HE-WBOIT Histogram Buffer"
				);
				if (!buffer) return buffer.error().forward("Create histogram buffer failed");

				auto cdf_result = cdf_texture.resize(
					allocator,
					glm::u32vec3(new_layout.tile_count_x, new_layout.tile_count_y, new_layout.num_bins)
				);
				if (!cdf_result) return cdf_result.error().forward("Create CDF texture failed");

				histogram_buffer = std::make_unique<Buffer>(std::move(*buffer));
				layout = new_layout;
				reset_pending = true;
				cdf_nonzero = false;
			}

			params_gpu = Histogram_params_gpu::from(layout, params);
			return {};
		}

		const Histogram_layout& get_layout() const noexcept { return layout; }

		const Histogram_params_gpu& get_params() const noexcept { return params_gpu; }

		const Buffer& get_histogram_buffer() const noexcept
		{
			assert(histogram_buffer != nullptr && "Histogram buffer not initialized. Call prepare() first.");
			return *histogram_buffer;
		}

		const Texture& get_cdf_texture() const noexcept { return *cdf_texture; }

		///
		/// @brief Whether the resources were just recreated and still hold undefined content
		///
		bool needs_reset() const noexcept { return reset_pending; }

		void mark_reset() noexcept
		{
			reset_pending = false;
			cdf_nonzero = false;
		}

		///
		/// @brief Whether the CDF texture may hold non-zero values
		///
		bool cdf_has_data() const noexcept { return cdf_nonzero; }

		///
		/// @brief Record whether the CDF built this frame came from a non-empty histogram
		///
		void mark_cdf_built(bool from_data) noexcept { cdf_nonzero = from_data; }

	  private:

		Histogram_layout layout;
		Histogram_params_gpu params_gpu{};

		std::unique_ptr<Buffer> histogram_buffer;
		graphics::Basic_auto_texture<Allocator> cdf_texture{cdf_format, "HE-WBOIT CDF Texture"};

		bool reset_pending = false;
		bool cdf_nonzero = false;
	};

	using Histogram = Basic_histogram<graphics::Device_allocator>;
}
