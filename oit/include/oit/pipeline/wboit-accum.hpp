#pragma once

#include "gpu/command-buffer.hpp"
#include "gpu/graphics-pipeline.hpp"
#include "gpu/graphics-shader.hpp"
#include "gpu/render-pass.hpp"
#include "gpu/sampler.hpp"
#include "oit/drawdata/transparent.hpp"
#include "oit/target/histogram.hpp"
#include "oit/target/wboit.hpp"

#include <map>
#include <memory>
#include <utility>
#include <vector>

namespace oit::pipeline
{
	///
	/// @brief WBOIT accumulation pipelines, specialized per mesh layout and variant
	/// @details
	/// #### Outputs
	/// 1. (`location=0`) Accumulation, additive on color and alpha
	/// 2. (`location=1`) Revealage, multiplied by `(1 - alpha)`
	///
	/// Depth is tested against the opaque depth (reversed-Z, `GREATER_OR_EQUAL`) and never written.
	///
	/// #### Histogram variant bindings
	/// - Fragment samplers: (0) previous CDF, linear; (1) previous revealage, nearest
	/// - Fragment storage buffer: (0) histogram counters
	/// - Fragment uniform: (0) `target::Histogram_params_gpu`
	///
	class Wboit_accum : public drawdata::Specializer
	{
	  public:

		static std::expected<Wboit_accum, util::Error> create(
			SDL_GPUDevice* device,
			SDL_GPUTextureFormat depth_format
		) noexcept;

		///
		/// @brief Get or create the pipeline of a mesh layout
		///
		std::expected<drawdata::Pipeline_id, util::Error> specialize(
			const drawdata::Mesh_layout& layout,
			Variant variant
		) noexcept override;

		///
		/// @brief Draw all queued transparent items into the current accumulation pass
		///
		/// @param histogram Histogram targets in histogram mode, `nullptr` in naive mode
		///
		void render(
			const gpu::Command_buffer& command_buffer,
			const gpu::Render_pass& render_pass,
			const drawdata::Oit& drawdata,
			const drawdata::Mesh_source& mesh_source,
			const target::Wboit& wboit,
			const target::Histogram* histogram
		) const noexcept;

	  private:

		SDL_GPUDevice* device;
		SDL_GPUTextureFormat depth_format;

		gpu::Graphics_shader naive_fragment_shader;
		gpu::Graphics_shader histogram_fragment_shader;
		gpu::Sampler cdf_sampler;
		gpu::Sampler revealage_sampler;

		// (Layout key, Variant) -> Pipeline Index
		std::map<std::pair<uint64_t, Variant>, drawdata::Pipeline_id> pipeline_cache;
		std::vector<std::unique_ptr<gpu::Graphics_pipeline>> pipelines;

		Wboit_accum(
			SDL_GPUDevice* device,
			SDL_GPUTextureFormat depth_format,
			gpu::Graphics_shader naive_fragment_shader,
			gpu::Graphics_shader histogram_fragment_shader,
			gpu::Sampler cdf_sampler,
			gpu::Sampler revealage_sampler
		) noexcept :
			device(device),
			depth_format(depth_format),
			naive_fragment_shader(std::move(naive_fragment_shader)),
			histogram_fragment_shader(std::move(histogram_fragment_shader)),
			cdf_sampler(std::move(cdf_sampler)),
			revealage_sampler(std::move(revealage_sampler))
		{}

		std::expected<gpu::Graphics_pipeline, util::Error> create_pipeline(
			const drawdata::Mesh_layout& layout,
			Variant variant
		) const noexcept;

	  public:

		Wboit_accum(const Wboit_accum&) = delete;
		Wboit_accum(Wboit_accum&&) = default;
		Wboit_accum& operator=(const Wboit_accum&) = delete;
		Wboit_accum& operator=(Wboit_accum&&) = default;
	};
}
