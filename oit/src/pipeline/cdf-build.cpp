#include "oit/pipeline/cdf-build.hpp"

#include "asset/shader/cdf-build.comp.hpp"
#include "util/as-byte.hpp"

#include <array>

namespace oit::pipeline
{
	std::expected<Cdf_build, util::Error> Cdf_build::create(SDL_GPUDevice* device) noexcept
	{
		const auto pipeline_info = gpu::Compute_pipeline::Create_info{
			.shader_data = shader_asset::cdf_build_comp,
			.num_readwrite_storage_textures = 1,
			.num_readwrite_storage_buffers = 1,
			.num_uniform_buffers = 1,
			.threadcount_x = workgroup_size,
			.threadcount_y = 1,
			.threadcount_z = 1
		};

		auto pipeline = gpu::Compute_pipeline::create(device, pipeline_info, "HE-WBOIT CDF Build Pipeline");
		if (!pipeline) return pipeline.error().forward("Create CDF build pipeline failed");

		return Cdf_build(std::move(*pipeline));
	}

	std::expected<void, util::Error> Cdf_build::compute(
		const gpu::Command_buffer& command_buffer,
		const target::Histogram& histogram,
		bool reset
	) const noexcept
	{
		const auto& layout = histogram.get_layout();

		const auto cdf_texture_binding = SDL_GPUStorageTextureReadWriteBinding{
			.texture = histogram.get_cdf_texture(),
			.mip_level = 0,
			.layer = 0,
			.cycle = false,
			.padding1 = 0,
			.padding2 = 0,
			.padding3 = 0
		};

		const auto histogram_buffer_binding = SDL_GPUStorageBufferReadWriteBinding{
			.buffer = histogram.get_histogram_buffer(),
			.cycle = false,
			.padding1 = 0,
			.padding2 = 0,
			.padding3 = 0
		};

		const auto param = Internal_param::from(layout, reset);
		command_buffer.push_uniform_to_compute(0, util::as_bytes(param));

		return command_buffer
			.run_compute_pass(
				std::to_array({cdf_texture_binding}),
				std::to_array({histogram_buffer_binding}),
				[this, &layout](const gpu::Compute_pass& compute_pass) {
					compute_pass.bind_pipeline(pipeline);
					compute_pass.dispatch(layout.tile_count_x, layout.tile_count_y, 1);
				}
			)
			.transform_error(util::Error::forward_fn("Run CDF build pass failed"));
	}

	Cdf_build::Internal_param Cdf_build::Internal_param::from(
		const target::Histogram_layout& layout,
		bool reset
	) noexcept
	{
		return Internal_param{
			.tile_count_x = layout.tile_count_x,
			.tile_count_y = layout.tile_count_y,
			.num_bins = layout.num_bins,
			.reset = reset ? 1u : 0u
		};
	}
}
