#include "oit/pipeline/wboit-accum.hpp"

#include "asset/shader/he-wboit-accum.frag.hpp"
#include "asset/shader/wboit-accum.frag.hpp"
#include "util/as-byte.hpp"

#include <array>
#include <format>
#include <optional>

namespace oit::pipeline
{
	std::expected<Wboit_accum, util::Error> Wboit_accum::create(
		SDL_GPUDevice* device,
		SDL_GPUTextureFormat depth_format
	) noexcept
	{
		auto naive_fragment_shader = gpu::Graphics_shader::create(
			device,
			shader_asset::wboit_accum_frag,
			gpu::Graphics_shader::Stage::Fragment,
			0,
			0,
			0,
			0
		);
		if (!naive_fragment_shader)
			return naive_fragment_shader.error().forward("Create WBOIT accumulation shader failed");

		auto histogram_fragment_shader = gpu::Graphics_shader::create(
			device,
			shader_asset::he_wboit_accum_frag,
			gpu::Graphics_shader::Stage::Fragment,
			2,
			0,
			1,
			1
		);
		if (!histogram_fragment_shader)
			return histogram_fragment_shader.error().forward("Create HE-WBOIT accumulation shader failed");

		auto cdf_sampler = gpu::Sampler::create(
			device,
			gpu::Sampler::Create_info{
				.min_filter = gpu::Sampler::Filter::Linear,
				.mag_filter = gpu::Sampler::Filter::Linear,
				.mipmap_mode = gpu::Sampler::Mipmap_mode::Nearest,
				.address_mode_u = gpu::Sampler::Address_mode::Clamp_to_edge,
				.address_mode_v = gpu::Sampler::Address_mode::Clamp_to_edge,
				.address_mode_w = gpu::Sampler::Address_mode::Clamp_to_edge,
				.max_lod = 0.0f
			}
		);
		if (!cdf_sampler) return cdf_sampler.error().forward("Create CDF sampler failed");

		auto revealage_sampler = gpu::Sampler::create(
			device,
			gpu::Sampler::Create_info{
				.min_filter = gpu::Sampler::Filter::Nearest,
				.mag_filter = gpu::Sampler::Filter::Nearest,
				.mipmap_mode = gpu::Sampler::Mipmap_mode::Nearest,
				.address_mode_u = gpu::Sampler::Address_mode::Clamp_to_edge,
				.address_mode_v = gpu::Sampler::Address_mode::Clamp_to_edge,
				.address_mode_w = gpu::Sampler::Address_mode::Clamp_to_edge,
				.max_lod = 0.0f
			}
		);
		if (!revealage_sampler) return revealage_sampler.error().forward("Create revealage sampler failed");

		return Wboit_accum(
			device,
			depth_format,
			std::move(*naive_fragment_shader),
			std::move(*histogram_fragment_shader),
			std::move(*cdf_sampler),
			std::move(*revealage_sampler)
		);
	}

	std::expected<drawdata::Pipeline_id, util::Error> Wboit_accum::specialize(
		const drawdata::Mesh_layout& layout,
		Variant variant
	) noexcept
	{
		if (layout.vertex_shader == nullptr)
			return util::Error(std::format("Mesh layout {} has no vertex shader", layout.key));

		const auto key = std::pair(layout.key, variant);
		if (const auto it = pipeline_cache.find(key); it != pipeline_cache.end()) return it->second;

		auto pipeline = create_pipeline(layout, variant);
		if (!pipeline)
			return pipeline.error().forward(std::format("Specialize pipeline for layout {} failed", layout.key));

		const auto id = pipelines.size();
		pipelines.emplace_back(std::make_unique<gpu::Graphics_pipeline>(std::move(*pipeline)));
		pipeline_cache.emplace(key, id);

		return id;
	}

	std::expected<gpu::Graphics_pipeline, util::Error> Wboit_accum::create_pipeline(
		const drawdata::Mesh_layout& layout,
		Variant variant
	) const noexcept
	{
		const SDL_GPURasterizerState rasterizer_state{
			.fill_mode = SDL_GPU_FILLMODE_FILL,
			.cull_mode = layout.cull_mode,
			.front_face = SDL_GPU_FRONTFACE_COUNTER_CLOCKWISE,
			.depth_bias_constant_factor = 0,
			.depth_bias_clamp = 0,
			.depth_bias_slope_factor = 0,
			.enable_depth_bias = false,
			.enable_depth_clip = false,
			.padding1 = 0,
			.padding2 = 0
		};

		const SDL_GPUColorTargetBlendState accum_blend_state{
			.src_color_blendfactor = SDL_GPU_BLENDFACTOR_ONE,
			.dst_color_blendfactor = SDL_GPU_BLENDFACTOR_ONE,
			.color_blend_op = SDL_GPU_BLENDOP_ADD,
			.src_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE,
			.dst_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE,
			.alpha_blend_op = SDL_GPU_BLENDOP_ADD,
			.color_write_mask = 0,
			.enable_blend = true,
			.enable_color_write_mask = false,
			.padding1 = 0,
			.padding2 = 0
		};

		const SDL_GPUColorTargetBlendState revealage_blend_state{
			.src_color_blendfactor = SDL_GPU_BLENDFACTOR_ZERO,
			.dst_color_blendfactor = SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_COLOR,
			.color_blend_op = SDL_GPU_BLENDOP_ADD,
			.src_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ZERO,
			.dst_alpha_blendfactor = SDL_GPU_BLENDFACTOR_ONE_MINUS_SRC_ALPHA,
			.alpha_blend_op = SDL_GPU_BLENDOP_ADD,
			.color_write_mask = 0,
			.enable_blend = true,
			.enable_color_write_mask = false,
			.padding1 = 0,
			.padding2 = 0
		};

		const auto color_target_descs = std::to_array<SDL_GPUColorTargetDescription>({
			{.format = target::Wboit::accum_format.format, .blend_state = accum_blend_state},
			{.format = target::Wboit::revealage_format.format, .blend_state = revealage_blend_state}
		});

		const gpu::Graphics_pipeline::Depth_stencil_state depth_stencil_state{
			.format = depth_format,
			.compare_op = SDL_GPU_COMPAREOP_GREATER_OR_EQUAL,
			.back_stencil_state = {},
			.front_stencil_state = {},
			.compare_mask = 0xFF,
			.write_mask = 0x00,
			.enable_depth_test = true,
			.enable_depth_write = false,
			.enable_stencil_test = false
		};

		const auto& fragment_shader =
			variant == Variant::Histogram ? histogram_fragment_shader : naive_fragment_shader;

		return gpu::Graphics_pipeline::create(
			device,
			*layout.vertex_shader,
			fragment_shader,
			layout.primitive_type,
			SDL_GPU_SAMPLECOUNT_1,
			rasterizer_state,
			layout.vertex_attributes,
			layout.vertex_buffers,
			color_target_descs,
			depth_stencil_state,
			std::format(
				"{} Accumulation Pipeline [Layout {}]",
				variant == Variant::Histogram ? "HE-WBOIT" : "WBOIT",
				layout.key
			)
		);
	}

	void Wboit_accum::render(
		const gpu::Command_buffer& command_buffer,
		const gpu::Render_pass& render_pass,
		const drawdata::Oit& drawdata,
		const drawdata::Mesh_source& mesh_source,
		const target::Wboit& wboit,
		const target::Histogram* histogram
	) const noexcept
	{
		if (histogram != nullptr)
			command_buffer.push_uniform_to_fragment(0, util::as_bytes(histogram->get_params()));

		std::optional<drawdata::Pipeline_id> bound_pipeline;

		for (const auto& [item, pipeline_id] : drawdata.drawcalls)
		{
			if (bound_pipeline != pipeline_id)
			{
				render_pass.bind_pipeline(*pipelines[pipeline_id]);
				bound_pipeline = pipeline_id;

				if (histogram != nullptr)
				{
					render_pass.bind_fragment_samplers(
						0,
						histogram->get_cdf_texture().bind_with_sampler(cdf_sampler),
						wboit.previous_revealage().bind_with_sampler(revealage_sampler)
					);
					render_pass.bind_fragment_storage_buffers(0, histogram->get_histogram_buffer());
				}
			}

			mesh_source.draw(command_buffer, render_pass, item);
		}
	}
}
