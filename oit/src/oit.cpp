#include "oit.hpp"
#include "oit/pass.hpp"
#include "oit/schedule.hpp"

#include <cassert>
#include <format>

namespace oit
{
	std::expected<Renderer, util::Error> Renderer::create(
		SDL_GPUDevice* device,
		const Format_info& format_info
	) noexcept
	{
		assert(device != nullptr);

		const auto support = Device_support::query(device);
		if (const auto result = support.check(Variant::Naive); !result)
			return result.error().forward("Unsupported GPU device");

		auto pipeline = Pipeline::create(device, format_info);
		if (!pipeline) return pipeline.error().forward("Create pipeline failed");

		return Renderer(device, support, std::move(*pipeline));
	}

	std::expected<void, util::Error> Renderer::configure(std::map<View_id, Camera>& cameras) noexcept
	{
		auto released = registry.configure(cameras);
		if (!released) return released.error().forward("Configure OIT views failed");

		for (const auto id : *released) resources.release(id);
		resources.begin_frame();

		return {};
	}

	std::expected<void, util::Error> Renderer::prepare(const View& view) noexcept
	{
		const auto mode = registry.get_mode(view.id);
		if (!is_active(mode)) return {};

		return resources.prepare(allocator, view.id, view.viewport_size, mode);
	}

	std::expected<void, util::Error> Renderer::render(
		const gpu::Command_buffer& command_buffer,
		const View& view,
		std::vector<drawdata::Transparent_item>& transparent_phase,
		const drawdata::Mesh_source& mesh_source
	) noexcept
	{
		const auto variant = get_variant(registry.get_mode(view.id));
		if (!variant.has_value()) return {};

		// Drained for every active view, prepared or not
		const auto oit_drawdata =
			drawdata::Oit::queue(transparent_phase, mesh_source, pipeline.wboit_accum, *variant);

		auto* const resource = resources.find(view.id);
		auto* const histogram =
			resource != nullptr && resource->histogram.has_value() ? &*resource->histogram : nullptr;

		const auto schedule = Pass_schedule::from({
			.prepared = resource != nullptr,
			.has_work = !oit_drawdata.empty(),
			.has_histogram = histogram != nullptr,
			.histogram_needs_reset = histogram != nullptr && histogram->needs_reset(),
			.history_valid = resource != nullptr && resource->wboit.frame_cycle.is_history_valid(),
			.cdf_has_data = histogram != nullptr && histogram->cdf_has_data()
		});

		if (schedule.reset_histogram)
		{
			command_buffer.push_debug_group("HE-WBOIT Reset");
			const auto reset_result = pipeline.cdf_build.compute(command_buffer, *histogram, true);
			command_buffer.pop_debug_group();

			if (!reset_result) return reset_result.error().forward("Reset histogram failed");
			histogram->mark_reset();
		}

		if (schedule.clear_previous_revealage)
		{
			if (const auto result = clear_previous_revealage(command_buffer, resource->wboit); !result)
				return result.error().forward("Clear previous revealage failed");
		}

		if (schedule.accumulate)
		{
			const auto result =
				render_accumulation(command_buffer, view, *resource, oit_drawdata, mesh_source);
			if (!result)
				return result.error().forward(std::format("Render accumulation of view {} failed", view.id));
		}

		if (schedule.build_cdf)
		{
			command_buffer.push_debug_group("HE-WBOIT CDF Build");
			const auto result = pipeline.cdf_build.compute(command_buffer, *histogram, false);
			command_buffer.pop_debug_group();

			if (!result) return result.error().forward(std::format("Build CDF of view {} failed", view.id));
			histogram->mark_cdf_built(schedule.accumulate);
		}

		if (schedule.composite)
		{
			command_buffer.push_debug_group("WBOIT Composite");
			const auto composite_result =
				pipeline.composite.render(command_buffer, resource->wboit, view.color_texture);
			command_buffer.pop_debug_group();

			if (!composite_result)
				return composite_result.error().forward(std::format("Composite view {} failed", view.id));
		}

		return {};
	}

	std::expected<void, util::Error> Renderer::render_accumulation(
		const gpu::Command_buffer& command_buffer,
		const View& view,
		View_resource& resource,
		const drawdata::Oit& oit_drawdata,
		const drawdata::Mesh_source& mesh_source
	) const noexcept
	{
		const auto* const histogram = resource.histogram.has_value() ? &*resource.histogram : nullptr;

		command_buffer.push_debug_group("WBOIT Accumulation");
		{
			auto render_pass = acquire_accumulation_pass(command_buffer, resource.wboit, view.depth_texture);
			if (!render_pass)
			{
				command_buffer.pop_debug_group();
				return render_pass.error().forward("Acquire accumulation pass failed");
			}

			pipeline.wboit_accum
				.render(command_buffer, *render_pass, oit_drawdata, mesh_source, resource.wboit, histogram);
			render_pass->end();
		}
		command_buffer.pop_debug_group();

		resource.wboit.frame_cycle.mark_written();
		return {};
	}
}
