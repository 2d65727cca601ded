#include "oit/drawdata/transparent.hpp"

#include <algorithm>
#include <format>
#include <iostream>
#include <print>
#include <set>
#include <utility>

namespace oit::drawdata
{
	std::expected<void, util::Error> validate_layout(const Mesh_layout& layout) noexcept
	{
		std::set<uint32_t> buffer_slots;
		for (const auto& buffer : layout.vertex_buffers)
		{
			if (!buffer_slots.insert(buffer.slot).second)
				return util::Error(std::format("Duplicated vertex buffer slot {}", buffer.slot));
			if (buffer.pitch == 0)
				return util::Error(std::format("Vertex buffer slot {} has zero pitch", buffer.slot));
		}

		std::set<uint32_t> locations;
		for (const auto& attribute : layout.vertex_attributes)
		{
			if (!locations.insert(attribute.location).second)
				return util::Error(std::format("Duplicated vertex attribute location {}", attribute.location));

			if (!buffer_slots.contains(attribute.buffer_slot))
				return util::Error(
					std::format(
						"Vertex attribute at location {} reads undescribed buffer slot {}",
						attribute.location,
						attribute.buffer_slot
					)
				);
		}

		return {};
	}

	Oit Oit::queue(
		std::vector<Transparent_item>& transparent_phase,
		const Mesh_source& mesh_source,
		Specializer& specializer,
		Variant variant
	) noexcept
	{
		Oit oit;
		oit.drawcalls.reserve(transparent_phase.size());

		for (const auto& item : std::as_const(transparent_phase))
		{
			auto pipeline =
				mesh_source.get_layout(item)
					.and_then([](const Mesh_layout& layout) {
						return validate_layout(layout).transform([&layout] { return layout; });
					})
					.and_then([&specializer, variant](const Mesh_layout& layout) {
						return specializer.specialize(layout, variant);
					});

			if (!pipeline)
			{
				std::println(
					std::cerr,
					"\033[93m[Warning]\033[0m Dropped transparent item of mesh {}: {}",
					item.mesh_index,
					pipeline.error()->front().message
				);
				oit.dropped_count++;
				continue;
			}

			oit.drawcalls.push_back(Drawcall{.item = item, .pipeline = *pipeline});
		}

		transparent_phase.clear();
		oit.sort();

		return oit;
	}

	void Oit::sort() noexcept
	{
		std::ranges::stable_sort(drawcalls, std::ranges::greater{}, [](const Drawcall& drawcall) {
			return drawcall.item.distance;
		});
	}
}
