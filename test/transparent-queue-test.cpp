#include "oit/drawdata/transparent.hpp"

#include <array>
#include <gtest/gtest.h>
#include <set>

namespace
{
	constexpr auto position_buffer = std::to_array<SDL_GPUVertexBufferDescription>({
		{.slot = 0, .pitch = 16, .input_rate = SDL_GPU_VERTEXINPUTRATE_VERTEX, .instance_step_rate = 0}
	});

	constexpr auto position_attribute = std::to_array<SDL_GPUVertexAttribute>({
		{.location = 0, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4, .offset = 0}
	});

	class Fake_mesh_source : public oit::drawdata::Mesh_source
	{
	  public:

		std::set<uint32_t> unsupported_meshes;
		const std::vector<oit::drawdata::Transparent_item>* observed_phase = nullptr;
		mutable std::vector<size_t> observed_sizes;

		std::expected<oit::drawdata::Mesh_layout, util::Error> get_layout(
			const oit::drawdata::Transparent_item& item
		) const noexcept override
		{
			if (observed_phase != nullptr) observed_sizes.push_back(observed_phase->size());

			if (unsupported_meshes.contains(item.mesh_index))
				return util::Error("Unsupported vertex layout");

			return oit::drawdata::Mesh_layout{
				.vertex_shader = nullptr,
				.vertex_attributes = position_attribute,
				.vertex_buffers = position_buffer,
				.key = item.mesh_index % 2
			};
		}

		void draw(
			const gpu::Command_buffer&,
			const gpu::Render_pass&,
			const oit::drawdata::Transparent_item&
		) const noexcept override
		{}
	};

	class Fake_specializer : public oit::drawdata::Specializer
	{
	  public:

		std::vector<oit::Variant> requested_variants;

		std::expected<oit::drawdata::Pipeline_id, util::Error> specialize(
			const oit::drawdata::Mesh_layout& layout,
			oit::Variant variant
		) noexcept override
		{
			requested_variants.push_back(variant);
			return static_cast<oit::drawdata::Pipeline_id>(layout.key);
		}
	};

	oit::drawdata::Transparent_item make_item(uint32_t mesh_index, float distance)
	{
		return {.distance = distance, .mesh_index = mesh_index, .batch_index = 0, .indexed = true};
	}
}

TEST(Transparent_queue, DrainsPhaseAndSortsBackToFront)
{
	std::vector phase = {make_item(0, 2.0f), make_item(1, 5.0f), make_item(2, 1.0f), make_item(3, 3.0f)};

	Fake_mesh_source mesh_source;
	Fake_specializer specializer;

	const auto oit_drawdata =
		oit::drawdata::Oit::queue(phase, mesh_source, specializer, oit::Variant::Naive);

	EXPECT_TRUE(phase.empty());
	EXPECT_EQ(oit_drawdata.dropped_count, 0u);
	ASSERT_EQ(oit_drawdata.drawcalls.size(), 4u);

	EXPECT_EQ(oit_drawdata.drawcalls[0].item.mesh_index, 1u);
	EXPECT_EQ(oit_drawdata.drawcalls[1].item.mesh_index, 3u);
	EXPECT_EQ(oit_drawdata.drawcalls[2].item.mesh_index, 0u);
	EXPECT_EQ(oit_drawdata.drawcalls[3].item.mesh_index, 2u);

	for (const auto& drawcall : oit_drawdata.drawcalls)
		EXPECT_EQ(drawcall.pipeline, drawcall.item.mesh_index % 2);
}

TEST(Transparent_queue, FailedItemsAreDroppedNotFatal)
{
	std::vector phase = {make_item(0, 1.0f), make_item(1, 2.0f), make_item(2, 3.0f)};

	Fake_mesh_source mesh_source;
	mesh_source.unsupported_meshes = {1};
	Fake_specializer specializer;

	const auto oit_drawdata =
		oit::drawdata::Oit::queue(phase, mesh_source, specializer, oit::Variant::Histogram);

	EXPECT_TRUE(phase.empty());
	EXPECT_EQ(oit_drawdata.dropped_count, 1u);
	ASSERT_EQ(oit_drawdata.drawcalls.size(), 2u);
	EXPECT_EQ(oit_drawdata.drawcalls[0].item.mesh_index, 2u);
	EXPECT_EQ(oit_drawdata.drawcalls[1].item.mesh_index, 0u);
}

TEST(Transparent_queue, PhaseIsUntouchedWhileSpecializing)
{
	std::vector phase = {make_item(0, 1.0f), make_item(1, 2.0f), make_item(2, 3.0f)};

	Fake_mesh_source mesh_source;
	mesh_source.unsupported_meshes = {0};
	mesh_source.observed_phase = &phase;
	Fake_specializer specializer;

	[[maybe_unused]] const auto oit_drawdata =
		oit::drawdata::Oit::queue(phase, mesh_source, specializer, oit::Variant::Naive);

	EXPECT_EQ(mesh_source.observed_sizes, (std::vector<size_t>{3, 3, 3}));
	EXPECT_TRUE(phase.empty());
}

TEST(Transparent_queue, SpecializesForRequestedVariant)
{
	std::vector phase = {make_item(0, 1.0f), make_item(1, 2.0f)};

	Fake_mesh_source mesh_source;
	Fake_specializer specializer;

	[[maybe_unused]] const auto oit_drawdata =
		oit::drawdata::Oit::queue(phase, mesh_source, specializer, oit::Variant::Histogram);

	EXPECT_EQ(
		specializer.requested_variants,
		(std::vector<oit::Variant>{oit::Variant::Histogram, oit::Variant::Histogram})
	);
}

TEST(Transparent_queue, EmptyPhaseProducesNoWork)
{
	std::vector<oit::drawdata::Transparent_item> phase;

	Fake_mesh_source mesh_source;
	Fake_specializer specializer;

	const auto oit_drawdata =
		oit::drawdata::Oit::queue(phase, mesh_source, specializer, oit::Variant::Naive);

	EXPECT_TRUE(oit_drawdata.empty());
	EXPECT_TRUE(specializer.requested_variants.empty());
}

TEST(Mesh_layout, ValidLayout)
{
	const oit::drawdata::Mesh_layout layout{
		.vertex_shader = nullptr,
		.vertex_attributes = position_attribute,
		.vertex_buffers = position_buffer,
		.key = 0
	};

	EXPECT_TRUE(oit::drawdata::validate_layout(layout).has_value());
}

TEST(Mesh_layout, ProceduralLayoutWithoutBuffers)
{
	const oit::drawdata::Mesh_layout layout{.vertex_shader = nullptr, .key = 0};
	EXPECT_TRUE(oit::drawdata::validate_layout(layout).has_value());
}

TEST(Mesh_layout, AttributeReadsUndescribedSlot)
{
	const auto attributes = std::to_array<SDL_GPUVertexAttribute>({
		{.location = 0, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4, .offset = 0},
		{.location = 1, .buffer_slot = 1, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4, .offset = 0}
	});

	const oit::drawdata::Mesh_layout layout{
		.vertex_shader = nullptr,
		.vertex_attributes = attributes,
		.vertex_buffers = position_buffer,
		.key = 0
	};

	EXPECT_FALSE(oit::drawdata::validate_layout(layout).has_value());
}

TEST(Mesh_layout, DuplicatedLocation)
{
	const auto attributes = std::to_array<SDL_GPUVertexAttribute>({
		{.location = 0, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT4, .offset = 0},
		{.location = 0, .buffer_slot = 0, .format = SDL_GPU_VERTEXELEMENTFORMAT_FLOAT2, .offset = 8}
	});

	const oit::drawdata::Mesh_layout layout{
		.vertex_shader = nullptr,
		.vertex_attributes = attributes,
		.vertex_buffers = position_buffer,
		.key = 0
	};

	EXPECT_FALSE(oit::drawdata::validate_layout(layout).has_value());
}

TEST(Mesh_layout, ZeroPitchBuffer)
{
	const auto buffers = std::to_array<SDL_GPUVertexBufferDescription>({
		{.slot = 0, .pitch = 0, .input_rate = SDL_GPU_VERTEXINPUTRATE_VERTEX, .instance_step_rate = 0}
	});

	const oit::drawdata::Mesh_layout layout{
		.vertex_shader = nullptr,
		.vertex_attributes = position_attribute,
		.vertex_buffers = buffers,
		.key = 0
	};

	EXPECT_FALSE(oit::drawdata::validate_layout(layout).has_value());
}
