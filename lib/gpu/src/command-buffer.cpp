#include "gpu/command-buffer.hpp"
#include "gpu/util.hpp"

#include <cassert>
#include <utility>

namespace gpu
{
	Command_buffer::Command_buffer(Command_buffer&& other) noexcept :
		device(std::exchange(other.device, nullptr)),
		cmd_buffer(std::exchange(other.cmd_buffer, nullptr))
	{}

	Command_buffer& Command_buffer::operator=(Command_buffer&& other) noexcept
	{
		if (&other != this)
		{
			std::swap(device, other.device);
			std::swap(cmd_buffer, other.cmd_buffer);
		}

		return *this;
	}

	std::expected<Command_buffer, util::Error> Command_buffer::acquire_from(SDL_GPUDevice* device) noexcept
	{
		assert(device != nullptr);

		auto* const cmd_buffer = SDL_AcquireGPUCommandBuffer(device);
		if (cmd_buffer == nullptr) RETURN_SDL_ERROR;

		return Command_buffer(device, cmd_buffer);
	}

	std::expected<Render_pass, util::Error> Command_buffer::begin_render_pass(
		std::span<const SDL_GPUColorTargetInfo> color_targets,
		const std::optional<SDL_GPUDepthStencilTargetInfo>& depth_stencil_target
	) const noexcept
	{
		assert(cmd_buffer != nullptr);

		auto* const render_pass = SDL_BeginGPURenderPass(
			cmd_buffer,
			color_targets.data(),
			color_targets.size(),
			depth_stencil_target.has_value() ? &depth_stencil_target.value() : nullptr
		);

		if (render_pass == nullptr) RETURN_SDL_ERROR;
		return Render_pass(render_pass);
	}

	std::expected<void, util::Error> Command_buffer::run_render_pass(
		std::span<const SDL_GPUColorTargetInfo> color_targets,
		const std::optional<SDL_GPUDepthStencilTargetInfo>& depth_stencil_target,
		const std::function<void(const Render_pass&)>& task
	) const noexcept
	{
		assert(cmd_buffer != nullptr);

		auto render_pass_result = this->begin_render_pass(color_targets, depth_stencil_target);
		if (!render_pass_result) return render_pass_result.error();

		{
			auto& render_pass = *render_pass_result;
			task(render_pass);
			render_pass.end();
		}

		return {};
	}

	std::expected<Compute_pass, util::Error> Command_buffer::begin_compute_pass(
		std::span<const SDL_GPUStorageTextureReadWriteBinding> storage_textures,
		std::span<const SDL_GPUStorageBufferReadWriteBinding> storage_buffers
	) const noexcept
	{
		assert(cmd_buffer != nullptr);

		auto* const compute_pass = SDL_BeginGPUComputePass(
			cmd_buffer,
			storage_textures.data(),
			static_cast<Uint32>(storage_textures.size()),
			storage_buffers.data(),
			static_cast<Uint32>(storage_buffers.size())
		);

		if (compute_pass == nullptr) RETURN_SDL_ERROR;
		return Compute_pass(compute_pass);
	}

	std::expected<void, util::Error> Command_buffer::run_compute_pass(
		std::span<const SDL_GPUStorageTextureReadWriteBinding> storage_textures,
		std::span<const SDL_GPUStorageBufferReadWriteBinding> storage_buffers,
		const std::function<void(const Compute_pass&)>& task
	) const noexcept
	{
		assert(cmd_buffer != nullptr);

		auto compute_pass_result = this->begin_compute_pass(storage_textures, storage_buffers);
		if (!compute_pass_result) return compute_pass_result.error();

		{
			auto& compute_pass = *compute_pass_result;
			task(compute_pass);
			compute_pass.end();
		}

		return {};
	}

	void Command_buffer::push_uniform_to_vertex(uint32_t slot, std::span<const std::byte> data) const noexcept
	{
		assert(cmd_buffer != nullptr);

		if (data.empty()) return;
		SDL_PushGPUVertexUniformData(cmd_buffer, slot, data.data(), static_cast<Uint32>(data.size()));
	}

	void Command_buffer::push_uniform_to_fragment(
		uint32_t slot,
		std::span<const std::byte> data
	) const noexcept
	{
		assert(cmd_buffer != nullptr);

		if (data.empty()) return;
		SDL_PushGPUFragmentUniformData(cmd_buffer, slot, data.data(), static_cast<Uint32>(data.size()));
	}

	void Command_buffer::push_uniform_to_compute(
		uint32_t slot,
		std::span<const std::byte> data
	) const noexcept
	{
		assert(cmd_buffer != nullptr);

		if (data.empty()) return;
		SDL_PushGPUComputeUniformData(cmd_buffer, slot, data.data(), static_cast<Uint32>(data.size()));
	}

	void Command_buffer::push_debug_group(const char* name) const noexcept
	{
		assert(cmd_buffer != nullptr);
		SDL_PushGPUDebugGroup(cmd_buffer, name);
	}

	void Command_buffer::pop_debug_group() const noexcept
	{
		assert(cmd_buffer != nullptr);
		SDL_PopGPUDebugGroup(cmd_buffer);
	}

	std::expected<void, util::Error> Command_buffer::submit() noexcept
	{
		assert(cmd_buffer != nullptr);

		const auto success = SDL_SubmitGPUCommandBuffer(cmd_buffer);
		cmd_buffer = nullptr;
		device = nullptr;

		if (!success) RETURN_SDL_ERROR;
		return {};
	}

	Command_buffer::operator SDL_GPUCommandBuffer*() const noexcept
	{
		return this->cmd_buffer;
	}

	Command_buffer::Command_buffer(SDL_GPUDevice* device, SDL_GPUCommandBuffer* resource) noexcept :
		device(device),
		cmd_buffer(resource)
	{}
}
