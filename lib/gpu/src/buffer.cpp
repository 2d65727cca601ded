#include "gpu/buffer.hpp"
#include "gpu/util.hpp"

#include <bit>

namespace gpu
{
	Buffer::Usage::operator SDL_GPUBufferUsageFlags(this Usage self) noexcept
	{
		return std::bit_cast<uint8_t>(self) & 0x3f;
	}

	std::expected<Buffer, util::Error> Buffer::create(
		SDL_GPUDevice* device,
		Usage usage,
		uint32_t size,
		const std::string& name
	) noexcept
	{
		assert(device != nullptr);

		if (size == 0) return util::Error("Buffer size must be greater than zero");

		const SDL_GPUBufferCreateInfo create_info{.usage = usage, .size = size, .props = 0};

		auto* const buffer = SDL_CreateGPUBuffer(device, &create_info);
		if (buffer == nullptr) RETURN_SDL_ERROR;

		SDL_SetGPUBufferName(device, buffer, name.c_str());

		return Buffer(device, buffer);
	}
}
