#include "graphics/util/allocator.hpp"

#include <cassert>
#include <format>

namespace graphics
{
	std::expected<gpu::Texture, util::Error> Device_allocator::create_texture(
		const gpu::Texture::Format& format,
		glm::u32vec3 size,
		const std::string& name
	) const noexcept
	{
		assert(device != nullptr);

		if (!format.supported_on(device))
			return util::Error(std::format("Format of texture '{}' not supported on device", name));

		return gpu::Texture::create(device, format.create(size.x, size.y, size.z), name);
	}

	std::expected<gpu::Buffer, util::Error> Device_allocator::create_buffer(
		gpu::Buffer::Usage usage,
		uint32_t size,
		const std::string& name
	) const noexcept
	{
		assert(device != nullptr);

		return gpu::Buffer::create(device, usage, size, name);
	}
}
