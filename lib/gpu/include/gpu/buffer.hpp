#pragma once

#include "resource-box.hpp"
#include "util/error.hpp"

#include <SDL3/SDL_gpu.h>
#include <expected>
#include <string>

namespace gpu
{
	///
	/// @brief GPU Buffer
	///
	///
	class Buffer : public Resource_box<SDL_GPUBuffer>
	{
	  public:

		///
		/// @brief Buffer usage flags, bit-compatible with `SDL_GPUBufferUsageFlags`
		///
		struct Usage
		{
			bool vertex : 1 = false;
			bool index : 1 = false;
			bool indirect : 1 = false;
			bool graphic_storage_read : 1 = false;
			bool compute_storage_read : 1 = false;
			bool compute_storage_write : 1 = false;
			uint8_t _reserved : 2 = 0;

			operator SDL_GPUBufferUsageFlags(this Usage self) noexcept;
		};

		static_assert(sizeof(Usage) == 1);

		Buffer(const Buffer&) = delete;
		Buffer(Buffer&&) = default;
		Buffer& operator=(const Buffer&) = delete;
		Buffer& operator=(Buffer&&) = default;
		~Buffer() noexcept = default;

		///
		/// @brief Create a GPU buffer
		///
		/// @param usage Usage flags
		/// @param size Size in bytes
		/// @param name Debug name
		/// @return Created buffer, or error
		///
		static std::expected<Buffer, util::Error> create(
			SDL_GPUDevice* device,
			Usage usage,
			uint32_t size,
			const std::string& name
		) noexcept;

	  private:

		Buffer(SDL_GPUDevice* device, SDL_GPUBuffer* buffer) noexcept :
			Resource_box(device, buffer)
		{}
	};
}
