#pragma once

#include <SDL3/SDL_gpu.h>
#include <cassert>
#include <utility>

namespace gpu
{
	///
	/// @brief Release function for each kind of SDL GPU resource
	///
	template <typename T>
	struct Resource_release;

	template <>
	struct Resource_release<SDL_GPUTexture>
	{
		static void release(SDL_GPUDevice* device, SDL_GPUTexture* resource) noexcept
		{
			SDL_ReleaseGPUTexture(device, resource);
		}
	};

	template <>
	struct Resource_release<SDL_GPUBuffer>
	{
		static void release(SDL_GPUDevice* device, SDL_GPUBuffer* resource) noexcept
		{
			SDL_ReleaseGPUBuffer(device, resource);
		}
	};

	template <>
	struct Resource_release<SDL_GPUSampler>
	{
		static void release(SDL_GPUDevice* device, SDL_GPUSampler* resource) noexcept
		{
			SDL_ReleaseGPUSampler(device, resource);
		}
	};

	template <>
	struct Resource_release<SDL_GPUShader>
	{
		static void release(SDL_GPUDevice* device, SDL_GPUShader* resource) noexcept
		{
			SDL_ReleaseGPUShader(device, resource);
		}
	};

	template <>
	struct Resource_release<SDL_GPUGraphicsPipeline>
	{
		static void release(SDL_GPUDevice* device, SDL_GPUGraphicsPipeline* resource) noexcept
		{
			SDL_ReleaseGPUGraphicsPipeline(device, resource);
		}
	};

	template <>
	struct Resource_release<SDL_GPUComputePipeline>
	{
		static void release(SDL_GPUDevice* device, SDL_GPUComputePipeline* resource) noexcept
		{
			SDL_ReleaseGPUComputePipeline(device, resource);
		}
	};

	///
	/// @brief Owning box of an SDL GPU resource, released together with its device on destruction
	/// @note Move-only
	///
	template <typename T>
	class Resource_box
	{
	  public:

		Resource_box(const Resource_box&) = delete;
		Resource_box& operator=(const Resource_box&) = delete;

		Resource_box(Resource_box&& other) noexcept :
			device(std::exchange(other.device, nullptr)),
			resource(std::exchange(other.resource, nullptr))
		{}

		Resource_box& operator=(Resource_box&& other) noexcept
		{
			if (&other != this)
			{
				std::swap(device, other.device);
				std::swap(resource, other.resource);
			}

			return *this;
		}

		~Resource_box() noexcept
		{
			if (resource != nullptr) Resource_release<T>::release(device, resource);
		}

		operator T*() const noexcept { return resource; }

	  protected:

		Resource_box(SDL_GPUDevice* device, T* resource) noexcept :
			device(device),
			resource(resource)
		{
			assert(device != nullptr);
			assert(resource != nullptr);
		}

		SDL_GPUDevice* device = nullptr;
		T* resource = nullptr;
	};
}
