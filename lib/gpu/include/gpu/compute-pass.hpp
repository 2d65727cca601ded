#pragma once

#include "compute-pipeline.hpp"

#include <SDL3/SDL_gpu.h>

namespace gpu
{
	///
	/// @brief Compute pass, begun from a `Command_buffer`
	///
	///
	class Compute_pass
	{
	  public:

		Compute_pass(const Compute_pass&) = delete;
		Compute_pass(Compute_pass&& other) noexcept;
		Compute_pass& operator=(const Compute_pass&) = delete;
		Compute_pass& operator=(Compute_pass&& other) noexcept;
		~Compute_pass() noexcept = default;

		void bind_pipeline(const Compute_pipeline& pipeline) const noexcept;

		void dispatch(uint32_t groupcount_x, uint32_t groupcount_y, uint32_t groupcount_z) const noexcept;

		void end() noexcept;

	  private:

		friend class Command_buffer;

		SDL_GPUComputePass* compute_pass = nullptr;

		explicit Compute_pass(SDL_GPUComputePass* compute_pass) noexcept :
			compute_pass(compute_pass)
		{}
	};
}
