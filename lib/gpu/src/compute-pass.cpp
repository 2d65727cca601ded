#include "gpu/compute-pass.hpp"

#include <cassert>
#include <utility>

namespace gpu
{
	Compute_pass::Compute_pass(Compute_pass&& other) noexcept :
		compute_pass(std::exchange(other.compute_pass, nullptr))
	{}

	Compute_pass& Compute_pass::operator=(Compute_pass&& other) noexcept
	{
		if (&other != this) std::swap(compute_pass, other.compute_pass);
		return *this;
	}

	void Compute_pass::bind_pipeline(const Compute_pipeline& pipeline) const noexcept
	{
		assert(compute_pass != nullptr);
		SDL_BindGPUComputePipeline(compute_pass, pipeline);
	}

	void Compute_pass::dispatch(uint32_t groupcount_x, uint32_t groupcount_y, uint32_t groupcount_z)
		const noexcept
	{
		assert(compute_pass != nullptr);
		SDL_DispatchGPUCompute(compute_pass, groupcount_x, groupcount_y, groupcount_z);
	}

	void Compute_pass::end() noexcept
	{
		assert(compute_pass != nullptr);
		SDL_EndGPUComputePass(compute_pass);
		compute_pass = nullptr;
	}
}
