#pragma once

#include "oit/pipeline/cdf-build.hpp"
#include "oit/pipeline/composite.hpp"
#include "oit/pipeline/wboit-accum.hpp"

namespace oit
{
	///
	/// @brief Formats of the host's view targets
	///
	struct Format_info
	{
		SDL_GPUTextureFormat color_format;
		SDL_GPUTextureFormat depth_format;
	};

	struct Pipeline
	{
		pipeline::Wboit_accum wboit_accum;
		pipeline::Cdf_build cdf_build;
		pipeline::Composite composite;

		static std::expected<Pipeline, util::Error> create(
			SDL_GPUDevice* device,
			const Format_info& format_info
		) noexcept;
	};
}
