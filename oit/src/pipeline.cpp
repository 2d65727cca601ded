#include "oit/pipeline.hpp"

namespace oit
{
	std::expected<Pipeline, util::Error> Pipeline::create(
		SDL_GPUDevice* device,
		const Format_info& format_info
	) noexcept
	{
		auto wboit_accum = pipeline::Wboit_accum::create(device, format_info.depth_format);
		if (!wboit_accum) return wboit_accum.error().forward("Create WBOIT accumulation pipeline failed");

		auto cdf_build = pipeline::Cdf_build::create(device);
		if (!cdf_build) return cdf_build.error().forward("Create CDF build pipeline failed");

		auto composite = pipeline::Composite::create(device, format_info.color_format);
		if (!composite) return composite.error().forward("Create composite pipeline failed");

		return Pipeline{
			.wboit_accum = std::move(*wboit_accum),
			.cdf_build = std::move(*cdf_build),
			.composite = std::move(*composite)
		};
	}
}
