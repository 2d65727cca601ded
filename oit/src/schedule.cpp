#include "oit/schedule.hpp"

namespace oit
{
	Pass_schedule Pass_schedule::from(const View_state& state) noexcept
	{
		if (!state.prepared) return {};

		const bool histogram = state.has_histogram;

		// A reset leaves a zero CDF behind
		const bool cdf_has_data = state.cdf_has_data && !state.histogram_needs_reset;

		return {
			.reset_histogram = histogram && state.histogram_needs_reset,
			.clear_previous_revealage = histogram && state.has_work && !state.history_valid,
			.accumulate = state.has_work,
			.build_cdf = histogram && (state.has_work || cdf_has_data),
			.composite = state.has_work
		};
	}
}
