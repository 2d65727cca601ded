#pragma once

namespace oit
{
	///
	/// @brief Passes recorded for one active view in one frame
	/// @details Passes run in member order. Everything is skipped for a view whose resources were not
	/// prepared this frame.
	///
	struct Pass_schedule
	{
		///
		/// @brief State of a view after its transparent phase was queued
		///
		struct View_state
		{
			bool prepared;               // Resources prepared this frame
			bool has_work;               // At least one drawcall queued
			bool has_histogram;          // Histogram variant
			bool histogram_needs_reset;  // Histogram resources just recreated
			bool history_valid;          // Previous revealage written by last frame
			bool cdf_has_data;           // CDF may hold non-zero values
		};

		bool reset_histogram = false;
		bool clear_previous_revealage = false;
		bool accumulate = false;
		bool build_cdf = false;
		bool composite = false;

		static Pass_schedule from(const View_state& state) noexcept;
	};
}
