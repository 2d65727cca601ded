#pragma once

#include "oit/device.hpp"
#include "oit/mode.hpp"
#include "oit/view.hpp"
#include "util/error.hpp"

#include <expected>
#include <map>
#include <vector>

namespace oit
{
	///
	/// @brief Tracks the OIT mode of every view
	/// @details Modes recorded by `configure` are read by the next resource preparation. Views that turn
	/// inactive or disappear from the camera set are reported so their resources can be released.
	///
	class View_registry
	{
	  public:

		///
		/// @param support Capabilities of the device the views render on
		///
		explicit View_registry(Device_support support) noexcept :
			support(support)
		{}

		///
		/// @brief Validate and apply the host's camera set for this frame
		/// @details Active views must not be multisampled, their variant must run on the device, and
		/// histogram parameters must be valid.
		/// Validation runs on the whole set first; on failure nothing is applied.
		///
		/// @param cameras All live cameras of the host. Depth usage of newly activated cameras is
		/// updated in place.
		/// @return Views whose resources must be released, or error on invalid configuration
		///
		std::expected<std::vector<View_id>, util::Error> configure(std::map<View_id, Camera>& cameras) noexcept;

		///
		/// @brief Get the mode of a view
		///
		/// @return Mode, `mode::Inactive` if the view is unknown or inactive
		///
		Mode get_mode(View_id id) const noexcept;

		size_t get_active_count() const noexcept { return active_views.size(); }

	  private:

		Device_support support;
		std::map<View_id, Mode> active_views;
	};
}
