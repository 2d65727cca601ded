#include "oit/frame-cycle.hpp"

namespace oit
{
	void Frame_cycle::advance() noexcept
	{
		if (started)
		{
			frame_index = 1 - frame_index;
			previous_written = current_written;
		}
		else
		{
			started = true;
			previous_written = false;
		}

		current_written = false;
	}

	void Frame_cycle::mark_written() noexcept
	{
		current_written = true;
	}

	void Frame_cycle::invalidate_history() noexcept
	{
		current_written = false;
		previous_written = false;
	}
}
