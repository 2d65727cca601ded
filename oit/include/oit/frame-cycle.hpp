#pragma once

#include <cstdint>

namespace oit
{
	///
	/// @brief Double-buffer index of a view's revealage textures
	/// @details `current()` is written this frame, `previous()` holds last frame's result. The index flips
	/// once per frame in `advance()`, except on the very first frame. History is valid only if the
	/// previous slot was actually written by last frame and the textures were not recreated since.
	///
	class Frame_cycle
	{
	  public:

		///
		/// @brief Advance to the next frame. Called exactly once per frame, before any pass.
		///
		void advance() noexcept;

		///
		/// @brief Mark the current slot as written this frame
		///
		void mark_written() noexcept;

		///
		/// @brief Forget all history, eg. after the textures were recreated
		///
		void invalidate_history() noexcept;

		uint32_t current() const noexcept { return frame_index; }

		uint32_t previous() const noexcept { return 1 - frame_index; }

		bool is_history_valid() const noexcept { return previous_written; }

		bool is_started() const noexcept { return started; }

	  private:

		uint32_t frame_index = 0;
		bool started = false;
		bool current_written = false;
		bool previous_written = false;
	};
}
