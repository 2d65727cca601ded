#pragma once

#include <expected>
#include <functional>
#include <source_location>
#include <string>
#include <utility>
#include <vector>

namespace util
{
	///
	/// @brief Chained error type, used as the error half of `std::expected`
	/// @details Each layer that forwards the error appends a message, so the chain reads from the
	/// outermost context (front) to the root cause (back).
	///
	class Error
	{
	  public:

		struct Entry
		{
			std::string message;
			std::source_location location;
		};

		Error(std::string message, std::source_location location = std::source_location::current()) noexcept;

		///
		/// @brief Append a context message to the error
		///
		/// @param message Context message, eg. "Create pipeline failed"
		/// @return Forwarded error
		///
		[[nodiscard]]
		Error forward(
			std::string message,
			std::source_location location = std::source_location::current()
		) const& noexcept;

		[[nodiscard]]
		Error forward(
			std::string message,
			std::source_location location = std::source_location::current()
		) && noexcept;

		///
		/// @brief Create a forwarding function, for use with `std::expected::transform_error`
		///
		/// @param message Context message
		/// @return Callable taking an `Error` and returning the forwarded `Error`
		///
		static std::function<Error(Error)> forward_fn(
			std::string message,
			std::source_location location = std::source_location::current()
		) noexcept;

		///
		/// @brief Convert to an unexpected result, so that `return error;` works in any function
		/// returning `std::expected<T, Error>`
		///
		template <typename T>
		operator std::expected<T, Error>() const& noexcept
		{
			return std::unexpected(*this);
		}

		template <typename T>
		operator std::expected<T, Error>() && noexcept
		{
			return std::unexpected(std::move(*this));
		}

		const std::vector<Entry>& operator*() const noexcept { return chain; }
		const std::vector<Entry>* operator->() const noexcept { return &chain; }

	  private:

		std::vector<Entry> chain;

		Error() = default;
	};
}
