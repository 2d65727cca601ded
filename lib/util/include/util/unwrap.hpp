#pragma once

#include "util/error.hpp"

#include <expected>
#include <optional>
#include <string>
#include <type_traits>

namespace util
{
	///
	/// @brief Pipe adaptor that extracts the value of a `std::expected`, throwing the error otherwise
	/// @details #### Usage:
	/// ```cpp
	/// auto renderer = oit::Renderer::create(device, formats) | util::unwrap("Create renderer failed");
	/// ```
	///
	class unwrap
	{
	  public:

		unwrap(std::source_location location = std::source_location::current()) noexcept :
			location(location)
		{}

		unwrap(std::string message, std::source_location location = std::source_location::current()) noexcept :
			message(std::move(message)),
			location(location)
		{}

		template <typename T>
		friend T operator|(std::expected<T, Error>&& result, const unwrap& self)
		{
			if (!result) throw self.wrap(std::move(result.error()));
			if constexpr (!std::is_void_v<T>) return std::move(*result);
		}

		template <typename T>
		friend T operator|(const std::expected<T, Error>& result, const unwrap& self)
		{
			if (!result) throw self.wrap(result.error());
			if constexpr (!std::is_void_v<T>) return *result;
		}

	  private:

		std::optional<std::string> message;
		std::source_location location;

		Error wrap(Error error) const noexcept
		{
			if (!message.has_value()) return error;
			return std::move(error).forward(*message, location);
		}
	};
}
