#include "util/error.hpp"

#include <utility>

namespace util
{
	Error::Error(std::string message, std::source_location location) noexcept
	{
		chain.emplace_back(std::move(message), location);
	}

	Error Error::forward(std::string message, std::source_location location) const& noexcept
	{
		Error result;
		result.chain.reserve(chain.size() + 1);
		result.chain.emplace_back(std::move(message), location);
		result.chain.insert(result.chain.end(), chain.begin(), chain.end());
		return result;
	}

	Error Error::forward(std::string message, std::source_location location) && noexcept
	{
		chain.insert(chain.begin(), Entry{.message = std::move(message), .location = location});
		return std::move(*this);
	}

	std::function<Error(Error)> Error::forward_fn(std::string message, std::source_location location) noexcept
	{
		return [message = std::move(message), location](Error error) {
			return std::move(error).forward(message, location);
		};
	}
}
