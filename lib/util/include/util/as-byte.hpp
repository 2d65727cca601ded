#pragma once

#include <cstddef>
#include <span>
#include <type_traits>

namespace util
{
	///
	/// @brief View a trivially copyable object as raw bytes, eg. for pushing uniforms
	///
	/// @param value Object to view
	/// @return Byte span covering the object, valid as long as @p value is alive
	///
	template <typename T>
		requires(std::is_trivially_copyable_v<T>)
	std::span<const std::byte, sizeof(T)> as_bytes(const T& value) noexcept
	{
		return std::span<const std::byte, sizeof(T)>(reinterpret_cast<const std::byte*>(&value), sizeof(T));
	}
}
