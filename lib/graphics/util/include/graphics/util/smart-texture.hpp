#pragma once

#include "graphics/util/allocator.hpp"
#include "gpu/texture.hpp"
#include "util/error.hpp"

#include <cassert>
#include <expected>
#include <format>
#include <glm/glm.hpp>
#include <memory>
#include <string>

namespace graphics
{
	///
	/// @brief Smart texture, recreated lazily when the requested extent changes
	/// @details #### Usage:
	/// - Assigns a format at construction
	/// - Call `resize` once per frame with the wanted extent, before use
	/// - Use `operator*` to get the underlying texture reference, valid until the next recreation
	/// @note Single mip level. For 3D textures the third component of the extent is the depth, otherwise it
	/// must be 1
	///
	template <typename Allocator>
	class Basic_auto_texture
	{
	  public:

		using Texture = typename Allocator::Texture;

		Basic_auto_texture(gpu::Texture::Format format, std::string name) noexcept :
			format(format),
			name(std::move(name))
		{}

		///
		/// @brief Make sure the texture exists with the given extent
		///
		/// @param size Wanted extent, (width, height, depth-or-layers)
		/// @return `true` if the texture was (re)created and its content is undefined, `false` if it was kept
		///
		std::expected<bool, util::Error> resize(const Allocator& allocator, glm::u32vec3 new_size) noexcept
		{
			if (texture != nullptr && size == new_size) return false;
			if (new_size.x == 0 || new_size.y == 0 || new_size.z == 0)
				return util::Error(
					std::format("Invalid size {}x{}x{} for texture '{}'", new_size.x, new_size.y, new_size.z, name)
				);
			if (format.type == SDL_GPU_TEXTURETYPE_2D && new_size.z != 1)
				return util::Error(std::format("Texture '{}' is not layered, depth must be 1", name));

			reset();

			auto create_texture_result = allocator.create_texture(format, new_size, name);
			if (!create_texture_result) return create_texture_result.error().forward("Resize texture failed");

			size = new_size;
			texture = std::make_unique<Texture>(std::move(*create_texture_result));
			return true;
		}

		///
		/// @brief Resize a 2D texture
		///
		std::expected<bool, util::Error> resize(const Allocator& allocator, glm::u32vec2 size) noexcept
		{
			return resize(allocator, glm::u32vec3(size, 1));
		}

		///
		/// @brief Drop the underlying texture
		///
		void reset() noexcept
		{
			texture.reset();
			size = {0, 0, 0};
		}

		const Texture& operator*() const noexcept
		{
			assert(texture != nullptr && "Texture not initialized. Call resize() first.");
			return *texture;
		}

		const Texture* operator->() const noexcept
		{
			assert(texture != nullptr && "Texture not initialized. Call resize() first.");
			return texture.get();
		}

	  private:

		gpu::Texture::Format format;
		std::string name;

		glm::u32vec3 size = {0, 0, 0};
		std::unique_ptr<Texture> texture;

	  public:

		Basic_auto_texture(const Basic_auto_texture&) = delete;
		Basic_auto_texture(Basic_auto_texture&&) = default;
		Basic_auto_texture& operator=(const Basic_auto_texture&) = delete;
		Basic_auto_texture& operator=(Basic_auto_texture&&) = default;
		~Basic_auto_texture() noexcept = default;
	};

	using Auto_texture = Basic_auto_texture<Device_allocator>;
}
