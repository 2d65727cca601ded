#pragma once

#include "util/error.hpp"

#include <SDL3/SDL_error.h>
#include <format>

///
/// @brief Return the current SDL error as an `util::Error`
///
#define RETURN_SDL_ERROR return util::Error(std::format("SDL Error: {}", SDL_GetError()))
