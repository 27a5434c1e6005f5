#pragma once

#include <audiotap/sdk/compiler.hh>

#if defined(AUDIOTAP_COMPILER_MSVC)
#pragma warning( push )
#pragma warning( disable : 4820)
#elif defined(AUDIOTAP_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(AUDIOTAP_COMPILER_CLANG) || defined(AUDIOTAP_COMPILER_WASM)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif

#include <SDL3/SDL.h>

#if defined(AUDIOTAP_COMPILER_MSVC)
#pragma warning( pop )
#elif defined(AUDIOTAP_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(AUDIOTAP_COMPILER_CLANG) || defined(AUDIOTAP_COMPILER_WASM)
# pragma clang diagnostic pop
#endif

#include <string>

namespace audiotap {
    inline std::string get_sdl_error() {
        const char* error = SDL_GetError();
        return (error && *error) ? error : "Unknown SDL error";
    }
}
