/**
 * @file compiler.hh
 * @brief Compiler detection for warning suppression around C headers
 */
#pragma once

#if defined(__EMSCRIPTEN__)
#define AUDIOTAP_COMPILER_WASM
#elif defined(__clang__)
#define AUDIOTAP_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
#define AUDIOTAP_COMPILER_GCC
#elif defined(_MSC_VER)
#define AUDIOTAP_COMPILER_MSVC
#endif
