#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   LIBCTDI_BUILDING : defined when compiling the libctdi library itself
///   LIBCTDI_STATIC   : define when building/linking libctdi as a static lib

#if defined(LIBCTDI_STATIC)
  #define LIBCTDI_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef LIBCTDI_BUILDING
    #define LIBCTDI_EXPORT __declspec(dllexport)
  #else
    #define LIBCTDI_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBCTDI_EXPORT __attribute__((visibility("default")))
#else
  #define LIBCTDI_EXPORT
#endif
