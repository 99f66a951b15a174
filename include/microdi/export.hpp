#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   MICRODI_BUILDING  — defined when compiling the microdi library itself
///   MICRODI_STATIC    — define when building/linking microdi as a static lib

#if defined(MICRODI_STATIC)
  #define MICRODI_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef MICRODI_BUILDING
    #define MICRODI_EXPORT __declspec(dllexport)
  #else
    #define MICRODI_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define MICRODI_EXPORT __attribute__((visibility("default")))
#else
  #define MICRODI_EXPORT
#endif
