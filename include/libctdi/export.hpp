#pragma once

/// @file export.hpp
/// Symbol visibility for libctdi.
///
/// CMake defines LIBCTDI_STATIC for static builds and LIBCTDI_BUILDING while
/// compiling the library. Shared builds hide every symbol not marked
/// LIBCTDI_EXPORT; LIBCTDI_LOCAL keeps internal helpers out of the ABI.

#if defined(LIBCTDI_STATIC)
  #define LIBCTDI_EXPORT
  #define LIBCTDI_LOCAL
#elif defined(_WIN32) || defined(__CYGWIN__)
  #if defined(LIBCTDI_BUILDING)
    #define LIBCTDI_EXPORT __declspec(dllexport)
  #else
    #define LIBCTDI_EXPORT __declspec(dllimport)
  #endif
  #define LIBCTDI_LOCAL
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBCTDI_EXPORT __attribute__((visibility("default")))
  #define LIBCTDI_LOCAL  __attribute__((visibility("hidden")))
#else
  #define LIBCTDI_EXPORT
  #define LIBCTDI_LOCAL
#endif
