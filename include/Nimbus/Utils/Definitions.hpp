#pragma once

// Fixes conflict in Windows with <windows.h>
#ifdef _WIN32
  #undef ERROR
#endif

#if defined(__linux__)
  #define NIMBUS_PLATFORM_LINUX 1
#else
  #define NIMBUS_PLATFORM_LINUX 0
#endif

#if defined(__APPLE__)
  #define NIMBUS_PLATFORM_MACOS 1
#else
  #define NIMBUS_PLATFORM_MACOS 0
#endif

#if defined(_WIN32)
  #define NIMBUS_PLATFORM_WINDOWS 1
#else
  #define NIMBUS_PLATFORM_WINDOWS 0
#endif

#ifndef NIMBUS_VERSION
  #define NIMBUS_VERSION "0.1.0"
#endif

/// Macro alias for trailing return type functions.
#define fn auto
