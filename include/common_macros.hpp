#pragma once

#include <cstdlib>
#include <iostream>

// ---------------------------------------------
// Debug-build tracing, compiled out otherwise.
#ifdef LANLENS_DEBUG_BUILD
#define DEBUG_PRINT(...)                                                     \
  do {                                                                       \
    std::cerr << __VA_ARGS__ << std::endl;                                   \
  } while (0)
#else
#define DEBUG_PRINT(...) // No operation
#endif

// -------------------------------------------------

#define LANLENS_VERBOSE_LOG(...)                     \
  do {                                               \
    if (std::getenv("LANLENS_VERBOSE") != nullptr) { \
      std::cerr << __VA_ARGS__ << std::endl;         \
    }                                                \
  } while (0)
