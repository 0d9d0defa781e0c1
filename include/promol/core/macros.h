#pragma once

// small per-point kernels called from the innermost loops
#if defined(__GNUC__) || defined(__clang__)
#define PROMOL_ALWAYS_INLINE inline __attribute__((always_inline))
#elif defined(_MSC_VER)
#define PROMOL_ALWAYS_INLINE __forceinline
#else
#define PROMOL_ALWAYS_INLINE inline
#endif
