#pragma once

// Branch prediction hints for the forwarding loops.
// Plain expressions on compilers without __builtin_expect.
#if defined(__GNUC__) || defined(__clang__)
#define MPBRIDGE_LIKELY(x) (__builtin_expect(!!(x), 1))
#define MPBRIDGE_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define MPBRIDGE_LIKELY(x) (x)
#define MPBRIDGE_UNLIKELY(x) (x)
#endif
