#pragma once

// Branch prediction hints for failure paths; plain expressions elsewhere.
#if defined(__GNUC__) || defined(__clang__)
#define LGTV_LIKELY(x) (__builtin_expect(!!(x), 1))
#define LGTV_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define LGTV_LIKELY(x) (x)
#define LGTV_UNLIKELY(x) (x)
#endif
