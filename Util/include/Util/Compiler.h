
#ifndef UTIL_COMPILER_H_
#define UTIL_COMPILER_H_

#if defined(__GNUC__) || defined(__clang__)
#define COLD_CODE __attribute__((noinline, cold))
#define FORCE_INLINE __attribute__((always_inline)) inline
#elif defined(_MSC_VER)
#define COLD_CODE __declspec(noinline)
#define FORCE_INLINE __forceinline
#else
#define COLD_CODE
#define FORCE_INLINE inline
#endif

#endif
