#pragma once

// portability macros for attributes that are not available on all
//   supported compilers / language versions.

#if __cplusplus >= 202002L
#define CXX_LIKELY [[likely]]
#define CXX_UNLIKELY [[unlikely]]
#else
#define CXX_LIKELY
#define CXX_UNLIKELY
#endif /* __cplusplus >= 202002L */

#define CXX_NORETURN [[noreturn]]
