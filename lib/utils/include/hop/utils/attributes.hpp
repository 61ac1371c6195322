/*
Module Name:
- attributes.hpp

Abstract:
- Branch-prediction hints with one spelling across MSVC, Clang, and GCC.

Provided Macros:
- HOP_LIKELY(x), HOP_UNLIKELY(x)

Notes:
- Hints guide code generation only and do not change semantics.
*/
#pragma once

// HOP_LIKELY / HOP_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define HOP_LIKELY(x) (__builtin_expect(!!(x), 1))
#define HOP_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define HOP_LIKELY(x) (x)
#define HOP_UNLIKELY(x) (x)
#endif

