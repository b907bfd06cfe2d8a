// Copyright (c) 2025, WH & 2026, hitcore contributors, All rights reserved.
// miscellaneous utilities/macros which don't require transitive includes
#pragma once

#if defined(__GNUC__) || defined(__clang__)
#define forceinline __attribute__((always_inline)) inline
#define likely(x) __builtin_expect(bool(x), 1)
#define unlikely(x) __builtin_expect(bool(x), 0)
#else
#define forceinline inline
#define likely(x) (x)
#define unlikely(x) (x)
#endif

#define PI 3.1415926535897932384626433832795

// not copy or move constructable/assignable
// purely for clarifying intent
#define NOCOPY_NOMOVE(classname__)                       \
   private:                                              \
    classname__(const classname__&) = delete;            \
    classname__& operator=(const classname__&) = delete; \
    classname__(classname__&&) = delete;                 \
    classname__& operator=(classname__&&) = delete;
