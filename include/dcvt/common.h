#pragma once

#include "dcvt/config.h"

#include <cstddef>
#include <cstdint>

#if !defined(DCVT_EXPORT_ALL_STUFF_FOR_GNUC)
#    ifdef __GNUC__
#        define DCVT_EXPORT_ALL_STUFF_FOR_GNUC DCVT_EXPORT
#    else
#        define DCVT_EXPORT_ALL_STUFF_FOR_GNUC
#    endif
#endif

#if !defined(DCVT_FORCE_INLINE)
#    if defined(_MSC_VER)
#        define DCVT_FORCE_INLINE __forceinline
#    elif defined(__GNUC__)
#        define DCVT_FORCE_INLINE __attribute__((always_inline)) inline
#    else
#        define DCVT_FORCE_INLINE inline
#    endif
#endif  // !defined(DCVT_FORCE_INLINE)

#if !defined(DCVT_UNREACHABLE_CODE)
#    if defined(_MSC_VER)
#        define DCVT_UNREACHABLE_CODE __assume(false)
#    elif defined(__GNUC__)
#        define DCVT_UNREACHABLE_CODE __builtin_unreachable()
#    else
#        define DCVT_UNREACHABLE_CODE
#    endif
#endif  // !defined(DCVT_UNREACHABLE_CODE)

// Vectorized parsing needs generic vector types and `__builtin_convertvector`
#if !defined(DCVT_HAS_VECTOR_PARSE)
#    if DCVT_USE_VECTOR_PARSE != 0 && \
        (defined(__clang__) || (defined(__GNUC__) && __GNUC__ >= 9 && !defined(__INTEL_COMPILER)))
#        define DCVT_HAS_VECTOR_PARSE 1
#    else
#        define DCVT_HAS_VECTOR_PARSE 0
#    endif
#endif  // !defined(DCVT_HAS_VECTOR_PARSE)
