/*
Module Name:
- attributes.hpp

Abstract:
- Cross-compiler spellings for the inlining and branch hints used by the validators
  and the table lookups.

Provided Macros:
- PDB_FORCE_INLINE
- PDB_UNLIKELY(x)

Notes:
- Hints guide code generation only and do not change semantics.
*/
#pragma once

#ifndef __has_attribute
#define __has_attribute(x) 0
#endif

// PDB_FORCE_INLINE
#if !defined(PDB_NO_FORCE_INLINE)
#if defined(_MSC_VER)
#define PDB_FORCE_INLINE __forceinline
#elif defined(__clang__) || defined(__GNUC__)
#if __has_attribute(always_inline) || defined(__GNUC__)
#define PDB_FORCE_INLINE inline __attribute__((always_inline))
#else
#define PDB_FORCE_INLINE inline
#endif
#else
#define PDB_FORCE_INLINE inline
#endif
#else
#define PDB_FORCE_INLINE inline
#endif

// PDB_UNLIKELY
#if defined(__clang__) || defined(__GNUC__)
#define PDB_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define PDB_UNLIKELY(x) (x)
#endif
