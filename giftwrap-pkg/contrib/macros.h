// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - Compiler attribute wrappers and small helpers shared
   by all of libgiftwrap-pkg

   ##################################################################### */
									/*}}}*/
// Private header
#ifndef GIFTWRAP_MACROS_H
#define GIFTWRAP_MACROS_H

#ifdef __GNUC__
#define GIFTWRAP_GCC_VERSION (__GNUC__ << 8 | __GNUC_MINOR__)
#else
#define GIFTWRAP_GCC_VERSION 0
#endif

#if GIFTWRAP_GCC_VERSION >= 0x0300
	#define GIFTWRAP_PURE	__attribute__((pure))
	#define GIFTWRAP_PRINTF(n)	__attribute__((format(printf, n, n + 1)))
	#define GIFTWRAP_UNUSED	__attribute__((unused))
#else
	#define GIFTWRAP_PURE
	#define GIFTWRAP_PRINTF(n)
	#define GIFTWRAP_UNUSED
#endif

#if GIFTWRAP_GCC_VERSION >= 0x0400
	#define GIFTWRAP_PUBLIC __attribute__ ((visibility ("default")))
	#define GIFTWRAP_HIDDEN __attribute__ ((visibility ("hidden")))
#else
	#define GIFTWRAP_PUBLIC
	#define GIFTWRAP_HIDDEN
#endif

// cold functions are rarely called, error reporting mostly
#if GIFTWRAP_GCC_VERSION >= 0x0403
	#define GIFTWRAP_COLD	__attribute__ ((__cold__))
#else
	#define GIFTWRAP_COLD
#endif

// Bumping MAJOR or MINOR changes the SONAME of libgiftwrap-pkg
#define GIFTWRAP_PKG_MAJOR 1
#define GIFTWRAP_PKG_MINOR 0
#define GIFTWRAP_PKG_RELEASE 0

/* Should be a multiple of the common page size (4096) */
static constexpr unsigned long long GIFTWRAP_BUFFER_SIZE = 64 * 1024;

template <class F>
struct GiftWrapScopeWrapper {
   F func;
   ~GiftWrapScopeWrapper() { func(); }
};
template <class F>
GiftWrapScopeWrapper(F) -> GiftWrapScopeWrapper<F>;
#define GIFTWRAP_PASTE2(a, b) a##b
#define GIFTWRAP_PASTE(a, b) GIFTWRAP_PASTE2(a, b)
#define DEFER(lambda) GiftWrapScopeWrapper GIFTWRAP_PASTE(defer, __LINE__){lambda};

#endif
