// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - Compiler attributes and small helpers shared by the
   library and the front-end

   ##################################################################### */
									/*}}}*/
// Private header
#ifndef PKGCAT_MACROS_H
#define PKGCAT_MACROS_H

#ifdef __GNUC__
#define PKGCAT_GCC_VERSION (__GNUC__ << 8 | __GNUC_MINOR__)
#else
#define PKGCAT_GCC_VERSION 0
#endif

#ifdef PKGCAT_COMPILING_PKGCAT
/* likely() and unlikely() can be used to mark boolean expressions
   as (not) likely true which will help the compiler to optimise */
#if PKGCAT_GCC_VERSION >= 0x0300
	#define likely(x)	__builtin_expect (!!(x), 1)
	#define unlikely(x)	__builtin_expect (!!(x), 0)
#else
	#define likely(x)	(x)
	#define unlikely(x)	(x)
#endif
#endif

#if PKGCAT_GCC_VERSION >= 0x0300
	#define PKGCAT_PURE	__attribute__((pure))
	#define PKGCAT_PRINTF(n)	__attribute__((format(printf, n, n + 1)))
	#define PKGCAT_UNUSED	__attribute__((unused))
#else
	#define PKGCAT_PURE
	#define PKGCAT_PRINTF(n)
	#define PKGCAT_UNUSED
#endif

#if PKGCAT_GCC_VERSION > 0x0302
	#define PKGCAT_NONNULL(...)	__attribute__((nonnull(__VA_ARGS__)))
#else
	#define PKGCAT_NONNULL(...)
#endif

#if PKGCAT_GCC_VERSION >= 0x0400
	#define PKGCAT_PUBLIC __attribute__ ((visibility ("default")))
	#define PKGCAT_HIDDEN __attribute__ ((visibility ("hidden")))
#else
	#define PKGCAT_PUBLIC
	#define PKGCAT_HIDDEN
#endif

// cold functions are unlikely() to be called
#if PKGCAT_GCC_VERSION >= 0x0403
	#define PKGCAT_COLD	__attribute__ ((__cold__))
#else
	#define PKGCAT_COLD
#endif

#define PKGCAT_OVERRIDE override

#define PKGCAT_MAJOR 1
#define PKGCAT_MINOR 0
#define PKGCAT_RELEASE 0

template <class F>
struct PkgCatScopeWrapper {
   F func;
   ~PkgCatScopeWrapper() { func(); }
};
template <class F>
PkgCatScopeWrapper(F) -> PkgCatScopeWrapper<F>;
#define PKGCAT_PASTE2(a, b) a##b
#define PKGCAT_PASTE(a, b) PKGCAT_PASTE2(a, b)
#define DEFER(lambda) PkgCatScopeWrapper PKGCAT_PASTE(defer, __LINE__){lambda};

#endif
