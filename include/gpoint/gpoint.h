/*****************************************************************************\
* This file is part of the gpoint library.
*
* gpoint - a compact C/C++ library that renders floating-point values exactly
* as the C runtime's printf("%g") does, without calling the C runtime.
* It was developed for experimental and educational purposes, so please keep
* expectations reasonable.
*
* Report bugs or suggest improvements to author: <programmer.amateur@proton.me>
*
* LICENSE & DISCLAIMER:
* - No warranties. Use at your own risk.
* - Licensed under Business Source License 1.1 (BSL-1.1):
*   - Free for non-commercial use.
*   - For commercial licensing, contact the author.
*   - Change Date: 2029-09-01 - after which the library will be licensed
*     under GNU GPLv3.
*   - Attribution required: "gpoint Library (c) A.Prograamar".
*   - See LICENSE in the project root for full terms.
\*****************************************************************************/

/*****************************************************************************\
* This header defines the C API of gpoint.
* All functions here are designed for C99/C++17 interoperability.
*
* All functions are reentrant: they keep no state between calls and may be
* called concurrently from any number of threads.
\*****************************************************************************/

#ifndef GPOINT_GPOINT_C_H
#	define GPOINT_GPOINT_C_H
#	pragma once

// Ensure minimum language standard: C99 or C++17
#if defined(_MSVC_LANG) // Some MSVC versions (pre-2019) define __cplusplus incorrectly unless /Zc:__cplusplus is enabled. Fallback to _MSVC_LANG if available.
#	if _MSVC_LANG < 201703L
#		error "gpoint requires at least C++17 or newer."
#	endif
#elif defined(__cplusplus)
#	if __cplusplus < 201703L
#		error "gpoint requires at least C++17 or newer."
#	endif
#elif defined(__STDC_VERSION__)
#	if __STDC_VERSION__ < 199901L
#		error "gpoint requires at least ISO C99 or newer."
#	endif
#else
#	error "Unknown language standard. gpoint requires at least C99 or C++17."
#endif

#include <stdint.h> // uint32_t
#include <stddef.h> // size_t

//*******************************************************************************************************************
// Library configuration options:

// Set GP_DEBUG to FALSE to link with the release version of the library.
#if !defined(GP_DEBUG) && !defined(NDEBUG)
#	define GP_DEBUG 1 // Enable debug mode.
#endif

// Set GP_SHARED to TRUE to build the library as a SHARED library.
// Library rebuild required.
#ifndef GP_SHARED
#	define GP_SHARED 0
#endif

// Size of the bounded output buffer, including the terminating zero.
// A rendering that does not fit fails with gp_ErrOverflow instead of growing the buffer.
// Library rebuild required.
#ifndef GP_BUFFER_SIZE
#	define GP_BUFFER_SIZE 200
#endif

// If GP_EXPORTS defined, the library is built as a shared and exports its functions.
#ifndef GP_EXPORTS
#	define GP_EXPORTS 0
#endif

//*******************************************************************************************************************

// Compiler-Specific Configuration: calling conventions and symbol visibility.
#if defined(_MSC_VER) // Microsoft Visual C++ Compiler
#	ifdef _M_IX86 // x86 architecture MSVC
#		define GP_SYS_CALL __cdecl // System API compatibility (e.g., fputs)
#		define GP_CALL __cdecl // Library internal functions
#	else
#		define GP_SYS_CALL // Default calling convention (e.g., x64)
#		define GP_CALL
#	endif
#
#	if ! GP_SHARED
#		define GP_API // Static library - no decoration needed
#	elif ! GP_EXPORTS
#		define GP_API __declspec(dllimport) // Client importing from DLL
#	else
#		define GP_API __declspec(dllexport) // Library exporting symbols
#	endif
#elif defined (__GNUC__) || defined(__clang__) // GCC and Clang Compilers
#	ifdef __i386__ // x86 architecture GCC/Clang
#		define GP_SYS_CALL __attribute__((cdecl))
#		define GP_CALL __attribute__((cdecl))
#	else
#		define GP_SYS_CALL
#		define GP_CALL
#	endif
#
#	if GP_EXPORTS
#		define GP_API __attribute__((visibility("default"))) // Export symbol
#	else
#		define GP_API // Import or static build
#	endif
#else // Unknown/Unsupported Compiler
#	define GP_SYS_CALL
#	define GP_CALL
#	define GP_API
#endif

// Language feature abstraction layer
// Unifies C and C++ attributes for consistent API definitions.
#ifdef __cplusplus
#	define GP_NODISCARD [[nodiscard]]
#	define GP_NOEXCEPT noexcept
#	define GP_DEFAULT(v) =(v) // C++ default argument syntax
#else
#	if defined(_MSC_VER)
#		define GP_NODISCARD _Check_return_
#		define GP_NOEXCEPT
#		define GP_DEFAULT(v)
#	elif defined(__GNUC__) || defined(__clang__)
#		define GP_NODISCARD __attribute__((warn_unused_result))
#		define GP_NOEXCEPT __attribute__((nothrow))
#		define GP_DEFAULT(v)
#	else
#		define GP_NODISCARD
#		define GP_NOEXCEPT
#		define GP_DEFAULT(v)
#	endif
#endif

#define GP_SUCCEEDED( v ) ((v) >= 0)
#define GP_FAILED( v ) ((v) < 0)

#ifdef __cplusplus
extern "C" {
#endif

typedef int32_t GP_RESULT; // Non-negative on success (usually a character count), negative gp_Error_e on failure.
typedef uint32_t GP_FLAGS;
typedef size_t GP_SIZE;
typedef GP_RESULT (GP_SYS_CALL *gp_SinkCb_t)(const char* str, void* ctx); // Text sink: receives the whole zero-terminated token in one call.

// gp_Error_e: Failure codes. Every failure is reported before anything is written.
typedef enum gp_Error_e
{	gp_ErrDirectiveEncoding = -1, // The directives cannot be encoded (unknown flag bits, control buffer too small).
	gp_ErrOverflow			= -2, // The rendering would not fit into GP_BUFFER_SIZE characters.
	gp_ErrInvalidArg		= -3, // A required pointer argument is NULL.
} gp_Error_e;

// gp_Directives_e: Bits of gp_Directives_t::flags_.
typedef enum gp_Directives_e
{	gp_ZeroPad		= 1 << 0, // '0': pad with zeros between the sign and the digits. Ignored for inf/nan and with gp_LeftJustify.
	gp_LeftJustify	= 1 << 1, // '-': pad on the right.
	gp_ForceSign	= 1 << 2, // '+': emit '+' for non-negative values.
	gp_Alternate	= 1 << 3, // '#': keep trailing zeros and the decimal point.
	gp_Width		= 1 << 4, // width_ is valid.
	gp_Precision	= 1 << 5, // precision_ is valid.
	gp_DirectivesMask = 0x3F, // 0b0011'1111
} gp_Directives_e;

// gp_Directives_t: The formatting request of one call.
// A NULL pointer to this structure is equivalent to zero-initialized directives, i.e. "%g".
typedef struct gp_Directives_t
{	GP_FLAGS flags_;		// Combination of gp_Directives_e.
	uint32_t width_;		// Minimum total output length. Read only when gp_Width is set.
	uint32_t precision_;	// Significant digits; 0 behaves as 1. Read only when gp_Precision is set, otherwise 6.
} gp_Directives_t;

// gp_Info_e: Static information queries. The type behind the returned pointer is indicated in the comment.
typedef enum gp_Info_e
{	gp_InfoVer,			// const unsigned*: Version number of the library.
	gp_InfoVersion,		// const char*: Full version string of the library.
	gp_InfoBufferSize,	// const unsigned*: GP_BUFFER_SIZE the library was built with.
	gp_InfoFlags,		// const unsigned*: Combination of gp_Status_e.
	gp_InfoCount_,		// Number of information types.
} gp_Info_e;

typedef enum gp_Status_e
{	gp_FlagDebug	= 1 << 0,
	gp_FlagShared	= 1 << 1,
	gp_FlagMask		= 0x03,
} gp_Status_e;

/// <summary>
/// Renders a value the way printf would render it with the control string equivalent to dirs.
/// </summary>
/// <param name="buff">Destination buffer. May be NULL to query the length.</param>
/// <param name="sz">Size of the destination buffer, including room for the terminating zero.</param>
/// <param name="val">The value to render.</param>
/// <param name="dirs">Formatting directives, or NULL for "%g".</param>
/// <returns>The length of the rendering without the terminating zero, or a negative gp_Error_e.
/// If the buffer is too small nothing is copied (an empty string is stored when sz is non-zero).</returns>
GP_API GP_RESULT GP_CALL gp_FormatG(char *buff, GP_SIZE sz, double val, const gp_Directives_t *dirs GP_DEFAULT(NULL)) GP_NOEXCEPT;

/// <summary>
/// Renders a value and passes the whole token to a text sink in a single call.
/// </summary>
/// <param name="val">The value to render.</param>
/// <param name="dirs">Formatting directives, or NULL for "%g".</param>
/// <param name="cb">The text sink. Is not called if rendering fails.</param>
/// <param name="ctx">A pointer to user data passed to the callback function.</param>
/// <returns>The value returned by the sink, or a negative gp_Error_e.</returns>
GP_API GP_RESULT GP_CALL gp_FormatGCb(
	double val,
	const gp_Directives_t *dirs,
	gp_SinkCb_t cb,
	void *ctx GP_DEFAULT(NULL)
);

/// <summary>
/// Default text sink. Writes the given string to the FILE* in ctx, or to the standard output stream if ctx is NULL.
/// </summary>
/// <param name="str">The string to output.</param>
/// <param name="ctx">FILE* to write to, or NULL.</param>
/// <returns>On success, returns a non-negative value.</returns>
GP_API GP_RESULT GP_SYS_CALL gp_SinkCb(const char *str, void *ctx GP_DEFAULT(NULL));

/// <summary>
/// Encodes the directives as the equivalent printf control string, e.g. "%#-+012.3g".
/// </summary>
/// <param name="buff">Destination buffer.</param>
/// <param name="sz">Size of the destination buffer, including room for the terminating zero.</param>
/// <param name="dirs">Formatting directives, or NULL for "%g".</param>
/// <returns>The length of the control string, or gp_ErrDirectiveEncoding.</returns>
GP_API GP_RESULT GP_CALL gp_DirectivesToFormat(char *buff, GP_SIZE sz, const gp_Directives_t *dirs) GP_NOEXCEPT;

/// <summary>
/// Retrieves static information about the library.
/// </summary>
/// <param name="info">The type of information to retrieve.</param>
/// <returns>A pointer to the requested static data, or NULL if the info type is not recognized.</returns>
GP_NODISCARD GP_API const void* GP_CALL gp_StaticInfo(gp_Info_e info);

#ifdef __cplusplus
} // extern "C"
#endif

#endif // #ifndef GPOINT_GPOINT_C_H
