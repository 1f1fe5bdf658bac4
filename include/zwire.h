/* SPDX-License-Identifier: MPL-2.0 */
/*
    zwire - decoder for the key-value store client wire protocol.

    This header carries the C-level contract shared with the C++ API under
    core/src: version, option identifiers and error numbers.
*/

#ifndef __ZWIRE_H_INCLUDED__
#define __ZWIRE_H_INCLUDED__

/*  Version macros for compile-time API version detection                    */
#define ZWIRE_VERSION_MAJOR 1
#define ZWIRE_VERSION_MINOR 0
#define ZWIRE_VERSION_PATCH 0

#define ZWIRE_MAKE_VERSION(major, minor, patch)                                \
    ((major) *10000 + (minor) *100 + (patch))
#define ZWIRE_VERSION                                                          \
    ZWIRE_MAKE_VERSION (ZWIRE_VERSION_MAJOR, ZWIRE_VERSION_MINOR,              \
                        ZWIRE_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>

#if defined ZWIRE_STATIC || !defined _WIN32
#define ZWIRE_EXPORT
#elif defined DLL_EXPORT
#define ZWIRE_EXPORT __declspec (dllexport)
#else
#define ZWIRE_EXPORT __declspec (dllimport)
#endif

/******************************************************************************/
/*  Errors.                                                                   */
/******************************************************************************/

/*  A number random enough not to collide with different errno ranges on      */
/*  different OSes. The assumption is that error_t is at least 32-bit type.   */
#define ZWIRE_HAUSNUMERO 156384712

#ifndef EMSGSIZE
#define EMSGSIZE (ZWIRE_HAUSNUMERO + 10)
#endif
#ifndef ECANCELED
#define ECANCELED (ZWIRE_HAUSNUMERO + 11)
#endif

/*  Decoder-specific errors.                                                  */
#define EEMPTYDATA (ZWIRE_HAUSNUMERO + 60)
#define EENDOFSTREAM (ZWIRE_HAUSNUMERO + 61)
#define EINVALIDOPCODE (ZWIRE_HAUSNUMERO + 62)
#define EINVALIDOPERAND (ZWIRE_HAUSNUMERO + 63)
#define EINVALIDINSTR (ZWIRE_HAUSNUMERO + 64)
#define ECONTEXT (ZWIRE_HAUSNUMERO + 65)
#define ENESTING (ZWIRE_HAUSNUMERO + 66)

/*  This function retrieves the errno as it is known to zwire library. The    */
/*  goal of this function is to make the code 100% portable, including where  */
/*  the library is compiled with a different runtime than the application.   */
ZWIRE_EXPORT int zwire_errno (void);

/*  Resolves system errors and zwire errors to human-readable string.         */
ZWIRE_EXPORT const char *zwire_strerror (int errnum_);

/*  Run-time API version detection                                            */
ZWIRE_EXPORT void zwire_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Decoder options.                                                          */
/******************************************************************************/

/*  Maximum container nesting depth (int). 0 forbids containers.              */
#define ZWIRE_MAXDEPTH 1
/*  Maximum byte length / element count of one operand (int64, -1 = none).    */
#define ZWIRE_MAXLEN 2
/*  Bytes requested from a streaming source per blocking read (int).          */
#define ZWIRE_RCVBUF 3

#define ZWIRE_MAXDEPTH_DFLT 512
#define ZWIRE_RCVBUF_DFLT 65536

#undef ZWIRE_EXPORT

#ifdef __cplusplus
}
#endif

#endif
