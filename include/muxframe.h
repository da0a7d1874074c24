/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_H_INCLUDED__
#define __MUXFRAME_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define MUXFRAME_VERSION_MAJOR 0
#define MUXFRAME_VERSION_MINOR 1
#define MUXFRAME_VERSION_PATCH 0

#define MUXFRAME_MAKE_VERSION(major, minor, patch)                             \
    ((major) *10000 + (minor) *100 + (patch))
#define MUXFRAME_VERSION                                                       \
    MUXFRAME_MAKE_VERSION (MUXFRAME_VERSION_MAJOR, MUXFRAME_VERSION_MINOR,     \
                           MUXFRAME_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined MUXFRAME_NO_EXPORT
#define MUXFRAME_EXPORT
#else
#if defined _WIN32
#if defined MUXFRAME_STATIC
#define MUXFRAME_EXPORT
#elif defined DLL_EXPORT
#define MUXFRAME_EXPORT __declspec(dllexport)
#else
#define MUXFRAME_EXPORT __declspec(dllimport)
#endif
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define MUXFRAME_EXPORT __attribute__ ((visibility ("default")))
#else
#define MUXFRAME_EXPORT
#endif
#endif
#endif

/******************************************************************************/
/*  muxframe errors.                                                          */
/******************************************************************************/

/*  A number random enough not to collide with different errno ranges on      */
/*  different OSes. The assumption is that error_t is at least 32-bit type.  */
#define MUXFRAME_HAUSNUMERO 156384912

#ifndef EPROTO
#define EPROTO (MUXFRAME_HAUSNUMERO + 1)
#define MUXFRAME_EPROTO_FALLBACK
#endif
#ifndef EMSGSIZE
#define EMSGSIZE (MUXFRAME_HAUSNUMERO + 2)
#define MUXFRAME_EMSGSIZE_FALLBACK
#endif

/*  This function retrieves the errno as it is known to the library. The     */
/*  goal of this function is to make the code 100% portable, including where */
/*  the library is compiled with certain CRT library (on Windows) and linked  */
/*  to an application that uses different CRT library.                        */
MUXFRAME_EXPORT int muxframe_errno (void);

/*  Resolves system errors and muxframe errors to human-readable string.      */
MUXFRAME_EXPORT const char *muxframe_strerror (int errnum_);

/*  Run-time API version detection                                            */
MUXFRAME_EXPORT void muxframe_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  Frame header wire format.                                                 */
/*                                                                            */
/*  +---------+-----+--------+-----------+--------+                           */
/*  | version | tag | flags  | stream_id | length |  then `length` body bytes */
/*  |   u8    | u8  | be u16 |  be u32   | be u32 |                           */
/*  +---------+-----+--------+-----------+--------+                           */
/******************************************************************************/

#define MUXFRAME_HEADER_SIZE 12

/*  Frame tags                                                                */
#define MUXFRAME_TAG_DATA 0
#define MUXFRAME_TAG_WINDOW_UPDATE 1
#define MUXFRAME_TAG_PING 2
#define MUXFRAME_TAG_GO_AWAY 3

/*  Parse failure codes, see muxframe_parser_error                           */
#define MUXFRAME_ERROR_INSUFFICIENT_DATA 0x01
#define MUXFRAME_ERROR_INVALID_TAG 0x02
#define MUXFRAME_ERROR_VERSION_MISMATCH 0x03
#define MUXFRAME_ERROR_BODY_TOO_LARGE 0x04
#define MUXFRAME_ERROR_INCOMPLETE_BODY 0x05

/*  Parser options                                                            */
#define MUXFRAME_MAXMSGSIZE 1
#define MUXFRAME_STRICT_VERSION 2
#define MUXFRAME_REQUIRE_BODY 3

/*  Host-order copy of a frame header.                                        */
typedef struct muxframe_header_t
{
    uint8_t version;
    uint8_t tag;
    uint16_t flags;
    uint32_t stream_id;
    uint32_t length;
} muxframe_header_t;

MUXFRAME_EXPORT void *muxframe_parser_new (void);
MUXFRAME_EXPORT int muxframe_parser_close (void *parser_);
MUXFRAME_EXPORT int muxframe_parser_setopt (void *parser_,
                                            int option_,
                                            const void *optval_,
                                            size_t optvallen_);
MUXFRAME_EXPORT int muxframe_parser_getopt (void *parser_,
                                            int option_,
                                            void *optval_,
                                            size_t *optvallen_);

/*  Failure code (MUXFRAME_ERROR_*) of the last parse, 0 after a success.    */
MUXFRAME_EXPORT int muxframe_parser_error (void *parser_);
MUXFRAME_EXPORT const char *muxframe_error_reason (int code_);

/*  Validates the header at the start of buf_. On success the header is      */
/*  copied to header_ (may be NULL) and body_ points into buf_ at the bytes   */
/*  following the header. Fails with EAGAIN when more bytes are needed and   */
/*  with EPROTO or EMSGSIZE when the frame is corrupt.                        */
MUXFRAME_EXPORT int muxframe_parse (void *parser_,
                                    const void *buf_,
                                    size_t size_,
                                    muxframe_header_t *header_,
                                    const void **body_,
                                    size_t *body_size_);

/*  Like muxframe_parse, but the body is bounded by the declared length and  */
/*  the whole body must be present. consumed_ receives the size of the frame. */
MUXFRAME_EXPORT int muxframe_split (void *parser_,
                                    const void *buf_,
                                    size_t size_,
                                    muxframe_header_t *header_,
                                    const void **body_,
                                    size_t *body_size_,
                                    size_t *consumed_);

/*  Rewrites the tag of the frame at the start of buf_ in place.             */
MUXFRAME_EXPORT int
muxframe_set_tag (void *parser_, void *buf_, size_t size_, int tag_);

/*  Writes header_ in wire format. Returns MUXFRAME_HEADER_SIZE on success.  */
MUXFRAME_EXPORT int muxframe_header_encode (void *buf_,
                                            size_t size_,
                                            const muxframe_header_t *header_);

#undef MUXFRAME_EXPORT

#ifdef __cplusplus
}
#endif

#endif
