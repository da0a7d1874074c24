/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_DEBUG_HPP_INCLUDED__
#define __MUXFRAME_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Debug macros for the framing layer.
//  Enable with -DMUXFRAME_DEBUG=1 during compilation
//
//  Usage:
//    MUXFRAME_DBG_PARSE ("rejected tag byte 0x%02x", tag);
//    MUXFRAME_DBG_ALIAS ("region %p claimed", ptr);

#ifdef MUXFRAME_DEBUG

#define MUXFRAME_DBG(category, fmt, ...)                                       \
    do {                                                                       \
        fprintf (stderr, "[MUXFRAME:" category "] " fmt "\n",                  \
                 ##__VA_ARGS__);                                               \
    } while (0)

#define MUXFRAME_DBG_THIS(category, fmt, ...)                                  \
    do {                                                                       \
        fprintf (stderr, "[MUXFRAME:" category ":%p] " fmt "\n",               \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define MUXFRAME_DBG(category, fmt, ...) ((void) 0)
#define MUXFRAME_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define MUXFRAME_DBG_PARSE(fmt, ...)                                           \
    MUXFRAME_DBG_THIS ("PARSE", fmt, ##__VA_ARGS__)
#define MUXFRAME_DBG_OPTIONS(fmt, ...)                                         \
    MUXFRAME_DBG_THIS ("OPTIONS", fmt, ##__VA_ARGS__)
#define MUXFRAME_DBG_ALIAS(fmt, ...) MUXFRAME_DBG ("ALIAS", fmt, ##__VA_ARGS__)

#endif
