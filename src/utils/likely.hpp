/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_LIKELY_HPP_INCLUDED__
#define __MUXFRAME_LIKELY_HPP_INCLUDED__

#if defined __GNUC__
#define unlikely(x) __builtin_expect ((x), 0)
#else
#define unlikely(x) (x)
#endif

#endif
