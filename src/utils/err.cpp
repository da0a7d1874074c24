/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/err.hpp"
#include "utils/macros.hpp"

const char *muxframe::errno_to_string (int errno_)
{
    switch (errno_) {
#if defined MUXFRAME_EPROTO_FALLBACK
        case EPROTO:
            return "Protocol error";
#endif
#if defined MUXFRAME_EMSGSIZE_FALLBACK
        case EMSGSIZE:
            return "Message too long";
#endif
        default:
            return strerror (errno_);
    }
}

void muxframe::muxframe_abort (const char *errmsg_)
{
    LIBMUXFRAME_UNUSED (errmsg_);
    abort ();
}
