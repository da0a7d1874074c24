/* SPDX-License-Identifier: MPL-2.0 */

#include <string.h>

#include "../include/muxframe.h"
#include "core/options.hpp"
#include "utils/err.hpp"

static int opt_invalid ()
{
#if defined(MUXFRAME_ACT_MILITANT)
    muxframe_assert (false);
#endif
    errno = EINVAL;
    return -1;
}

template <typename T>
static int do_setopt (const void *const optval_,
                      const size_t optvallen_,
                      T *const out_value_)
{
    if (optvallen_ == sizeof (T)) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return opt_invalid ();
}

template <typename T>
static int do_getopt_value (void *const optval_,
                            size_t *const optvallen_,
                            const T value_)
{
    if (*optvallen_ < sizeof (T)) {
        return opt_invalid ();
    }
    memcpy (optval_, &value_, sizeof (T));
    *optvallen_ = sizeof (T);
    return 0;
}

int muxframe::do_getopt (void *const optval_,
                         size_t *const optvallen_,
                         int value_)
{
    return do_getopt_value (optval_, optvallen_, value_);
}

int muxframe::do_setopt_int_as_bool_strict (const void *const optval_,
                                            const size_t optvallen_,
                                            bool *const out_value_)
{
    int value = -1;
    if (do_setopt (optval_, optvallen_, &value) == -1)
        return -1;
    if (value == 0 || value == 1) {
        *out_value_ = (value != 0);
        return 0;
    }
    return opt_invalid ();
}

muxframe::options_t::options_t () :
    maxmsgsize (-1),
    strict_version (false),
    require_body (false)
{
}

int muxframe::options_t::setopt (int option_,
                                 const void *optval_,
                                 size_t optvallen_)
{
    if (!optval_ && optvallen_ > 0)
        return opt_invalid ();

    switch (option_) {
        case MUXFRAME_MAXMSGSIZE: {
            int64_t value = 0;
            if (do_setopt (optval_, optvallen_, &value) == -1)
                return -1;
            if (value < -1)
                return opt_invalid ();
            maxmsgsize = value;
            return 0;
        }

        case MUXFRAME_STRICT_VERSION:
            return do_setopt_int_as_bool_strict (optval_, optvallen_,
                                                 &strict_version);

        case MUXFRAME_REQUIRE_BODY:
            return do_setopt_int_as_bool_strict (optval_, optvallen_,
                                                 &require_body);

        default:
            break;
    }
    return opt_invalid ();
}

int muxframe::options_t::getopt (int option_,
                                 void *optval_,
                                 size_t *optvallen_) const
{
    if (!optval_ || !optvallen_)
        return opt_invalid ();

    switch (option_) {
        case MUXFRAME_MAXMSGSIZE:
            return do_getopt_value (optval_, optvallen_, maxmsgsize);

        case MUXFRAME_STRICT_VERSION:
            return do_getopt (optval_, optvallen_, strict_version ? 1 : 0);

        case MUXFRAME_REQUIRE_BODY:
            return do_getopt (optval_, optvallen_, require_body ? 1 : 0);

        default:
            break;
    }
    return opt_invalid ();
}
