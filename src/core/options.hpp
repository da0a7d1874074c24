/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_OPTIONS_HPP_INCLUDED__
#define __MUXFRAME_OPTIONS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace muxframe
{
struct options_t
{
    options_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Maximum declared body length accepted, -1 for no limit.
    int64_t maxmsgsize;

    //  Reject headers whose version is not frame_version.
    bool strict_version;

    //  Treat a body shorter than the declared length as incomplete.
    bool require_body;
};

int do_getopt (void *optval_, size_t *optvallen_, int value_);

int do_setopt_int_as_bool_strict (const void *optval_,
                                  size_t optvallen_,
                                  bool *out_value_);
}

#endif
