/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/frame.hpp"

#if defined MUXFRAME_CHECK_ALIASING

#include <stdint.h>
#include <vector>

#include "utils/debug.hpp"
#include "utils/err.hpp"
#include "utils/mutex.hpp"

namespace
{
struct region_t
{
    uintptr_t begin;
    uintptr_t end;
    bool exclusive;
};

muxframe::mutex_t &regions_sync ()
{
    static muxframe::mutex_t sync;
    return sync;
}

std::vector<region_t> &regions ()
{
    static std::vector<region_t> claimed;
    return claimed;
}

region_t make_region (const void *begin_, size_t size_, bool exclusive_)
{
    const uintptr_t begin = reinterpret_cast<uintptr_t> (begin_);
    const region_t region = {begin, begin + size_, exclusive_};
    return region;
}

bool overlaps (const region_t &a_, const region_t &b_)
{
    return a_.begin < b_.end && b_.begin < a_.end;
}
}

void muxframe::claim_region (const void *begin_, size_t size_, bool exclusive_)
{
    const region_t region = make_region (begin_, size_, exclusive_);

    muxframe::scoped_lock_t lock (regions_sync ());
    std::vector<region_t> &claimed = regions ();
    for (size_t i = 0; i != claimed.size (); ++i) {
        if (!overlaps (claimed[i], region))
            continue;
        //  Shared views may overlap each other, nothing may overlap a
        //  mutable one.
        muxframe_assert (!region.exclusive && !claimed[i].exclusive);
    }
    claimed.push_back (region);
    MUXFRAME_DBG_ALIAS ("claimed %p+%zu (%s)", begin_, size_,
                        exclusive_ ? "mutable" : "shared");
}

void muxframe::release_region (const void *begin_,
                               size_t size_,
                               bool exclusive_)
{
    const region_t region = make_region (begin_, size_, exclusive_);

    muxframe::scoped_lock_t lock (regions_sync ());
    std::vector<region_t> &claimed = regions ();
    for (std::vector<region_t>::iterator it = claimed.begin ();
         it != claimed.end (); ++it) {
        if (it->begin == region.begin && it->end == region.end
            && it->exclusive == region.exclusive) {
            claimed.erase (it);
            MUXFRAME_DBG_ALIAS ("released %p+%zu", begin_, size_);
            return;
        }
    }
    //  Every release is paired with an earlier claim.
    muxframe_assert (false);
}

#endif
