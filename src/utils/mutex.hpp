/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_MUTEX_HPP_INCLUDED__
#define __MUXFRAME_MUTEX_HPP_INCLUDED__

#include <pthread.h>

#include "utils/err.hpp"
#include "utils/macros.hpp"

namespace muxframe
{
//  Thin wrapper over a recursive pthread mutex.
class mutex_t
{
  public:
    inline mutex_t ()
    {
        int rc = pthread_mutexattr_init (&_attr);
        posix_assert (rc);

        rc = pthread_mutexattr_settype (&_attr, PTHREAD_MUTEX_RECURSIVE);
        posix_assert (rc);

        rc = pthread_mutex_init (&_mutex, &_attr);
        posix_assert (rc);
    }

    inline ~mutex_t ()
    {
        int rc = pthread_mutex_destroy (&_mutex);
        posix_assert (rc);

        rc = pthread_mutexattr_destroy (&_attr);
        posix_assert (rc);
    }

    inline void lock ()
    {
        const int rc = pthread_mutex_lock (&_mutex);
        posix_assert (rc);
    }

    inline void unlock ()
    {
        const int rc = pthread_mutex_unlock (&_mutex);
        posix_assert (rc);
    }

  private:
    pthread_mutex_t _mutex;
    pthread_mutexattr_t _attr;

    MUXFRAME_NON_COPYABLE_NOR_MOVABLE (mutex_t)
};

struct scoped_lock_t
{
    scoped_lock_t (mutex_t &mutex_) : _mutex (mutex_) { _mutex.lock (); }

    ~scoped_lock_t () { _mutex.unlock (); }

  private:
    mutex_t &_mutex;

    MUXFRAME_NON_COPYABLE_NOR_MOVABLE (scoped_lock_t)
};
}

#endif
