/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_UNITY_HPP_INCLUDED__
#define __TESTUTIL_UNITY_HPP_INCLUDED__

#include "../include/muxframe.h"

#include <stdio.h>
#include <unity.h>

//  Asserts that a libmuxframe API function succeeded. The return value is
//  made available for further checks.
#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    test_assert_success_message_errno_helper (expr, NULL, #expr, __LINE__)

//  Asserts that a libmuxframe API function failed with a specific error
//  code.
#define TEST_ASSERT_FAILURE_ERRNO(error_code, expr)                            \
    {                                                                          \
        int _rc = (expr);                                                      \
        TEST_ASSERT_EQUAL_INT (-1, _rc);                                       \
        TEST_ASSERT_EQUAL_INT (error_code, errno);                             \
    }

inline int test_assert_success_message_errno_helper (int rc_,
                                                     const char *msg_,
                                                     const char *expr_,
                                                     int line_)
{
    if (rc_ == -1) {
        char buffer[512];
        buffer[sizeof (buffer) - 1] =
          0; // to ensure defined behavior with VC++ <= 2013
        snprintf (buffer, sizeof (buffer) - 1,
                  "%s failed%s%s%s, errno = %i (%s)", expr_,
                  msg_ ? " (additional info: " : "", msg_ ? msg_ : "",
                  msg_ ? ")" : "", muxframe_errno (),
                  muxframe_strerror (muxframe_errno ()));
        UNITY_TEST_FAIL (line_, buffer);
    }
    return rc_;
}

#define SETUP_TEARDOWN_NOOP                                                    \
    void setUp ()                                                              \
    {                                                                          \
    }                                                                          \
    void tearDown ()                                                           \
    {                                                                          \
    }

#endif
