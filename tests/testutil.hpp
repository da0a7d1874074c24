/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_HPP_INCLUDED__
#define __TESTUTIL_HPP_INCLUDED__

#include "../include/muxframe.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <vector>

#if !defined _WIN32
#include <unistd.h>
#endif

//  Time in seconds after which a hanging test is killed.
#define MUXFRAME_TEST_TIMEOUT 60

inline void setup_test_environment (int timeout_seconds_ = MUXFRAME_TEST_TIMEOUT)
{
#if !defined _WIN32
    //  Kill the test if it does not finish in time.
    alarm (timeout_seconds_);
#else
    (void) timeout_seconds_;
#endif
}

//  Raw header bytes in wire order, independent of the library encoder.
inline void build_header (unsigned char *buf_,
                          unsigned char version_,
                          unsigned char tag_,
                          uint16_t flags_,
                          uint32_t stream_id_,
                          uint32_t length_)
{
    buf_[0] = version_;
    buf_[1] = tag_;
    buf_[2] = static_cast<unsigned char> (flags_ >> 8);
    buf_[3] = static_cast<unsigned char> (flags_);
    buf_[4] = static_cast<unsigned char> (stream_id_ >> 24);
    buf_[5] = static_cast<unsigned char> (stream_id_ >> 16);
    buf_[6] = static_cast<unsigned char> (stream_id_ >> 8);
    buf_[7] = static_cast<unsigned char> (stream_id_);
    buf_[8] = static_cast<unsigned char> (length_ >> 24);
    buf_[9] = static_cast<unsigned char> (length_ >> 16);
    buf_[10] = static_cast<unsigned char> (length_ >> 8);
    buf_[11] = static_cast<unsigned char> (length_);
}

//  Appends a header and body_size_ body bytes to buf_.
inline void append_frame (std::vector<unsigned char> &buf_,
                          unsigned char tag_,
                          uint32_t stream_id_,
                          const unsigned char *body_,
                          size_t body_size_)
{
    const size_t offset = buf_.size ();
    buf_.resize (offset + MUXFRAME_HEADER_SIZE + body_size_);
    build_header (&buf_[offset], 0, tag_, 0, stream_id_,
                  static_cast<uint32_t> (body_size_));
    if (body_size_ > 0)
        memcpy (&buf_[offset + MUXFRAME_HEADER_SIZE], body_, body_size_);
}

#endif
