/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_WIRE_HPP_INCLUDED__
#define __MUXFRAME_WIRE_HPP_INCLUDED__

#include <stdint.h>

namespace muxframe
{
//  Helper functions to convert different integer types to/from network
//  byte order.

inline void put_uint8 (unsigned char *buffer_, uint8_t value_)
{
    *buffer_ = value_;
}

inline uint8_t get_uint8 (const unsigned char *buffer_)
{
    return *buffer_;
}

inline void put_uint16 (unsigned char *buffer_, uint16_t value_)
{
    buffer_[0] = static_cast<unsigned char> (((value_) >> 8) & 0xff);
    buffer_[1] = static_cast<unsigned char> (value_ & 0xff);
}

inline uint16_t get_uint16 (const unsigned char *buffer_)
{
    return static_cast<uint16_t> ((static_cast<uint16_t> (buffer_[0]) << 8)
                                  | (static_cast<uint16_t> (buffer_[1])));
}

inline void put_uint32 (unsigned char *buffer_, uint32_t value_)
{
    buffer_[0] = static_cast<unsigned char> (((value_) >> 24) & 0xff);
    buffer_[1] = static_cast<unsigned char> (((value_) >> 16) & 0xff);
    buffer_[2] = static_cast<unsigned char> (((value_) >> 8) & 0xff);
    buffer_[3] = static_cast<unsigned char> (value_ & 0xff);
}

inline uint32_t get_uint32 (const unsigned char *buffer_)
{
    return (static_cast<uint32_t> (buffer_[0]) << 24)
           | (static_cast<uint32_t> (buffer_[1]) << 16)
           | (static_cast<uint32_t> (buffer_[2]) << 8)
           | (static_cast<uint32_t> (buffer_[3]));
}
}

#endif
