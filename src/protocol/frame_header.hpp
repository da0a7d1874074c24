/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_FRAME_HEADER_HPP_INCLUDED__
#define __MUXFRAME_FRAME_HEADER_HPP_INCLUDED__

#include <stddef.h>
#include <string.h>
#include <type_traits>

#include "protocol/frame_protocol.hpp"
#include "protocol/wire.hpp"

namespace muxframe
{
/*
    Frame header overlay

    The types below hold their fields as raw bytes in wire order, so a
    header_t can be laid directly over the first header_size bytes of a
    receive buffer. Multi-byte fields are stored big-endian and are only
    converted to host order by the accessors.

    DO NOT reorder fields.
    DO NOT change sizes.
*/
#pragma pack(push, 1)

class version_t
{
  public:
    uint8_t value () const { return get_uint8 (_value); }

    static version_t make (uint8_t value_)
    {
        version_t version;
        put_uint8 (version._value, value_);
        return version;
    }

  private:
    unsigned char _value[1];
};

class flags_t
{
  public:
    uint16_t value () const { return get_uint16 (_value); }

    static flags_t make (uint16_t value_)
    {
        flags_t flags;
        put_uint16 (flags._value, value_);
        return flags;
    }

  private:
    unsigned char _value[2];
};

class stream_id_t
{
  public:
    uint32_t value () const { return get_uint32 (_value); }

    //  Every 32-bit value is a legal stream id.
    static stream_id_t make (uint32_t value_)
    {
        stream_id_t id;
        put_uint32 (id._value, value_);
        return id;
    }

  private:
    unsigned char _value[4];
};

class len_t
{
  public:
    uint32_t value () const { return get_uint32 (_value); }

    static len_t make (uint32_t value_)
    {
        len_t len;
        put_uint32 (len._value, value_);
        return len;
    }

  private:
    unsigned char _value[4];
};

class header_t
{
  public:
    //  Header of a data frame: version 0, no flags.
    static header_t data (stream_id_t id_, uint32_t length_)
    {
        return make (tag_data, 0, id_, length_);
    }

    static header_t
    make (tag_t tag_, uint16_t flags_, stream_id_t id_, uint32_t length_)
    {
        header_t header;
        header._version = version_t::make (frame_version);
        header._tag = static_cast<unsigned char> (tag_);
        header._flags = flags_t::make (flags_);
        header._stream_id = id_;
        header._length = len_t::make (length_);
        return header;
    }

    version_t version () const { return _version; }
    //  Not validated; only parsed frames guarantee a known tag.
    uint8_t raw_tag () const { return _tag; }
    flags_t flags () const { return _flags; }
    stream_id_t stream_id () const { return _stream_id; }
    len_t length () const { return _length; }

    void set_version (version_t version_) { _version = version_; }
    void set_tag (tag_t tag_) { _tag = static_cast<unsigned char> (tag_); }
    void set_flags (flags_t flags_) { _flags = flags_; }
    void set_stream_id (stream_id_t id_) { _stream_id = id_; }
    void set_length (len_t length_) { _length = length_; }

    const unsigned char *bytes () const
    {
        return reinterpret_cast<const unsigned char *> (this);
    }

    //  Copies the wire bytes to out_. Returns 0 if out_ is too small.
    size_t encode (unsigned char *out_, size_t size_) const
    {
        if (size_ < sizeof (header_t))
            return 0;
        memcpy (out_, bytes (), sizeof (header_t));
        return sizeof (header_t);
    }

  private:
    version_t _version;
    unsigned char _tag;
    flags_t _flags;
    stream_id_t _stream_id;
    len_t _length;
};

#pragma pack(pop)

static_assert (sizeof (header_t) == header_size, "header_t size mismatch");
static_assert (std::is_standard_layout<header_t>::value,
               "header_t must be standard layout");
static_assert (std::is_trivially_copyable<header_t>::value,
               "header_t must be trivially copyable");
static_assert (alignof (header_t) == 1, "header_t must be byte aligned");
}

#endif
