/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_FRAME_HPP_INCLUDED__
#define __MUXFRAME_FRAME_HPP_INCLUDED__

#include <stddef.h>
#include <array>

#include <boost/asio/buffer.hpp>

#include "protocol/frame_header.hpp"
#include "utils/macros.hpp"

namespace muxframe
{
class frame_parser_t;

template <typename Buffer> struct frame_traits;

template <> struct frame_traits<boost::asio::const_buffer>
{
    typedef const header_t header_type;
    enum
    {
        is_mutable = 0
    };
};

template <> struct frame_traits<boost::asio::mutable_buffer>
{
    typedef header_t header_type;
    enum
    {
        is_mutable = 1
    };
};

#if defined MUXFRAME_CHECK_ALIASING
//  Registry of the byte ranges covered by live frames. Claiming a range
//  that overlaps a mutable frame, or claiming a mutable frame over any
//  claimed range, fails an assertion.
void claim_region (const void *begin_, size_t size_, bool exclusive_);
void release_region (const void *begin_, size_t size_, bool exclusive_);
#endif

//  Non-owning view of one frame in a caller's buffer. The header overlays
//  the first header_size bytes and the body refers to the bytes after it,
//  so the buffer must outlive the frame. Reads and writes go straight to
//  the buffer.
//
//  Frames over a mutable_buffer can rewrite header fields and are
//  move-only. Frames over a const_buffer are read-only and copyable.
template <typename Buffer> class basic_frame_t
{
  public:
    typedef frame_traits<Buffer> traits;
    typedef typename traits::header_type header_type;

    basic_frame_t () : _header (NULL) {}

    basic_frame_t (const basic_frame_t &other_) :
        _header (other_._header), _body (other_._body)
    {
        static_assert (!traits::is_mutable, "mutable frames are move-only");
        claim ();
    }

    basic_frame_t (basic_frame_t &&other_) MUXFRAME_NOEXCEPT
        : _header (other_._header),
          _body (other_._body)
    {
        other_._header = NULL;
        other_._body = Buffer ();
    }

    ~basic_frame_t () { release (); }

    basic_frame_t &operator= (const basic_frame_t &other_)
    {
        static_assert (!traits::is_mutable, "mutable frames are move-only");
        if (this != &other_)
            assign (other_._header, other_._body);
        return *this;
    }

    basic_frame_t &operator= (basic_frame_t &&other_) MUXFRAME_NOEXCEPT
    {
        if (this != &other_) {
            release ();
            _header = other_._header;
            _body = other_._body;
            other_._header = NULL;
            other_._body = Buffer ();
        }
        return *this;
    }

    //  The accessors and setters below require valid ().
    bool valid () const { return _header != NULL; }

    version_t version () const { return _header->version (); }
    len_t length () const { return _header->length (); }
    flags_t flags () const { return _header->flags (); }
    stream_id_t stream_id () const { return _header->stream_id (); }

    //  The tag was validated by the parser and can only be rewritten with
    //  another tag_t, so the cast is safe.
    tag_t tag () const { return static_cast<tag_t> (_header->raw_tag ()); }

    header_type &header () const { return *_header; }
    const Buffer &body () const { return _body; }

    //  Header plus body bytes covered by the view.
    size_t size () const { return header_size + _body.size (); }

    //  The setters write through to the buffer. Nothing is revalidated: the
    //  body is not checked against the new tag or length.
    void set_tag (tag_t tag_)
    {
        static_assert (traits::is_mutable, "set_tag requires a mutable frame");
        _header->set_tag (tag_);
    }

    void set_flags (uint16_t flags_)
    {
        static_assert (traits::is_mutable,
                       "set_flags requires a mutable frame");
        _header->set_flags (flags_t::make (flags_));
    }

    void set_stream_id (stream_id_t id_)
    {
        static_assert (traits::is_mutable,
                       "set_stream_id requires a mutable frame");
        _header->set_stream_id (id_);
    }

    void set_length (uint32_t length_)
    {
        static_assert (traits::is_mutable,
                       "set_length requires a mutable frame");
        _header->set_length (len_t::make (length_));
    }

    //  Header and body as a gather sequence, for writing the frame out
    //  without copying it.
    std::array<boost::asio::const_buffer, 2> buffers () const
    {
        std::array<boost::asio::const_buffer, 2> buffers = {
          {boost::asio::const_buffer (_header, _header ? header_size : 0),
           boost::asio::const_buffer (_body)}};
        return buffers;
    }

  private:
    void assign (header_type *header_, const Buffer &body_)
    {
        release ();
        _header = header_;
        _body = body_;
        claim ();
    }

    void claim ()
    {
#if defined MUXFRAME_CHECK_ALIASING
        if (_header)
            claim_region (_header, size (), traits::is_mutable != 0);
#endif
    }

    void release ()
    {
#if defined MUXFRAME_CHECK_ALIASING
        if (_header)
            release_region (_header, size (), traits::is_mutable != 0);
#endif
    }

    header_type *_header;
    Buffer _body;

    friend class frame_parser_t;
};

typedef basic_frame_t<boost::asio::const_buffer> const_frame_t;
typedef basic_frame_t<boost::asio::mutable_buffer> mutable_frame_t;
}

#endif
