/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_FRAME_PARSER_HPP_INCLUDED__
#define __MUXFRAME_FRAME_PARSER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "core/options.hpp"
#include "protocol/frame.hpp"
#include "utils/macros.hpp"

namespace muxframe
{
//  Keeps the buffer argument out of template deduction, so the buffer
//  flavour is picked by the frame and asio's buffers_1 wrappers convert.
template <typename T> struct buffer_arg
{
    typedef T type;
};

//  Validates frame headers in caller buffers and binds frames to them.
//
//  Failures return -1 and set errno:
//    EAGAIN    buffer is shorter than a header, or than the declared body
//              when the whole body is required; wait for more bytes.
//    EPROTO    unknown tag, or wrong version in strict mode; the stream
//              that produced the bytes is corrupt.
//    EMSGSIZE  declared length exceeds MUXFRAME_MAXMSGSIZE.
//  error_code () tells which check failed. The output frame is only
//  written on success and the buffer is never modified by a parse.
class frame_parser_t MUXFRAME_FINAL
{
  public:
    frame_parser_t ();
    explicit frame_parser_t (const options_t &options_);
    ~frame_parser_t ();

    //  Returns false if object is not a parser.
    bool check_tag () const;

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    const options_t &options () const { return _options; }
    uint8_t error_code () const { return _error_code; }

    //  Binds frame_ to buffer_: the header overlays its first header_size
    //  bytes and the body is all remaining bytes.
    template <typename Buffer>
    int parse (const typename buffer_arg<Buffer>::type &buffer_,
               basic_frame_t<Buffer> &frame_)
    {
        if (check_header (buffer_.data (), buffer_.size (),
                          _options.require_body)
            == -1)
            return -1;

        typedef typename basic_frame_t<Buffer>::header_type header_type;
        frame_.assign (static_cast<header_type *> (buffer_.data ()),
                       buffer_ + header_size);
        return 0;
    }

    //  Binds frame_ to the first frame of a buffer holding consecutive
    //  frames. The body is exactly the declared length and must be fully
    //  present. consumed_ receives the size of the frame on success.
    template <typename Buffer>
    int split (const typename buffer_arg<Buffer>::type &buffer_,
               basic_frame_t<Buffer> &frame_,
               size_t &consumed_)
    {
        if (check_header (buffer_.data (), buffer_.size (), true) == -1)
            return -1;

        typedef typename basic_frame_t<Buffer>::header_type header_type;
        header_type *header = static_cast<header_type *> (buffer_.data ());
        const size_t body_size = header->length ().value ();
        frame_.assign (header,
                       Buffer ((buffer_ + header_size).data (), body_size));
        consumed_ = header_size + body_size;
        return 0;
    }

  private:
    int check_header (const void *data_, size_t size_, bool require_body_);

    uint32_t _tag;
    options_t _options;
    uint8_t _error_code;

    MUXFRAME_NON_COPYABLE_NOR_MOVABLE (frame_parser_t)
};
}

#endif
