/* SPDX-License-Identifier: MPL-2.0 */

#include <new>

#include <boost/asio/buffer.hpp>

#include "../include/muxframe.h"
#include "protocol/frame_parser.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

namespace
{
muxframe::frame_parser_t *as_parser (void *parser_)
{
    muxframe::frame_parser_t *parser =
      static_cast<muxframe::frame_parser_t *> (parser_);
    if (!parser || !parser->check_tag ()) {
        errno = EFAULT;
        return NULL;
    }
    return parser;
}

void copy_header (const muxframe::header_t &in_, muxframe_header_t *out_)
{
    if (!out_)
        return;
    out_->version = in_.version ().value ();
    out_->tag = in_.raw_tag ();
    out_->flags = in_.flags ().value ();
    out_->stream_id = in_.stream_id ().value ();
    out_->length = in_.length ().value ();
}
}

void muxframe_version (int *major_, int *minor_, int *patch_)
{
    *major_ = MUXFRAME_VERSION_MAJOR;
    *minor_ = MUXFRAME_VERSION_MINOR;
    *patch_ = MUXFRAME_VERSION_PATCH;
}

const char *muxframe_strerror (int errnum_)
{
    return muxframe::errno_to_string (errnum_);
}

int muxframe_errno (void)
{
    return errno;
}

//  Parser handles

void *muxframe_parser_new (void)
{
    muxframe::frame_parser_t *parser =
      new (std::nothrow) muxframe::frame_parser_t;
    alloc_assert (parser);
    return parser;
}

int muxframe_parser_close (void *parser_)
{
    muxframe::frame_parser_t *parser = as_parser (parser_);
    if (!parser)
        return -1;
    LIBMUXFRAME_DELETE (parser);
    return 0;
}

int muxframe_parser_setopt (void *parser_,
                            int option_,
                            const void *optval_,
                            size_t optvallen_)
{
    muxframe::frame_parser_t *parser = as_parser (parser_);
    if (!parser)
        return -1;
    return parser->setopt (option_, optval_, optvallen_);
}

int muxframe_parser_getopt (void *parser_,
                            int option_,
                            void *optval_,
                            size_t *optvallen_)
{
    muxframe::frame_parser_t *parser = as_parser (parser_);
    if (!parser)
        return -1;
    return parser->getopt (option_, optval_, optvallen_);
}

int muxframe_parser_error (void *parser_)
{
    muxframe::frame_parser_t *parser = as_parser (parser_);
    if (!parser)
        return -1;
    return parser->error_code ();
}

const char *muxframe_error_reason (int code_)
{
    return muxframe::frame_error_reason (static_cast<uint8_t> (code_));
}

//  Framing

int muxframe_parse (void *parser_,
                    const void *buf_,
                    size_t size_,
                    muxframe_header_t *header_,
                    const void **body_,
                    size_t *body_size_)
{
    muxframe::frame_parser_t *parser = as_parser (parser_);
    if (!parser)
        return -1;
    if (!buf_ && size_ > 0) {
        errno = EFAULT;
        return -1;
    }

    muxframe::const_frame_t frame;
    if (parser->parse (boost::asio::const_buffer (buf_, size_), frame) == -1)
        return -1;

    copy_header (frame.header (), header_);
    if (body_)
        *body_ = frame.body ().data ();
    if (body_size_)
        *body_size_ = frame.body ().size ();
    return 0;
}

int muxframe_split (void *parser_,
                    const void *buf_,
                    size_t size_,
                    muxframe_header_t *header_,
                    const void **body_,
                    size_t *body_size_,
                    size_t *consumed_)
{
    muxframe::frame_parser_t *parser = as_parser (parser_);
    if (!parser)
        return -1;
    if ((!buf_ && size_ > 0) || !consumed_) {
        errno = EFAULT;
        return -1;
    }

    muxframe::const_frame_t frame;
    size_t consumed = 0;
    if (parser->split (boost::asio::const_buffer (buf_, size_), frame,
                       consumed)
        == -1)
        return -1;

    copy_header (frame.header (), header_);
    if (body_)
        *body_ = frame.body ().data ();
    if (body_size_)
        *body_size_ = frame.body ().size ();
    *consumed_ = consumed;
    return 0;
}

int muxframe_set_tag (void *parser_, void *buf_, size_t size_, int tag_)
{
    muxframe::frame_parser_t *parser = as_parser (parser_);
    if (!parser)
        return -1;
    if (!buf_ && size_ > 0) {
        errno = EFAULT;
        return -1;
    }

    muxframe::tag_t tag;
    if (tag_ < 0 || tag_ > 0xff
        || !muxframe::tag_from_byte (static_cast<uint8_t> (tag_), tag)) {
        errno = EINVAL;
        return -1;
    }

    muxframe::mutable_frame_t frame;
    if (parser->parse (boost::asio::mutable_buffer (buf_, size_), frame)
        == -1)
        return -1;
    frame.set_tag (tag);
    return 0;
}

int muxframe_header_encode (void *buf_,
                            size_t size_,
                            const muxframe_header_t *header_)
{
    if (!buf_ || !header_) {
        errno = EFAULT;
        return -1;
    }

    muxframe::tag_t tag;
    if (!muxframe::tag_from_byte (header_->tag, tag)) {
        errno = EINVAL;
        return -1;
    }

    muxframe::header_t header = muxframe::header_t::make (
      tag, header_->flags, muxframe::stream_id_t::make (header_->stream_id),
      header_->length);
    header.set_version (muxframe::version_t::make (header_->version));

    const size_t written =
      header.encode (static_cast<unsigned char *> (buf_), size_);
    if (written == 0) {
        errno = ENOBUFS;
        return -1;
    }
    return static_cast<int> (written);
}
