/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/frame_parser.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#define MUXFRAME_PARSER_TAG_VALUE_GOOD 0x6d786672
#define MUXFRAME_PARSER_TAG_VALUE_BAD 0xdeadbeef

muxframe::frame_parser_t::frame_parser_t () :
    _tag (MUXFRAME_PARSER_TAG_VALUE_GOOD),
    _error_code (0)
{
}

muxframe::frame_parser_t::frame_parser_t (const options_t &options_) :
    _tag (MUXFRAME_PARSER_TAG_VALUE_GOOD),
    _options (options_),
    _error_code (0)
{
}

muxframe::frame_parser_t::~frame_parser_t ()
{
    //  Remove the tag, so that the object is considered dead.
    _tag = MUXFRAME_PARSER_TAG_VALUE_BAD;
}

bool muxframe::frame_parser_t::check_tag () const
{
    return _tag == MUXFRAME_PARSER_TAG_VALUE_GOOD;
}

int muxframe::frame_parser_t::setopt (int option_,
                                      const void *optval_,
                                      size_t optvallen_)
{
    const int rc = _options.setopt (option_, optval_, optvallen_);
    if (rc == -1)
        MUXFRAME_DBG_OPTIONS ("rejected option %d (%zu bytes)", option_,
                              optvallen_);
    return rc;
}

int muxframe::frame_parser_t::getopt (int option_,
                                      void *optval_,
                                      size_t *optvallen_) const
{
    return _options.getopt (option_, optval_, optvallen_);
}

int muxframe::frame_parser_t::check_header (const void *data_,
                                            size_t size_,
                                            bool require_body_)
{
    _error_code = 0;

    if (size_ < header_size) {
        MUXFRAME_DBG_PARSE ("need %d header bytes, have %zu",
                            static_cast<int> (header_size), size_);
        _error_code = frame_error_insufficient_data;
        errno = EAGAIN;
        return -1;
    }
    const header_t *header = static_cast<const header_t *> (data_);

    tag_t tag;
    if (!tag_from_byte (header->raw_tag (), tag)) {
        MUXFRAME_DBG_PARSE ("rejected tag byte 0x%02x", header->raw_tag ());
        _error_code = frame_error_invalid_tag;
        errno = EPROTO;
        return -1;
    }

    if (_options.strict_version
        && header->version ().value () != frame_version) {
        MUXFRAME_DBG_PARSE ("rejected version %u",
                            header->version ().value ());
        _error_code = frame_error_version_mismatch;
        errno = EPROTO;
        return -1;
    }

    const uint32_t length = header->length ().value ();
    if (unlikely (_options.maxmsgsize >= 0
                  && static_cast<uint64_t> (length)
                       > static_cast<uint64_t> (_options.maxmsgsize))) {
        MUXFRAME_DBG_PARSE ("%s frame declares %u body bytes, limit %lld",
                            tag_name (tag), length,
                            static_cast<long long> (_options.maxmsgsize));
        _error_code = frame_error_body_too_large;
        errno = EMSGSIZE;
        return -1;
    }

    if (require_body_ && length > size_ - header_size) {
        MUXFRAME_DBG_PARSE ("%s frame declares %u body bytes, have %zu",
                            tag_name (tag), length, size_ - header_size);
        _error_code = frame_error_incomplete_body;
        errno = EAGAIN;
        return -1;
    }

    return 0;
}
