/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __MUXFRAME_FRAME_PROTOCOL_HPP_INCLUDED__
#define __MUXFRAME_FRAME_PROTOCOL_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "../include/muxframe.h"

namespace muxframe
{
//  Frame protocol constants
const size_t header_size = MUXFRAME_HEADER_SIZE;

enum
{
    frame_version = 0x00
};

//  Frame kinds. Any other tag byte is a framing error.
enum tag_t
{
    tag_data = MUXFRAME_TAG_DATA,
    tag_window_update = MUXFRAME_TAG_WINDOW_UPDATE,
    tag_ping = MUXFRAME_TAG_PING,
    tag_go_away = MUXFRAME_TAG_GO_AWAY
};

enum
{
    frame_error_insufficient_data = MUXFRAME_ERROR_INSUFFICIENT_DATA,
    frame_error_invalid_tag = MUXFRAME_ERROR_INVALID_TAG,
    frame_error_version_mismatch = MUXFRAME_ERROR_VERSION_MISMATCH,
    frame_error_body_too_large = MUXFRAME_ERROR_BODY_TOO_LARGE,
    frame_error_incomplete_body = MUXFRAME_ERROR_INCOMPLETE_BODY
};

inline bool tag_from_byte (uint8_t byte_, tag_t &tag_)
{
    switch (byte_) {
        case tag_data:
        case tag_window_update:
        case tag_ping:
        case tag_go_away:
            tag_ = static_cast<tag_t> (byte_);
            return true;
        default:
            return false;
    }
}

inline const char *tag_name (tag_t tag_)
{
    switch (tag_) {
        case tag_data:
            return "DATA";
        case tag_window_update:
            return "WINDOW_UPDATE";
        case tag_ping:
            return "PING";
        case tag_go_away:
            return "GO_AWAY";
    }
    return "UNKNOWN";
}

inline const char *frame_error_reason (uint8_t code_)
{
    switch (code_) {
        case frame_error_insufficient_data:
            return "insufficient data";
        case frame_error_invalid_tag:
            return "invalid tag";
        case frame_error_version_mismatch:
            return "version mismatch";
        case frame_error_body_too_large:
            return "body too large";
        case frame_error_incomplete_body:
            return "incomplete body";
        default:
            return "none";
    }
}
}

#endif
