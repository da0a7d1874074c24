/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/frame_parser.hpp"

#include <boost/asio/buffer.hpp>
#include <unity.h>
#include <utility>
#include <vector>

#if defined MUXFRAME_CHECK_ALIASING
#include <signal.h>
#include <sys/wait.h>
#endif

void setUp ()
{
}

void tearDown ()
{
}

namespace
{
//  version 1, tag PING, flags 0x0100, stream 1, length 3, body 01 02 03
const unsigned char example[] = {0x01, 0x02, 0x01, 0x00, 0x00,
                                 0x00, 0x00, 0x01, 0x00, 0x00,
                                 0x00, 0x03, 0x01, 0x02, 0x03};

void set_int_option (muxframe::frame_parser_t &parser_, int option_, int value_)
{
    TEST_ASSERT_EQUAL_INT (0,
                           parser_.setopt (option_, &value_, sizeof (value_)));
}
}

void test_default_frame_is_invalid ()
{
    const muxframe::const_frame_t frame;
    TEST_ASSERT_FALSE (frame.valid ());

    const std::array<boost::asio::const_buffer, 2> buffers = frame.buffers ();
    TEST_ASSERT_EQUAL_INT (0, buffers[0].size ());
    TEST_ASSERT_EQUAL_INT (0, buffers[1].size ());
}

void test_parse_example ()
{
    muxframe::frame_parser_t parser;
    muxframe::const_frame_t frame;
    TEST_ASSERT_EQUAL_INT (
      0, parser.parse (boost::asio::buffer (example), frame));

    TEST_ASSERT_TRUE (frame.valid ());
    TEST_ASSERT_EQUAL_UINT8 (1, frame.version ().value ());
    TEST_ASSERT_EQUAL_INT (muxframe::tag_ping, frame.tag ());
    TEST_ASSERT_EQUAL_UINT16 (0x0100, frame.flags ().value ());
    TEST_ASSERT_EQUAL_UINT32 (1, frame.stream_id ().value ());
    TEST_ASSERT_EQUAL_UINT32 (3, frame.length ().value ());

    TEST_ASSERT_EQUAL_INT (3, frame.body ().size ());
    const unsigned char body[] = {0x01, 0x02, 0x03};
    TEST_ASSERT_EQUAL_HEX8_ARRAY (
      body, static_cast<const unsigned char *> (frame.body ().data ()), 3);
    TEST_ASSERT_EQUAL_INT (0, parser.error_code ());
}

void test_header_aliases_buffer ()
{
    muxframe::frame_parser_t parser;
    muxframe::const_frame_t frame;
    TEST_ASSERT_EQUAL_INT (
      0, parser.parse (boost::asio::buffer (example), frame));

    TEST_ASSERT_EQUAL_PTR (example, frame.header ().bytes ());
    TEST_ASSERT_EQUAL_PTR (example + muxframe::header_size,
                           frame.body ().data ());
}

void test_short_buffer_rejected ()
{
    unsigned char buf[muxframe::header_size];
    build_header (buf, 0, muxframe::tag_data, 0, 1, 0);

    muxframe::frame_parser_t parser;
    for (size_t size = 0; size < muxframe::header_size; ++size) {
        muxframe::const_frame_t frame;
        errno = 0;
        const int rc =
          parser.parse (boost::asio::const_buffer (buf, size), frame);
        TEST_ASSERT_EQUAL_INT (-1, rc);
        TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
        TEST_ASSERT_EQUAL_UINT8 (muxframe::frame_error_insufficient_data,
                                 parser.error_code ());
        TEST_ASSERT_FALSE (frame.valid ());
    }
}

void test_invalid_tag_rejected ()
{
    muxframe::frame_parser_t parser;
    for (int tag = 4; tag <= 0xff; ++tag) {
        unsigned char buf[muxframe::header_size + 2];
        build_header (buf, 0, static_cast<unsigned char> (tag), 0, 1, 2);

        muxframe::const_frame_t frame;
        const int rc = parser.parse (boost::asio::buffer (buf), frame);
        TEST_ASSERT_EQUAL_INT (-1, rc);
        TEST_ASSERT_EQUAL_INT (EPROTO, errno);
        TEST_ASSERT_EQUAL_UINT8 (muxframe::frame_error_invalid_tag,
                                 parser.error_code ());
        TEST_ASSERT_FALSE (frame.valid ());
        //  Validation does not touch the buffer.
        TEST_ASSERT_EQUAL_UINT8 (tag, buf[1]);
    }
}

void test_failed_parse_keeps_previous_frame ()
{
    unsigned char bad[muxframe::header_size];
    build_header (bad, 0, 9, 0, 1, 0);

    muxframe::frame_parser_t parser;
    muxframe::const_frame_t frame;
    TEST_ASSERT_EQUAL_INT (
      0, parser.parse (boost::asio::buffer (example), frame));
    TEST_ASSERT_EQUAL_INT (-1, parser.parse (boost::asio::buffer (bad), frame));

    TEST_ASSERT_TRUE (frame.valid ());
    TEST_ASSERT_EQUAL_PTR (example, frame.header ().bytes ());
}

void test_roundtrip_every_tag ()
{
    const muxframe::tag_t tags[] = {
      muxframe::tag_data, muxframe::tag_window_update, muxframe::tag_ping,
      muxframe::tag_go_away};

    muxframe::frame_parser_t parser;
    for (size_t i = 0; i < sizeof (tags) / sizeof (tags[0]); ++i) {
        muxframe::header_t header = muxframe::header_t::make (
          tags[i], static_cast<uint16_t> (0x8001 + i),
          muxframe::stream_id_t::make (0xfffffff0u + static_cast<uint32_t> (i)),
          static_cast<uint32_t> (i * 1000));
        header.set_version (muxframe::version_t::make (static_cast<uint8_t> (i)));

        unsigned char buf[muxframe::header_size];
        TEST_ASSERT_EQUAL_INT (muxframe::header_size,
                               header.encode (buf, sizeof (buf)));

        muxframe::const_frame_t frame;
        TEST_ASSERT_EQUAL_INT (0,
                               parser.parse (boost::asio::buffer (buf), frame));
        TEST_ASSERT_EQUAL_UINT8 (i, frame.version ().value ());
        TEST_ASSERT_EQUAL_INT (tags[i], frame.tag ());
        TEST_ASSERT_EQUAL_UINT16 (0x8001 + i, frame.flags ().value ());
        TEST_ASSERT_EQUAL_UINT32 (0xfffffff0u + i, frame.stream_id ().value ());
        TEST_ASSERT_EQUAL_UINT32 (i * 1000, frame.length ().value ());
        TEST_ASSERT_EQUAL_INT (0, frame.body ().size ());
    }
}

void test_set_tag_writes_through ()
{
    unsigned char buf[sizeof (example)];
    memcpy (buf, example, sizeof (example));

    muxframe::frame_parser_t parser;
    {
        muxframe::mutable_frame_t frame;
        TEST_ASSERT_EQUAL_INT (0,
                               parser.parse (boost::asio::buffer (buf), frame));
        frame.set_tag (muxframe::tag_go_away);
        TEST_ASSERT_EQUAL_INT (muxframe::tag_go_away, frame.tag ());
    }

    TEST_ASSERT_EQUAL_UINT8 (muxframe::tag_go_away, buf[1]);
    //  Nothing else changed.
    TEST_ASSERT_EQUAL_HEX8 (example[0], buf[0]);
    TEST_ASSERT_EQUAL_HEX8_ARRAY (example + 2, buf + 2, sizeof (example) - 2);
}

void test_mutable_setters_write_through ()
{
    unsigned char buf[sizeof (example)];
    memcpy (buf, example, sizeof (example));

    muxframe::frame_parser_t parser;
    muxframe::mutable_frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, parser.parse (boost::asio::buffer (buf), frame));
    frame.set_flags (0);
    frame.set_stream_id (muxframe::stream_id_t::make (0x01020304));
    frame.set_length (1);

    const unsigned char expected[] = {0x01, 0x02, 0x00, 0x00, 0x01,
                                      0x02, 0x03, 0x04, 0x00, 0x00,
                                      0x00, 0x01, 0x01, 0x02, 0x03};
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, buf, sizeof (expected));
    //  The body view is not resized by a length change.
    TEST_ASSERT_EQUAL_INT (3, frame.body ().size ());
}

void test_body_aliasing ()
{
    unsigned char buf[muxframe::header_size + 8];
    build_header (buf, 0, muxframe::tag_data, 0, 5, 8);
    for (size_t i = muxframe::header_size; i < sizeof (buf); ++i)
        buf[i] = static_cast<unsigned char> (0xa0 + i);

    muxframe::frame_parser_t parser;
    muxframe::mutable_frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, parser.parse (boost::asio::buffer (buf), frame));

    TEST_ASSERT_EQUAL_INT (sizeof (buf) - muxframe::header_size,
                           frame.body ().size ());
    unsigned char *body = static_cast<unsigned char *> (frame.body ().data ());
    TEST_ASSERT_EQUAL_HEX8 (buf[muxframe::header_size], body[0]);

    body[0] = 0x55;
    TEST_ASSERT_EQUAL_HEX8 (0x55, buf[muxframe::header_size]);
}

void test_header_only_buffer ()
{
    unsigned char buf[muxframe::header_size];
    build_header (buf, 0, muxframe::tag_ping, 0, 0, 8);

    muxframe::frame_parser_t parser;
    muxframe::const_frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, parser.parse (boost::asio::buffer (buf), frame));
    //  The declared length is not enforced by default.
    TEST_ASSERT_EQUAL_UINT32 (8, frame.length ().value ());
    TEST_ASSERT_EQUAL_INT (0, frame.body ().size ());
}

void test_gather_buffers ()
{
    muxframe::frame_parser_t parser;
    muxframe::const_frame_t frame;
    TEST_ASSERT_EQUAL_INT (
      0, parser.parse (boost::asio::buffer (example), frame));

    const std::array<boost::asio::const_buffer, 2> buffers = frame.buffers ();
    TEST_ASSERT_EQUAL_INT (muxframe::header_size, buffers[0].size ());
    TEST_ASSERT_EQUAL_INT (3, buffers[1].size ());
    TEST_ASSERT_EQUAL_INT (sizeof (example),
                           boost::asio::buffer_size (buffers));

    std::vector<unsigned char> out (sizeof (example));
    TEST_ASSERT_EQUAL_INT (
      sizeof (example),
      boost::asio::buffer_copy (boost::asio::buffer (out), buffers));
    TEST_ASSERT_EQUAL_HEX8_ARRAY (example, &out[0], sizeof (example));
}

void test_const_frames_share_buffer ()
{
    muxframe::frame_parser_t parser;
    muxframe::const_frame_t first;
    muxframe::const_frame_t second;
    TEST_ASSERT_EQUAL_INT (
      0, parser.parse (boost::asio::buffer (example), first));
    TEST_ASSERT_EQUAL_INT (
      0, parser.parse (boost::asio::buffer (example), second));

    const muxframe::const_frame_t copy (first);
    TEST_ASSERT_EQUAL_PTR (second.header ().bytes (), copy.header ().bytes ());
    TEST_ASSERT_EQUAL_UINT32 (3, copy.length ().value ());
}

void test_mutable_frame_moves ()
{
    unsigned char buf[sizeof (example)];
    memcpy (buf, example, sizeof (example));

    muxframe::frame_parser_t parser;
    muxframe::mutable_frame_t frame;
    TEST_ASSERT_EQUAL_INT (0, parser.parse (boost::asio::buffer (buf), frame));

    muxframe::mutable_frame_t moved (std::move (frame));
    TEST_ASSERT_FALSE (frame.valid ());
    TEST_ASSERT_TRUE (moved.valid ());

    moved.set_tag (muxframe::tag_data);
    TEST_ASSERT_EQUAL_UINT8 (muxframe::tag_data, buf[1]);

    //  Parsing the same buffer again replaces the earlier view.
    TEST_ASSERT_EQUAL_INT (0, parser.parse (boost::asio::buffer (buf), moved));
    TEST_ASSERT_EQUAL_INT (muxframe::tag_data, moved.tag ());
}

void test_strict_version ()
{
    muxframe::frame_parser_t parser;
    set_int_option (parser, MUXFRAME_STRICT_VERSION, 1);

    muxframe::const_frame_t frame;
    TEST_ASSERT_EQUAL_INT (
      -1, parser.parse (boost::asio::buffer (example), frame));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
    TEST_ASSERT_EQUAL_UINT8 (muxframe::frame_error_version_mismatch,
                             parser.error_code ());

    unsigned char buf[muxframe::header_size];
    build_header (buf, 0, muxframe::tag_data, 0, 1, 0);
    TEST_ASSERT_EQUAL_INT (0, parser.parse (boost::asio::buffer (buf), frame));
    TEST_ASSERT_EQUAL_UINT8 (0, parser.error_code ());
}

void test_maxmsgsize ()
{
    muxframe::options_t options;
    options.maxmsgsize = 2;
    muxframe::frame_parser_t parser (options);

    muxframe::const_frame_t frame;
    TEST_ASSERT_EQUAL_INT (
      -1, parser.parse (boost::asio::buffer (example), frame));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);
    TEST_ASSERT_EQUAL_UINT8 (muxframe::frame_error_body_too_large,
                             parser.error_code ());

    const int64_t limit = 3;
    TEST_ASSERT_EQUAL_INT (
      0, parser.setopt (MUXFRAME_MAXMSGSIZE, &limit, sizeof (limit)));
    TEST_ASSERT_EQUAL_INT (
      0, parser.parse (boost::asio::buffer (example), frame));
}

void test_require_body ()
{
    muxframe::frame_parser_t parser;
    set_int_option (parser, MUXFRAME_REQUIRE_BODY, 1);

    muxframe::const_frame_t frame;
    TEST_ASSERT_EQUAL_INT (
      0, parser.parse (boost::asio::buffer (example), frame));

    muxframe::const_frame_t truncated;
    TEST_ASSERT_EQUAL_INT (
      -1, parser.parse (
            boost::asio::const_buffer (example, sizeof (example) - 1),
            truncated));
    TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
    TEST_ASSERT_EQUAL_UINT8 (muxframe::frame_error_incomplete_body,
                             parser.error_code ());
    TEST_ASSERT_FALSE (truncated.valid ());
}

void test_split_consecutive_frames ()
{
    std::vector<unsigned char> buf;
    const unsigned char first[] = "abc";
    const unsigned char second[] = "de";
    append_frame (buf, muxframe::tag_data, 1, first, 3);
    append_frame (buf, muxframe::tag_window_update, 2, second, 2);
    append_frame (buf, muxframe::tag_ping, 3, NULL, 0);

    muxframe::frame_parser_t parser;
    muxframe::mutable_frame_t frame;
    size_t offset = 0;
    size_t consumed = 0;

    TEST_ASSERT_EQUAL_INT (
      0, parser.split (boost::asio::buffer (buf) + offset, frame, consumed));
    TEST_ASSERT_EQUAL_INT (muxframe::header_size + 3, consumed);
    TEST_ASSERT_EQUAL_INT (muxframe::tag_data, frame.tag ());
    TEST_ASSERT_EQUAL_INT (3, frame.body ().size ());
    TEST_ASSERT_EQUAL_STRING_LEN (
      "abc", static_cast<const char *> (frame.body ().data ()), 3);
    offset += consumed;

    TEST_ASSERT_EQUAL_INT (
      0, parser.split (boost::asio::buffer (buf) + offset, frame, consumed));
    TEST_ASSERT_EQUAL_INT (muxframe::header_size + 2, consumed);
    TEST_ASSERT_EQUAL_INT (muxframe::tag_window_update, frame.tag ());
    TEST_ASSERT_EQUAL_UINT32 (2, frame.stream_id ().value ());
    TEST_ASSERT_EQUAL_STRING_LEN (
      "de", static_cast<const char *> (frame.body ().data ()), 2);
    offset += consumed;

    TEST_ASSERT_EQUAL_INT (
      0, parser.split (boost::asio::buffer (buf) + offset, frame, consumed));
    TEST_ASSERT_EQUAL_INT (muxframe::header_size, consumed);
    TEST_ASSERT_EQUAL_INT (muxframe::tag_ping, frame.tag ());
    offset += consumed;
    TEST_ASSERT_EQUAL_INT (buf.size (), offset);

    TEST_ASSERT_EQUAL_INT (
      -1, parser.split (boost::asio::buffer (buf) + offset, frame, consumed));
    TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
    TEST_ASSERT_EQUAL_UINT8 (muxframe::frame_error_insufficient_data,
                             parser.error_code ());
}

void test_split_partial_body ()
{
    muxframe::frame_parser_t parser;
    muxframe::const_frame_t frame;
    size_t consumed = 0;

    TEST_ASSERT_EQUAL_INT (
      -1, parser.split (
            boost::asio::const_buffer (example, sizeof (example) - 1), frame,
            consumed));
    TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
    TEST_ASSERT_EQUAL_UINT8 (muxframe::frame_error_incomplete_body,
                             parser.error_code ());
    TEST_ASSERT_EQUAL_INT (0, consumed);
}

void test_split_bounds_body ()
{
    std::vector<unsigned char> buf (example, example + sizeof (example));
    buf.push_back (0xff);

    muxframe::frame_parser_t parser;
    muxframe::const_frame_t frame;
    size_t consumed = 0;
    TEST_ASSERT_EQUAL_INT (
      0, parser.split (boost::asio::const_buffer (&buf[0], buf.size ()), frame,
                       consumed));
    TEST_ASSERT_EQUAL_INT (sizeof (example), consumed);
    TEST_ASSERT_EQUAL_INT (3, frame.body ().size ());
    TEST_ASSERT_EQUAL_INT (sizeof (example), frame.size ());
}

void test_options ()
{
    muxframe::frame_parser_t parser;

    int value = -1;
    size_t size = sizeof (value);
    TEST_ASSERT_EQUAL_INT (
      0, parser.getopt (MUXFRAME_STRICT_VERSION, &value, &size));
    TEST_ASSERT_EQUAL_INT (0, value);

    int64_t limit = 0;
    size = sizeof (limit);
    TEST_ASSERT_EQUAL_INT (0, parser.getopt (MUXFRAME_MAXMSGSIZE, &limit, &size));
    TEST_ASSERT_TRUE (limit == -1);

    value = 2;
    TEST_ASSERT_EQUAL_INT (
      -1, parser.setopt (MUXFRAME_REQUIRE_BODY, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    value = 1;
    TEST_ASSERT_EQUAL_INT (-1, parser.setopt (MUXFRAME_MAXMSGSIZE, &value,
                                              sizeof (value)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    limit = -2;
    TEST_ASSERT_EQUAL_INT (-1, parser.setopt (MUXFRAME_MAXMSGSIZE, &limit,
                                              sizeof (limit)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    TEST_ASSERT_EQUAL_INT (-1, parser.setopt (99, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    set_int_option (parser, MUXFRAME_REQUIRE_BODY, 1);
    TEST_ASSERT_TRUE (parser.options ().require_body);
}

#if defined MUXFRAME_CHECK_ALIASING
namespace
{
//  Runs fn_ in a child process and returns the signal that killed it, or
//  0 if it exited normally.
int run_in_child (void (*fn_) ())
{
    fflush (stdout);
    const pid_t pid = fork ();
    TEST_ASSERT_NOT_EQUAL (-1, pid);
    if (pid == 0) {
        fn_ ();
        _exit (0);
    }
    int status = 0;
    TEST_ASSERT_EQUAL_INT (pid, waitpid (pid, &status, 0));
    if (WIFSIGNALED (status))
        return WTERMSIG (status);
    TEST_ASSERT_TRUE (WIFEXITED (status));
    TEST_ASSERT_EQUAL_INT (0, WEXITSTATUS (status));
    return 0;
}

void two_mutable_frames ()
{
    unsigned char buf[sizeof (example)];
    memcpy (buf, example, sizeof (example));

    muxframe::frame_parser_t parser;
    muxframe::mutable_frame_t first;
    muxframe::mutable_frame_t second;
    parser.parse (boost::asio::buffer (buf), first);
    parser.parse (boost::asio::buffer (buf), second);
}

void const_and_mutable_frames ()
{
    unsigned char buf[sizeof (example)];
    memcpy (buf, example, sizeof (example));

    muxframe::frame_parser_t parser;
    muxframe::const_frame_t reader;
    muxframe::mutable_frame_t writer;
    parser.parse (boost::asio::const_buffer (buf, sizeof (buf)), reader);
    parser.parse (boost::asio::buffer (buf), writer);
}

void shared_const_frames ()
{
    muxframe::frame_parser_t parser;
    muxframe::const_frame_t first;
    muxframe::const_frame_t second;
    parser.parse (boost::asio::buffer (example), first);
    parser.parse (boost::asio::buffer (example), second);
    muxframe::const_frame_t copy (first);
    copy = second;
}
}

void test_overlapping_mutable_frames_abort ()
{
    TEST_ASSERT_EQUAL_INT (SIGABRT, run_in_child (two_mutable_frames));
}

void test_mutable_over_const_frame_aborts ()
{
    TEST_ASSERT_EQUAL_INT (SIGABRT, run_in_child (const_and_mutable_frames));
}

void test_overlapping_const_frames_allowed ()
{
    TEST_ASSERT_EQUAL_INT (0, run_in_child (shared_const_frames));
}
#endif

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_default_frame_is_invalid);
    RUN_TEST (test_parse_example);
    RUN_TEST (test_header_aliases_buffer);
    RUN_TEST (test_short_buffer_rejected);
    RUN_TEST (test_invalid_tag_rejected);
    RUN_TEST (test_failed_parse_keeps_previous_frame);
    RUN_TEST (test_roundtrip_every_tag);
    RUN_TEST (test_set_tag_writes_through);
    RUN_TEST (test_mutable_setters_write_through);
    RUN_TEST (test_body_aliasing);
    RUN_TEST (test_header_only_buffer);
    RUN_TEST (test_gather_buffers);
    RUN_TEST (test_const_frames_share_buffer);
    RUN_TEST (test_mutable_frame_moves);
    RUN_TEST (test_strict_version);
    RUN_TEST (test_maxmsgsize);
    RUN_TEST (test_require_body);
    RUN_TEST (test_split_consecutive_frames);
    RUN_TEST (test_split_partial_body);
    RUN_TEST (test_split_bounds_body);
    RUN_TEST (test_options);
#if defined MUXFRAME_CHECK_ALIASING
    RUN_TEST (test_overlapping_mutable_frames_abort);
    RUN_TEST (test_mutable_over_const_frame_aborts);
    RUN_TEST (test_overlapping_const_frames_allowed);
#endif

    return UNITY_END ();
}
