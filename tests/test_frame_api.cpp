/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include <string.h>
#include <vector>

SETUP_TEARDOWN_NOOP

namespace
{
const unsigned char example[] = {0x01, 0x02, 0x01, 0x00, 0x00,
                                 0x00, 0x00, 0x01, 0x00, 0x00,
                                 0x00, 0x03, 0x01, 0x02, 0x03};
}

void test_version ()
{
    int major, minor, patch;
    muxframe_version (&major, &minor, &patch);
    TEST_ASSERT_EQUAL_INT (MUXFRAME_VERSION_MAJOR, major);
    TEST_ASSERT_EQUAL_INT (MUXFRAME_VERSION_MINOR, minor);
    TEST_ASSERT_EQUAL_INT (MUXFRAME_VERSION_PATCH, patch);
}

void test_parse_example ()
{
    void *parser = muxframe_parser_new ();
    TEST_ASSERT_NOT_NULL (parser);

    muxframe_header_t header;
    const void *body = NULL;
    size_t body_size = 0;
    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parse (
      parser, example, sizeof (example), &header, &body, &body_size));

    TEST_ASSERT_EQUAL_UINT8 (1, header.version);
    TEST_ASSERT_EQUAL_UINT8 (MUXFRAME_TAG_PING, header.tag);
    TEST_ASSERT_EQUAL_UINT16 (0x0100, header.flags);
    TEST_ASSERT_EQUAL_UINT32 (1, header.stream_id);
    TEST_ASSERT_EQUAL_UINT32 (3, header.length);
    TEST_ASSERT_EQUAL_PTR (example + MUXFRAME_HEADER_SIZE, body);
    TEST_ASSERT_EQUAL_INT (3, body_size);
    TEST_ASSERT_EQUAL_INT (0, muxframe_parser_error (parser));

    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parser_close (parser));
}

void test_need_more_bytes_and_corrupt_frames_differ ()
{
    void *parser = muxframe_parser_new ();

    TEST_ASSERT_FAILURE_ERRNO (
      EAGAIN, muxframe_parse (parser, example, MUXFRAME_HEADER_SIZE - 1, NULL,
                              NULL, NULL));
    TEST_ASSERT_EQUAL_INT (MUXFRAME_ERROR_INSUFFICIENT_DATA,
                           muxframe_parser_error (parser));

    unsigned char corrupt[sizeof (example)];
    memcpy (corrupt, example, sizeof (example));
    corrupt[1] = 4;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO,
      muxframe_parse (parser, corrupt, sizeof (corrupt), NULL, NULL, NULL));
    TEST_ASSERT_EQUAL_INT (MUXFRAME_ERROR_INVALID_TAG,
                           muxframe_parser_error (parser));
    TEST_ASSERT_EQUAL_STRING (
      "invalid tag", muxframe_error_reason (muxframe_parser_error (parser)));

    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parser_close (parser));
}

void test_empty_buffer ()
{
    void *parser = muxframe_parser_new ();
    TEST_ASSERT_FAILURE_ERRNO (
      EAGAIN, muxframe_parse (parser, NULL, 0, NULL, NULL, NULL));
    TEST_ASSERT_FAILURE_ERRNO (
      EFAULT, muxframe_parse (parser, NULL, 4, NULL, NULL, NULL));
    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parser_close (parser));
}

void test_set_tag_in_place ()
{
    unsigned char buf[sizeof (example)];
    memcpy (buf, example, sizeof (example));

    void *parser = muxframe_parser_new ();
    TEST_ASSERT_SUCCESS_ERRNO (
      muxframe_set_tag (parser, buf, sizeof (buf), MUXFRAME_TAG_GO_AWAY));
    TEST_ASSERT_EQUAL_UINT8 (MUXFRAME_TAG_GO_AWAY, buf[1]);
    TEST_ASSERT_EQUAL_HEX8_ARRAY (example + 2, buf + 2, sizeof (buf) - 2);

    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               muxframe_set_tag (parser, buf, sizeof (buf), 4));
    TEST_ASSERT_EQUAL_UINT8 (MUXFRAME_TAG_GO_AWAY, buf[1]);

    //  A frame with an unknown tag is not rewritten.
    buf[1] = 0x7f;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO,
      muxframe_set_tag (parser, buf, sizeof (buf), MUXFRAME_TAG_DATA));
    TEST_ASSERT_EQUAL_UINT8 (0x7f, buf[1]);

    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parser_close (parser));
}

void test_header_encode ()
{
    muxframe_header_t header;
    header.version = 1;
    header.tag = MUXFRAME_TAG_DATA;
    header.flags = 0;
    header.stream_id = 1;
    header.length = 3;

    unsigned char buf[MUXFRAME_HEADER_SIZE];
    TEST_ASSERT_EQUAL_INT (MUXFRAME_HEADER_SIZE,
                           muxframe_header_encode (buf, sizeof (buf), &header));
    const unsigned char expected[] = {0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
                                      0x00, 0x01, 0x00, 0x00, 0x00, 0x03};
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, buf, sizeof (expected));

    TEST_ASSERT_FAILURE_ERRNO (
      ENOBUFS, muxframe_header_encode (buf, sizeof (buf) - 1, &header));

    header.tag = 4;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, muxframe_header_encode (buf, sizeof (buf), &header));
}

void test_split_stream ()
{
    std::vector<unsigned char> buf;
    const unsigned char body[] = "hello";
    append_frame (buf, MUXFRAME_TAG_DATA, 7, body, 5);
    append_frame (buf, MUXFRAME_TAG_GO_AWAY, 0, NULL, 0);

    void *parser = muxframe_parser_new ();
    muxframe_header_t header;
    const void *data = NULL;
    size_t data_size = 0;
    size_t consumed = 0;

    TEST_ASSERT_SUCCESS_ERRNO (muxframe_split (parser, &buf[0], buf.size (),
                                               &header, &data, &data_size,
                                               &consumed));
    TEST_ASSERT_EQUAL_UINT32 (7, header.stream_id);
    TEST_ASSERT_EQUAL_INT (5, data_size);
    TEST_ASSERT_EQUAL_STRING_LEN ("hello", static_cast<const char *> (data),
                                  5);
    TEST_ASSERT_EQUAL_INT (MUXFRAME_HEADER_SIZE + 5, consumed);

    size_t offset = consumed;
    TEST_ASSERT_SUCCESS_ERRNO (muxframe_split (
      parser, &buf[offset], buf.size () - offset, &header, NULL, NULL,
      &consumed));
    TEST_ASSERT_EQUAL_UINT8 (MUXFRAME_TAG_GO_AWAY, header.tag);
    offset += consumed;
    TEST_ASSERT_EQUAL_INT (buf.size (), offset);

    //  Only part of the body has arrived.
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN,
                               muxframe_split (parser, &buf[0], 14, NULL, NULL,
                                               NULL, &consumed));
    TEST_ASSERT_EQUAL_INT (MUXFRAME_ERROR_INCOMPLETE_BODY,
                           muxframe_parser_error (parser));

    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parser_close (parser));
}

void test_parser_options ()
{
    void *parser = muxframe_parser_new ();

    const int64_t limit = 2;
    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parser_setopt (
      parser, MUXFRAME_MAXMSGSIZE, &limit, sizeof (limit)));
    int64_t value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (
      muxframe_parser_getopt (parser, MUXFRAME_MAXMSGSIZE, &value, &size));
    TEST_ASSERT_TRUE (value == 2);

    TEST_ASSERT_FAILURE_ERRNO (EMSGSIZE,
                               muxframe_parse (parser, example,
                                               sizeof (example), NULL, NULL,
                                               NULL));
    TEST_ASSERT_EQUAL_INT (MUXFRAME_ERROR_BODY_TOO_LARGE,
                           muxframe_parser_error (parser));

    const int strict = 1;
    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parser_setopt (
      parser, MUXFRAME_STRICT_VERSION, &strict, sizeof (strict)));
    unsigned char buf[MUXFRAME_HEADER_SIZE];
    build_header (buf, 1, MUXFRAME_TAG_PING, 0, 0, 0);
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, muxframe_parse (parser, buf, sizeof (buf), NULL, NULL, NULL));
    TEST_ASSERT_EQUAL_INT (MUXFRAME_ERROR_VERSION_MISMATCH,
                           muxframe_parser_error (parser));

    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, muxframe_parser_setopt (parser, 0, &strict, sizeof (strict)));

    TEST_ASSERT_SUCCESS_ERRNO (muxframe_parser_close (parser));
}

void test_invalid_handle ()
{
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, muxframe_parser_close (NULL));
    TEST_ASSERT_FAILURE_ERRNO (
      EFAULT, muxframe_parse (NULL, example, sizeof (example), NULL, NULL,
                              NULL));
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, muxframe_parser_error (NULL));
}

void test_strerror ()
{
    TEST_ASSERT_NOT_NULL (muxframe_strerror (EPROTO));
    TEST_ASSERT_NOT_NULL (muxframe_strerror (EAGAIN));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_version);
    RUN_TEST (test_parse_example);
    RUN_TEST (test_need_more_bytes_and_corrupt_frames_differ);
    RUN_TEST (test_empty_buffer);
    RUN_TEST (test_set_tag_in_place);
    RUN_TEST (test_header_encode);
    RUN_TEST (test_split_stream);
    RUN_TEST (test_parser_options);
    RUN_TEST (test_invalid_handle);
    RUN_TEST (test_strerror);

    return UNITY_END ();
}
