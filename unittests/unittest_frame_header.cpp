/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/frame_header.hpp"
#include "protocol/frame_protocol.hpp"
#include "protocol/wire.hpp"

#include <unity.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_header_is_packed ()
{
    TEST_ASSERT_EQUAL_INT (12, sizeof (muxframe::header_t));
    TEST_ASSERT_EQUAL_INT (muxframe::header_size, sizeof (muxframe::header_t));
}

void test_data_header_defaults ()
{
    const muxframe::header_t header =
      muxframe::header_t::data (muxframe::stream_id_t::make (7), 42);

    TEST_ASSERT_EQUAL_UINT8 (0, header.version ().value ());
    TEST_ASSERT_EQUAL_UINT8 (muxframe::tag_data, header.raw_tag ());
    TEST_ASSERT_EQUAL_UINT16 (0, header.flags ().value ());
    TEST_ASSERT_EQUAL_UINT32 (7, header.stream_id ().value ());
    TEST_ASSERT_EQUAL_UINT32 (42, header.length ().value ());
}

void test_encode_network_byte_order ()
{
    muxframe::header_t header =
      muxframe::header_t::data (muxframe::stream_id_t::make (1), 3);
    header.set_version (muxframe::version_t::make (1));

    unsigned char out[muxframe::header_size];
    TEST_ASSERT_EQUAL_INT (muxframe::header_size,
                           header.encode (out, sizeof (out)));

    const unsigned char expected[] = {0x01, 0x00, 0x00, 0x00, 0x00, 0x00,
                                      0x00, 0x01, 0x00, 0x00, 0x00, 0x03};
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, out, sizeof (expected));
}

void test_multibyte_fields_most_significant_first ()
{
    const muxframe::header_t header = muxframe::header_t::make (
      muxframe::tag_window_update, 0xbeef,
      muxframe::stream_id_t::make (0x01020304), 0xa0b0c0d0);

    const unsigned char expected[] = {0x00, 0x01, 0xbe, 0xef, 0x01, 0x02,
                                      0x03, 0x04, 0xa0, 0xb0, 0xc0, 0xd0};
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, header.bytes (),
                                  sizeof (expected));
}

void test_encode_into_short_buffer ()
{
    const muxframe::header_t header =
      muxframe::header_t::data (muxframe::stream_id_t::make (1), 1);
    unsigned char out[muxframe::header_size - 1];
    TEST_ASSERT_EQUAL_INT (0, header.encode (out, sizeof (out)));
}

void test_stream_id_accepts_every_value ()
{
    TEST_ASSERT_EQUAL_UINT32 (0, muxframe::stream_id_t::make (0).value ());
    TEST_ASSERT_EQUAL_UINT32 (
      0xffffffffu, muxframe::stream_id_t::make (0xffffffffu).value ());
}

void test_len_decodes_stored_bytes ()
{
    unsigned char raw[muxframe::header_size];
    build_header (raw, 0, 0, 0, 0, 0x00010203);
    const muxframe::header_t *header =
      reinterpret_cast<const muxframe::header_t *> (raw);
    TEST_ASSERT_EQUAL_UINT32 (0x00010203, header->length ().value ());
    TEST_ASSERT_EQUAL_UINT32 (0x00010203, muxframe::get_uint32 (raw + 8));
}

void test_setters_write_in_place ()
{
    unsigned char raw[muxframe::header_size];
    build_header (raw, 0, muxframe::tag_data, 0, 1, 3);
    muxframe::header_t *header = reinterpret_cast<muxframe::header_t *> (raw);

    header->set_tag (muxframe::tag_ping);
    header->set_flags (muxframe::flags_t::make (0x0102));
    header->set_stream_id (muxframe::stream_id_t::make (0x0a0b0c0d));
    header->set_length (muxframe::len_t::make (0x11223344));

    const unsigned char expected[] = {0x00, 0x02, 0x01, 0x02, 0x0a, 0x0b,
                                      0x0c, 0x0d, 0x11, 0x22, 0x33, 0x44};
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, raw, sizeof (expected));
}

void test_tag_from_byte ()
{
    muxframe::tag_t tag = muxframe::tag_data;
    TEST_ASSERT_TRUE (muxframe::tag_from_byte (0, tag));
    TEST_ASSERT_EQUAL_INT (muxframe::tag_data, tag);
    TEST_ASSERT_TRUE (muxframe::tag_from_byte (1, tag));
    TEST_ASSERT_EQUAL_INT (muxframe::tag_window_update, tag);
    TEST_ASSERT_TRUE (muxframe::tag_from_byte (2, tag));
    TEST_ASSERT_EQUAL_INT (muxframe::tag_ping, tag);
    TEST_ASSERT_TRUE (muxframe::tag_from_byte (3, tag));
    TEST_ASSERT_EQUAL_INT (muxframe::tag_go_away, tag);

    for (int byte = 4; byte <= 0xff; ++byte)
        TEST_ASSERT_FALSE (
          muxframe::tag_from_byte (static_cast<uint8_t> (byte), tag));
    //  A rejected byte leaves the output alone.
    TEST_ASSERT_EQUAL_INT (muxframe::tag_go_away, tag);
}

void test_names ()
{
    TEST_ASSERT_EQUAL_STRING ("GO_AWAY",
                              muxframe::tag_name (muxframe::tag_go_away));
    TEST_ASSERT_EQUAL_STRING ("invalid tag",
                              muxframe::frame_error_reason (
                                muxframe::frame_error_invalid_tag));
    TEST_ASSERT_EQUAL_STRING ("none", muxframe::frame_error_reason (0));
}

int main (void)
{
    setup_test_environment ();

    UNITY_BEGIN ();

    RUN_TEST (test_header_is_packed);
    RUN_TEST (test_data_header_defaults);
    RUN_TEST (test_encode_network_byte_order);
    RUN_TEST (test_multibyte_fields_most_significant_first);
    RUN_TEST (test_encode_into_short_buffer);
    RUN_TEST (test_stream_id_accepts_every_value);
    RUN_TEST (test_len_decodes_stored_bytes);
    RUN_TEST (test_setters_write_in_place);
    RUN_TEST (test_tag_from_byte);
    RUN_TEST (test_names);

    return UNITY_END ();
}
