#include <muxframe.h>

#include <cstdio>

static void print_bytes(const char* label, const unsigned char* data, size_t size) {
    std::printf("%s =", label);
    for (size_t i = 0; i < size; ++i) std::printf(" %02x", data[i]);
    std::printf("\n");
}

int main() {
    unsigned char bytes[] = {0x01, 0x02, 0x01, 0x00, 0x00, 0x00, 0x00, 0x01,
                             0x00, 0x00, 0x00, 0x03, 0x01, 0x02, 0x03};

    void* parser = muxframe_parser_new();

    muxframe_header_t header;
    const void* body = NULL;
    size_t body_size = 0;
    if (muxframe_parse(parser, bytes, sizeof bytes, &header, &body, &body_size) != 0) {
        std::fprintf(stderr, "parse failed: %s (%s)\n", muxframe_strerror(muxframe_errno()),
                     muxframe_error_reason(muxframe_parser_error(parser)));
        muxframe_parser_close(parser);
        return 1;
    }

    std::printf("frame version = %u, tag = %u, flags = 0x%04x, stream id = %u, length = %u\n",
                header.version, header.tag, header.flags, header.stream_id, header.length);
    print_bytes("frame body", static_cast<const unsigned char*>(body), body_size);
    print_bytes("header bytes", bytes, MUXFRAME_HEADER_SIZE);

    // The tag is rewritten in place, the header bytes above change with it.
    if (muxframe_set_tag(parser, bytes, sizeof bytes, MUXFRAME_TAG_GO_AWAY) != 0) {
        std::fprintf(stderr, "set_tag failed: %s\n", muxframe_strerror(muxframe_errno()));
        muxframe_parser_close(parser);
        return 1;
    }
    print_bytes("header bytes", bytes, MUXFRAME_HEADER_SIZE);

    muxframe_parser_close(parser);
    return 0;
}
