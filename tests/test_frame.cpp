#include <doctest/doctest.h>
#include <string>
#include "meshz/frame.hpp"

using namespace meshz;

static std::string wire(const Frame& f) {
    Text255 t;
    REQUIRE(encode(f, t));
    return t.c_str();
}

static ParseError parse_error_of(const char* text) {
    Frame f;
    ParseError err = ParseError::None;
    CHECK_FALSE(decode(text, f, err));
    return err;
}

TEST_CASE("Frames encode to the pipe-delimited wire text") {
    CHECK(wire(Frame::request("notes.txt", 300, 3)) == "MESHZ_REQ|notes.txt|300|3");
    CHECK(wire(Frame::ack()) == "MESHZ_ACK");
    CHECK(wire(Frame::chunk_ack(12)) == "MESHZ_GOCONT|12");

    const uint8_t abcd[] = {'A', 'B', 'C', 'D'};
    CHECK(wire(Frame::data_chunk(1, abcd, 4)) == "ZD|1|QUJDRA==");
}

TEST_CASE("Decoding yields typed frames") {
    Frame f;
    ParseError err = ParseError::Empty;

    REQUIRE(decode("MESHZ_REQ|photo.jpg|123456|1029", f, err));
    CHECK(err == ParseError::None);
    CHECK(f.kind == FrameKind::Request);
    CHECK(f.filename == FileNameStr("photo.jpg"));
    CHECK(f.file_size == 123456);
    CHECK(f.total_chunks == 1029);

    REQUIRE(decode("MESHZ_ACK", f, err));
    CHECK(f.kind == FrameKind::Ack);

    REQUIRE(decode("ZD|7|RUZHSA==", f, err));
    CHECK(f.kind == FrameKind::DataChunk);
    CHECK(f.index == 7);
    REQUIRE(f.payload.size() == 4);
    CHECK(f.payload[0] == 'E');
    CHECK(f.payload[3] == 'H');

    REQUIRE(decode("MESHZ_GOCONT|4294967295", f, err));
    CHECK(f.kind == FrameKind::ChunkAck);
    CHECK(f.index == 4294967295u);
}

TEST_CASE("Decoded frames compare equal to the frame that was encoded") {
    const uint8_t bin[] = {0x00, 0x7C, 0xFF, 0x0A};      // includes '|' and newline bytes
    const Frame sent[] = {
        Frame::request("a b.tar.gz", 0, 0),
        Frame::data_chunk(99, bin, sizeof(bin)),
        Frame::chunk_ack(1),
    };
    for (const Frame& s : sent) {
        Frame back;
        ParseError err;
        REQUIRE(decode(wire(s).c_str(), back, err));
        CHECK(back == s);
    }
}

TEST_CASE("Every malformed line maps to one parse error") {
    CHECK(parse_error_of("") == ParseError::Empty);
    CHECK(parse_error_of(nullptr) == ParseError::Empty);
    CHECK(parse_error_of("hello mesh") == ParseError::UnknownTag);
    CHECK(parse_error_of("meshz_ack") == ParseError::UnknownTag);       // tags are case-sensitive
    CHECK(parse_error_of("MESHZ_ACK|1") == ParseError::FieldCount);
    CHECK(parse_error_of("MESHZ_REQ|a.txt|10") == ParseError::FieldCount);
    CHECK(parse_error_of("MESHZ_REQ|a|b|c|d") == ParseError::FieldCount);
    CHECK(parse_error_of("MESHZ_REQ||10|1") == ParseError::FieldCount);  // empty filename
    CHECK(parse_error_of("MESHZ_REQ|a.txt|ten|1") == ParseError::BadNumber);
    CHECK(parse_error_of("MESHZ_REQ|a.txt|10|-1") == ParseError::BadNumber);
    CHECK(parse_error_of("MESHZ_REQ|a.txt|10|4294967296") == ParseError::BadNumber);
    CHECK(parse_error_of("ZD|x|QUJD") == ParseError::BadNumber);
    CHECK(parse_error_of("ZD|0|QUJD") == ParseError::BadIndex);
    CHECK(parse_error_of("ZD|1|") == ParseError::BadPayload);
    CHECK(parse_error_of("ZD|1|QUJ") == ParseError::BadPayload);
    CHECK(parse_error_of("ZD|1|QU*D") == ParseError::BadPayload);
    CHECK(parse_error_of("ZD|1|QUJDRB==") == ParseError::BadPayload);
    CHECK(parse_error_of("MESHZ_GOCONT|0") == ParseError::BadIndex);
    CHECK(parse_error_of("MESHZ_GOCONT| 1") == ParseError::BadNumber);
    CHECK(parse_error_of("MESHZ_GOCONT") == ParseError::FieldCount);

    const std::string long_name(FILE_NAME_MAX + 1, 'n');
    CHECK(parse_error_of(("MESHZ_REQ|" + long_name + "|1|1").c_str()) == ParseError::TooLong);

    const std::string huge(TEXT_MAX + 1, 'Z');
    CHECK(parse_error_of(huge.c_str()) == ParseError::TooLong);
}

TEST_CASE("A failed decode leaves a default frame behind") {
    Frame f = Frame::chunk_ack(5);
    ParseError err = ParseError::None;
    CHECK_FALSE(decode("ZD|0|QUJD", f, err));
    CHECK(f == Frame{});
}

TEST_CASE("A full-size chunk still fits one text frame") {
    uint8_t data[MAX_CHUNK_BYTES];
    for (size_t i = 0; i < sizeof(data); ++i) data[i] = static_cast<uint8_t>(i);
    Text255 t;
    REQUIRE(encode(Frame::data_chunk(4294967295u, data, sizeof(data)), t));
    CHECK(t.size() <= TEXT_MAX);
}

TEST_CASE("Parse error names are stable for logs") {
    CHECK(std::string(to_string(ParseError::UnknownTag)) == "unknown_tag");
    CHECK(std::string(to_string(ParseError::BadPayload)) == "bad_payload");
    CHECK(std::string(to_string(FrameKind::DataChunk)) == "data");
}
