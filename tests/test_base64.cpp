#include <doctest/doctest.h>
#include <string.h>
#include "meshz/base64.hpp"
#include "meshz/types.hpp"

using namespace meshz;

static std::string enc(const char* s) {
    Text255 out;
    REQUIRE(base64::encode(reinterpret_cast<const uint8_t*>(s), strlen(s), out));
    return out.c_str();
}

TEST_CASE("base64 encodes the RFC 4648 test vectors") {
    CHECK(enc("") == "");
    CHECK(enc("f") == "Zg==");
    CHECK(enc("fo") == "Zm8=");
    CHECK(enc("foo") == "Zm9v");
    CHECK(enc("foob") == "Zm9vYg==");
    CHECK(enc("fooba") == "Zm9vYmE=");
    CHECK(enc("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64 decode restores binary bytes") {
    ChunkBytes out;
    REQUIRE(base64::decode("AP/AAQ==", 8, out));
    REQUIRE(out.size() == 4);
    CHECK(out[0] == 0x00);
    CHECK(out[1] == 0xFF);
    CHECK(out[2] == 0xC0);
    CHECK(out[3] == 0x01);
}

TEST_CASE("base64 decode rejects malformed input") {
    ChunkBytes out;
    CHECK_FALSE(base64::decode("abc", 3, out));          // not a multiple of 4
    CHECK_FALSE(base64::decode("ab$=", 4, out));         // bad character
    CHECK_FALSE(base64::decode("a=b=", 4, out));         // padding in the middle
    CHECK_FALSE(base64::decode("QUJDRB==", 8, out));     // "ABCD" with stray low bits
    CHECK_FALSE(base64::decode("QUJDREF=", 8, out));     // "ABCDE" likewise, one pad
    CHECK(base64::decode("QUJDRA==", 8, out));
    CHECK(base64::decode("QUJDREU=", 8, out));
    out.clear();
    CHECK(out.empty());
}

TEST_CASE("base64 decode refuses payloads larger than the target") {
    // 186 raw bytes do not fit a 180-byte chunk.
    std::string big(4 * 62, 'A');
    ChunkBytes out;
    CHECK_FALSE(base64::decode(big.c_str(), big.size(), out));
}

TEST_CASE("base64 encode refuses to overflow the output string") {
    etl::string<8> small;
    const uint8_t data[9] = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    CHECK_FALSE(base64::encode(data, sizeof(data), small));
    CHECK(small.empty());
}
