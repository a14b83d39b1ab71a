#include <doctest/doctest.h>
#include "../src/libpngchunk/utf8.hh"

#include <string_view>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    bool valid(std::string_view s) {
        auto b = bytes_of(s);
        return is_valid_utf8(b.data(), b.size());
    }
}

TEST_CASE("UTF-8 validation") {
    SUBCASE("accepted") {
        CHECK(valid(""));
        CHECK(valid(secret_message));
        CHECK(valid("caf\xC3\xA9"));                // 2 bytes
        CHECK(valid("\xE2\x82\xAC"));               // 3 bytes, euro sign
        CHECK(valid("\xF0\x9F\x98\x80"));           // 4 bytes
        CHECK(valid("\xF4\x8F\xBF\xBF"));           // U+10FFFF
        CHECK(valid(std::string_view("\0", 1)));
    }

    SUBCASE("rejected") {
        CHECK_FALSE(valid("\x80"));                 // lone continuation
        CHECK_FALSE(valid("\xC3"));                 // truncated
        CHECK_FALSE(valid("\xE2\x82"));             // truncated
        CHECK_FALSE(valid("\xC0\xAF"));             // overlong
        CHECK_FALSE(valid("\xE0\x80\xAF"));         // overlong
        CHECK_FALSE(valid("\xED\xA0\x80"));         // surrogate
        CHECK_FALSE(valid("\xF4\x90\x80\x80"));     // above U+10FFFF
        CHECK_FALSE(valid("\xFF"));
        CHECK_FALSE(valid("ok\xC3" "A"));           // bad continuation
    }
}
