//
// Test the in-memory reader used by chunk parsing
//

#include <doctest/doctest.h>
#include <pngchunk/exceptions.hh>
#include "../src/libpngchunk/input.hh"

#include <vector>

using namespace pngchunk;

TEST_CASE("memory_reader") {
    const std::vector<std::byte> data{
        std::byte{0x00}, std::byte{0x00}, std::byte{0x01}, std::byte{0x02},
        std::byte{'I'}, std::byte{'E'}, std::byte{'N'}, std::byte{'D'},
        std::byte{0xAA}
    };

    SUBCASE("big-endian integer") {
        memory_reader reader(data.data(), data.size());
        CHECK(reader.read<std::uint32_t>(byte_order::big) == 0x0102u);
        CHECK(reader.tell() == 4);
        CHECK(reader.remaining() == 5);
    }

    SUBCASE("little-endian integer") {
        memory_reader reader(data.data(), data.size());
        CHECK(reader.read<std::uint32_t>(byte_order::little) == 0x02010000u);
    }

    SUBCASE("chunk type") {
        memory_reader reader(data.data(), data.size());
        reader.read_exact(4);
        CHECK(reader.read_chunk_type() == chunk_types::IEND);
    }

    SUBCASE("non-ASCII chunk type") {
        memory_reader reader(data.data() + 5, 4);
        CHECK_THROWS_AS(reader.read_chunk_type(), invalid_encoding);
    }

    SUBCASE("short reads") {
        memory_reader reader(data.data(), data.size());
        reader.read_exact(8);
        CHECK_THROWS_AS(reader.read<std::uint32_t>(byte_order::big), io_error);

        memory_reader short_type(data.data() + 4, 3);
        CHECK_THROWS_AS(short_type.read_chunk_type(), io_error);
    }

    SUBCASE("read_exact checks before allocating") {
        memory_reader reader(data.data(), data.size());
        CHECK_THROWS_AS(reader.read_exact(0xFFFFFFFFu), io_error);
        CHECK(reader.tell() == 0);
    }

    SUBCASE("read stops at end of input") {
        memory_reader reader(data.data(), data.size());
        std::byte buf[16];
        CHECK(reader.read(buf, sizeof(buf)) == data.size());
        CHECK(reader.read(buf, sizeof(buf)) == 0);
        CHECK(reader.remaining() == 0);
    }

    SUBCASE("empty input") {
        memory_reader reader(nullptr, 0);
        CHECK(reader.size() == 0);
        CHECK(reader.read_exact(0).empty());
        CHECK_THROWS_AS(reader.read<std::uint32_t>(byte_order::big), io_error);
    }

    SUBCASE("null buffer with a size") {
        CHECK_THROWS_AS(memory_reader(nullptr, 4), io_error);
    }
}

TEST_CASE("byte order helpers") {
    CHECK(swap32(0x11223344u) == 0x44332211u);
    CHECK(swap_byte_order(std::uint16_t{0x1122}) == 0x2211);

    std::byte out[4];
    store(std::uint32_t{0x0A0B0C0Du}, out, byte_order::big);
    CHECK(out[0] == std::byte{0x0A});
    CHECK(out[3] == std::byte{0x0D});

    store(std::uint32_t{0x0A0B0C0Du}, out, byte_order::little);
    CHECK(out[0] == std::byte{0x0D});
    CHECK(out[3] == std::byte{0x0A});
}
