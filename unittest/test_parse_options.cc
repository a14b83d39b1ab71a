#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    struct warning_record {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    parse_options collecting(std::vector<warning_record>& out) {
        parse_options opts;
        opts.on_warning = [&out](std::uint64_t offset, std::string_view category, std::string_view message) {
            out.push_back({offset, std::string(category), std::string(message)});
        };
        return opts;
    }
}

TEST_SUITE("PARSE_OPTIONS") {
    TEST_CASE("defaults") {
        parse_options opts;
        CHECK(opts.strict);
        CHECK(opts.max_chunk_size == 0xFFFFFFFFu);
        CHECK(opts.allow_trailing_data);
        CHECK_FALSE(static_cast<bool>(opts.on_warning));
    }

    TEST_CASE("max_chunk_size") {
        SUBCASE("strict mode rejects oversized chunks") {
            parse_options opts;
            opts.max_chunk_size = 16;
            try {
                (void)chunk::parse(secret_wire(), opts);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                std::string msg = e.what();
                CHECK(msg.find("42") != std::string::npos);
                CHECK(msg.find("16") != std::string::npos);
            }
        }

        SUBCASE("lenient mode warns and continues") {
            std::vector<warning_record> warnings;
            auto opts = collecting(warnings);
            opts.strict = false;
            opts.max_chunk_size = 16;

            auto c = chunk::parse(secret_wire(), opts);
            CHECK(c.length() == 42);
            REQUIRE(warnings.size() == 1);
            CHECK(warnings[0].category == "size_limit");
            CHECK(warnings[0].offset == 0);
        }

        SUBCASE("PNG limit") {
            parse_options opts;
            opts.max_chunk_size = png_max_chunk_size;
            auto wire = make_wire(0x80000000u, "IDAT", "", 0);
            CHECK_THROWS_AS(chunk::parse(wire, opts), parse_error);
            CHECK_THROWS_AS(chunk::parse(wire), io_error);
        }

        SUBCASE("limit equal to length is accepted") {
            parse_options opts;
            opts.max_chunk_size = 42;
            CHECK_NOTHROW((void)chunk::parse(secret_wire(), opts));
        }
    }

    TEST_CASE("trailing data") {
        auto wire = secret_wire();
        wire.push_back(std::byte{0});
        wire.push_back(std::byte{1});

        SUBCASE("allowed by default without warnings") {
            std::vector<warning_record> warnings;
            auto c = chunk::parse(wire, collecting(warnings));
            CHECK(c.serialized_size() == 54);
            CHECK(warnings.empty());
        }

        SUBCASE("strict rejection") {
            parse_options opts;
            opts.allow_trailing_data = false;
            CHECK_THROWS_AS(chunk::parse(wire, opts), parse_error);
            CHECK_NOTHROW((void)chunk::parse(secret_wire(), opts));
        }

        SUBCASE("lenient warning") {
            std::vector<warning_record> warnings;
            auto opts = collecting(warnings);
            opts.strict = false;
            opts.allow_trailing_data = false;

            auto c = chunk::parse(wire, opts);
            CHECK(c == chunk::parse(secret_wire()));
            REQUIRE(warnings.size() == 1);
            CHECK(warnings[0].category == "trailing_data");
            CHECK(warnings[0].offset == 54);
            CHECK(warnings[0].message.find("2 bytes") != std::string::npos);
        }
    }

    TEST_CASE("nonconforming type") {
        SUBCASE("reported but accepted") {
            std::vector<warning_record> warnings;
            chunk original(chunk_type("Rust"), bytes_of("x"));

            auto c = chunk::parse(original.to_bytes(), collecting(warnings));
            CHECK(c == original);
            REQUIRE(warnings.size() == 1);
            CHECK(warnings[0].category == "nonconforming_type");
            CHECK(warnings[0].offset == 4);
        }

        SUBCASE("conforming type is silent") {
            std::vector<warning_record> warnings;
            (void)chunk::parse(secret_wire(), collecting(warnings));
            CHECK(warnings.empty());
        }
    }

    TEST_CASE("length and crc checks ignore strictness") {
        parse_options opts;
        opts.strict = false;
        auto wire = make_wire(42, "RuSt", secret_message, secret_message_crc ^ 1u);
        CHECK_THROWS_AS(chunk::parse(wire, opts), invalid_crc);
    }
}
