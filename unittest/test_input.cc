#include <doctest/doctest.h>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include "../src/pngchunk/input.hh"
#include "../src/pngchunk/output.hh"
#include "test_utils.hh"

using namespace pngchunk;

TEST_CASE("input cursor") {
    auto bytes = make_bytes({0x12, 0x34, 0x56, 0x78, 'I', 'E', 'N', 'D', 0xAA});
    input in(bytes.data(), bytes.size());

    SUBCASE("big-endian integers") {
        CHECK(in.read<std::uint32_t>(byte_order::big) == 0x12345678u);
        CHECK(in.tell() == 4);
        CHECK(in.remaining() == 5);
    }

    SUBCASE("little-endian integers") {
        CHECK(in.read<std::uint16_t>(byte_order::little) == 0x3412u);
    }

    SUBCASE("chunk type") {
        in.seek(4, input::set);
        CHECK(in.read_chunk_type() == chunk_types::IEND);
    }

    SUBCASE("read past end") {
        in.seek(7, input::set);
        CHECK_THROWS_AS(in.read<std::uint32_t>(byte_order::big), parse_error);
        CHECK_THROWS_AS(input(bytes.data(), bytes.size()).read_exact(10), parse_error);
    }

    SUBCASE("short read returns what is left") {
        in.seek(7, input::set);
        std::byte out[4];
        CHECK(in.read(out, 4) == 2);
        CHECK(in.at_end());
        CHECK(in.read(out, 4) == 0);
    }

    SUBCASE("seek bounds") {
        CHECK_THROWS_AS(in.seek(10, input::set), parse_error);
        in.seek(5, input::set);
        CHECK_THROWS_AS(in.seek(5, input::cur), parse_error);
        CHECK(in.tell() == 5);
        in.seek(9, input::set);
        CHECK(in.at_end());
    }

    SUBCASE("sub input") {
        in.seek(4, input::cur);
        auto sub = in.create_subinput(4);
        CHECK(sub.size() == 4);
        CHECK(sub.read_chunk_type() == chunk_types::IEND);
        CHECK(in.tell() == 4);
        CHECK_THROWS_AS(in.create_subinput(6), parse_error);
    }
}

TEST_CASE("output appender") {
    std::vector<std::byte> buffer;
    output out(buffer);
    out.write(std::uint32_t(0x0A0B0C0D), byte_order::big);
    out.write_chunk_type(chunk_types::tEXt);
    out.write(std::uint16_t(0x0102), byte_order::little);
    CHECK(buffer == make_bytes({0x0A, 0x0B, 0x0C, 0x0D, 't', 'E', 'X', 't', 0x02, 0x01}));
}

TEST_CASE("byte swapping") {
    static_assert(swap16(0x1234) == 0x3412);
    static_assert(swap32(0x12345678u) == 0x78563412u);
    static_assert(swap64(0x0102030405060708ULL) == 0x0807060504030201ULL);
    static_assert(swap_byte_order(std::uint8_t(0xAB)) == 0xAB);
    static_assert(is_big_endian != is_little_endian);

    auto bytes = make_bytes({1, 2, 3, 4, 5, 6, 7, 8});
    input in(bytes.data(), bytes.size());
    CHECK(in.read<std::uint64_t>(byte_order::big) == 0x0102030405060708ULL);
    in.seek(0, input::set);
    CHECK(in.read<std::uint64_t>(byte_order::little) == 0x0807060504030201ULL);
}
