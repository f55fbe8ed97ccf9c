#include <doctest/doctest.h>
#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    std::vector<std::byte> testing_png() {
        return png_of({
            chunk::from_strings("FrSt", "I am the first chunk"),
            chunk::from_strings("miDl", "I am another chunk"),
            chunk::from_strings("LASt", "I am the last chunk")
        });
    }
}

TEST_SUITE("CONTAINER") {
    TEST_CASE("container parse") {
        SUBCASE("hand-built chunk stream") {
            auto png = container::parse(testing_png());
            CHECK(png.size() == 3);
            CHECK(type_names(png) == std::vector<std::string>{"FrSt", "miDl", "LASt"});
            CHECK(png.chunks()[1].interpret_data_as_text() == "I am another chunk");
            CHECK(png.header() == container::signature);
        }

        SUBCASE("real image") {
            auto png = container::parse(tiny_png());
            CHECK(type_names(png) == std::vector<std::string>{"IHDR", "IDAT", "IEND"});
            CHECK(png.chunks()[0].length() == 13);
            CHECK(png.chunks()[1].crc() == 0xEB47BA92u);
            CHECK(png.chunks()[2].length() == 0);
        }

        SUBCASE("signature only") {
            auto png = container::parse(png_signature());
            CHECK(png.empty());
        }

        SUBCASE("raw pointer overload") {
            auto bytes = tiny_png();
            auto png = container::parse(bytes.data(), bytes.size());
            CHECK(png.size() == 3);
        }
    }

    TEST_CASE("container round trip") {
        SUBCASE("bytes are reproduced exactly") {
            auto bytes = tiny_png();
            CHECK(container::parse(bytes).to_wire_bytes() == bytes);

            auto other = testing_png();
            CHECK(container::parse(other).to_wire_bytes() == other);
        }

        SUBCASE("structure is reproduced") {
            auto png = container::parse(testing_png());
            CHECK(container::parse(png.to_wire_bytes()) == png);
        }

        SUBCASE("empty container serializes to the signature") {
            container png;
            CHECK(png.to_wire_bytes() == png_signature());
        }
    }

    TEST_CASE("container header gate") {
        SUBCASE("any wrong signature byte") {
            auto good = testing_png();
            for (std::size_t i = 0; i < 8; i++) {
                CAPTURE(i);
                auto bytes = good;
                bytes[i] ^= std::byte{0x01};
                try {
                    (void)container::parse(bytes);
                    FAIL("Should have thrown exception");
                } catch (const header_error& e) {
                    CHECK(e.code() == error_code::bad_header);
                    REQUIRE(e.found().size() == 8);
                    CHECK(e.found()[i] == (container::signature[i] ^ 0x01));
                }
            }
        }

        SUBCASE("first byte 13") {
            auto bytes = testing_png();
            bytes[0] = std::byte{13};
            CHECK_THROWS_AS(container::parse(bytes), header_error);
        }

        SUBCASE("fewer than 8 bytes") {
            auto bytes = make_bytes({137, 80, 78, 71});
            try {
                (void)container::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const header_error& e) {
                CHECK(e.code() == error_code::missing_header);
                CHECK(e.found().size() == 4);
            }
        }

        SUBCASE("empty buffer") {
            CHECK_THROWS_AS(container::parse(std::vector<std::byte>{}), header_error);
        }
    }

    TEST_CASE("container rejects damaged chunks") {
        SUBCASE("bad crc anywhere aborts the whole parse") {
            auto bytes = tiny_png();
            // last byte of IDAT's crc
            bytes[8 + 25 + 24] ^= std::byte{0xFF};
            CHECK_THROWS_AS(container::parse(bytes), crc_error);
        }

        SUBCASE("last chunk cut short") {
            auto bytes = tiny_png();
            bytes.pop_back();
            try {
                (void)container::parse(bytes);
                FAIL("Should have thrown exception");
            } catch (const parse_error& e) {
                CHECK(e.code() == error_code::truncated);
            }
        }

        SUBCASE("bad type in the middle") {
            auto bytes = png_signature();
            append(bytes, chunk::from_strings("IHDR", "x").as_wire_bytes());
            append(bytes, raw_chunk("ID4T", "", 0));
            append(bytes, chunk::from_strings("IEND", "").as_wire_bytes());
            CHECK_THROWS_AS(container::parse(bytes), invalid_byte_error);
        }
    }

    TEST_CASE("container insert") {
        SUBCASE("new chunk goes before the last one") {
            auto png = container::parse(png_of({
                chunk::from_strings("AAAa", "a"),
                chunk::from_strings("BBBb", "b"),
                chunk::from_strings("IEND", "")
            }));
            png.insert(chunk::from_strings("XXXx", "x"));
            CHECK(type_names(png) == std::vector<std::string>{"AAAa", "BBBb", "XXXx", "IEND"});

            png.insert(chunk::from_strings("YYYy", "y"));
            CHECK(type_names(png) == std::vector<std::string>{"AAAa", "BBBb", "XXXx", "YYYy", "IEND"});
        }

        SUBCASE("empty container gets the chunk as sole element") {
            container png;
            png.insert(chunk::from_strings("IEND", ""));
            CHECK(type_names(png) == std::vector<std::string>{"IEND"});
        }

        SUBCASE("last element is not checked for IEND") {
            auto png = container::parse(testing_png());
            png.insert(chunk::from_strings("ruSt", "hidden"));
            CHECK(type_names(png) == std::vector<std::string>{"FrSt", "miDl", "ruSt", "LASt"});
        }

        SUBCASE("append puts the chunk last") {
            container png;
            png.append(chunk::from_strings("IHDR", "h"));
            png.append(chunk::from_strings("IEND", ""));
            CHECK(type_names(png) == std::vector<std::string>{"IHDR", "IEND"});
        }
    }

    TEST_CASE("container remove") {
        auto png = container::parse(png_of({
            chunk::from_strings("AAAa", "first"),
            chunk::from_strings("BBBb", "middle"),
            chunk::from_strings("AAAa", "second")
        }));

        SUBCASE("only the first match is removed") {
            auto removed = png.remove_first_by_type("AAAa");
            CHECK(removed.interpret_data_as_text() == "first");
            CHECK(type_names(png) == std::vector<std::string>{"BBBb", "AAAa"});
            CHECK(png.chunks()[1].interpret_data_as_text() == "second");
        }

        SUBCASE("no match") {
            CHECK_THROWS_AS(png.remove_first_by_type("CCCc"), not_found_error);
            CHECK(png.size() == 3);
        }

        SUBCASE("type match is case sensitive") {
            CHECK_THROWS_AS(png.remove_first_by_type("aaaa"), not_found_error);
        }

        SUBCASE("malformed query") {
            CHECK_THROWS_AS(png.remove_first_by_type("AAA"), format_error);
            CHECK_THROWS_AS(png.remove_first_by_type("AA1a"), invalid_byte_error);
            CHECK(png.size() == 3);
        }

        SUBCASE("empty container") {
            container empty;
            CHECK_THROWS_AS(empty.remove_first_by_type("IEND"), not_found_error);
        }
    }

    TEST_CASE("container find") {
        auto png = container::parse(testing_png());

        SUBCASE("found") {
            const auto* c = png.find_first_by_type("miDl");
            REQUIRE(c != nullptr);
            CHECK(c->interpret_data_as_text() == "I am another chunk");
            CHECK(c == &png.chunks()[1]);
        }

        SUBCASE("not found") {
            CHECK(png.find_first_by_type("IEND") == nullptr);
        }

        SUBCASE("malformed query is not an error") {
            CHECK(png.find_first_by_type("miD") == nullptr);
            CHECK(png.find_first_by_type("mi1l") == nullptr);
            CHECK(png.find_first_by_type("") == nullptr);
            CHECK(png.find_first_by_type("m\xc3\xa9l") == nullptr);
        }

        SUBCASE("first of several") {
            png.insert(chunk::from_strings("miDl", "again"));
            const auto* c = png.find_first_by_type("miDl");
            REQUIRE(c != nullptr);
            CHECK(c->interpret_data_as_text() == "I am another chunk");
        }
    }

    TEST_CASE("container chunks view is live") {
        container png;
        const auto& view = png.chunks();
        CHECK(view.empty());
        png.insert(chunk::from_strings("IEND", ""));
        CHECK(view.size() == 1);
        (void)png.remove_first_by_type("IEND");
        CHECK(view.empty());
    }

    TEST_CASE("container equality") {
        auto a = container::parse(testing_png());
        auto b = container::parse(testing_png());
        CHECK(a == b);
        b.insert(chunk::from_strings("ruSt", "x"));
        CHECK(a != b);
        CHECK(container() == container::parse(png_signature()));
    }

    TEST_CASE("container stream output") {
        container png;
        png.insert(chunk::from_strings("IEND", ""));
        std::ostringstream oss;
        oss << png;
        auto text = oss.str();
        CHECK(text.rfind("Header: [137, 80, 78, 71, 13, 10, 26, 10]\n", 0) == 0);
        CHECK(text.find("Type: 'IEND'") != std::string::npos);
    }
}
