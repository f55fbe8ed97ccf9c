//
// Hide a message in a PNG, read it back and strip it again
//

#include <doctest/doctest.h>
#include <pngchunk/container.hh>
#include <pngchunk/exceptions.hh>

#include "test_utils.hh"

using namespace pngchunk;

TEST_CASE("Message round trip") {
    SUBCASE("container holding only IEND") {
        auto png = container::parse(png_of({chunk::from_strings("IEND", "")}));

        // encode
        png.insert(chunk::from_strings("teXt", "hello"));
        CHECK(type_names(png) == std::vector<std::string>{"teXt", "IEND"});
        CHECK(png.chunks()[0].crc() == 0xA3F69134u);

        // store and reload
        auto stored = png.to_wire_bytes();
        auto reloaded = container::parse(stored);
        CHECK(reloaded == png);

        // decode
        const auto* message = reloaded.find_first_by_type("teXt");
        REQUIRE(message != nullptr);
        CHECK(message->interpret_data_as_text() == "hello");

        // remove
        auto removed = reloaded.remove_first_by_type("teXt");
        CHECK(removed.interpret_data_as_text() == "hello");
        CHECK(type_names(reloaded) == std::vector<std::string>{"IEND"});
        CHECK(reloaded.to_wire_bytes() == png_of({chunk::from_strings("IEND", "")}));
    }

    SUBCASE("real image keeps its pixels untouched") {
        auto original = tiny_png();
        auto png = container::parse(original);

        png.insert(chunk::from_strings("ruSt", "This is a secret message!"));
        auto with_message = png.to_wire_bytes();
        CHECK(with_message.size() == original.size() + 12 + 25);

        auto reloaded = container::parse(with_message);
        CHECK(type_names(reloaded) == std::vector<std::string>{"IHDR", "IDAT", "ruSt", "IEND"});
        CHECK(reloaded.chunks().back().type() == chunk_types::IEND);
        CHECK(reloaded.find_first_by_type("ruSt")->interpret_data_as_text() == "This is a secret message!");

        (void)reloaded.remove_first_by_type("ruSt");
        CHECK(reloaded.to_wire_bytes() == original);
    }

    SUBCASE("decoding a missing message") {
        auto png = container::parse(tiny_png());
        CHECK(png.find_first_by_type("teXt") == nullptr);
        CHECK_THROWS_AS(png.remove_first_by_type("teXt"), not_found_error);
    }
}
