/**
 * @file test_codec.cpp
 * @brief Unit tests for parsing and rendering.
 */

#include <tailbits/codec.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace tailbits;

TEST_CASE("Codec parse binary", "[codec]") {
    WordVector vec;

    SECTION("plain digits") {
        REQUIRE(codec::parse_binary("1010", vec) == Error::Ok);
        REQUIRE(vec == WordVector({0b1010U}, Tail::Zero));
    }

    SECTION("prefixed digits") {
        REQUIRE(codec::parse_binary("0b1010", vec) == Error::Ok);
        REQUIRE(vec == WordVector({0b1010U}, Tail::Zero));

        REQUIRE(codec::parse_binary("0B1", vec) == Error::Ok);
        REQUIRE(vec == WordVector({0x1U}, Tail::Zero));
    }

    SECTION("leading zeros are canonicalized away") {
        REQUIRE(codec::parse_binary("0000", vec) == Error::Ok);
        REQUIRE(vec.empty());
    }

    SECTION("more than one word") {
        std::string text = "1" + std::string(39, '0');
        REQUIRE(codec::parse_binary(text, vec) == Error::Ok);
        REQUIRE(vec == WordVector({0x0U, 0x80U}, Tail::Zero));
    }

    SECTION("malformed input") {
        REQUIRE(codec::parse_binary("", vec) == Error::ParseError);
        REQUIRE(codec::parse_binary("0b", vec) == Error::ParseError);
        REQUIRE(codec::parse_binary("10201", vec) == Error::ParseError);
        REQUIRE(codec::parse_binary(" 101", vec) == Error::ParseError);
        REQUIRE(codec::parse_binary("0xff", vec) == Error::ParseError);
    }
}

TEST_CASE("Codec parse hex", "[codec]") {
    WordVector vec;

    SECTION("prefixed digits in either case") {
        REQUIRE(codec::parse_hex("0xaffe", vec) == Error::Ok);
        REQUIRE(vec == WordVector({0xAFFEU}, Tail::Zero));

        REQUIRE(codec::parse_hex("0XAFFE", vec) == Error::Ok);
        REQUIRE(vec == WordVector({0xAFFEU}, Tail::Zero));
    }

    SECTION("digits without prefix") {
        REQUIRE(codec::parse_hex("ff", vec) == Error::Ok);
        REQUIRE(vec == WordVector({0xFFU}, Tail::Zero));
    }

    SECTION("more than one word") {
        REQUIRE(codec::parse_hex("123456789", vec) == Error::Ok);
        REQUIRE(vec == WordVector({0x23456789U, 0x1U}, Tail::Zero));
    }

    SECTION("malformed input") {
        REQUIRE(codec::parse_hex("0x", vec) == Error::ParseError);
        REQUIRE(codec::parse_hex("0xg1", vec) == Error::ParseError);
        REQUIRE(codec::parse_hex("-1", vec) == Error::ParseError);
    }
}

TEST_CASE("Codec parse text picks the base from the prefix", "[codec]") {
    WordVector vec;

    REQUIRE(codec::parse_text("0x1F", vec) == Error::Ok);
    REQUIRE(vec == WordVector({31U}, Tail::Zero));

    REQUIRE(codec::parse_text("0b11111", vec) == Error::Ok);
    REQUIRE(vec == WordVector({31U}, Tail::Zero));

    REQUIRE(codec::parse_text("11111", vec) == Error::Ok);
    REQUIRE(vec == WordVector({31U}, Tail::Zero));

    REQUIRE(codec::parse_text("12", vec) == Error::ParseError);
}

TEST_CASE("Codec integers and index lists", "[codec]") {
    WordVector vec;

    SECTION("integer binary expansion") {
        codec::from_integer(0, vec);
        REQUIRE(vec.empty());

        codec::from_integer(8, vec);
        REQUIRE(vec == WordVector({0x8U}, Tail::Zero));

        codec::from_integer(0x100000001ULL, vec);
        REQUIRE(vec == WordVector({0x1U, 0x1U}, Tail::Zero));
    }

    SECTION("index list") {
        REQUIRE(codec::from_indices({2, 4, 6}, vec) == Error::Ok);
        REQUIRE(vec == WordVector({0x54U}, Tail::Zero));

        REQUIRE(codec::from_indices({100}, vec) == Error::Ok);
        REQUIRE(vec.size() == 4);
        REQUIRE(vec.word(3) == 0x10U);

        REQUIRE(codec::from_indices({3, 3, 3}, vec) == Error::Ok);
        REQUIRE(vec == WordVector({0x8U}, Tail::Zero));

        REQUIRE(codec::from_indices({}, vec) == Error::Ok);
        REQUIRE(vec.empty());
    }

    SECTION("index list sized by its highest index") {
        REQUIRE(codec::from_indices({31}, vec) == Error::Ok);
        REQUIRE(vec.size() == 1);
        REQUIRE(vec.word(0) == 0x80000000U);

        REQUIRE(codec::from_indices({0, 32}, vec) == Error::Ok);
        REQUIRE(vec.size() == 2);
        REQUIRE(vec.word(1) == 0x1U);
    }

    SECTION("negative index is malformed") {
        REQUIRE(codec::from_indices({1, -1}, vec) == Error::ParseError);
    }
}

TEST_CASE("Codec bytes", "[codec]") {
    WordVector vec;

    SECTION("little endian") {
        const std::uint8_t data[] = {0x01, 0x80};
        codec::from_bytes(data, 2, ByteOrder::LittleEndian, vec);
        REQUIRE(vec == WordVector({0x8001U}, Tail::Zero));
    }

    SECTION("big endian") {
        const std::uint8_t data[] = {0x01, 0x80};
        codec::from_bytes(data, 2, ByteOrder::BigEndian, vec);
        REQUIRE(vec == WordVector({0x0180U}, Tail::Zero));
    }

    SECTION("more than one word") {
        const std::uint8_t data[] = {0x01, 0x02, 0x03, 0x04, 0x05};
        codec::from_bytes(data, 5, ByteOrder::LittleEndian, vec);
        REQUIRE(vec == WordVector({0x04030201U, 0x05U}, Tail::Zero));
    }

    SECTION("store little and big endian") {
        std::vector<std::uint8_t> out;
        REQUIRE(codec::to_bytes(WordVector({0x8001U}, Tail::Zero), ByteOrder::LittleEndian, out) ==
                Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0x01, 0x80});

        REQUIRE(codec::to_bytes(WordVector({0x8001U}, Tail::Zero), ByteOrder::BigEndian, out) ==
                Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0x80, 0x01});
    }

    SECTION("store uses the minimal length") {
        std::vector<std::uint8_t> out;
        REQUIRE(codec::to_bytes(WordVector({0x0U, 0x80U}, Tail::Zero), ByteOrder::LittleEndian,
                                out) == Error::Ok);
        REQUIRE(out == std::vector<std::uint8_t>{0x00, 0x00, 0x00, 0x00, 0x80});

        REQUIRE(codec::to_bytes(WordVector(), ByteOrder::LittleEndian, out) == Error::Ok);
        REQUIRE(out.empty());
    }

    SECTION("indefinite set cannot be stored") {
        std::vector<std::uint8_t> out;
        REQUIRE(codec::to_bytes(WordVector({}, Tail::One), ByteOrder::LittleEndian, out) ==
                Error::UndefinedForIndefiniteSet);
    }
}

TEST_CASE("Codec parse dispatches on the input shape", "[codec]") {
    WordVector vec;

    REQUIRE(codec::parse(Input{std::string("0x10")}, vec) == Error::Ok);
    REQUIRE(vec == WordVector({0x10U}, Tail::Zero));

    REQUIRE(codec::parse(Input{std::uint64_t{5}}, vec) == Error::Ok);
    REQUIRE(vec == WordVector({0x5U}, Tail::Zero));

    REQUIRE(codec::parse(Input{IndexList{1, 3}}, vec) == Error::Ok);
    REQUIRE(vec == WordVector({0xAU}, Tail::Zero));

    REQUIRE(codec::parse(Input{ByteSequence{{0x12, 0x34}, ByteOrder::BigEndian}}, vec) ==
            Error::Ok);
    REQUIRE(vec == WordVector({0x1234U}, Tail::Zero));

    REQUIRE(codec::parse(Input{std::string("abc")}, vec) == Error::ParseError);
    REQUIRE(codec::parse(Input{IndexList{-4}}, vec) == Error::ParseError);
}

TEST_CASE("Codec to_string", "[codec]") {
    std::string out;

    SECTION("binary") {
        REQUIRE(codec::to_string(WordVector({0b1010U}, Tail::Zero), 2, out) == Error::Ok);
        REQUIRE(out == "1010");

        REQUIRE(codec::to_string(WordVector(), 2, out) == Error::Ok);
        REQUIRE(out == "0");

        REQUIRE(codec::to_string(WordVector({0x0U, 0x1U}, Tail::Zero), 2, out) == Error::Ok);
        REQUIRE(out == "1" + std::string(32, '0'));
    }

    SECTION("hexadecimal") {
        REQUIRE(codec::to_string(WordVector({0xAFFEU}, Tail::Zero), 16, out) == Error::Ok);
        REQUIRE(out == "affe");

        REQUIRE(codec::to_string(WordVector({0x23456789U, 0x1U}, Tail::Zero), 16, out) ==
                Error::Ok);
        REQUIRE(out == "123456789");
    }

    SECTION("other power-of-two bases") {
        REQUIRE(codec::to_string(WordVector({6U}, Tail::Zero), 4, out) == Error::Ok);
        REQUIRE(out == "12");

        REQUIRE(codec::to_string(WordVector({8U}, Tail::Zero), 8, out) == Error::Ok);
        REQUIRE(out == "10");

        REQUIRE(codec::to_string(WordVector({31U}, Tail::Zero), 32, out) == Error::Ok);
        REQUIRE(out == "v");
    }

    SECTION("octal digit straddling two words") {
        // 2^33 = 8^11
        REQUIRE(codec::to_string(WordVector({0x0U, 0x2U}, Tail::Zero), 8, out) == Error::Ok);
        REQUIRE(out == "1" + std::string(11, '0'));
    }

    SECTION("indefinite sets") {
        REQUIRE(codec::to_string(WordVector({}, Tail::One), 2, out) == Error::Ok);
        REQUIRE(out == "...1111");

        REQUIRE(codec::to_string(WordVector({~word_t{0b1010U}}, Tail::One), 2, out) == Error::Ok);
        REQUIRE(out == "...11110101");

        REQUIRE(codec::to_string(WordVector({0xFFFFFFF0U}, Tail::One), 16, out) == Error::Ok);
        REQUIRE(out == "...ffff0");
    }

    SECTION("unsupported base") {
        REQUIRE(codec::to_string(WordVector({1U}, Tail::Zero), 10, out) == Error::InvalidArg);
        REQUIRE(codec::to_string(WordVector({1U}, Tail::Zero), 0, out) == Error::InvalidArg);
    }
}

TEST_CASE("Codec to_array", "[codec]") {
    std::vector<std::size_t> out;

    REQUIRE(codec::to_array(WordVector({0x54U}, Tail::Zero), out) == Error::Ok);
    REQUIRE(out == std::vector<std::size_t>{2, 4, 6});

    REQUIRE(codec::to_array(WordVector({0x80000001U, 0x1U}, Tail::Zero), out) == Error::Ok);
    REQUIRE(out == std::vector<std::size_t>{0, 31, 32});

    REQUIRE(codec::to_array(WordVector(), out) == Error::Ok);
    REQUIRE(out.empty());

    REQUIRE(codec::to_array(WordVector({}, Tail::One), out) == Error::UndefinedForIndefiniteSet);
}
