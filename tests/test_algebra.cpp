/**
 * @file test_algebra.cpp
 * @brief Unit tests for AND, OR, XOR, AND-NOT, NOT and equality.
 */

#include <tailbits/algebra.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace tailbits;
using algebra::Op;

TEST_CASE("Algebra AND", "[algebra]") {
    SECTION("operands of different lengths") {
        WordVector a({0xF0F0U, 1U}, Tail::Zero);
        WordVector b({0xFF00U}, Tail::Zero);

        WordVector result = algebra::apply(Op::And, a, b);
        REQUIRE(result == WordVector({0xF000U}, Tail::Zero));
    }

    SECTION("with an indefinite operand keeps the finite high words") {
        WordVector a({0xFFU, 0x3U}, Tail::Zero);
        WordVector b({0x0FU}, Tail::One);

        WordVector result = algebra::apply(Op::And, a, b);
        REQUIRE(result == WordVector({0x0FU, 0x3U}, Tail::Zero));
    }

    SECTION("two indefinite operands stay indefinite") {
        WordVector a({0x1U}, Tail::One);
        WordVector b({0x2U}, Tail::One);

        WordVector result = algebra::apply(Op::And, a, b);
        REQUIRE(result.tail() == Tail::One);
        REQUIRE(result.word(0) == 0U);
    }
}

TEST_CASE("Algebra OR", "[algebra]") {
    SECTION("finite operands") {
        WordVector a({0x1U}, Tail::Zero);
        WordVector b({0x0U, 0x2U}, Tail::Zero);

        REQUIRE(algebra::apply(Op::Or, a, b) == WordVector({0x1U, 0x2U}, Tail::Zero));
    }

    SECTION("with an indefinite operand") {
        WordVector a({0x1U}, Tail::Zero);
        WordVector b({~word_t{0x3U}}, Tail::One);

        WordVector result = algebra::apply(Op::Or, a, b);
        REQUIRE(result.tail() == Tail::One);
        REQUIRE(result.word(0) == ~word_t{0x2U});
    }

    SECTION("filling every bit collapses to the full set") {
        WordVector a({0x0000FFFFU}, Tail::Zero);
        WordVector b({0xFFFF0000U}, Tail::One);

        WordVector result = algebra::apply(Op::Or, a, b);
        REQUIRE(result.empty());
        REQUIRE(result.tail() == Tail::One);
    }
}

TEST_CASE("Algebra XOR", "[algebra]") {
    SECTION("identical operands give the empty set") {
        WordVector a({0xDEADBEEFU, 0x1234U}, Tail::Zero);
        REQUIRE(algebra::apply(Op::Xor, a, a) == WordVector());
    }

    SECTION("finite with indefinite is indefinite") {
        WordVector a({0x5U}, Tail::Zero);
        WordVector b({}, Tail::One);

        WordVector result = algebra::apply(Op::Xor, a, b);
        REQUIRE(result == WordVector({~word_t{0x5U}}, Tail::One));
    }

    SECTION("two indefinite operands give a finite result") {
        WordVector a({0x5U}, Tail::One);
        WordVector b({0x6U, 0x0U}, Tail::One);

        WordVector result = algebra::apply(Op::Xor, a, b);
        REQUIRE(result.tail() == Tail::Zero);
        REQUIRE(result == WordVector({0x3U, ALL_ONES}, Tail::Zero));
    }
}

TEST_CASE("Algebra AND-NOT", "[algebra]") {
    SECTION("finite operands") {
        WordVector a({0xFFU}, Tail::Zero);
        WordVector b({0x0FU}, Tail::Zero);

        REQUIRE(algebra::apply(Op::AndNot, a, b) == WordVector({0xF0U}, Tail::Zero));
    }

    SECTION("subtracting an indefinite set") {
        WordVector a({0xFFU, 0xFFU}, Tail::Zero);
        WordVector b({0x0FU}, Tail::One);

        WordVector result = algebra::apply(Op::AndNot, a, b);
        REQUIRE(result == WordVector({0xF0U}, Tail::Zero));
    }

    SECTION("indefinite minus finite stays indefinite") {
        WordVector a({}, Tail::One);
        WordVector b({0x0U, 0x1U}, Tail::Zero);

        WordVector result = algebra::apply(Op::AndNot, a, b);
        REQUIRE(result == WordVector({ALL_ONES, ~word_t{1U}}, Tail::One));
    }
}

TEST_CASE("Algebra NOT", "[algebra]") {
    SECTION("empty set becomes the full set") {
        WordVector result = algebra::complement(WordVector());
        REQUIRE(result.empty());
        REQUIRE(result.tail() == Tail::One);
    }

    SECTION("complement inverts words and tail") {
        WordVector result = algebra::complement(WordVector({0xAU, 0x1U}, Tail::Zero));
        REQUIRE(result == WordVector({~word_t{0xAU}, ~word_t{0x1U}}, Tail::One));
    }

    SECTION("operand is not modified") {
        WordVector a({0xAU}, Tail::Zero);
        WordVector result = algebra::complement(a);
        REQUIRE(a == WordVector({0xAU}, Tail::Zero));
        REQUIRE_FALSE(result == a);
    }
}

TEST_CASE("Algebra equality", "[algebra]") {
    REQUIRE(algebra::equals(WordVector(), WordVector()));
    REQUIRE(algebra::equals(WordVector({0x7U}, Tail::Zero), WordVector({0x7U, 0x0U}, Tail::Zero)));
    REQUIRE(algebra::equals(WordVector({0x7U}, Tail::One), WordVector({0x7U, ALL_ONES}, Tail::One)));
    REQUIRE_FALSE(algebra::equals(WordVector({0x7U}, Tail::Zero), WordVector({0x7U}, Tail::One)));
    REQUIRE_FALSE(algebra::equals(WordVector({0x7U}, Tail::Zero), WordVector({0x7U, 1U}, Tail::Zero)));
    REQUIRE_FALSE(algebra::equals(WordVector(), WordVector({}, Tail::One)));
}
