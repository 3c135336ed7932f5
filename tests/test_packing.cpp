/**
 * @file test_packing.cpp
 * @brief Unit tests for slot addressing and bit-field primitives.
 */

#include <bitlongvec/packing.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace bitlongvec;

TEST_CASE("low_mask", "[packing]") {
    REQUIRE(low_mask(0) == 0U);
    REQUIRE(low_mask(1) == 1U);
    REQUIRE(low_mask(10) == 1023U);
    REQUIRE(low_mask(63) == 0x7FFFFFFFFFFFFFFFULL);

    SECTION("full word width does not overflow the shift") {
        REQUIRE(low_mask(64) == 0xFFFFFFFFFFFFFFFFULL);
    }
}

TEST_CASE("max_value", "[packing]") {
    REQUIRE(max_value(4) == 15U);
    REQUIRE(max_value(5) == 31U);
    REQUIRE(max_value(6) == 63U);
    REQUIRE(max_value(7) == 127U);
    REQUIRE(max_value(8) == 255U);
    REQUIRE(max_value(14) == 16383U);
    REQUIRE(max_value(64) == std::numeric_limits<word_t>::max());
}

TEST_CASE("bit width validation", "[packing]") {
    REQUIRE_FALSE(is_valid_bit_width(0));
    REQUIRE(is_valid_bit_width(1));
    REQUIRE(is_valid_bit_width(64));
    REQUIRE_FALSE(is_valid_bit_width(65));
    REQUIRE_FALSE(is_valid_bit_width(128));
}

TEST_CASE("capacity overflow detection", "[packing]") {
    constexpr std::size_t max_size = std::numeric_limits<std::size_t>::max();

    REQUIRE(fits_capacity(max_size, 1));
    REQUIRE_FALSE(fits_capacity(max_size, 2));
    REQUIRE(fits_capacity(max_size / 64, 64));
    REQUIRE_FALSE(fits_capacity(max_size / 64 + 1, 64));
}

TEST_CASE("words_required", "[packing]") {
    SECTION("100 values of 10 bits") {
        // ceil(1000 / 64) = 16
        REQUIRE(words_required(100, 10) == 16);
    }

    SECTION("exact multiples of the word size") {
        REQUIRE(words_required(2048, 4) == 128);
        REQUIRE(words_required(4096, 4) == 256);
        REQUIRE(words_required(2048, 8) == 256);
        REQUIRE(words_required(4096, 8) == 512);
        REQUIRE(words_required(4096, 14) == 896);
        REQUIRE(words_required(3, 64) == 3);
    }

    SECTION("partial last word") {
        REQUIRE(words_required(1, 1) == 1);
        REQUIRE(words_required(7, 9) == 1);
        REQUIRE(words_required(65, 1) == 2);
        REQUIRE(words_required(9, 14) == 2);
    }

    SECTION("empty vector needs no storage") {
        REQUIRE(words_required(0, 10) == 0);
    }
}

TEST_CASE("locate", "[packing]") {
    SECTION("slot inside a single word") {
        SlotSpan span = locate(5, 10);
        REQUIRE(span.start_word == 0);
        REQUIRE(span.start_offset == 50);
        REQUIRE(span.end_word == 0);
        REQUIRE_FALSE(span.spans_two_words());
    }

    SECTION("slot straddling words 0 and 1") {
        // bits 60-69
        SlotSpan span = locate(6, 10);
        REQUIRE(span.start_word == 0);
        REQUIRE(span.start_offset == 60);
        REQUIRE(span.end_word == 1);
        REQUIRE(span.spans_two_words());
    }

    SECTION("slot starting in the second word") {
        SlotSpan span = locate(7, 10);
        REQUIRE(span.start_word == 1);
        REQUIRE(span.start_offset == 6);
        REQUIRE(span.end_word == 1);
    }

    SECTION("slot ending exactly on a word boundary") {
        SlotSpan span = locate(15, 4);
        REQUIRE(span.start_word == 0);
        REQUIRE(span.start_offset == 60);
        REQUIRE(span.end_word == 0);
    }

    SECTION("full-word slots are always aligned") {
        SlotSpan span = locate(2, 64);
        REQUIRE(span.start_word == 2);
        REQUIRE(span.start_offset == 0);
        REQUIRE(span.end_word == 2);
    }
}

TEST_CASE("deposit and extract", "[packing]") {
    SECTION("cross-word deposit splits the value") {
        word_t words[2] = {0, 0};
        deposit(words, locate(6, 10), 10, 0x3FF);

        REQUIRE(words[0] == 0xF000000000000000ULL);
        REQUIRE(words[1] == 0x3FULL);
        REQUIRE(extract(words, locate(6, 10), 10) == 0x3FF);
    }

    SECTION("deposit clears only the field") {
        word_t words[2] = {~word_t{0}, ~word_t{0}};
        deposit(words, locate(6, 10), 10, 0);

        REQUIRE(words[0] == 0x0FFFFFFFFFFFFFFFULL);
        REQUIRE(words[1] == 0xFFFFFFFFFFFFFFC0ULL);
        REQUIRE(extract(words, locate(5, 10), 10) == 1023);
        REQUIRE(extract(words, locate(7, 10), 10) == 1023);
    }

    SECTION("extract ignores neighbouring bits") {
        word_t words[1] = {0xABCDULL};
        REQUIRE(extract(words, locate(0, 4), 4) == 0xD);
        REQUIRE(extract(words, locate(1, 4), 4) == 0xC);
        REQUIRE(extract(words, locate(2, 4), 4) == 0xB);
        REQUIRE(extract(words, locate(3, 4), 4) == 0xA);
        REQUIRE(extract(words, locate(4, 4), 4) == 0x0);
    }

    SECTION("full word field") {
        word_t words[2] = {0, 0};
        deposit(words, locate(1, 64), 64, 0x0123456789ABCDEFULL);
        REQUIRE(words[0] == 0);
        REQUIRE(words[1] == 0x0123456789ABCDEFULL);
        REQUIRE(extract(words, locate(1, 64), 64) == 0x0123456789ABCDEFULL);
    }
}
