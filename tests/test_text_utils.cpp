#include <catch2/catch_test_macros.hpp>

#include "order_voice/utils/text.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("remove_emojis strips emoji codepoints") {
    const std::string emoji = "\xF0\x9F\x98\x80";
    const std::string input = "Hello " + emoji + " world";
    const std::string expected = "Hello  world";
    REQUIRE(order_voice::utils::remove_emojis(input) == expected);
}

TEST_CASE("remove_emojis leaves plain ASCII untouched") {
    const std::string input = "Plain text only.";
    REQUIRE(order_voice::utils::remove_emojis(input) == input);
}

TEST_CASE("trim removes surrounding whitespace only") {
    REQUIRE(order_voice::utils::trim("  order 1003 \n\t") == "order 1003");
    REQUIRE(order_voice::utils::trim("   ").empty());
}

TEST_CASE("split_sentences keeps every character") {
    const std::string reply = "Your order has shipped. It should arrive Friday! Anything else?";
    const auto sentences = order_voice::utils::split_sentences(reply);
    REQUIRE(sentences.size() == 3);
    REQUIRE(sentences[0] == "Your order has shipped. ");
    REQUIRE(sentences[2] == "Anything else?");

    std::string joined;
    for (const auto& sentence : sentences) {
        joined += sentence;
    }
    REQUIRE(joined == reply);
}

TEST_CASE("split_sentences does not break inside numbers") {
    const auto sentences = order_voice::utils::split_sentences("The total is $114.99 in all");
    REQUIRE(sentences.size() == 1);
}

TEST_CASE("base64 decoding accepts both alphabets and rejects junk") {
    REQUIRE(order_voice::utils::encode_base64("hi?>") == "aGk/Pg==");
    REQUIRE(order_voice::utils::decode_base64("aGk/Pg==") == "hi?>");
    REQUIRE(order_voice::utils::decode_base64("aGk_Pg") == "hi?>");
    REQUIRE_THROWS_AS(order_voice::utils::decode_base64("a$b="), std::invalid_argument);
}

TEST_CASE("base64 decoding refuses data after padding and keeps binary bytes") {
    REQUIRE_THROWS_AS(order_voice::utils::decode_base64("aGk=Pg=="), std::invalid_argument);
    REQUIRE(order_voice::utils::decode_base64("aGk/\nPg==") == "hi?>");

    const std::string pcm("\x00\xff\x10\x80\x7f", 5);
    REQUIRE(order_voice::utils::decode_base64(order_voice::utils::encode_base64(pcm)) == pcm);
}
