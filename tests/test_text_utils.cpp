#include <catch2/catch_test_macros.hpp>
#include "processing/TextUtils.hpp"
#include <string>

using namespace processing;

TEST_CASE("TextUtils - utf8ToUtf32 decodes multi-byte sequences", "[text_utils]")
{
    REQUIRE(utf8ToUtf32("abc") == U"abc");
    REQUIRE(utf8ToUtf32("é«»") == U"é«»");
    REQUIRE(utf8ToUtf32("a\u202Fb") == U"a\u202Fb");
    REQUIRE(utf8ToUtf32("").empty());
}

TEST_CASE("TextUtils - utf32ToUtf8 encodes back to the original bytes", "[text_utils]")
{
    std::string text = "Qu’est-ce\u202F? «\u202Foui\u202F» こんにちは";
    REQUIRE(utf32ToUtf8(utf8ToUtf32(text)) == text);
}

TEST_CASE("TextUtils - utf8ToUtf32 throws on invalid input", "[text_utils]")
{
    std::string bad = std::string("ab") + '\xC3';
    REQUIRE_THROWS_AS(utf8ToUtf32(bad), InvalidEncodingError);
}

TEST_CASE("TextUtils - find_invalid_utf8 locates the first bad byte", "[text_utils]")
{
    REQUIRE_FALSE(find_invalid_utf8("plain ascii").has_value());
    REQUIRE_FALSE(find_invalid_utf8("«\u202Foui\u202F»").has_value());
    REQUIRE_FALSE(find_invalid_utf8("").has_value());

    REQUIRE(find_invalid_utf8(std::string(1, '\xFF')) == std::optional<std::size_t>(0));
    REQUIRE(find_invalid_utf8(std::string("ok ") + '\xE2' + '\x80') == std::optional<std::size_t>(3));
    REQUIRE(find_invalid_utf8(std::string("é") + '\x80' + "x") == std::optional<std::size_t>(2));
}

TEST_CASE("TextUtils - require_valid_utf8 reports the offset", "[text_utils]")
{
    REQUIRE_NOTHROW(require_valid_utf8("Bonjour\u202F!"));
    REQUIRE(is_valid_utf8("Bonjour"));

    std::string bad = std::string("abcd") + '\xFE';
    REQUIRE_FALSE(is_valid_utf8(bad));
    try
    {
        require_valid_utf8(bad);
        FAIL("expected InvalidEncodingError");
    }
    catch (const InvalidEncodingError& ex)
    {
        REQUIRE(ex.offset() == 4);
    }
}

TEST_CASE("TextUtils - character classes", "[text_utils]")
{
    REQUIRE(isFrenchSpacing(U' '));
    REQUIRE(isFrenchSpacing(NBSP));
    REQUIRE(isFrenchSpacing(NARROW_NBSP));
    REQUIRE_FALSE(isFrenchSpacing(U'\t'));
    REQUIRE_FALSE(isFrenchSpacing(U'\n'));

    REQUIRE(isDoublePunctuation(U':'));
    REQUIRE(isDoublePunctuation(U';'));
    REQUIRE(isDoublePunctuation(U'!'));
    REQUIRE(isDoublePunctuation(U'?'));
    REQUIRE_FALSE(isDoublePunctuation(U'.'));
    REQUIRE_FALSE(isDoublePunctuation(U','));

    REQUIRE(isLineBreak(U'\n'));
    REQUIRE(isLineBreak(U'\r'));
    REQUIRE_FALSE(isLineBreak(U' '));
}
