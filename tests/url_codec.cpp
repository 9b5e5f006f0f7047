#include <doctest/doctest.h>
#include "datauri/url_codec.hpp"

using namespace datauri;
using namespace datauri::url_codec;

TEST_CASE("FormDecode - Plus and escapes") {
    auto ascii = Charset::usAscii();

    CHECK(formDecode("hello+world", ascii) == U"hello world");
    CHECK(formDecode("%48%65llo", ascii) == U"Hello");
    CHECK(formDecode("a%2Bb%3Dc", ascii) == U"a+b=c");
    CHECK(formDecode("%2b%2B", ascii) == U"++");
    CHECK(formDecode("", ascii).empty());
}

TEST_CASE("FormDecode - Escape runs use the charset") {
    CHECK(formDecode("caf%C3%A9", Charset::utf8()) == U"café");
    CHECK(formDecode("caf%E9", Charset::forName("ISO-8859-1")) == U"café");
    CHECK(formDecode("%E9", Charset::usAscii()) == U"\uFFFD");
    CHECK(formDecode("%FE%FF%00%41", Charset::forName("UTF-16")) == U"A");
}

TEST_CASE("FormDecode - Literal text is read as UTF-8") {
    CHECK(formDecode("caf\xc3\xa9+ok", Charset::forName("ISO-8859-1")) == U"café ok");
}

TEST_CASE("FormDecode - Malformed escapes") {
    auto ascii = Charset::usAscii();

    CHECK_THROWS_AS(formDecode("50%", ascii), InvalidPercentEncodingError);
    CHECK_THROWS_AS(formDecode("%4", ascii), InvalidPercentEncodingError);
    CHECK_THROWS_AS(formDecode("%zz", ascii), InvalidPercentEncodingError);
    CHECK_THROWS_AS(formDecode("%41%g1", ascii), InvalidPercentEncodingError);

    try {
        formDecode("%", ascii);
        FAIL("expected InvalidPercentEncodingError");
    } catch (const DataUriError& e) {
        CHECK(e.errorCode() == DataUriErrorCode::INVALID_PERCENT_ENCODING);
    }
}

TEST_CASE("FormEncode - Unreserved characters and spaces") {
    auto ascii = Charset::usAscii();

    CHECK(formEncode(U"hello world", ascii) == "hello+world");
    CHECK(formEncode(U"AZaz09.-*_", ascii) == "AZaz09.-*_");
    CHECK(formEncode(U"~", ascii) == "%7E");
    CHECK(formEncode(U"a+b=c&d", ascii) == "a%2Bb%3Dc%26d");
    CHECK(formEncode(U"", ascii).empty());
}

TEST_CASE("FormEncode - Escape runs use the charset") {
    CHECK(formEncode(U"café", Charset::utf8()) == "caf%C3%A9");
    CHECK(formEncode(U"café", Charset::forName("ISO-8859-1")) == "caf%E9");
    CHECK(formEncode(U"é", Charset::usAscii()) == "%3F");
    CHECK(formEncode(U"é", Charset::forName("UTF-16")) == "%FE%FF%00%E9");
    CHECK(formEncode(U"é!", Charset::forName("UTF-16BE")) == "%00%E9%00%21");
}

TEST_CASE("FormEncode/FormDecode - Text survives a round trip") {
    const std::u32string text = U"Grüße, 世界! 100% \"quoted\" & more";
    for (const char* name : {"UTF-8", "UTF-16", "UTF-16LE"}) {
        CAPTURE(name);
        auto charset = Charset::forName(name);
        CHECK(formDecode(formEncode(text, charset), charset) == text);
    }
}

TEST_CASE("is_unreserved") {
    CHECK(is_unreserved(U'a'));
    CHECK(is_unreserved(U'*'));
    CHECK_FALSE(is_unreserved(U'~'));
    CHECK_FALSE(is_unreserved(U' '));
    CHECK_FALSE(is_unreserved(U'é'));
}
