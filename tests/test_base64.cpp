#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "datauri/base64.hpp"
#include <array>
#include <numeric>
#include <random>
#include <stdexcept>

using namespace datauri;

static std::vector<uint8_t> randomBytes(size_t size, unsigned seed) {
    std::vector<uint8_t> data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

TEST_CASE("Base64Encode - Empty input") {
    std::vector<uint8_t> empty;
    std::string encoded = base64Encode(empty);
    CHECK(encoded.empty());
}

TEST_CASE("Base64Encode - Single byte is padded") {
    std::vector<uint8_t> data = {0x4d}; // "M"
    CHECK(base64Encode(data) == "TQ==");
}

TEST_CASE("Base64Encode - Three and four bytes") {
    std::vector<uint8_t> man = {0x4d, 0x61, 0x6e};
    CHECK(base64Encode(man) == "TWFu");

    std::vector<uint8_t> many = {0x4d, 0x61, 0x6e, 0x79};
    CHECK(base64Encode(many) == "TWFueQ==");
}

TEST_CASE("Base64Encode - Binary data uses standard alphabet") {
    std::vector<uint8_t> data = {0x00, 0x01, 0x02, 0x03, 0xff, 0xfe, 0xfd};
    CHECK(base64Encode(data) == "AAECA//+/Q==");

    std::vector<uint8_t> data2 = {0xfb, 0xff};
    CHECK(base64Encode(data2) == "+/8=");
}

TEST_CASE("Base64Encode - Use std::array") {
    std::array<uint8_t, 3> arr = {0x4d, 0x61, 0x6e};
    CHECK(base64Encode(arr) == "TWFu");
}

TEST_CASE("Base64Decode - Empty input") {
    auto decoded = base64Decode("");
    CHECK(decoded.empty());
}

TEST_CASE("Base64Decode - Padding is optional") {
    std::vector<uint8_t> expected = {0x4d};
    CHECK(base64Decode("TQ") == expected);
    CHECK(base64Decode("TQ==") == expected);

    std::vector<uint8_t> expected2 = {0x4d, 0x61};
    CHECK(base64Decode("TWE") == expected2);
    CHECK(base64Decode("TWE=") == expected2);
}

TEST_CASE("Base64Decode - Standard alphabet characters") {
    std::vector<uint8_t> expected = {0xfb, 0xff};
    CHECK(base64Decode("+/8=") == expected);
}

TEST_CASE("Base64Decode - Invalid characters") {
    CHECK_THROWS_AS(base64Decode("TW@u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("TW-u"), InvalidBase64Error); // URL-safe chars not allowed
    CHECK_THROWS_AS(base64Decode("TW_u"), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("TW u"), InvalidBase64Error); // Whitespace is stripped by the caller
    CHECK_THROWS_AS(base64Decode("TWFu%"), InvalidBase64Error);
}

TEST_CASE("Base64Decode - Malformed padding") {
    CHECK_THROWS_AS(base64Decode("TQ="), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("TQ=x"), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("="), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("TWFu="), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("T==="), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("TQ==TQ=="), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("TWE=x"), InvalidBase64Error);
}

TEST_CASE("Base64Decode - Dangling single character") {
    CHECK_THROWS_AS(base64Decode("T"), InvalidBase64Error);
    CHECK_THROWS_AS(base64Decode("TWFuT"), InvalidBase64Error);
}

TEST_CASE("Base64Decode - Error code") {
    try {
        base64Decode("!!!!");
        FAIL("expected InvalidBase64Error");
    } catch (const DataUriError& e) {
        CHECK(e.errorCode() == DataUriErrorCode::INVALID_BASE64);
    }
}

TEST_CASE("Base64Encode/Decode - All byte values") {
    std::vector<uint8_t> original(256);
    std::iota(original.begin(), original.end(), 0);

    CHECK(base64Decode(base64Encode(original)) == original);
}

TEST_CASE("Base64Appender - Byte at a time") {
    std::string dest = "prefix:";
    Base64Appender appender(dest);
    const std::string input = "QUJD";
    for (char c : input) {
        appender.writeByte(static_cast<uint8_t>(c));
    }
    CHECK(dest == "prefix:QUJD");
}

TEST_CASE("Base64Appender - Slice larger than staging buffer") {
    std::vector<uint8_t> input(Base64Appender::kStagingSize * 3 + 17);
    for (size_t i = 0; i < input.size(); ++i) {
        input[i] = static_cast<uint8_t>('A' + i % 26);
    }

    std::string dest;
    Base64Appender appender(dest);
    appender.writeSlice(input);

    CHECK(dest == std::string(input.begin(), input.end()));
}

TEST_CASE("Base64Appender - Small slices keep order") {
    std::string dest;
    Base64Appender appender(dest);
    std::vector<uint8_t> first = {'a', 'b'};
    std::vector<uint8_t> second = {'c'};
    std::vector<uint8_t> empty;
    appender.writeSlice(first);
    appender.writeSlice(empty);
    appender.writeByte('=');
    appender.writeSlice(second);
    CHECK(dest == "ab=c");
}

TEST_CASE("Base64Encoder - Output does not depend on chunking") {
    auto data = randomBytes(5000, 42);
    const std::string expected = base64Encode(data);

    for (size_t chunk : {size_t{1}, size_t{2}, size_t{3}, size_t{7}, size_t{768},
                         size_t{1000}, size_t{4999}}) {
        CAPTURE(chunk);
        std::string out;
        Base64Appender appender(out);
        Base64Encoder encoder(appender);
        std::span<const uint8_t> rest(data);
        while (!rest.empty()) {
            size_t n = std::min(chunk, rest.size());
            encoder.update(rest.first(n));
            rest = rest.subspan(n);
        }
        encoder.finish();
        CHECK(out == expected);
    }
}

TEST_CASE("Base64Encoder - Update after finish") {
    std::string out;
    Base64Appender appender(out);
    Base64Encoder encoder(appender);
    std::vector<uint8_t> data = {1, 2};
    encoder.update(data);
    encoder.finish();
    encoder.finish();
    CHECK(out == "AQI=");
    CHECK_THROWS_AS(encoder.update(data), std::logic_error);
}
