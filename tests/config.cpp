#include <doctest/doctest.h>
#include "datauri/config.hpp"
#include "datauri/builder.hpp"
#include "datauri/logging.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace datauri;

TEST_CASE("CodecConfig - Defaults") {
    CodecConfig config;
    CHECK(config.copyBufferSize == kDefaultBufferSize);
    CHECK(config.base64ByDefault);
    CHECK(config.logLevel == "info");
}

TEST_CASE("CodecConfig - Partial JSON keeps defaults") {
    auto config = CodecConfig::fromJsonString(R"({"copyBufferSize": 16})");
    CHECK(config.copyBufferSize == 16);
    CHECK(config.base64ByDefault);
    CHECK(config.logLevel == "info");

    auto empty = CodecConfig::fromJsonString("{}");
    CHECK(empty.copyBufferSize == kDefaultBufferSize);
}

TEST_CASE("CodecConfig - Invalid JSON") {
    CHECK_THROWS_AS(CodecConfig::fromJsonString("{not json"), IoError);
    CHECK_THROWS_AS(CodecConfig::fromJsonString("[1, 2]"), IoError);
    CHECK_THROWS_AS(CodecConfig::fromJsonString(R"({"base64ByDefault": "yes"})"), IoError);
}

TEST_CASE("CodecConfig - Buffer size range") {
    CHECK_THROWS_AS(CodecConfig::fromJsonString(R"({"copyBufferSize": -1})"), IoError);
    CHECK_THROWS_AS(CodecConfig::fromJsonString(R"({"copyBufferSize": 0})"), IoError);
    CHECK_THROWS_AS(CodecConfig::fromJsonString(R"({"copyBufferSize": 1.5})"), IoError);
    CHECK_THROWS_AS(CodecConfig::fromJsonString(R"({"copyBufferSize": 16777217})"), IoError);

    auto largest = CodecConfig::fromJsonString(R"({"copyBufferSize": 16777216})");
    CHECK(largest.copyBufferSize == kMaxCopyBufferSize);

    auto config = CodecConfig::fromJsonString(R"({"copyBufferSize": 1})");
    std::istringstream in("abc");
    CHECK(DataUriBuilder::fromBytes(in, config).build() == "data:;base64,YWJj");
}

TEST_CASE("CodecConfig - From file") {
    const std::string path = "datauri_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"base64ByDefault": false, "logLevel": "warn"})";
    }

    auto config = CodecConfig::fromFile(path);
    CHECK_FALSE(config.base64ByDefault);
    CHECK(config.logLevel == "warn");

    std::remove(path.c_str());
}

TEST_CASE("CodecConfig - Missing file") {
    try {
        CodecConfig::fromFile("/nonexistent/datauri.json");
        FAIL("expected IoError");
    } catch (const IoError& e) {
        CHECK(e.errorCode() == DataUriErrorCode::IO_ERROR);
        CHECK(std::string(e.what()).find("/nonexistent/datauri.json") != std::string::npos);
    }
}

TEST_CASE("CodecConfig - Apply log level") {
    CodecConfig config;
    config.logLevel = "off";
    CHECK_NOTHROW(config.apply());

    config.logLevel = "info";
    CHECK_NOTHROW(config.apply());
}
