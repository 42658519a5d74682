/**
 * @file test_api.cpp
 * @brief Tests for the high-level decode API and error reporting.
 *
 * @authors resp3 contributors
 */

#include <catch2/catch.hpp>
#include <resp3/resp3.hpp>

#include <set>
#include <string>

using namespace resp3;

TEST_CASE("Decode from string view", "[api]") {
    Value value;
    REQUIRE(decode("+OK\r\n", value) == Error::Ok);
    REQUIRE(value.get<SimpleString>().text == "OK");
}

TEST_CASE("Decode from byte buffer", "[api]") {
    std::uint8_t data[] = {'*', '1', '\r', '\n', ':', '4', '2', '\r', '\n'};
    Value value;
    REQUIRE(decode(data, sizeof(data), value) == Error::Ok);
    REQUIRE(value.get<Array>()[0].get<Number>().value == 42);
}

TEST_CASE("Scalars borrow from the message buffer", "[api]") {
    std::string message = "*2\r\n+Hello\r\n$5\r\nWorld\r\n";
    Value value;
    REQUIRE(decode(message, value) == Error::Ok);

    const auto& array = value.get<Array>();
    REQUIRE(array[0].get<SimpleString>().text.data() == message.data() + 5);
    REQUIRE(array[1].get<BlobString>().bytes.data() == message.data() + 16);
}

TEST_CASE("decode_or_throw", "[api]") {
    SECTION("returns the value") {
        Value value = decode_or_throw(":12\r\n");
        REQUIRE(value.get<Number>().value == 12);
    }

    SECTION("throws with the error code") {
        REQUIRE_THROWS_AS(decode_or_throw("*2\r\n+key\r\n>1\r\n+get\r\n"), DecodeException);

        try {
            (void)decode_or_throw(">0\r\n");
            FAIL("expected DecodeException");
        } catch (const DecodeException& e) {
            REQUIRE(e.code() == Error::PushZeroLength);
            REQUIRE(std::string(e.what()) == error_string(Error::PushZeroLength));
        }
    }
}

TEST_CASE("Error strings", "[api]") {
    const Error errors[] = {Error::Ok,
                            Error::EndOfMessage,
                            Error::ExpectedLength,
                            Error::InvalidCharacter,
                            Error::ExpectedCRLF,
                            Error::ExpectedEOL,
                            Error::UnexpectedCharacterAfterNull,
                            Error::InvalidVerbatimStringFormat,
                            Error::InvalidCharacterAfterVerbatimFormat,
                            Error::PushZeroLength,
                            Error::PushExpectedString,
                            Error::IllegalPushPosition,
                            Error::InternalError,
                            Error::Unsupported,
                            Error::NestingTooDeep};

    std::set<std::string> seen;
    for (auto error : errors) {
        std::string text = error_string(error);
        REQUIRE(text != "Unknown error");
        seen.insert(text);
    }
    REQUIRE(seen.size() == sizeof(errors) / sizeof(errors[0]));
}

TEST_CASE("Version", "[api]") {
    REQUIRE(std::string(version()) == "1.0.0");
    REQUIRE(VERSION_MAJOR == 1);
}
