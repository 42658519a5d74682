/**
 * @file test_reader.cpp
 * @brief Unit tests for Reader class.
 *
 * @authors resp3 contributors
 */

#include <catch2/catch.hpp>
#include <resp3/reader.hpp>

using namespace resp3;

TEST_CASE("Reader construction", "[reader]") {
    SECTION("with string view") {
        Reader reader("+OK\r\n");
        REQUIRE(reader.remaining() == 5);
        REQUIRE(reader.position() == 0);
    }

    SECTION("with byte array") {
        std::uint8_t data[] = {'_', '\r', '\n'};
        Reader reader(data, sizeof(data));
        REQUIRE(reader.remaining() == 3);
    }
}

TEST_CASE("Reader read_byte and peek", "[reader]") {
    Reader reader("ab");
    std::uint8_t byte = 0;

    REQUIRE(reader.peek(byte) == Error::Ok);
    REQUIRE(byte == 'a');
    REQUIRE(reader.position() == 0);

    REQUIRE(reader.read_byte(byte) == Error::Ok);
    REQUIRE(byte == 'a');
    REQUIRE(reader.read_byte(byte) == Error::Ok);
    REQUIRE(byte == 'b');

    REQUIRE(reader.read_byte(byte) == Error::EndOfMessage);
    REQUIRE(reader.peek(byte) == Error::EndOfMessage);
}

TEST_CASE("Reader read_line", "[reader]") {
    std::string_view line;

    SECTION("text up to CRLF") {
        Reader reader("OK\r\nrest");
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line == "OK");
        REQUIRE(reader.position() == 4);
    }

    SECTION("empty line") {
        Reader reader("\r\n");
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line.empty());
        REQUIRE(reader.remaining() == 0);
    }

    SECTION("no carriage return") {
        Reader reader("OK");
        REQUIRE(reader.read_line(line) == Error::EndOfMessage);
    }

    SECTION("carriage return not followed by line feed") {
        Reader reader("OK\rX");
        REQUIRE(reader.read_line(line) == Error::ExpectedCRLF);
    }

    SECTION("carriage return at end of buffer") {
        Reader reader("OK\r");
        REQUIRE(reader.read_line(line) == Error::EndOfMessage);
    }

    SECTION("empty buffer") {
        Reader reader("");
        REQUIRE(reader.read_line(line) == Error::EndOfMessage);
    }
}

TEST_CASE("Reader read_length", "[reader]") {
    std::size_t length = 99;

    SECTION("decimal") {
        Reader reader("128\r\n");
        REQUIRE(reader.read_length(length) == Error::Ok);
        REQUIRE(length == 128);
    }

    SECTION("zero with leading zeros") {
        Reader reader("000\r\n");
        REQUIRE(reader.read_length(length) == Error::Ok);
        REQUIRE(length == 0);
    }

    SECTION("must start with a digit") {
        Reader reader("-1\r\n");
        REQUIRE(reader.read_length(length) == Error::ExpectedLength);
        REQUIRE(length == 99);
    }

    SECTION("trailing garbage") {
        Reader reader("12a\r\n");
        REQUIRE(reader.read_length(length) == Error::InvalidCharacter);
    }

    SECTION("overflow") {
        Reader reader("99999999999999999999999\r\n");
        REQUIRE(reader.read_length(length) == Error::InternalError);
    }

    SECTION("missing terminator") {
        Reader reader("12");
        REQUIRE(reader.read_length(length) == Error::EndOfMessage);
    }
}

TEST_CASE("Reader read_bytes", "[reader]") {
    std::string_view bytes;

    SECTION("exact size") {
        Reader reader("abc");
        REQUIRE(reader.read_bytes(3, bytes) == Error::Ok);
        REQUIRE(bytes == "abc");
        REQUIRE(reader.remaining() == 0);
    }

    SECTION("payload may contain CRLF") {
        Reader reader("a\r\nb");
        REQUIRE(reader.read_bytes(4, bytes) == Error::Ok);
        REQUIRE(bytes == "a\r\nb");
    }

    SECTION("too short") {
        Reader reader("abc");
        REQUIRE(reader.read_bytes(4, bytes) == Error::EndOfMessage);
        REQUIRE(reader.position() == 0);
    }

    SECTION("zero bytes at end of buffer") {
        Reader reader("");
        REQUIRE(reader.read_bytes(0, bytes) == Error::EndOfMessage);
    }
}

TEST_CASE("Reader expect_crlf", "[reader]") {
    SECTION("consumes CRLF") {
        Reader reader("\r\n");
        REQUIRE(reader.expect_crlf() == Error::Ok);
        REQUIRE(reader.position() == 2);
    }

    SECTION("wrong bytes") {
        Reader reader("\n\r");
        REQUIRE(reader.expect_crlf() == Error::ExpectedCRLF);
    }

    SECTION("single byte left") {
        Reader reader("\r");
        REQUIRE(reader.expect_crlf() == Error::EndOfMessage);
    }
}
