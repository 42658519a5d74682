/**
 * @file cli.cpp
 * @brief resp3dump command line interface.
 *
 * Decodes a single RESP3 message and prints the value tree.
 *
 * @authors resp3 contributors
 */

#include <resp3/resp3.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory_resource>
#include <string>

using namespace resp3;

static void print_version() {
    std::printf("resp3dump %s (C++)\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("\nRESP3 Message Decoder (v%s C++)\n", version());
    std::printf("================================\n\n");
    std::printf("References:\n");
    std::printf("  RESP3: https://github.com/redis/redis-specifications/blob/master/protocol/RESP3.md\n\n");
    std::printf("Usage:\n");
    std::printf("  %s <input>\n", prog_name);
    std::printf("  %s -\n", prog_name);
    std::printf("  %s -e <message>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -              Read the message from standard input\n");
    std::printf("  -e             Decode an inline message with C escapes (\\r \\n \\t \\\\ \\xHH)\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s reply.bin\n", prog_name);
    std::printf("  %s -e '*2\\r\\n+Hello\\r\\n:100\\r\\n'\n\n", prog_name);
}

static bool read_file(const std::string& path, std::string& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return false;
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    data.resize(static_cast<std::size_t>(size));
    if (!file.read(data.data(), size)) {
        return false;
    }

    return true;
}

static bool read_stdin(std::string& data) {
    data.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return !std::cin.bad();
}

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

static bool unescape(const char* text, std::string& out) {
    for (const char* p = text; *p != '\0'; ++p) {
        if (*p != '\\') {
            out.push_back(*p);
            continue;
        }

        ++p;
        switch (*p) {
        case 'r':
            out.push_back('\r');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 't':
            out.push_back('\t');
            break;
        case '\\':
            out.push_back('\\');
            break;
        case 'x': {
            int high = hex_digit(p[1]);
            int low = (high < 0) ? -1 : hex_digit(p[2]);
            if (low < 0) {
                return false;
            }
            out.push_back(static_cast<char>((high << 4) | low));
            p += 2;
            break;
        }
        default:
            return false;
        }
    }
    return true;
}

static int do_decode(const std::string& message) {
    std::pmr::monotonic_buffer_resource arena;
    Decoder decoder(message, &arena);

    Value value;
    auto result = decoder.decode(value);
    if (result != Error::Ok) {
        std::fprintf(stderr, "Error: %s at byte %zu\n", error_string(result), decoder.position());
        return 1;
    }

    std::fputs(to_string(value).c_str(), stdout);

    if (decoder.position() < message.size()) {
        std::fprintf(stderr, "Warning: %zu trailing bytes not decoded\n",
                     message.size() - decoder.position());
    }

    return 0;
}

int main(int argc, char** argv) {
    // Check for help flag
    if (argc < 2 || std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0) {
        print_help(argv[0]);
        return (argc < 2) ? 1 : 0;
    }

    // Check for version flag
    if (std::strcmp(argv[1], "-v") == 0 || std::strcmp(argv[1], "--version") == 0) {
        print_version();
        return 0;
    }

    std::string message;

    if (std::strcmp(argv[1], "-e") == 0) {
        // Inline mode: -e <message>
        if (argc != 3) {
            std::fprintf(stderr, "Error: -e requires exactly one message argument\n");
            std::fprintf(stderr, "Usage: %s -e <message>\n", argv[0]);
            return 1;
        }
        if (!unescape(argv[2], message)) {
            std::fprintf(stderr, "Error: Invalid escape sequence in message\n");
            return 1;
        }
    } else {
        if (argc != 2) {
            std::fprintf(stderr, "Error: Expected a single input\n");
            std::fprintf(stderr, "Usage: %s <input>\n", argv[0]);
            return 1;
        }

        const char* input_path = argv[1];
        bool ok = (std::strcmp(input_path, "-") == 0) ? read_stdin(message)
                                                       : read_file(input_path, message);
        if (!ok) {
            std::fprintf(stderr, "Error: Cannot read input: %s\n", input_path);
            return 1;
        }
    }

    if (message.empty()) {
        std::fprintf(stderr, "Error: Empty message\n");
        return 1;
    }

    return do_decode(message);
}
