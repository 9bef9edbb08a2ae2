#include "base64.hpp"

#include <array>

namespace base64 {

namespace {

constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr int8_t INVALID = -1;
constexpr int8_t PADDING = -2;

constexpr std::array<int8_t, 256> make_decode_table() {
    std::array<int8_t, 256> t{};
    t.fill(INVALID);
    for (int i = 0; i < 64; i++) {
        t[static_cast<uint8_t>(ALPHABET[i])] = static_cast<int8_t>(i);
    }
    t[static_cast<uint8_t>('=')] = PADDING;
    return t;
}

constexpr auto DECODE_TABLE = make_decode_table();

bool is_space(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // namespace

std::string encode(std::span<const uint8_t> data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(ALPHABET[(v >> 18) & 0x3f]);
        out.push_back(ALPHABET[(v >> 12) & 0x3f]);
        out.push_back(ALPHABET[(v >> 6) & 0x3f]);
        out.push_back(ALPHABET[v & 0x3f]);
    }

    size_t rem = data.size() - i;
    if (rem == 1) {
        uint32_t v = uint32_t(data[i]) << 16;
        out.push_back(ALPHABET[(v >> 18) & 0x3f]);
        out.push_back(ALPHABET[(v >> 12) & 0x3f]);
        out.append("==");
    } else if (rem == 2) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(ALPHABET[(v >> 18) & 0x3f]);
        out.push_back(ALPHABET[(v >> 12) & 0x3f]);
        out.push_back(ALPHABET[(v >> 6) & 0x3f]);
        out.push_back('=');
    }
    return out;
}

std::expected<std::vector<uint8_t>, std::string> decode(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    uint32_t acc = 0;
    int bits = 0;
    int pad = 0;

    for (char c : text) {
        if (is_space(c)) continue;
        int8_t v = DECODE_TABLE[static_cast<uint8_t>(c)];
        if (v == INVALID) {
            return std::unexpected(std::string("invalid base64 character '") + c + "'");
        }
        if (v == PADDING) {
            pad++;
            v = 0;
        } else if (pad > 0) {
            return std::unexpected("data after base64 padding");
        }

        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xff));
        }
    }

    // Padding characters decoded as zero bits; drop the bytes they produced.
    if (pad > 2 || out.size() < static_cast<size_t>(pad)) {
        return std::unexpected("malformed base64 padding");
    }
    out.resize(out.size() - static_cast<size_t>(pad));
    return out;
}

} // namespace base64
