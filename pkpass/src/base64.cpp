#include "base64.hpp"
#include <array>
#include <stdexcept>

static const char kTable[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static const std::array<int8_t, 256>& decode_table() {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t;
        t.fill(-1);
        for (int i = 0; i < 64; ++i)
            t[static_cast<unsigned char>(kTable[i])] = static_cast<int8_t>(i);
        return t;
    }();
    return table;
}

static bool is_skippable(unsigned char c) {
    return c == '\n' || c == '\r' || c == ' ' || c == '\t';
}

std::vector<uint8_t> base64_decode(const std::string& encoded) {
    const auto& table = decode_table();

    std::vector<uint8_t> out;
    out.reserve((encoded.size() / 4) * 3);

    uint32_t buf     = 0;
    int      bits    = 0;
    size_t   symbols = 0;   // data + padding characters seen
    size_t   padding = 0;

    for (unsigned char c : encoded) {
        if (is_skippable(c)) continue;
        if (c == '=') {
            ++padding;
            ++symbols;
            continue;
        }
        if (padding > 0)
            throw std::invalid_argument("base64: data after padding");
        int val = table[c];
        if (val < 0)
            throw std::invalid_argument("base64: invalid character");
        buf = (buf << 6) | (uint32_t)val;
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((uint8_t)((buf >> bits) & 0xFF));
        }
    }

    if (padding > 2 || (padding > 0 && symbols % 4 != 0))
        throw std::invalid_argument("base64: bad padding");
    if (padding == 0 && symbols % 4 == 1)
        throw std::invalid_argument("base64: truncated input");
    return out;
}
