#include "base64.hpp"
#include <array>

namespace {

const char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr uint8_t INVALID = 0xFF;

std::array<uint8_t, 256> buildDecodeTable() {
    std::array<uint8_t, 256> table;
    table.fill(INVALID);
    for (uint8_t i = 0; i < 64; ++i) {
        table[static_cast<uint8_t>(ALPHABET[i])] = i;
    }
    return table;
}

const std::array<uint8_t, 256>& decodeTable() {
    static const std::array<uint8_t, 256> table = buildDecodeTable();
    return table;
}

} // namespace

std::optional<std::vector<uint8_t>> decode_base64(const std::string& text) {
    if (text.size() % 4 != 0) return std::nullopt;

    const auto& table = decodeTable();
    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    for (size_t pos = 0; pos < text.size(); pos += 4) {
        bool lastQuartet = (pos + 4 == text.size());

        size_t padding = 0;
        if (lastQuartet) {
            if (text[pos + 3] == '=') ++padding;
            if (padding && text[pos + 2] == '=') ++padding;
        }

        uint32_t quad = 0;
        for (size_t k = 0; k < 4 - padding; ++k) {
            uint8_t v = table[static_cast<uint8_t>(text[pos + k])];
            if (v == INVALID) return std::nullopt;
            quad = (quad << 6) | v;
        }
        quad <<= 6 * padding;

        switch (padding) {
        case 0:
            out.push_back(static_cast<uint8_t>(quad >> 16));
            out.push_back(static_cast<uint8_t>(quad >> 8));
            out.push_back(static_cast<uint8_t>(quad));
            break;
        case 1:
            if (quad & 0xFF) return std::nullopt;
            out.push_back(static_cast<uint8_t>(quad >> 16));
            out.push_back(static_cast<uint8_t>(quad >> 8));
            break;
        case 2:
            if (quad & 0xFFFF) return std::nullopt;
            out.push_back(static_cast<uint8_t>(quad >> 16));
            break;
        }
    }
    return out;
}

std::string encode_base64(const std::vector<uint8_t>& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 3 <= data.size(); i += 3) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out += ALPHABET[(triple >> 18) & 0x3F];
        out += ALPHABET[(triple >> 12) & 0x3F];
        out += ALPHABET[(triple >> 6) & 0x3F];
        out += ALPHABET[triple & 0x3F];
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        uint32_t triple = data[i] << 16;
        out += ALPHABET[(triple >> 18) & 0x3F];
        out += ALPHABET[(triple >> 12) & 0x3F];
        out += "==";
    } else if (rest == 2) {
        uint32_t triple = (data[i] << 16) | (data[i + 1] << 8);
        out += ALPHABET[(triple >> 18) & 0x3F];
        out += ALPHABET[(triple >> 12) & 0x3F];
        out += ALPHABET[(triple >> 6) & 0x3F];
        out += '=';
    }
    return out;
}
