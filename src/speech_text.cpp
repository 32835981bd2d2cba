#include "RunSessionCore/speech_text.hpp"
#include <cstddef>

namespace
{
struct CodePointRange
{
    uint32_t first;
    uint32_t last;
};

// Extended pictographic blocks plus emoji presentation helpers
const CodePointRange PICTOGRAPHIC_RANGES[] = {
    {0x00A9, 0x00A9},     // copyright
    {0x00AE, 0x00AE},     // registered
    {0x200D, 0x200D},     // zero width joiner
    {0x203C, 0x203C},
    {0x2049, 0x2049},
    {0x20E3, 0x20E3},     // combining keycap
    {0x2122, 0x2122},
    {0x2139, 0x2139},
    {0x2194, 0x2199},
    {0x21A9, 0x21AA},
    {0x231A, 0x231B},
    {0x2328, 0x2328},
    {0x23CF, 0x23CF},
    {0x23E9, 0x23F3},
    {0x23F8, 0x23FA},
    {0x24C2, 0x24C2},
    {0x25AA, 0x25AB},
    {0x25B6, 0x25B6},
    {0x25C0, 0x25C0},
    {0x25FB, 0x25FE},
    {0x2600, 0x27BF},     // misc symbols, dingbats
    {0x2934, 0x2935},
    {0x2B05, 0x2B07},
    {0x2B1B, 0x2B1C},
    {0x2B50, 0x2B50},
    {0x2B55, 0x2B55},
    {0x3030, 0x3030},
    {0x303D, 0x303D},
    {0x3297, 0x3297},
    {0x3299, 0x3299},
    {0xFE00, 0xFE0F},     // variation selectors
    {0x1F000, 0x1FAFF},   // mahjong through symbols and pictographs extended-A
    {0xE0020, 0xE007F},   // tag sequences
};

bool is_space(uint32_t cp)
{
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f' || cp == '\v' ||
           cp == 0x00A0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000 || cp == 0xFEFF;
}

// Decode one UTF-8 sequence at pos. Returns the sequence length, 0 if malformed.
size_t decode_utf8(const std::string& text, size_t pos, uint32_t& code_point)
{
    unsigned char lead = static_cast<unsigned char>(text[pos]);
    size_t length = 0;

    if (lead < 0x80) {
        code_point = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        code_point = lead & 0x1F;
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        code_point = lead & 0x0F;
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        code_point = lead & 0x07;
        length = 4;
    } else {
        return 0;
    }

    if (pos + length > text.size()) return 0;

    for (size_t i = 1; i < length; ++i) {
        unsigned char next = static_cast<unsigned char>(text[pos + i]);
        if ((next & 0xC0) != 0x80) return 0;
        code_point = (code_point << 6) | (next & 0x3F);
    }

    return length;
}
}  // namespace

bool is_pictographic(uint32_t code_point)
{
    for (const auto& range : PICTOGRAPHIC_RANGES) {
        if (code_point >= range.first && code_point <= range.last) {
            return true;
        }
    }
    return false;
}

std::string clean_speech_text(const std::string& text)
{
    std::string cleaned;
    cleaned.reserve(text.size());
    bool pending_space = false;

    size_t pos = 0;
    while (pos < text.size()) {
        uint32_t code_point = 0;
        size_t length = decode_utf8(text, pos, code_point);
        if (length == 0) {
            ++pos;  // Skip malformed byte
            continue;
        }

        if (is_pictographic(code_point)) {
            pos += length;
            continue;
        }

        if (is_space(code_point)) {
            pending_space = true;
        } else {
            // Leading whitespace is dropped; inner runs become one space
            if (pending_space && !cleaned.empty()) {
                cleaned.push_back(' ');
            }
            pending_space = false;
            cleaned.append(text, pos, length);
        }
        pos += length;
    }

    return cleaned;
}
