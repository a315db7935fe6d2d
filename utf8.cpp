#include "utf8.hpp"

#include <cstdint>

namespace zwstego {

    static bool isContinuation(uint8_t b) {
        return (b & 0xC0) == 0x80;
    }

    bool isCharBoundary(const std::string& text, std::size_t pos)
    {
        if (pos == 0 || pos >= text.size()) {
            return true;
        }
        return !isContinuation(static_cast<uint8_t>(text[pos]));
    }

    std::size_t floorCharBoundary(const std::string& text, std::size_t pos)
    {
        if (pos >= text.size()) {
            return text.size();
        }
        while (pos > 0 && !isCharBoundary(text, pos)) {
            --pos;
        }
        return pos;
    }

    bool isValidUtf8(const std::string& bytes)
    {
        size_t i = 0;
        const size_t n = bytes.size();

        while (i < n) {
            uint8_t lead = static_cast<uint8_t>(bytes[i]);

            if (lead < 0x80) {
                ++i;
                continue;
            }

            size_t len = 0;
            uint32_t cp = 0;
            uint32_t minCp = 0;

            if ((lead & 0xE0) == 0xC0) {
                len = 2; cp = lead & 0x1F; minCp = 0x80;
            } else if ((lead & 0xF0) == 0xE0) {
                len = 3; cp = lead & 0x0F; minCp = 0x800;
            } else if ((lead & 0xF8) == 0xF0) {
                len = 4; cp = lead & 0x07; minCp = 0x10000;
            } else {
                return false; // stray continuation or 0xF8..0xFF
            }

            if (n - i < len) {
                return false;
            }

            for (size_t k = 1; k < len; ++k) {
                uint8_t b = static_cast<uint8_t>(bytes[i + k]);
                if (!isContinuation(b)) {
                    return false;
                }
                cp = (cp << 6) | (b & 0x3F);
            }

            if (cp < minCp || cp > 0x10FFFF) {
                return false;
            }
            if (cp >= 0xD800 && cp <= 0xDFFF) {
                return false;
            }

            i += len;
        }

        return true;
    }

}
