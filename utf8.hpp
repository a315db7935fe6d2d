#ifndef UTF8_HPP
#define UTF8_HPP

#include <string>
#include <cstddef>

namespace zwstego {

    // pos == 0 and pos >= size are always boundaries
    bool isCharBoundary(const std::string& text, std::size_t pos);

    // Largest boundary <= pos. Never goes below 0.
    std::size_t floorCharBoundary(const std::string& text, std::size_t pos);

    // Strict UTF-8: rejects overlong forms, surrogates, code points above
    // U+10FFFF and truncated sequences.
    bool isValidUtf8(const std::string& bytes);

}

#endif // UTF8_HPP
