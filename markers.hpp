#ifndef MARKERS_HPP
#define MARKERS_HPP

#include <string>
#include <cstddef>

// 两个零宽字符当作 0 / 1 bit
namespace zwstego {

    // U+200C ZERO WIDTH NON-JOINER -> bit 0
    const std::string& markerZero();
    // U+200D ZERO WIDTH JOINER -> bit 1
    const std::string& markerOne();

    // UTF-8 byte length of each marker
    constexpr std::size_t MARKER_SIZE = 3;
    constexpr std::size_t BITS_PER_BYTE = 8;

    enum class Marker {
        None,
        Zero,
        One
    };

    // Both markers must be exactly MARKER_SIZE bytes.
    bool checkMarkerAlphabet();

    // What marker (if any) starts at text[pos].
    Marker markerAt(const std::string& text, std::size_t pos);

}

#endif // MARKERS_HPP
