#ifndef BYTE_CODEC_HPP
#define BYTE_CODEC_HPP

#include <string>
#include <cstdint>

namespace zwstego {

    enum class DecodeStatus {
        Ok,
        MalformedLength,  // not a whole number of marker groups
        InvalidText       // decoded bytes are not valid UTF-8
    };

    const char* decodeStatusName(DecodeStatus status);

    // 一个 byte -> 8 个 marker，LSB 在前
    std::string encodeByte(uint8_t byte);

    // data must be exactly 8 * MARKER_SIZE bytes. A chunk that is not
    // markerOne() decodes as 0, including bytes that match neither marker.
    DecodeStatus decodeByte(const std::string& data, uint8_t& outByte);

}

#endif // BYTE_CODEC_HPP
