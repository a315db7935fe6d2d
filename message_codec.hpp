#ifndef MESSAGE_CODEC_HPP
#define MESSAGE_CODEC_HPP

#include <string>
#include <cstddef>

#include "byte_codec.hpp"

namespace zwstego {

    // Marker sequence for the UTF-8 bytes of payload, 8 markers per byte.
    std::string encodeMessage(const std::string& payload);

    // Inverse of encodeMessage. markers must contain nothing but markers;
    // run sanitizeMarkers() first on arbitrary text.
    // MalformedLength: byte length is not a multiple of 8 * MARKER_SIZE.
    // InvalidText: the decoded bytes are not UTF-8.
    // Empty input decodes to an empty payload.
    DecodeStatus decodeMessage(const std::string& markers, std::string& outPayload);

    // Byte length of encodeMessage(payload) without building it.
    std::size_t encodedLength(const std::string& payload);

}

#endif // MESSAGE_CODEC_HPP
