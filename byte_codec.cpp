#include "byte_codec.hpp"
#include "markers.hpp"

namespace zwstego {

    const char* decodeStatusName(DecodeStatus status)
    {
        switch (status) {
            case DecodeStatus::Ok:              return "ok";
            case DecodeStatus::MalformedLength: return "malformed length";
            case DecodeStatus::InvalidText:     return "invalid text";
        }
        return "unknown";
    }

    std::string encodeByte(uint8_t byte)
    {
        std::string out;
        out.reserve(BITS_PER_BYTE * MARKER_SIZE);

        for (size_t i = 0; i < BITS_PER_BYTE; ++i) {
            out += ((byte >> i) & 1) ? markerOne() : markerZero();
        }
        return out;
    }

    DecodeStatus decodeByte(const std::string& data, uint8_t& outByte)
    {
        if (data.size() != BITS_PER_BYTE * MARKER_SIZE) {
            return DecodeStatus::MalformedLength;
        }

        uint8_t cur = 0;
        for (size_t i = 0; i < BITS_PER_BYTE; ++i) {
            if (data.compare(i * MARKER_SIZE, MARKER_SIZE, markerOne()) == 0) {
                cur |= static_cast<uint8_t>(1u << i);
            }
        }

        outByte = cur;
        return DecodeStatus::Ok;
    }

}
