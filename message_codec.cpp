#include "message_codec.hpp"
#include "markers.hpp"
#include "utf8.hpp"

#include <cstdint>

namespace zwstego {

    static const size_t GROUP_SIZE = BITS_PER_BYTE * MARKER_SIZE;

    std::string encodeMessage(const std::string& payload)
    {
        std::string out;
        out.reserve(encodedLength(payload));

        for (unsigned char c : payload) {
            out += encodeByte(static_cast<uint8_t>(c));
        }
        return out;
    }

    DecodeStatus decodeMessage(const std::string& markers, std::string& outPayload)
    {
        if (markers.size() % GROUP_SIZE != 0) {
            return DecodeStatus::MalformedLength;
        }

        std::string bytes;
        bytes.reserve(markers.size() / GROUP_SIZE);

        for (size_t pos = 0; pos < markers.size(); pos += GROUP_SIZE) {
            uint8_t cur = 0;
            DecodeStatus st = decodeByte(markers.substr(pos, GROUP_SIZE), cur);
            if (st != DecodeStatus::Ok) {
                return st;
            }
            bytes.push_back(static_cast<char>(cur));
        }

        if (!isValidUtf8(bytes)) {
            return DecodeStatus::InvalidText;
        }

        outPayload.swap(bytes);
        return DecodeStatus::Ok;
    }

    std::size_t encodedLength(const std::string& payload)
    {
        return payload.size() * GROUP_SIZE;
    }

}
