#include "metrics.hpp"
#include "markers.hpp"
#include "message_codec.hpp"
#include "text_stego.hpp"

#include <algorithm>
#include <bitset>
#include <cstdint>

namespace metrics {

    // --- BER ---
    // Bytes past the end of the shorter string count as 8 bit errors each.
    double computeBER(const std::string& original, const std::string& extracted)
    {
        size_t longest = std::max(original.size(), extracted.size());
        if (longest == 0) {
            return 0.0;
        }

        size_t common = std::min(original.size(), extracted.size());
        size_t bitErrors = (longest - common) * 8;
        size_t totalBits = longest * 8;

        for (size_t i = 0; i < common; i++) {
            uint8_t a = original[i];
            uint8_t b = extracted[i];

            uint8_t diff = a ^ b;
            bitErrors += std::bitset<8>(diff).count();
        }

        return (double)bitErrors / totalBits;
    }

    // --- markers ---
    size_t countMarkers(const std::string& text)
    {
        return zwstego::sanitizeMarkers(text).size() / zwstego::MARKER_SIZE;
    }

    EmbeddingStats computeStats(const std::string& cover, const std::string& secret)
    {
        EmbeddingStats s;
        s.coverBytes = cover.size();
        s.secretBytes = secret.size();
        s.markerCount = secret.size() * zwstego::BITS_PER_BYTE;
        s.hiddenBytes = zwstego::encodedLength(secret);
        s.combinedBytes = s.coverBytes + s.hiddenBytes;
        if (s.coverBytes > 0) {
            s.expansion = (double)s.combinedBytes / s.coverBytes;
        }
        return s;
    }

}
