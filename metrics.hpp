#ifndef METRICS_HPP
#define METRICS_HPP

#include <string>
#include <cstddef>

namespace metrics {

    struct EmbeddingStats {
        std::size_t coverBytes = 0;
        std::size_t secretBytes = 0;
        std::size_t markerCount = 0;    // 8 per secret byte
        std::size_t hiddenBytes = 0;    // markerCount * MARKER_SIZE
        std::size_t combinedBytes = 0;
        double expansion = 0.0;         // combinedBytes / coverBytes, 0 for an empty cover
    };

    // BER for extracted vs original text
    double computeBER(const std::string& original, const std::string& extracted);

    std::size_t countMarkers(const std::string& text);

    EmbeddingStats computeStats(const std::string& cover, const std::string& secret);
}

#endif
