#include "text_stego.hpp"
#include "markers.hpp"
#include "message_codec.hpp"
#include "utf8.hpp"

#include <iostream>

namespace zwstego {

    // Walks text once; each marker goes to keep, everything else to drop.
    // Either side may be null.
    static void splitMarkers(const std::string& text,
                             std::string* keep,
                             std::string* drop)
    {
        size_t i = 0;
        while (i < text.size()) {
            Marker m = markerAt(text, i);
            if (m != Marker::None) {
                if (keep) {
                    keep->append(text, i, MARKER_SIZE);
                }
                i += MARKER_SIZE;
                continue;
            }
            if (drop) {
                drop->push_back(text[i]);
            }
            ++i;
        }
    }

    static DecodeStatus findHidden(const std::string& text,
                                   std::string& markers,
                                   std::string& outSecret)
    {
        markers = sanitizeMarkers(text);
        if (markers.empty()) {
            return DecodeStatus::MalformedLength;
        }
        return decodeMessage(markers, outSecret);
    }

    size_t splitOffset(const std::string& cover)
    {
        return floorCharBoundary(cover, cover.size() / 2);
    }

    std::string embedText(const std::string& cover,
                          const std::string& secret)
    {
        if (!isValidUtf8(secret)) {
            std::cerr << "[embed] Secret is not valid UTF-8, it will not be recoverable.\n";
        }

        size_t k = splitOffset(cover);
        std::string hidden = encodeMessage(secret);

        std::string out;
        out.reserve(cover.size() + hidden.size());
        out.append(cover, 0, k);
        out += hidden;
        out.append(cover, k, std::string::npos);
        return out;
    }

    std::string sanitizeMarkers(const std::string& text)
    {
        std::string out;
        splitMarkers(text, &out, nullptr);
        return out;
    }

    std::string stripMarkers(const std::string& text)
    {
        std::string out;
        out.reserve(text.size());
        splitMarkers(text, nullptr, &out);
        return out;
    }

    bool extractText(const std::string& text,
                     std::string& outSecret)
    {
        std::string markers;
        std::string secret;
        DecodeStatus st = findHidden(text, markers, secret);

        if (markers.empty()) {
            std::cerr << "[extract] No markers found.\n";
            return false;
        }
        if (st != DecodeStatus::Ok) {
            std::cerr << "[extract] Found " << markers.size() / MARKER_SIZE
                      << " markers but decoding failed: " << decodeStatusName(st) << "\n";
            return false;
        }

        outSecret.swap(secret);
        return true;
    }

    bool hasHiddenText(const std::string& text)
    {
        std::string markers;
        std::string secret;
        return findHidden(text, markers, secret) == DecodeStatus::Ok;
    }

}
