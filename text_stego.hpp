#ifndef TEXT_STEGO_HPP
#define TEXT_STEGO_HPP

#include <string>
#include <cstddef>

// 把 secret 用零宽字符藏进 cover 文本中间
namespace zwstego {

    // Insertion offset used by embedText: the middle of cover in bytes,
    // moved back to the nearest UTF-8 character boundary.
    std::size_t splitOffset(const std::string& cover);

    // cover[0..k] + encodeMessage(secret) + cover[k..]. Never fails.
    // Markers already present in cover are not escaped.
    std::string embedText(const std::string& cover,
                          const std::string& secret);

    // Only the markerZero() / markerOne() symbols of text, in order.
    std::string sanitizeMarkers(const std::string& text);

    // text with every marker removed, i.e. the visible part.
    std::string stripMarkers(const std::string& text);

    // 从任意文本中提取 secret
    // Returns false when no payload is found: no markers at all, or the
    // markers do not decode to UTF-8 text.
    bool extractText(const std::string& text,
                     std::string& outSecret);

    // Same test as extractText, without output or logging.
    bool hasHiddenText(const std::string& text);

}

#endif // TEXT_STEGO_HPP
