#include "markers.hpp"

namespace zwstego {

    // Function-local statics, safe to use from other static initializers.
    const std::string& markerZero()
    {
        static const std::string zero = "\xE2\x80\x8C";
        return zero;
    }

    const std::string& markerOne()
    {
        static const std::string one = "\xE2\x80\x8D";
        return one;
    }

    bool checkMarkerAlphabet()
    {
        return markerZero().size() == MARKER_SIZE
            && markerOne().size() == MARKER_SIZE
            && markerZero() != markerOne();
    }

    Marker markerAt(const std::string& text, std::size_t pos)
    {
        if (pos > text.size() || text.size() - pos < MARKER_SIZE) {
            return Marker::None;
        }
        if (text.compare(pos, MARKER_SIZE, markerOne()) == 0) {
            return Marker::One;
        }
        if (text.compare(pos, MARKER_SIZE, markerZero()) == 0) {
            return Marker::Zero;
        }
        return Marker::None;
    }

}
