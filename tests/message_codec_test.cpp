#include "message_codec.hpp"
#include "markers.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace zwstego;

namespace {

    // Built during static initialization of this file.
    const std::string encodedAtStartup = encodeMessage("init");

}

TEST(MessageCodecTest, RoundTripAscii) {
    std::string data = "Hello, World!";
    std::string decoded;
    ASSERT_EQ(decodeMessage(encodeMessage(data), decoded), DecodeStatus::Ok);
    EXPECT_EQ(decoded, data);
}

TEST(MessageCodecTest, RoundTripMultiByte) {
    std::vector<std::string> samples = {
        "ДАРОВА БРАТВА!",
        "суперsecret",
        "€100 \U0001F600",
        std::string("nul\0inside", 10),
    };
    for (const auto& s : samples) {
        std::string decoded;
        ASSERT_EQ(decodeMessage(encodeMessage(s), decoded), DecodeStatus::Ok) << s;
        EXPECT_EQ(decoded, s);
    }
}

TEST(MessageCodecTest, LengthIsEightMarkersPerByte) {
    std::vector<std::string> samples = {"", "a", "hi", "ДА", "\U0001F600"};
    for (const auto& s : samples) {
        std::string enc = encodeMessage(s);
        EXPECT_EQ(enc.size() / MARKER_SIZE, 8 * s.size());
        EXPECT_EQ(enc.size(), encodedLength(s));
    }
}

TEST(MessageCodecTest, OutputContainsOnlyMarkers) {
    std::string enc = encodeMessage("xyz");
    for (size_t i = 0; i < enc.size(); i += MARKER_SIZE) {
        EXPECT_NE(markerAt(enc, i), Marker::None);
    }
}

TEST(MessageCodecTest, EmptyInputIsEmptyPayload) {
    EXPECT_TRUE(encodeMessage("").empty());
    std::string decoded = "unchanged";
    ASSERT_EQ(decodeMessage("", decoded), DecodeStatus::Ok);
    EXPECT_TRUE(decoded.empty());
}

TEST(MessageCodecTest, RejectsPartialGroups) {
    std::string enc = encodeMessage("hi");
    std::string decoded = "unchanged";

    EXPECT_EQ(decodeMessage(enc + markerZero(), decoded), DecodeStatus::MalformedLength);
    EXPECT_EQ(decodeMessage(enc.substr(MARKER_SIZE), decoded), DecodeStatus::MalformedLength);
    EXPECT_EQ(decodeMessage(markerOne(), decoded), DecodeStatus::MalformedLength);
    EXPECT_EQ(decoded, "unchanged");
}

TEST(MessageCodecTest, RejectsBytesThatAreNotUtf8) {
    std::string decoded = "unchanged";
    EXPECT_EQ(decodeMessage(encodeByte(0xFF), decoded), DecodeStatus::InvalidText);

    // first byte of a two-byte sequence alone
    std::string truncated = encodeMessage("Д");
    truncated.resize(truncated.size() / 2);
    EXPECT_EQ(decodeMessage(truncated, decoded), DecodeStatus::InvalidText);
    EXPECT_EQ(decoded, "unchanged");
}

TEST(MessageCodecTest, Deterministic) {
    EXPECT_EQ(encodeMessage("same input"), encodeMessage("same input"));
}

TEST(MessageCodecTest, UsableFromStaticInitializers) {
    ASSERT_EQ(encodedAtStartup.size(), 4 * 8 * MARKER_SIZE);
    std::string decoded;
    ASSERT_EQ(decodeMessage(encodedAtStartup, decoded), DecodeStatus::Ok);
    EXPECT_EQ(decoded, "init");
}
