#include <gtest/gtest.h>

#include "common/coordinate_frame.hpp"

#include <sstream>
#include <stdexcept>
#include <string>

using namespace common;

class CoordinateFrameTest : public ::testing::Test {
protected:
    std::stringstream ss;
};

// ============================================================================
// NAMING TESTS
// ============================================================================

TEST_F(CoordinateFrameTest, CanonicalNames) {
    EXPECT_EQ(to_string(CoordinateFrame::ECI), "ECI");
    EXPECT_EQ(to_string(CoordinateFrame::ECEF), "ECEF");

    ss << CoordinateFrame::ECEF;
    EXPECT_EQ(ss.str(), to_string(CoordinateFrame::ECEF));
}

TEST_F(CoordinateFrameTest, ParsesEitherCase) {
    EXPECT_EQ(frame_from_string("ECI"), CoordinateFrame::ECI);
    EXPECT_EQ(frame_from_string("eci"), CoordinateFrame::ECI);
    EXPECT_EQ(frame_from_string("ECEF"), CoordinateFrame::ECEF);
    EXPECT_EQ(frame_from_string("ecef"), CoordinateFrame::ECEF);
}

// Ephemeris vectors are J2000-aligned, so the name maps to the inertial frame
TEST_F(CoordinateFrameTest, J2000AliasParsesAsECI) {
    EXPECT_EQ(frame_from_string("J2000"), CoordinateFrame::ECI);
    EXPECT_EQ(frame_from_string("j2000"), CoordinateFrame::ECI);
}

TEST_F(CoordinateFrameTest, UnknownNamesRejected) {
    for (const std::string name : {"Eci", "ICRF", "RTN", ""}) {
        EXPECT_THROW(frame_from_string(name), std::invalid_argument) << name;
    }
}

// ============================================================================
// STREAM TESTS
// ============================================================================

TEST_F(CoordinateFrameTest, StreamedScenarioTokens) {
    ss << "J2000 ecef ECI";

    CoordinateFrame first, second, third;
    ss >> first >> second >> third;

    EXPECT_EQ(first, CoordinateFrame::ECI);
    EXPECT_EQ(second, CoordinateFrame::ECEF);
    EXPECT_EQ(third, CoordinateFrame::ECI);
}

TEST_F(CoordinateFrameTest, StreamRoundTrip) {
    for (CoordinateFrame original : {CoordinateFrame::ECI, CoordinateFrame::ECEF}) {
        std::stringstream stream;
        stream << original;

        CoordinateFrame parsed;
        stream >> parsed;
        EXPECT_EQ(parsed, original);
    }
}

TEST_F(CoordinateFrameTest, InvalidTokenMessage) {
    CoordinateFrame frame;
    ss << "BAD";
    try {
        ss >> frame;
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Invalid coordinate frame: BAD");
    }
}
