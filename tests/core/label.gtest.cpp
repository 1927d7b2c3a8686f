#include "core/label.hpp"

#include <gtest/gtest.h>

namespace unvoid::gtest {

TEST(Label, FromLabel) {
	Coord c{};
	EXPECT_EQ(fromLabel("A1", 6u, 8u, c), Status::Ok);
	EXPECT_EQ(c, (Coord{0u, 0u}));

	EXPECT_EQ(fromLabel("C3", 6u, 8u, c), Status::Ok);
	EXPECT_EQ(c, (Coord{2u, 2u}));

	EXPECT_EQ(fromLabel("h6", 6u, 8u, c), Status::Ok);
	EXPECT_EQ(c, (Coord{7u, 5u}));

	EXPECT_EQ(fromLabel("L12", 12u, 12u, c), Status::Ok);
	EXPECT_EQ(c, (Coord{11u, 11u}));
}

TEST(Label, FromLabel_InvalidFormat) {
	Coord c{3u, 4u};
	EXPECT_EQ(fromLabel("", 6u, 8u, c), Status::InvalidFormat);
	EXPECT_EQ(fromLabel("A", 6u, 8u, c), Status::InvalidFormat);
	EXPECT_EQ(fromLabel("AB", 6u, 8u, c), Status::InvalidFormat);
	EXPECT_EQ(fromLabel("A1x", 6u, 8u, c), Status::InvalidFormat);
	EXPECT_EQ(fromLabel("A-1", 6u, 8u, c), Status::InvalidFormat);
	EXPECT_EQ(fromLabel("11", 6u, 8u, c), Status::InvalidFormat);

	// Output untouched on failure.
	EXPECT_EQ(c, (Coord{3u, 4u}));
}

TEST(Label, FromLabel_OutOfRange) {
	Coord c{3u, 4u};
	EXPECT_EQ(fromLabel("A0", 6u, 8u, c), Status::OutOfRange);
	EXPECT_EQ(fromLabel("A7", 6u, 8u, c), Status::OutOfRange);
	EXPECT_EQ(fromLabel("I1", 6u, 8u, c), Status::OutOfRange);
	EXPECT_EQ(fromLabel("z3", 6u, 8u, c), Status::OutOfRange);
	EXPECT_EQ(fromLabel("M1", 12u, 12u, c), Status::OutOfRange);
	EXPECT_EQ(c, (Coord{3u, 4u}));
}

TEST(Label, ToLabel) {
	EXPECT_EQ(toLabel({0u, 0u}), "A1");
	EXPECT_EQ(toLabel({2u, 2u}), "C3");
	EXPECT_EQ(toLabel({11u, 11u}), "L12");
}

// Every square of the biggest board reads back to the same coordinate.
TEST(Label, RoundTrip) {
	for (Id y = 0u; y != kMaxBoardDimension; ++y) {
		for (Id x = 0u; x != kMaxBoardDimension; ++x) {
			Coord c{};
			ASSERT_EQ(fromLabel(toLabel({x, y}), kMaxBoardDimension, kMaxBoardDimension, c), Status::Ok);
			EXPECT_EQ(c, (Coord{x, y}));
		}
	}
}

} // namespace unvoid::gtest
