#include "console.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace unvoid::console::gtest {

static bool contains(const std::string& text, const std::string& part) {
	return text.find(part) != std::string::npos;
}

TEST(Console, SelectAndMove) {
	std::istringstream in("select B1\nmove B1 B3\nexit\n");
	std::ostringstream out;
	Console console(in, out);

	EXPECT_EQ(console.run(Settings{.width = 8u, .height = 6u}), 0);

	const auto text = out.str();
	EXPECT_TRUE(contains(text, "Starting match on the (8 x 6) board..."));
	EXPECT_TRUE(contains(text, "Turn: White"));
	EXPECT_TRUE(contains(text, "Selected: ♖ at B1. Available moves: A2, B2, B3, B4, C2, D3, E4\n"));
	EXPECT_TRUE(contains(text, "Moved ♖ from B1 to B3.\n"));
	EXPECT_TRUE(contains(text, "Turn: Black"));
	EXPECT_TRUE(contains(text, "Exiting Unvoid Chess. Goodbye!"));

	EXPECT_EQ(console.game().currentPlayer(), Player::Black);
	EXPECT_EQ(console.game().board().get({1u, 2u}), (Piece{PieceType::Runner, Player::White}));
}

TEST(Console, PromptDimensions) {
	std::istringstream in("5\nabc\n8\n13\n6\nexit\n");
	std::ostringstream out;
	Console console(in, out);

	EXPECT_EQ(console.run(std::nullopt), 0);

	const auto text = out.str();
	EXPECT_TRUE(contains(text, "Enter board width (6-12): "));
	EXPECT_TRUE(contains(text, "Enter board height (6-12): "));
	EXPECT_TRUE(contains(text, "Invalid input. Please enter a number between 6 and 12."));
	EXPECT_TRUE(contains(text, "Starting match on the (8 x 6) board..."));
	EXPECT_EQ(console.game().board().width(), 8u);
	EXPECT_EQ(console.game().board().height(), 6u);
}

TEST(Console, PromptInputEnds) {
	std::istringstream in("7\n");
	std::ostringstream out;
	Console console(in, out);

	EXPECT_EQ(console.run(std::nullopt), 1);
}

TEST(Console, Errors) {
	std::istringstream in("");
	std::ostringstream out;
	Console console(in, out);
	console.start({.width = 8u, .height = 6u});

	const auto run = [&](const std::string& line) {
		out.str("");
		EXPECT_TRUE(console.handleCommand(parseCommand(line)));
		return out.str();
	};

	EXPECT_EQ(run("select Z9"), "Invalid input: Z9 is not a valid square on the board.\nPlease enter coordinates from A1 to H6.\n");
	EXPECT_EQ(run("select d4"), "Invalid input: There is no piece at D4.\n");
	EXPECT_EQ(run("select H6"), "Invalid input: You cannot select a black piece on White's turn.\n");
	EXPECT_EQ(run("move b0 B2"), "Invalid input: B0 is not a valid 'from' square.\n");
	EXPECT_EQ(run("move B1 x"), "Invalid input: X is not a valid 'to' square.\n");
	EXPECT_EQ(run("move D4 D5"), "Invalid move: There is no piece at D4.\n");
	EXPECT_EQ(run("move H6 H5"), "Invalid move: You can't move your opponent's piece.\n");
	EXPECT_EQ(run("move B1 B1"), "Invalid move: Destination must be different from origin.\n");
	EXPECT_EQ(run("move B1 C1"), "Invalid move: ♖ can't move to C1.\n");
	EXPECT_TRUE(contains(run("move B1"), "Usage: move <from_square> <to_square>"));
	EXPECT_TRUE(contains(run("select"), "Usage: select <square>"));
	EXPECT_EQ(run("dance"), "Unknown command: dance\nType \"help\" to see a list of valid commands.\n");
	EXPECT_TRUE(contains(run("help"), "move <from> <to>"));

	// Nothing changed.
	EXPECT_EQ(console.game().currentPlayer(), Player::White);
	EXPECT_EQ(console.game().moveId(), 0u);
}

// White leaper walks C1-B3-C5-E4 and takes the black royal on F6.
TEST(Console, GameOverAndRestart) {
	std::istringstream in("move C1 B3\n"
	                      "move E6 E5\n"
	                      "move B3 C5\n"
	                      "move E5 E6\n"
	                      "move C5 E4\n"
	                      "move E6 E5\n"
	                      "move E4 F6\n"
	                      "select A1\n"
	                      "move A1 A2\n"
	                      "restart\n"
	                      "move A1 A2\n"
	                      "exit\n");
	std::ostringstream out;
	Console console(in, out);

	EXPECT_EQ(console.run(Settings{.width = 6u, .height = 6u}), 0);

	const auto text = out.str();
	EXPECT_TRUE(contains(text, "Moved ♘ from E4 to F6. Captured ♚.\n"));
	EXPECT_TRUE(contains(text, "White wins!\nType \"restart\" to play again or \"exit\" to leave.\n"));
	EXPECT_TRUE(contains(text, "Game is over. Type \"restart\" to play again or \"exit\" to leave.\n"));
	EXPECT_TRUE(contains(text, "Restarting match...\n"));
	EXPECT_TRUE(contains(text, "Moved ♔ from A1 to A2.\n"));

	EXPECT_FALSE(console.game().isOver());
	EXPECT_EQ(console.game().currentPlayer(), Player::Black);
	EXPECT_EQ(console.game().moveId(), 1u);
}

TEST(Console, InputEnds) {
	std::istringstream in("select B1\n");
	std::ostringstream out;
	Console console(in, out);

	EXPECT_EQ(console.run(Settings{.width = 6u, .height = 6u}), 0);
	ASSERT_TRUE(console.game().selection());
}

} // namespace unvoid::console::gtest
