#include "command.hpp"

#include <gtest/gtest.h>

namespace unvoid::console::gtest {

TEST(Command, Simple) {
	EXPECT_TRUE(std::holds_alternative<HelpCommand>(parseCommand("help")));
	EXPECT_TRUE(std::holds_alternative<ExitCommand>(parseCommand("exit")));
	EXPECT_TRUE(std::holds_alternative<RestartCommand>(parseCommand("restart")));
	EXPECT_TRUE(std::holds_alternative<RestartCommand>(parseCommand("  ReStArT  ")));
	EXPECT_TRUE(std::holds_alternative<EmptyCommand>(parseCommand("")));
	EXPECT_TRUE(std::holds_alternative<EmptyCommand>(parseCommand(" \t ")));
}

TEST(Command, Select) {
	const auto command = parseCommand("SELECT b1");
	ASSERT_TRUE(std::holds_alternative<SelectCommand>(command));
	EXPECT_EQ(std::get<SelectCommand>(command).square, "b1");

	const auto usage = parseCommand("select");
	ASSERT_TRUE(std::holds_alternative<UsageError>(usage));
	EXPECT_EQ(std::get<UsageError>(usage).command, "select");
	EXPECT_TRUE(std::holds_alternative<UsageError>(parseCommand("select B1 C3")));
}

TEST(Command, Move) {
	const auto command = parseCommand("move  B1\tC3");
	ASSERT_TRUE(std::holds_alternative<MoveCommand>(command));
	EXPECT_EQ(std::get<MoveCommand>(command).from, "B1");
	EXPECT_EQ(std::get<MoveCommand>(command).to, "C3");

	EXPECT_TRUE(std::holds_alternative<UsageError>(parseCommand("move B1")));
	EXPECT_TRUE(std::holds_alternative<UsageError>(parseCommand("Move B1 C3 D4")));
}

TEST(Command, Unknown) {
	const auto command = parseCommand("Jump B1");
	ASSERT_TRUE(std::holds_alternative<UnknownCommand>(command));
	EXPECT_EQ(std::get<UnknownCommand>(command).name, "jump");
}

} // namespace unvoid::console::gtest
