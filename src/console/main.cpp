#include "console.hpp"
#include "settings.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
	unvoid::console::Console console(std::cin, std::cout);

	const auto exitCode = console.run(unvoid::console::settingsFromArgs(argc, argv));
	return exitCode;
}
