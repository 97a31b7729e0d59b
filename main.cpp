#include <cstdlib>
#include <iostream>

#include "command_line.hpp"
#include "versort.hpp"

int main(int argc, char **argv)
{
	command_line command_line;

	try
	{
		command_line.parse(argc, argv);
	}
	catch(const std::exception &e)
	{
		command_line.print_usage(std::cerr);
		std::cerr << e.what() << '\n';
		return EXIT_FAILURE;
	}

	if(command_line.help_requested())
	{
		command_line.print_usage(std::cout);
		return EXIT_SUCCESS;
	}

	std::ios_base::sync_with_stdio(false);

	versort versort{command_line.get_options()};

	return versort.run(std::cin, std::cout, std::cerr);
}
