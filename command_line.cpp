#include "command_line.hpp"

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

namespace po = boost::program_options;

command_line::command_line()
	: description_{"Options"}
{
	description_.add_options()
		("help,h", po::bool_switch(&help_), "print this message and exit")
		("ignore,i", po::bool_switch(&options_.ignore_unparsable), "drop unparsable lines instead of failing")
		("count-is-char,c", po::bool_switch(&options_.count_is_char), "treat a trailing letter as a counter (1.0a < 1.0b)");
}

void command_line::parse(int argc, const char *const argv[])
{
	// Versions are read from standard input only, so no positional arguments.
	const po::positional_options_description positional;

	po::variables_map vm;

	po::store(po::command_line_parser(argc, argv).options(description_).positional(positional).run(), vm);
	po::notify(vm);
}

const options &command_line::get_options() const
{
	return options_;
}

bool command_line::help_requested() const
{
	return help_;
}

void command_line::print_usage(std::ostream &stream) const
{
	stream << "Usage: versort [options] < versions\n\n" << description_ << '\n';
}
