#pragma once

#include <ostream>

#include <boost/program_options/options_description.hpp>

#include "options.hpp"

class command_line
{
public:
	command_line();

	command_line(const command_line &) = delete;
	command_line &operator=(const command_line &) = delete;

	// Throws boost::program_options::error on unknown flags or arguments.
	void parse(int argc, const char *const argv[]);

	const options &get_options() const;
	bool help_requested() const;

	void print_usage(std::ostream &stream) const;

private:
	boost::program_options::options_description description_;
	options options_;
	bool help_ = false;
};
