#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "options.hpp"
#include "version.hpp"

class versort
{
public:
	explicit versort(const options &opts);

	// Parses every line, one outcome per line in input order.
	std::vector<parse_outcome> parse(const std::vector<std::string> &lines) const;

	// Returns the lines ordered by version. Lines comparing equal keep their
	// input order. Without ignore_unparsable the first unparsable line throws
	// unparsable_line; with it such lines are left out.
	std::vector<std::string> sort(const std::vector<std::string> &lines) const;

	// Reads all of in, writes the sorted lines to out and reports failures to
	// err. Returns the process exit status.
	int run(std::istream &in, std::ostream &out, std::ostream &err) const;

private:
	options options_;
};
