#include "utils.hpp"

#include <utility>

#include "exception.hpp"

std::vector<std::string> read_lines(std::istream &stream)
{
	std::vector<std::string> lines;
	std::string line;

	while(std::getline(stream, line))
	{
		if(!line.empty() && line.back() == '\r')
		{
			line.pop_back();
		}

		lines.emplace_back(std::move(line));
	}

	if(stream.bad())
	{
		throw exception{"unable to read input"};
	}

	return lines;
}

void write_lines(std::ostream &stream, const std::vector<std::string> &lines)
{
	for(const auto &line : lines)
	{
		stream << line << '\n';
	}

	stream.flush();

	if(!stream)
	{
		throw exception{"unable to write output"};
	}
}
