#include "versort.hpp"

#include <algorithm>
#include <cstdlib>

#include "comparator.hpp"
#include "exception.hpp"
#include "utils.hpp"

namespace
{
	struct sort_entry
	{
		std::size_t index;
		const version *parsed;

		sort_entry(std::size_t index, const version *parsed)
			: index{index}, parsed{parsed}
		{
		}
	};
}

versort::versort(const options &opts)
	: options_{opts}
{
}

std::vector<parse_outcome> versort::parse(const std::vector<std::string> &lines) const
{
	std::vector<parse_outcome> outcomes;
	outcomes.reserve(lines.size());

	for(const auto &line : lines)
	{
		outcomes.emplace_back(parse_version(line, options_));
	}

	return outcomes;
}

std::vector<std::string> versort::sort(const std::vector<std::string> &lines) const
{
	const auto outcomes = parse(lines);

	std::vector<sort_entry> entries;
	entries.reserve(outcomes.size());

	for(std::size_t i = 0; i < outcomes.size(); ++i)
	{
		if(const auto failure = std::get_if<unparsed>(&outcomes[i]))
		{
			// Blank lines carry no version and are skipped in every mode.
			if(options_.ignore_unparsable || failure->reason == parse_failure::empty_input)
			{
				continue;
			}

			throw unparsable_line{i + 1, lines[i], failure->reason};
		}

		entries.emplace_back(i, &std::get<version>(outcomes[i]));
	}

	const version_less less{options_};

	std::stable_sort(entries.begin(), entries.end(), [&less](const sort_entry &x, const sort_entry &y)
	{
		return less(*x.parsed, *y.parsed);
	});

	std::vector<std::string> sorted;
	sorted.reserve(entries.size());

	for(const auto &entry : entries)
	{
		sorted.emplace_back(lines[entry.index]);
	}

	return sorted;
}

int versort::run(std::istream &in, std::ostream &out, std::ostream &err) const
{
	try
	{
		write_lines(out, sort(read_lines(in)));
	}
	catch(const std::exception &e)
	{
		err << "versort: " << e.what() << '\n';
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
}
