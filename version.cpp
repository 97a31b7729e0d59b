#include "version.hpp"

#include <algorithm>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

namespace
{
	bool is_digit(char c)
	{
		return c >= '0' && c <= '9';
	}

	bool is_letter(char c)
	{
		return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
	}

	bool is_number(std::string_view text)
	{
		return !text.empty() && std::all_of(text.cbegin(), text.cend(), is_digit);
	}

	std::vector<std::string> split(std::string_view text)
	{
		std::string input{text};
		std::vector<std::string> parts;

		boost::split(parts, input, boost::is_any_of("."));

		return parts;
	}
}

identifier::identifier(std::string_view text)
	: text{text}, is_numeric{is_number(text)}
{
}

const char *to_string(parse_failure failure)
{
	switch(failure)
	{
		case parse_failure::empty_input:
			return "empty input";

		case parse_failure::non_numeric_segment:
			return "non-numeric segment";

		case parse_failure::malformed_counter_usage:
			return "malformed counter usage";
	}

	return "unknown failure";
}

parse_outcome parse_version(std::string_view line, const options &opts)
{
	const auto trimmed = boost::algorithm::trim_copy(std::string{line});

	if(trimmed.empty())
	{
		return unparsed{parse_failure::empty_input, line};
	}

	std::string_view rest{trimmed};

	if(rest.front() == 'v' || rest.front() == 'V')
	{
		rest.remove_prefix(1);
	}

	version result;

	if(const auto plus = rest.find('+'); plus != std::string_view::npos)
	{
		result.build = split(rest.substr(plus + 1));
		rest = rest.substr(0, plus);
	}

	std::optional<std::string_view> prerelease;

	if(const auto dash = rest.find('-'); dash != std::string_view::npos)
	{
		prerelease = rest.substr(dash + 1);
		rest = rest.substr(0, dash);
	}

	// An explicit prerelease delimiter takes precedence over the counter.
	if(opts.count_is_char && !prerelease && !rest.empty() && is_letter(rest.back()))
	{
		if(rest.size() < 2 || !is_digit(rest[rest.size() - 2]))
		{
			return unparsed{parse_failure::malformed_counter_usage, line};
		}

		result.counter = rest.back();
		rest.remove_suffix(1);
	}

	for(const auto &segment : split(rest))
	{
		std::uint64_t value;

		if(!is_number(segment) || !boost::conversion::try_lexical_convert(segment, value))
		{
			return unparsed{parse_failure::non_numeric_segment, line};
		}

		result.release.emplace_back(value);
	}

	if(prerelease)
	{
		auto &identifiers = result.prerelease.emplace();

		for(const auto &part : split(*prerelease))
		{
			identifiers.emplace_back(part);
		}
	}

	return result;
}
