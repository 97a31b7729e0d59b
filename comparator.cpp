#include "comparator.hpp"

#include <algorithm>

namespace
{
	template
	<
		typename T
	>
	int compare_values(const T &x, const T &y)
	{
		return x < y ? -1 : (y < x ? 1 : 0);
	}

	int compare_release(const std::vector<std::uint64_t> &x, const std::vector<std::uint64_t> &y)
	{
		const auto length = std::max(x.size(), y.size());

		for(std::size_t i = 0; i < length; ++i)
		{
			const auto x_value = i < x.size() ? x[i] : 0;
			const auto y_value = i < y.size() ? y[i] : 0;

			if(const auto r = compare_values(x_value, y_value))
			{
				return r;
			}
		}

		return 0;
	}

	// Numeric identifiers may be arbitrarily long, so they are compared as
	// digit strings: leading zeros dropped, then length, then digits.
	int compare_numbers(std::string_view x, std::string_view y)
	{
		x.remove_prefix(std::min(x.find_first_not_of('0'), x.size()));
		y.remove_prefix(std::min(y.find_first_not_of('0'), y.size()));

		if(const auto r = compare_values(x.size(), y.size()))
		{
			return r;
		}

		return x.compare(y);
	}

	int compare_identifiers(const identifier &x, const identifier &y)
	{
		if(x.is_numeric && y.is_numeric)
		{
			return compare_numbers(x.text, y.text);
		}

		if(x.is_numeric != y.is_numeric)
		{
			return x.is_numeric ? -1 : 1;
		}

		return x.text.compare(y.text);
	}

	int compare_prerelease(const std::optional<std::vector<identifier>> &x, const std::optional<std::vector<identifier>> &y)
	{
		if(!x || !y)
		{
			// A release outranks any of its prereleases.
			return compare_values(!x, !y);
		}

		const auto length = std::min(x->size(), y->size());

		for(std::size_t i = 0; i < length; ++i)
		{
			if(const auto r = compare_identifiers((*x)[i], (*y)[i]))
			{
				return r;
			}
		}

		return compare_values(x->size(), y->size());
	}

	int compare_counters(const std::optional<char> &x, const std::optional<char> &y)
	{
		if(!x || !y)
		{
			return compare_values(x.has_value(), y.has_value());
		}

		return compare_values(static_cast<unsigned char>(*x), static_cast<unsigned char>(*y));
	}
}

int compare_versions(const version &x, const version &y, const options &opts)
{
	if(const auto r = compare_release(x.release, y.release))
	{
		return r;
	}

	if(const auto r = compare_prerelease(x.prerelease, y.prerelease))
	{
		return r;
	}

	if(opts.count_is_char)
	{
		return compare_counters(x.counter, y.counter);
	}

	return 0;
}

version_less::version_less(const options &opts)
	: options_{opts}
{
}

bool version_less::operator()(const version &x, const version &y) const
{
	return compare_versions(x, y, options_) < 0;
}
