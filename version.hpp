#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "options.hpp"

struct identifier
{
	std::string text;
	bool is_numeric;

	explicit identifier(std::string_view text);
};

struct version
{
	std::vector<std::uint64_t> release;
	std::optional<std::vector<identifier>> prerelease;
	std::optional<std::vector<std::string>> build;
	std::optional<char> counter;
};

enum class parse_failure
{
	empty_input,
	non_numeric_segment,
	malformed_counter_usage
};

const char *to_string(parse_failure failure);

struct unparsed
{
	parse_failure reason;
	std::string text;

	unparsed(parse_failure reason, std::string_view text)
		: reason{reason}, text{text}
	{
	}
};

using parse_outcome = std::variant<version, unparsed>;

// Parses one input line (without its line terminator). The line is trimmed of
// surrounding whitespace first; an optional leading 'v' or 'V' is skipped.
//
// Grammar: release ['-' prerelease] ['+' build], where release is one or more
// dot separated decimal numbers. With count_is_char and no '-' the release
// may end in a single letter directly after a digit, which becomes the counter.
parse_outcome parse_version(std::string_view line, const options &opts);
