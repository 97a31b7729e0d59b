#pragma once

#include <cstddef>
#include <exception>
#include <string>

#include "version.hpp"

class exception : public std::exception
{
public:
	explicit exception(const std::string &message);

	const char *what() const noexcept override;

private:
	std::string message_;
};

class unparsable_line : public exception
{
public:
	unparsable_line(std::size_t line_number, const std::string &text, parse_failure reason);

	std::size_t line_number() const noexcept;
	const std::string &text() const noexcept;
	parse_failure reason() const noexcept;

private:
	std::size_t line_number_;
	std::string text_;
	parse_failure reason_;
};
