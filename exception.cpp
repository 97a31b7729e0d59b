#include "exception.hpp"

#include <boost/format.hpp>

exception::exception(const std::string &message)
	: message_{message}
{
}

const char *exception::what() const noexcept
{
	return message_.data();
}

unparsable_line::unparsable_line(std::size_t line_number, const std::string &text, parse_failure reason)
	: exception{(boost::format("line %1%: unable to parse '%2%' as a version: %3%") % line_number % text % to_string(reason)).str()},
	  line_number_{line_number}, text_{text}, reason_{reason}
{
}

std::size_t unparsable_line::line_number() const noexcept
{
	return line_number_;
}

const std::string &unparsable_line::text() const noexcept
{
	return text_;
}

parse_failure unparsable_line::reason() const noexcept
{
	return reason_;
}
